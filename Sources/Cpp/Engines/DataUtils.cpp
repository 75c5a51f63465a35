// 표준 라이브러리
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

// 외부 라이브러리
#include <nlohmann/json.hpp>

// 파일 헤더
#include "Engines/DataUtils.hpp"

// 내부 헤더
#include "Engines/Logger.hpp"

// 네임 스페이스
namespace rolling_stdev {
using namespace logger;
}  // namespace rolling_stdev

namespace rolling_stdev::utils {

string ToFixedString(const double value, const int precision) {
  ostringstream oss;
  oss << fixed << setprecision(precision) << value;
  return oss.str();
}

bool IsNearlyEqual(const double value, const double reference,
                   const double relative_tolerance) {
  return fabs(value - reference) <=
         relative_tolerance * max(1.0, fabs(reference));
}

string FormatStdev(const optional<double>& stdev) {
  if (!stdev) {
    return "N/A";
  }

  return ToFixedString(*stdev, 8);
}

double GetDoubleFromJson(const json& data, const string& key) {
  if (!data.contains(key)) {
    Logger::LogAndThrowError("[" + key + "] 키가 존재하지 않습니다.",
                             __FILE__, __LINE__);
  }

  const auto& value = data.at(key);

  // 숫자형이면 Double로 반환
  if (value.is_number()) {
    return value.get<double>();
  }

  // String이면 Double로 변환 후 반환
  if (value.is_string()) {
    try {
      return stod(value.get<string>());
    } catch (const logic_error&) {
      Logger::LogAndThrowError(
          "[" + key + "] 키의 문자열 값을 숫자로 변환할 수 없습니다.",
          __FILE__, __LINE__);
    }
  }

  Logger::LogAndThrowError("[" + key + "] 키에 유효하지 않은 값이 존재합니다.",
                           __FILE__, __LINE__);
}

json ReadJsonFile(const string& file_path) {
  ifstream file(file_path);
  if (!file.is_open()) {
    Logger::LogAndThrowError(file_path + " 파일을 열 수 없습니다.", __FILE__,
                             __LINE__);
  }

  try {
    return json::parse(file);
  } catch (const json::parse_error& e) {
    Logger::LogAndThrowError(
        file_path + " 파일을 Json으로 파싱할 수 없습니다: " + e.what(),
        __FILE__, __LINE__);
  }
}

}  // namespace rolling_stdev::utils
