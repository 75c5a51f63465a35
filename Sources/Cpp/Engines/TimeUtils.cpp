// 표준 라이브러리
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

// 파일 헤더
#include "Engines/TimeUtils.hpp"

// 내부 헤더
#include "Engines/Logger.hpp"

// 네임 스페이스
using namespace chrono;
namespace rolling_stdev {
using namespace logger;
}  // namespace rolling_stdev

namespace rolling_stdev::utils {

int64_t GetCurrentUtcTimestamp() {
  const auto now = system_clock::now();
  return duration_cast<milliseconds>(now.time_since_epoch()).count();
}

string GetCurrentLocalDatetime() {
  const time_t now_time_t = system_clock::to_time_t(system_clock::now());

  tm local_time{};
#ifdef _WIN32
  localtime_s(&local_time, &now_time_t);
#else
  localtime_r(&now_time_t, &local_time);
#endif

  ostringstream ss;
  ss << put_time(&local_time, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

string UtcTimestampToUtcDatetime(const int64_t timestamp_ms) {
  // 에포크 이전은 대상 밖
  if (timestamp_ms < 0) {
    return "";
  }

  // timestamp ms를 time_t로 변환
  const auto timestamp_s = seconds(timestamp_ms / 1000);
  const system_clock::time_point tp(timestamp_s);
  const time_t timestamp_time_t = system_clock::to_time_t(tp);

  // UTC 시간으로 변환
  tm utc_time{};
#ifdef _WIN32
  gmtime_s(&utc_time, &timestamp_time_t);
#else
  gmtime_r(&timestamp_time_t, &utc_time);
#endif

  // Datetime으로 변환
  ostringstream ss;
  ss << put_time(&utc_time, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

int64_t UtcDatetimeToUtcTimestamp(const string& datetime,
                                  const string& format) {
  tm tm = {};
  istringstream ss(datetime);

  // 문자열을 tm으로 파싱
  ss >> get_time(&tm, format.c_str());
  if (ss.fail()) {
    Logger::LogAndThrowError(
        "Datetime 문자열 [" + datetime + "]을(를) 파싱하는 데 실패했습니다.",
        __FILE__, __LINE__);
  }

  // tm 구조체를 UTC 타임스탬프로 변환
#ifdef _WIN32
  const int64_t utc_timestamp = _mkgmtime(&tm);
#else
  const int64_t utc_timestamp = timegm(&tm);
#endif

  return utc_timestamp * 1000;
}

string FormatTimeframe(const int64_t timeframe_ms) {
  if (timeframe_ms == 0) {
    return "0ms";
  }

  if (timeframe_ms % kWeek == 0) {
    return to_string(timeframe_ms / kWeek) + "w";
  }
  if (timeframe_ms % kDay == 0) {
    return to_string(timeframe_ms / kDay) + "d";
  }
  if (timeframe_ms % kHour == 0) {
    return to_string(timeframe_ms / kHour) + "h";
  }
  if (timeframe_ms % kMinute == 0) {
    return to_string(timeframe_ms / kMinute) + "m";
  }
  if (timeframe_ms % kSecond == 0) {
    return to_string(timeframe_ms / kSecond) + "s";
  }

  return to_string(timeframe_ms) + "ms";
}

int64_t ParseTimeframe(const string& timeframe_str) {
  // 타임프레임의 숫자 부분의 끝 좌표 찾기
  size_t pos = 0;
  while (pos < timeframe_str.size() &&
         isdigit(static_cast<unsigned char>(timeframe_str[pos]))) {
    ++pos;
  }

  if (pos == 0) {
    Logger::LogAndThrowError(
        "잘못된 타임프레임 포맷 [" + timeframe_str + "]이(가) 지정되었습니다.",
        __FILE__, __LINE__);
  }

  // str의 숫자 부분 찾기
  int64_t value = 0;
  try {
    value = stoll(timeframe_str.substr(0, pos));
  } catch (const out_of_range&) {
    Logger::LogAndThrowError(
        "타임프레임 [" + timeframe_str + "]의 값이 너무 큽니다.", __FILE__,
        __LINE__);
  }

  const string unit = timeframe_str.substr(pos);
  int64_t multiplier = 0;

  if (unit == "ms") {
    multiplier = 1;
  } else if (unit == "s") {
    multiplier = kSecond;
  } else if (unit == "m") {
    multiplier = kMinute;
  } else if (unit == "h") {
    multiplier = kHour;
  } else if (unit == "d") {
    multiplier = kDay;
  } else if (unit == "w") {
    multiplier = kWeek;
  } else {
    Logger::LogAndThrowError(
        "잘못된 타임프레임 유닛 [" + unit + "]이(가) 지정되었습니다.",
        __FILE__, __LINE__);
  }

  // 밀리초 변환 시 int64_t 범위 초과 방지
  if (value > numeric_limits<int64_t>::max() / multiplier) {
    Logger::LogAndThrowError(
        "타임프레임 [" + timeframe_str + "]의 값이 너무 큽니다.", __FILE__,
        __LINE__);
  }

  return value * multiplier;
}

string FormatTimeDiff(const int64_t diff_ms) {
  if (diff_ms == 0) {
    return "0초";
  }

  if (diff_ms < 0) {
    return "-" + FormatTimeDiff(-diff_ms);
  }

  // 1초 미만
  if (diff_ms < kSecond) {
    return to_string(diff_ms) + "밀리초";
  }

  const vector<pair<int64_t, string>> units = {
      {kWeek, "주"}, {kDay, "일"},  {kHour, "시간"},
      {kMinute, "분"}, {kSecond, "초"}};

  vector<string> result_units;
  int64_t remainder = diff_ms;

  // 가장 큰 단위와 그 다음으로 0이 아닌 단위까지만 표시
  for (const auto& [unit_value, unit_name] : units) {
    if (remainder >= unit_value) {
      const int64_t count = remainder / unit_value;
      result_units.push_back(to_string(count) + unit_name);
      remainder %= unit_value;

      if (result_units.size() == 2) {
        break;
      }
    }
  }

  string result = result_units[0];
  for (size_t i = 1; i < result_units.size(); ++i) {
    result += " " + result_units[i];
  }

  return result;
}

}  // namespace rolling_stdev::utils
