// 표준 라이브러리
#include <cmath>

// 외부 라이브러리
#include <nlohmann/json.hpp>

// 파일 헤더
#include "Engines/Config.hpp"

// 내부 헤더
#include "Engines/DataUtils.hpp"
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"
#include "Engines/TimeUtils.hpp"

// 네임 스페이스
namespace rolling_stdev {
using namespace exception;
using namespace utils;
}  // namespace rolling_stdev

namespace rolling_stdev::engine {

MissingValuePolicy ParseMissingValuePolicy(const string& policy) {
  if (policy == "CARRY_FORWARD") {
    return MissingValuePolicy::CARRY_FORWARD;
  }

  if (policy == "EMIT_NONE") {
    return MissingValuePolicy::EMIT_NONE;
  }

  if (policy == "RESET_WINDOW") {
    return MissingValuePolicy::RESET_WINDOW;
  }

  const string& message =
      "잘못된 결측 값 처리 방법 [" + policy + "]이(가) 지정되었습니다.";
  Logger::GetLogger()->Log(ERROR_L, message, __FILE__, __LINE__, true);
  throw InvalidValue(message);
}

string MissingValuePolicyToString(const MissingValuePolicy policy) {
  switch (policy) {
    case MissingValuePolicy::CARRY_FORWARD: {
      return "CARRY_FORWARD";
    }

    case MissingValuePolicy::EMIT_NONE: {
      return "EMIT_NONE";
    }

    case MissingValuePolicy::RESET_WINDOW: {
      return "RESET_WINDOW";
    }
  }

  return "UNKNOWN";
}

Config::Config()
    : window_size_(20),
      cadence_(kHour),
      gap_tolerance_(0),
      min_periods_(1),
      missing_value_policy_(MissingValuePolicy::CARRY_FORWARD),
      max_abs_value_(1e12) {}
Config::~Config() = default;

shared_ptr<Logger>& Config::logger_ = Logger::GetLogger();

// 음수나 실수가 size_t로 변환되는 것을 막기 위한 함수
static size_t GetUnsignedFromJson(const json& config_json, const string& key) {
  const auto& value = config_json.at(key);
  if (!value.is_number_integer() || value.get<int64_t>() < 0) {
    throw InvalidValue("[" + key + "] 키는 0 이상의 정수여야 합니다.");
  }

  return value.get<size_t>();
}

Config Config::FromJson(const json& config_json) {
  Config config;

  try {
    if (config_json.contains("windowSize")) {
      config.SetWindowSize(GetUnsignedFromJson(config_json, "windowSize"));
    }

    if (config_json.contains("cadence")) {
      config.SetCadence(config_json.at("cadence").get<string>());
    }

    if (config_json.contains("gapTolerance")) {
      config.SetGapTolerance(
          ParseTimeframe(config_json.at("gapTolerance").get<string>()));
    }

    if (config_json.contains("minPeriods")) {
      config.SetMinPeriods(GetUnsignedFromJson(config_json, "minPeriods"));
    }

    if (config_json.contains("missingValuePolicy")) {
      config.SetMissingValuePolicy(ParseMissingValuePolicy(
          config_json.at("missingValuePolicy").get<string>()));
    }

    if (config_json.contains("maxAbsValue")) {
      config.SetMaxAbsValue(GetDoubleFromJson(config_json, "maxAbsValue"));
    }

    if (config_json.contains("statePath")) {
      config.SetStatePath(config_json.at("statePath").get<string>());
    }

    if (config_json.contains("logDirectory")) {
      config.SetLogDirectory(config_json.at("logDirectory").get<string>());
    }
  } catch (const json::exception& e) {
    const string& message =
        string("설정 Json의 값 타입이 올바르지 않습니다: ") + e.what();
    logger_->Log(ERROR_L, message, __FILE__, __LINE__, true);
    throw InvalidValue(message);
  } catch (const InvalidValue& e) {
    logger_->Log(ERROR_L, e.what(), __FILE__, __LINE__, true);
    throw;
  } catch (const runtime_error& e) {
    // 타임프레임 파싱 실패 등은 설정 오류로 취급
    throw InvalidValue(e.what());
  }

  config.Validate();
  return config;
}

Config Config::FromFile(const string& config_path) {
  json config_json;
  try {
    config_json = ReadJsonFile(config_path);
  } catch (const runtime_error& e) {
    throw InvalidValue(e.what());
  }

  logger_->Log(INFO_L, "설정 파일 [" + config_path + "]을(를) 읽었습니다.",
               __FILE__, __LINE__);

  return FromJson(config_json);
}

Config& Config::SetWindowSize(const size_t window_size) {
  window_size_ = window_size;
  return *this;
}

Config& Config::SetCadence(const int64_t cadence_ms) {
  cadence_ = cadence_ms;
  return *this;
}

Config& Config::SetCadence(const string& cadence) {
  cadence_ = ParseTimeframe(cadence);
  return *this;
}

Config& Config::SetGapTolerance(const int64_t gap_tolerance_ms) {
  gap_tolerance_ = gap_tolerance_ms;
  return *this;
}

Config& Config::SetMinPeriods(const size_t min_periods) {
  min_periods_ = min_periods;
  return *this;
}

Config& Config::SetMissingValuePolicy(
    const MissingValuePolicy missing_value_policy) {
  missing_value_policy_ = missing_value_policy;
  return *this;
}

Config& Config::SetMaxAbsValue(const double max_abs_value) {
  max_abs_value_ = max_abs_value;
  return *this;
}

Config& Config::SetStatePath(const string& state_path) {
  state_path_ = state_path;
  return *this;
}

Config& Config::SetLogDirectory(const string& log_directory) {
  log_directory_ = log_directory;

  // 로그 폴더 설정 시 로거의 로그 폴더도 함께 설정
  Logger::SetLogDirectory(log_directory);

  return *this;
}

void Config::Validate() const {
  string error;

  if (window_size_ == 0) {
    error = "윈도우 크기는 1 이상이어야 합니다.";
  } else if (cadence_ <= 0) {
    error = "기대 간격은 0보다 커야 합니다. (지정값: " +
            to_string(cadence_) + "ms)";
  } else if (gap_tolerance_ < 0) {
    error = "갭 허용 오차는 0 이상이어야 합니다. (지정값: " +
            to_string(gap_tolerance_) + "ms)";
  } else if (min_periods_ == 0 || min_periods_ > window_size_) {
    error = "최소 샘플 수는 1 이상, 윈도우 크기 " + to_string(window_size_) +
            " 이하여야 합니다. (지정값: " + to_string(min_periods_) + ")";
  } else if (!isfinite(max_abs_value_) || max_abs_value_ <= 0) {
    error = "유효한 값의 절댓값 상한은 0보다 큰 유한한 값이어야 합니다.";
  }

  if (!error.empty()) {
    logger_->Log(ERROR_L, error, __FILE__, __LINE__, true);
    throw InvalidValue(error);
  }
}

size_t Config::GetWindowSize() const { return window_size_; }
int64_t Config::GetCadence() const { return cadence_; }
int64_t Config::GetGapTolerance() const { return gap_tolerance_; }
size_t Config::GetMinPeriods() const { return min_periods_; }
MissingValuePolicy Config::GetMissingValuePolicy() const {
  return missing_value_policy_;
}
double Config::GetMaxAbsValue() const { return max_abs_value_; }
string Config::GetStatePath() const { return state_path_; }
string Config::GetLogDirectory() const { return log_directory_; }

}  // namespace rolling_stdev::engine
