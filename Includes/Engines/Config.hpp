#pragma once

// 표준 라이브러리
#include <cstdint>
#include <memory>
#include <string>

// 외부 라이브러리
#include <nlohmann/json_fwd.hpp>

// 전방 선언
namespace rolling_stdev::logger {
class Logger;
}

// 네임 스페이스
using namespace std;
using namespace nlohmann;
namespace rolling_stdev {
using namespace logger;
}  // namespace rolling_stdev

namespace rolling_stdev::engine {

/// 필드 값이 없거나 유효하지 않을 때의 처리 방법을 지정하는 열거형 클래스
enum class MissingValuePolicy {
  /// 윈도우를 갱신하지 않고 직전 윈도우 상태로 표준 편차를 계산
  CARRY_FORWARD,

  /// 윈도우를 갱신하지 않고 해당 시점의 표준 편차를 비움
  EMIT_NONE,

  /// 해당 필드의 윈도우를 초기화하고 마지막으로 계산된 표준 편차를 사용
  RESET_WINDOW
};

/// 문자열을 MissingValuePolicy로 변환하는 함수
[[nodiscard]] MissingValuePolicy ParseMissingValuePolicy(const string& policy);

/// MissingValuePolicy를 문자열로 변환하는 함수
[[nodiscard]] string MissingValuePolicyToString(MissingValuePolicy policy);

/// 엔진의 사전 설정값을 담당하는 빌더 클래스
class Config final {
 public:
  Config();
  ~Config();

  /**
   * Json 객체로부터 설정값을 생성하는 함수
   *
   * 존재하지 않는 키는 기본값을 사용함.\n
   * 지원 키: windowSize, cadence, gapTolerance, minPeriods,
   * missingValuePolicy, maxAbsValue, statePath, logDirectory
   */
  [[nodiscard]] static Config FromJson(const json& config_json);

  /// 지정된 경로의 Json 설정 파일로부터 설정값을 생성하는 함수
  [[nodiscard]] static Config FromFile(const string& config_path);

  /// 윈도우 크기(보관할 최근 샘플 수)를 설정하는 함수
  Config& SetWindowSize(size_t window_size);

  /// 스냅샷의 기대 간격을 밀리초 단위로 설정하는 함수
  Config& SetCadence(int64_t cadence_ms);

  /// 스냅샷의 기대 간격을 "1h" 같은 타임프레임 문자열로 설정하는 함수
  Config& SetCadence(const string& cadence);

  /// 기대 간격을 초과해도 갭으로 보지 않는 허용 오차를 밀리초 단위로 설정하는
  /// 함수
  Config& SetGapTolerance(int64_t gap_tolerance_ms);

  /// 표준 편차를 내보내기 위해 윈도우에 필요한 최소 샘플 수를 설정하는 함수
  Config& SetMinPeriods(size_t min_periods);

  /// 결측 필드 값 처리 방법을 설정하는 함수
  Config& SetMissingValuePolicy(MissingValuePolicy missing_value_policy);

  /// 유효한 값으로 인정하는 절댓값의 상한을 설정하는 함수
  Config& SetMaxAbsValue(double max_abs_value);

  /// 상태 파일 경로를 설정하는 함수
  Config& SetStatePath(const string& state_path);

  /// 로그 폴더를 설정하는 함수. 로거의 로그 폴더도 함께 변경됨.
  Config& SetLogDirectory(const string& log_directory);

  /// 설정값의 유효성을 검사하는 함수. 유효하지 않으면 InvalidValue를 던짐.
  void Validate() const;

  [[nodiscard]] size_t GetWindowSize() const;
  [[nodiscard]] int64_t GetCadence() const;
  [[nodiscard]] int64_t GetGapTolerance() const;
  [[nodiscard]] size_t GetMinPeriods() const;
  [[nodiscard]] MissingValuePolicy GetMissingValuePolicy() const;
  [[nodiscard]] double GetMaxAbsValue() const;
  [[nodiscard]] string GetStatePath() const;
  [[nodiscard]] string GetLogDirectory() const;

 private:
  static shared_ptr<Logger>& logger_;

  size_t window_size_;  // 윈도우 크기
  int64_t cadence_;     // 기대 간격 (밀리초)

  /// 갭 허용 오차 (밀리초).
  ///
  /// 경과 시간이 cadence_ + gap_tolerance_를 초과하면 윈도우를 초기화함.
  int64_t gap_tolerance_;

  size_t min_periods_;  // 표준 편차 계산에 필요한 최소 샘플 수
  MissingValuePolicy missing_value_policy_;  // 결측 값 처리 방법
  double max_abs_value_;                     // 유효한 값의 절댓값 상한

  string state_path_;     // 상태 파일 경로
  string log_directory_;  // 로그 폴더
};

}  // namespace rolling_stdev::engine
