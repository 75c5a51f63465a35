#pragma once

// 표준 라이브러리
#include <array>
#include <cstdint>
#include <optional>

// 내부 헤더
#include "Engines/Snapshot.hpp"
#include "Indicators/Window.hpp"

// 전방 선언
namespace rolling_stdev::engine {
class Config;
}

// 네임 스페이스
using namespace std;
namespace rolling_stdev {
using namespace indicator;
using namespace snapshot;
}  // namespace rolling_stdev

namespace rolling_stdev::engine {

/// 스냅샷 하나를 엔티티 상태에 적용한 결과를 지정하는 구조체
struct ApplyOutcome {
  /// 필드별 표준 편차. 인덱스는 Field 순서.
  array<optional<double>, kNumFields> stdevs;

  /// 시간 갭으로 윈도우가 초기화되었는지 여부
  bool gap_reset = false;

  /// 직전 스냅샷과의 경과 시간. 첫 스냅샷이면 nullopt.
  optional<int64_t> elapsed;

  /// 하나 이상의 필드가 표준 편차를 가지는지 여부
  [[nodiscard]] bool HasAnyStdev() const;
};

/**
 * 한 엔티티의 bid, mid, ask 윈도우와 마지막 타임스탬프를 보관하는 클래스
 *
 * 스냅샷마다 직전 스냅샷과의 경과 시간을 검사하여 기대 간격과 허용 오차를
 * 초과하면 세 윈도우를 모두 초기화한 후 새 값을 추가함.
 */
class EntityState final {
 public:
  explicit EntityState(size_t window_size);

  /// 저장된 윈도우와 타임스탬프로부터 상태를 복원하는 생성자
  EntityState(array<Window, kNumFields> windows,
              optional<int64_t> last_timestamp,
              array<optional<double>, kNumFields> last_stdevs);

  /**
   * 스냅샷을 적용하고 필드별 표준 편차를 반환하는 함수
   *
   * 호출 전 IsAlreadySeen으로 이미 처리한 시점이 아닌지 확인해야 함.
   * @param snapshot 적용할 스냅샷
   * @param config 갭 판단 기준, 최소 샘플 수, 결측 값 처리 방법
   * @return 필드별 표준 편차와 갭 초기화 여부
   */
  [[nodiscard]] ApplyOutcome Apply(const Snapshot& snapshot,
                                   const Config& config);

  /// 주어진 타임스탬프가 마지막 타임스탬프 이하인지 반환하는 함수
  [[nodiscard]] bool IsAlreadySeen(int64_t timestamp) const;

  /**
   * 주어진 타임스탬프가 시간 갭에 해당하는지 반환하는 함수
   *
   * 경과 시간이 cadence + tolerance를 초과하면 갭. 첫 스냅샷은 갭이 아님.
   */
  [[nodiscard]] bool IsGap(int64_t timestamp, int64_t cadence,
                           int64_t tolerance) const;

  /// 세 윈도우를 모두 초기화하는 함수
  void ResetWindows();

  [[nodiscard]] const Window& GetWindow(Field field) const;
  [[nodiscard]] optional<int64_t> GetLastTimestamp() const;
  [[nodiscard]] optional<double> GetLastStdev(Field field) const;

  /// 필드 값이 유효한 숫자인지 검사하는 함수
  [[nodiscard]] static bool IsUsableValue(const optional<double>& value,
                                          double max_abs_value);

 private:
  array<Window, kNumFields> windows_;
  optional<int64_t> last_timestamp_;

  // 필드별 마지막으로 계산된 표준 편차 (RESET_WINDOW 정책용)
  array<optional<double>, kNumFields> last_stdevs_;

  /// 윈도우의 표준 편차를 최소 샘플 수 조건을 적용하여 반환하는 함수
  [[nodiscard]] static optional<double> StdevWithMinPeriods(
      const Window& window, size_t min_periods);
};

}  // namespace rolling_stdev::engine
