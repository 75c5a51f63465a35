// 표준 라이브러리
#include <cmath>
#include <utility>

// 파일 헤더
#include "Engines/EntityState.hpp"

// 내부 헤더
#include "Engines/Config.hpp"

namespace rolling_stdev::engine {

bool ApplyOutcome::HasAnyStdev() const {
  for (const auto& stdev : stdevs) {
    if (stdev.has_value()) {
      return true;
    }
  }

  return false;
}

EntityState::EntityState(const size_t window_size)
    : windows_{Window(window_size), Window(window_size), Window(window_size)} {}

EntityState::EntityState(array<Window, kNumFields> windows,
                         const optional<int64_t> last_timestamp,
                         const array<optional<double>, kNumFields> last_stdevs)
    : windows_(move(windows)),
      last_timestamp_(last_timestamp),
      last_stdevs_(last_stdevs) {}

ApplyOutcome EntityState::Apply(const Snapshot& snapshot,
                                const Config& config) {
  ApplyOutcome outcome;

  // 첫 스냅샷이 아니면 경과 시간으로 갭 검사
  if (last_timestamp_) {
    outcome.elapsed = snapshot.timestamp - *last_timestamp_;

    if (IsGap(snapshot.timestamp, config.GetCadence(),
              config.GetGapTolerance())) {
      ResetWindows();
      outcome.gap_reset = true;
    }
  }

  const size_t min_periods = config.GetMinPeriods();

  for (const Field field : kFields) {
    const auto idx = static_cast<size_t>(field);
    Window& window = windows_[idx];

    if (const auto& value = snapshot.GetValue(field);
        IsUsableValue(value, config.GetMaxAbsValue())) {
      window.Push(*value);
      outcome.stdevs[idx] = StdevWithMinPeriods(window, min_periods);
    } else {
      // 결측 필드는 해당 필드만 정책에 따라 처리
      switch (config.GetMissingValuePolicy()) {
        case MissingValuePolicy::CARRY_FORWARD: {
          outcome.stdevs[idx] = StdevWithMinPeriods(window, min_periods);
          break;
        }

        case MissingValuePolicy::EMIT_NONE: {
          outcome.stdevs[idx] = nullopt;
          break;
        }

        case MissingValuePolicy::RESET_WINDOW: {
          window.Reset();
          outcome.stdevs[idx] = last_stdevs_[idx];
          continue;
        }
      }
    }

    if (outcome.stdevs[idx]) {
      last_stdevs_[idx] = outcome.stdevs[idx];
    }
  }

  // 갭 여부와 관계없이 항상 갱신
  last_timestamp_ = snapshot.timestamp;

  return outcome;
}

bool EntityState::IsAlreadySeen(const int64_t timestamp) const {
  return last_timestamp_ && timestamp <= *last_timestamp_;
}

bool EntityState::IsGap(const int64_t timestamp, const int64_t cadence,
                        const int64_t tolerance) const {
  if (!last_timestamp_) {
    return false;
  }

  return timestamp - *last_timestamp_ > cadence + tolerance;
}

void EntityState::ResetWindows() {
  for (auto& window : windows_) {
    window.Reset();
  }
}

const Window& EntityState::GetWindow(const Field field) const {
  return windows_[static_cast<size_t>(field)];
}

optional<int64_t> EntityState::GetLastTimestamp() const {
  return last_timestamp_;
}

optional<double> EntityState::GetLastStdev(const Field field) const {
  return last_stdevs_[static_cast<size_t>(field)];
}

bool EntityState::IsUsableValue(const optional<double>& value,
                                const double max_abs_value) {
  return value.has_value() && isfinite(*value) && fabs(*value) <= max_abs_value;
}

optional<double> EntityState::StdevWithMinPeriods(const Window& window,
                                                  const size_t min_periods) {
  if (window.GetCount() < min_periods) {
    return nullopt;
  }

  return window.Stdev();
}

}  // namespace rolling_stdev::engine
