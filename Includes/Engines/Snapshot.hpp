#pragma once

// 표준 라이브러리
#include <array>
#include <cstdint>
#include <optional>
#include <string>

// 네임 스페이스
using namespace std;

namespace rolling_stdev::snapshot {

/// 스냅샷의 가격 필드를 지정하는 열거형 클래스
enum class Field { BID, MID, ASK };
using enum Field;

/// 필드 개수
constexpr size_t kNumFields = 3;

/// 모든 필드를 순서대로 담은 배열
constexpr array<Field, kNumFields> kFields = {BID, MID, ASK};

/// 필드를 문자열로 변환하여 반환하는 함수
[[nodiscard]] constexpr const char* FieldToString(const Field field) {
  switch (field) {
    case BID: {
      return "bid";
    }

    case MID: {
      return "mid";
    }

    case ASK: {
      return "ask";
    }
  }

  return "unknown";
}

/// 한 엔티티의 한 시점 호가 스냅샷을 지정하는 구조체.
/// 값이 없는 필드는 nullopt로 지정.
struct Snapshot {
  Snapshot() = default;  // 명시적 초기화용
  Snapshot(const string& entity_id, const int64_t timestamp,
           const optional<double> bid, const optional<double> mid,
           const optional<double> ask) {
    this->entity_id = entity_id;
    this->timestamp = timestamp;
    this->bid = bid;
    this->mid = mid;
    this->ask = ask;
  }

  /// 필드에 해당하는 값을 반환하는 함수
  [[nodiscard]] optional<double> GetValue(const Field field) const {
    switch (field) {
      case BID: {
        return bid;
      }

      case MID: {
        return mid;
      }

      case ASK: {
        return ask;
      }
    }

    return nullopt;
  }

  string entity_id;   // 엔티티(종목) 식별자
  int64_t timestamp = 0;  // UTC 밀리초 타임스탬프
  optional<double> bid;
  optional<double> mid;
  optional<double> ask;
};

/// 스냅샷 하나를 처리한 결과를 지정하는 구조체
struct ResultRecord {
  ResultRecord() = default;
  ResultRecord(const string& entity_id, const int64_t timestamp,
               const optional<double> bid_stdev,
               const optional<double> mid_stdev,
               const optional<double> ask_stdev, const bool gap_reset) {
    this->entity_id = entity_id;
    this->timestamp = timestamp;
    this->bid_stdev = bid_stdev;
    this->mid_stdev = mid_stdev;
    this->ask_stdev = ask_stdev;
    this->gap_reset = gap_reset;
  }

  /// 필드에 해당하는 표준 편차를 반환하는 함수
  [[nodiscard]] optional<double> GetStdev(const Field field) const {
    switch (field) {
      case BID: {
        return bid_stdev;
      }

      case MID: {
        return mid_stdev;
      }

      case ASK: {
        return ask_stdev;
      }
    }

    return nullopt;
  }

  string entity_id;
  int64_t timestamp = 0;
  optional<double> bid_stdev;
  optional<double> mid_stdev;
  optional<double> ask_stdev;

  /// 이 스냅샷에서 시간 갭으로 윈도우가 초기화되었는지 여부
  bool gap_reset = false;
};

}  // namespace rolling_stdev::snapshot
