#pragma once

// 표준 라이브러리
#include <optional>
#include <vector>

// 내부 헤더
#include "Engines/Snapshot.hpp"

// 네임 스페이스
using namespace std;

namespace rolling_stdev::snapshot {

/**
 * 엔진에 스냅샷을 공급하는 입력 측 추상 클래스
 *
 * 구현체는 엔티티별로 타임스탬프가 순증가하는 스냅샷을 순서대로 반환해야
 * 하며, 엔진은 이를 재정렬하지 않음.\n
 * 원천 포맷의 로딩 및 스키마 검사는 구현체의 책임.
 */
class SnapshotSource {
 public:
  virtual ~SnapshotSource() = default;

  /// 다음 스냅샷을 반환하는 함수. 더 이상 없으면 nullopt를 반환.
  [[nodiscard]] virtual optional<Snapshot> Next() = 0;
};

/// 메모리에 적재된 스냅샷 벡터를 순서대로 공급하는 클래스
class VectorSnapshotSource final : public SnapshotSource {
 public:
  explicit VectorSnapshotSource(vector<Snapshot> snapshots);

  [[nodiscard]] optional<Snapshot> Next() override;

  /// 처음부터 다시 공급하도록 위치를 되돌리는 함수
  void Rewind();

 private:
  vector<Snapshot> snapshots_;
  size_t position_;
};

}  // namespace rolling_stdev::snapshot
