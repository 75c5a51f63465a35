// 표준 라이브러리
#include <utility>

// 파일 헤더
#include "Engines/SnapshotSource.hpp"

namespace rolling_stdev::snapshot {

VectorSnapshotSource::VectorSnapshotSource(vector<Snapshot> snapshots)
    : snapshots_(move(snapshots)), position_(0) {}

optional<Snapshot> VectorSnapshotSource::Next() {
  if (position_ >= snapshots_.size()) {
    return nullopt;
  }

  return snapshots_[position_++];
}

void VectorSnapshotSource::Rewind() { position_ = 0; }

}  // namespace rolling_stdev::snapshot
