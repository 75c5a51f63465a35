#pragma once

// 표준 라이브러리
#include <cstdint>
#include <map>
#include <optional>
#include <string>

// 내부 헤더
#include "Engines/EntityState.hpp"

// 네임 스페이스
using namespace std;

namespace rolling_stdev::engine {

/**
 * 엔티티 ID와 엔티티 상태의 매핑 및 하이 워터 마크를 보관하는 클래스
 *
 * 배치 시작 시 StateStore로부터 로드되고 엔진이 변경한 후 배치 종료 시
 * 저장됨.
 */
class StateMap final {
 public:
  using Container = map<string, EntityState>;

  StateMap() = default;

  /// 엔티티 상태를 반환하는 함수. 없으면 빈 윈도우로 생성하여 반환.
  EntityState& GetOrCreate(const string& entity_id, size_t window_size);

  /// 엔티티 상태를 추가하는 함수. 이미 존재하면 덮어씀.
  void Insert(const string& entity_id, EntityState entity_state);

  /// 엔티티 상태를 찾아 반환하는 함수. 없으면 nullptr를 반환.
  [[nodiscard]] const EntityState* Find(const string& entity_id) const;

  [[nodiscard]] size_t Size() const;
  [[nodiscard]] bool Empty() const;

  [[nodiscard]] Container::const_iterator begin() const;
  [[nodiscard]] Container::const_iterator end() const;

  /// 주어진 타임스탬프가 하이 워터 마크보다 크면 갱신하는 함수
  void UpdateHighWaterMark(int64_t timestamp);

  void SetHighWaterMark(optional<int64_t> high_water_mark);
  [[nodiscard]] optional<int64_t> GetHighWaterMark() const;

 private:
  Container entity_states_;

  // 어느 엔티티에든 적용된 가장 최근 스냅샷의 타임스탬프
  optional<int64_t> high_water_mark_;
};

}  // namespace rolling_stdev::engine
