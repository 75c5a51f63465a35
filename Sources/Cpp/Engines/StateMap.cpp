// 표준 라이브러리
#include <utility>

// 파일 헤더
#include "Engines/StateMap.hpp"

namespace rolling_stdev::engine {

EntityState& StateMap::GetOrCreate(const string& entity_id,
                                   const size_t window_size) {
  if (const auto it = entity_states_.find(entity_id);
      it != entity_states_.end()) {
    return it->second;
  }

  return entity_states_.emplace(entity_id, EntityState(window_size))
      .first->second;
}

void StateMap::Insert(const string& entity_id, EntityState entity_state) {
  entity_states_.insert_or_assign(entity_id, move(entity_state));
}

const EntityState* StateMap::Find(const string& entity_id) const {
  const auto it = entity_states_.find(entity_id);
  return it == entity_states_.end() ? nullptr : &it->second;
}

size_t StateMap::Size() const { return entity_states_.size(); }
bool StateMap::Empty() const { return entity_states_.empty(); }

StateMap::Container::const_iterator StateMap::begin() const {
  return entity_states_.begin();
}

StateMap::Container::const_iterator StateMap::end() const {
  return entity_states_.end();
}

void StateMap::UpdateHighWaterMark(const int64_t timestamp) {
  if (!high_water_mark_ || timestamp > *high_water_mark_) {
    high_water_mark_ = timestamp;
  }
}

void StateMap::SetHighWaterMark(const optional<int64_t> high_water_mark) {
  high_water_mark_ = high_water_mark;
}

optional<int64_t> StateMap::GetHighWaterMark() const {
  return high_water_mark_;
}

}  // namespace rolling_stdev::engine
