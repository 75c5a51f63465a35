// 표준 라이브러리
#include <utility>

// 파일 헤더
#include "Engines/Engine.hpp"

// 내부 헤더
#include "Engines/DataUtils.hpp"
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"
#include "Engines/SnapshotSource.hpp"
#include "Engines/TimeUtils.hpp"

// 네임 스페이스
namespace rolling_stdev {
using namespace exception;
using namespace utils;
}  // namespace rolling_stdev

namespace rolling_stdev::engine {

shared_ptr<Logger>& ResultStream::logger_ = Logger::GetLogger();
shared_ptr<Logger>& Engine::logger_ = Logger::GetLogger();

ResultStream::ResultStream(Engine& engine, SnapshotSource& source,
                           const int64_t start, const int64_t end)
    : engine_(&engine),
      source_(&source),
      start_(start),
      end_(end),
      exhausted_(false),
      started_at_(GetCurrentUtcTimestamp()),
      state_generation_(engine.GetStateGeneration()) {}

optional<ResultRecord> ResultStream::Next() {
  if (exhausted_) {
    return nullopt;
  }

  // 꺼내진 상태에 이어서 적용하면 저장된 상태와 어긋남
  if (engine_->GetStateGeneration() != state_generation_) {
    Logger::LogAndThrowError(
        "스트림 처리 중 엔진 상태가 꺼내졌습니다. 새 스트림으로 다시 "
        "처리해야 합니다.",
        __FILE__, __LINE__);
  }

  while (const auto& snapshot = source_->Next()) {
    if (auto result =
            engine_->ProcessSnapshot(*snapshot, start_, end_, counters_)) {
      return result;
    }
  }

  exhausted_ = true;
  LogSummary();

  return nullopt;
}

vector<ResultRecord> ResultStream::Collect() {
  vector<ResultRecord> results;

  while (auto result = Next()) {
    results.push_back(move(*result));
  }

  return results;
}

const BatchCounters& ResultStream::GetCounters() const { return counters_; }
bool ResultStream::IsExhausted() const { return exhausted_; }

void ResultStream::LogSummary() const {
  logger_->Log(INFO_L,
               "배치 처리가 완료되었습니다. | 적용: " +
                   to_string(counters_.processed) +
                   " | 범위 밖: " + to_string(counters_.skipped_out_of_range) +
                   " | 이미 처리됨: " +
                   to_string(counters_.skipped_already_seen) +
                   " | 갭 초기화: " + to_string(counters_.gap_resets) +
                   " | 결과: " + to_string(counters_.results_emitted) +
                   " | 소요 시간: " +
                   FormatTimeDiff(GetCurrentUtcTimestamp() - started_at_),
               __FILE__, __LINE__, true);
}

Engine::Engine(const Config& config, StateMap state_map)
    : config_(config), state_map_(move(state_map)), state_generation_(0) {
  config_.Validate();

  logger_->Log(INFO_L,
               "엔진 초기화가 완료되었습니다. | 윈도우 크기: " +
                   to_string(config_.GetWindowSize()) +
                   " | 기대 간격: " + FormatTimeframe(config_.GetCadence()) +
                   " | 허용 오차: " +
                   FormatTimeframe(config_.GetGapTolerance()) +
                   " | 결측 값 처리: " +
                   MissingValuePolicyToString(
                       config_.GetMissingValuePolicy()) +
                   " | 엔티티: " + to_string(state_map_.Size()),
               __FILE__, __LINE__);
}

ResultStream Engine::Process(SnapshotSource& source, const int64_t start,
                             const int64_t end) & {
  if (start > end) {
    const string& message = "처리 범위 시작 " +
                            UtcTimestampToUtcDatetime(start) +
                            "이(가) 끝 " + UtcTimestampToUtcDatetime(end) +
                            "보다 늦습니다.";
    logger_->Log(ERROR_L, message, __FILE__, __LINE__, true);
    throw InvalidValue(message);
  }

  logger_->Log(INFO_L,
               "배치 처리를 시작합니다. | 범위: " +
                   UtcTimestampToUtcDatetime(start) + " - " +
                   UtcTimestampToUtcDatetime(end),
               __FILE__, __LINE__);

  return {*this, source, start, end};
}

optional<ResultRecord> Engine::ProcessSnapshot(const Snapshot& snapshot,
                                               const int64_t start,
                                               const int64_t end,
                                               BatchCounters& counters) {
  if (snapshot.timestamp < start || snapshot.timestamp > end) {
    counters.skipped_out_of_range++;
    return nullopt;
  }

  EntityState& entity_state =
      state_map_.GetOrCreate(snapshot.entity_id, config_.GetWindowSize());

  // 재실행 시 윈도우에 같은 시점이 두 번 들어가지 않도록 건너뜀
  if (entity_state.IsAlreadySeen(snapshot.timestamp)) {
    counters.skipped_already_seen++;
    return nullopt;
  }

  const auto& outcome = entity_state.Apply(snapshot, config_);
  state_map_.UpdateHighWaterMark(snapshot.timestamp);
  counters.processed++;

  if (outcome.gap_reset) {
    counters.gap_resets++;

    logger_->Log(DEBUG_L,
                 "[" + snapshot.entity_id + "] " +
                     UtcTimestampToUtcDatetime(snapshot.timestamp) +
                     " 시간 갭으로 윈도우를 초기화했습니다. | 경과 시간: " +
                     FormatTimeDiff(*outcome.elapsed),
                 __FILE__, __LINE__);
  }

  if (!outcome.HasAnyStdev()) {
    return nullopt;
  }

  counters.results_emitted++;

  const auto& [bid_stdev, mid_stdev, ask_stdev] = outcome.stdevs;
  logger_->Log(DEBUG_L,
               "[" + snapshot.entity_id + "] " +
                   UtcTimestampToUtcDatetime(snapshot.timestamp) +
                   " | bid: " + FormatStdev(bid_stdev) +
                   " | mid: " + FormatStdev(mid_stdev) +
                   " | ask: " + FormatStdev(ask_stdev),
               __FILE__, __LINE__);

  return ResultRecord(snapshot.entity_id, snapshot.timestamp, bid_stdev,
                      mid_stdev, ask_stdev, outcome.gap_reset);
}

const StateMap& Engine::GetStateMap() const { return state_map_; }

StateMap Engine::ReleaseStateMap() {
  state_generation_++;
  return exchange(state_map_, StateMap());
}

const Config& Engine::GetConfig() const { return config_; }
size_t Engine::GetStateGeneration() const { return state_generation_; }

}  // namespace rolling_stdev::engine
