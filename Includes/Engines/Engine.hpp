#pragma once

// 표준 라이브러리
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

// 내부 헤더
#include "Engines/Config.hpp"
#include "Engines/Snapshot.hpp"
#include "Engines/StateMap.hpp"

// 전방 선언
namespace rolling_stdev::logger {
class Logger;
}

namespace rolling_stdev::snapshot {
class SnapshotSource;
}

// 네임 스페이스
using namespace std;
namespace rolling_stdev {
using namespace logger;
using namespace snapshot;
}  // namespace rolling_stdev

namespace rolling_stdev::engine {

class Engine;

/// 한 배치의 처리 통계를 지정하는 구조체
struct BatchCounters {
  size_t processed = 0;             // 상태에 적용된 스냅샷 수
  size_t skipped_out_of_range = 0;  // 시간 범위 밖이라 건너뛴 스냅샷 수
  size_t skipped_already_seen = 0;  // 이미 처리한 시점이라 건너뛴 스냅샷 수
  size_t gap_resets = 0;            // 시간 갭으로 윈도우가 초기화된 횟수
  size_t results_emitted = 0;       // 내보낸 결과 레코드 수
};

/**
 * Engine::Process가 반환하는 지연 평가 결과 스트림
 *
 * Next 호출 시마다 소스에서 결과를 낼 때까지 스냅샷을 읽어 적용하므로
 * 입력 순서가 그대로 유지됨. 소스가 소진되면 배치 통계를 로깅함.\n
 * 엔진과 소스는 스트림보다 오래 살아있어야 하며 임시 엔진에서는 스트림을
 * 만들 수 없음. 스트림 생성 후 엔진의 StateMap을 꺼내면 이후 Next 호출은
 * 에러를 던짐.
 */
class ResultStream final {
 public:
  ResultStream(Engine& engine, SnapshotSource& source, int64_t start,
               int64_t end);

  /// 다음 결과 레코드를 반환하는 함수. 소스가 소진되면 nullopt를 반환.
  [[nodiscard]] optional<ResultRecord> Next();

  /// 남은 결과 레코드를 모두 읽어 반환하는 함수
  [[nodiscard]] vector<ResultRecord> Collect();

  [[nodiscard]] const BatchCounters& GetCounters() const;
  [[nodiscard]] bool IsExhausted() const;

 private:
  static shared_ptr<Logger>& logger_;

  Engine* engine_;
  SnapshotSource* source_;
  int64_t start_;
  int64_t end_;

  BatchCounters counters_;
  bool exhausted_;
  int64_t started_at_;        // 스트림 생성 시각 (UTC 밀리초)
  size_t state_generation_;  // 스트림 생성 시점의 엔진 상태 세대

  void LogSummary() const;
};

/**
 * 엔티티별 bid, mid, ask 롤링 모표준편차를 계산하는 엔진 클래스
 *
 * 엔진이 StateMap을 소유하며 배치 종료 후 ReleaseStateMap으로 꺼내어
 * 저장함.
 */
class Engine final {
 public:
  /**
   * @param config 엔진 설정. 생성 시 유효성을 검사하여 유효하지 않으면
   *               InvalidValue를 던짐.
   * @param state_map 이전 배치에서 저장된 상태. 콜드 스타트면 빈 상태.
   */
  explicit Engine(const Config& config, StateMap state_map = {});

  /**
   * 스냅샷 소스를 처리하는 결과 스트림을 반환하는 함수
   *
   * 타임스탬프가 [start, end] 범위 안인 스냅샷만 적용하며 범위 밖이거나
   * 엔티티의 마지막 타임스탬프 이하인 스냅샷은 건너뜀.
   * @param source 엔티티별로 타임스탬프가 순증가하는 스냅샷 소스
   * @param start 처리 범위 시작 타임스탬프 (포함)
   * @param end 처리 범위 끝 타임스탬프 (포함)
   */
  [[nodiscard]] ResultStream Process(SnapshotSource& source, int64_t start,
                                     int64_t end) &;

  /// 스트림이 소멸된 엔진을 가리키지 않도록 임시 엔진에서는 호출 불가
  ResultStream Process(SnapshotSource& source, int64_t start,
                       int64_t end) && = delete;

  /**
   * 스냅샷 하나를 처리하는 함수
   *
   * @return 하나 이상의 필드가 표준 편차를 가지면 결과 레코드, 아니면 nullopt
   */
  [[nodiscard]] optional<ResultRecord> ProcessSnapshot(
      const Snapshot& snapshot, int64_t start, int64_t end,
      BatchCounters& counters);

  [[nodiscard]] const StateMap& GetStateMap() const;

  /// 엔진이 보유한 StateMap을 꺼내는 함수. 이후 엔진 상태는 비게 됨.
  [[nodiscard]] StateMap ReleaseStateMap();

  [[nodiscard]] const Config& GetConfig() const;

  /// ReleaseStateMap 호출마다 증가하는 상태 세대를 반환하는 함수
  [[nodiscard]] size_t GetStateGeneration() const;

 private:
  static shared_ptr<Logger>& logger_;

  Config config_;
  StateMap state_map_;
  size_t state_generation_;
};

}  // namespace rolling_stdev::engine
