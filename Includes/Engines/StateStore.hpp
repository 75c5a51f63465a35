#pragma once

// 표준 라이브러리
#include <memory>
#include <string>

// 외부 라이브러리
#include <nlohmann/json_fwd.hpp>

// 내부 헤더
#include "Engines/StateMap.hpp"

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

/**
 * StateMap을 Json 파일로 저장하고 로드하는 클래스
 *
 * 저장은 임시 파일에 쓰고 fsync한 후 원래 경로로 이름을 바꾸고 폴더를
 * fsync하는 방식으로 수행되어 실패나 시스템 중단 시에도 이전 상태 파일 또는
 * 새 상태 파일 중 하나가 온전히 남음.
 */
class StateStore final {
 public:
  StateStore() = delete;

  /// 상태 파일 포맷 태그
  static constexpr const char* kFormatTag = "rolling_stdev_state";

  /// 상태 파일 포맷 버전
  static constexpr int kFormatVersion = 1;

  /**
   * 상태 파일을 로드하여 StateMap을 반환하는 함수
   *
   * 파일이 없으면 빈 StateMap을 반환함 (콜드 스타트).
   * 파일이 존재하지만 읽을 수 없거나 구조적으로 유효하지 않으면
   * StateCorrupted를 던짐.
   * @param state_path 상태 파일 경로
   * @param window_size 현재 설정된 윈도우 크기. 파일의 크기와 달라도
   *                    StateCorrupted.
   */
  [[nodiscard]] static StateMap Load(const string& state_path,
                                     size_t window_size);

  /**
   * StateMap을 상태 파일에 원자적으로 저장하는 함수
   *
   * 실패 시 StateWriteFailed를 던지며 이전 파일은 변경되지 않음.
   */
  static void Save(const string& state_path, const StateMap& state_map,
                   size_t window_size);

  /// StateMap을 상태 파일 Json 구조로 변환하는 함수
  [[nodiscard]] static json ToJson(const StateMap& state_map,
                                   size_t window_size);

  /// 상태 파일 Json 구조를 검증하고 StateMap으로 변환하는 함수
  [[nodiscard]] static StateMap FromJson(const json& state_json,
                                         size_t window_size);

  /// 저장 시 사용하는 임시 파일 경로를 반환하는 함수
  [[nodiscard]] static string GetTempPath(const string& state_path);

 private:
  static shared_ptr<Logger>& logger_;

  /// 에러를 로깅하고 StateCorrupted를 던지는 함수
  [[noreturn]] static void ThrowCorrupted(const string& message, int line);

  /// 에러를 로깅하고 StateWriteFailed를 던지는 함수
  [[noreturn]] static void ThrowWriteFailed(const string& message, int line);

  /**
   * 파일 디스크립터로 내용을 쓰고 fsync한 후 닫는 함수
   *
   * 실패하면 파일을 지우고 StateWriteFailed를 던짐.
   */
  static void WriteFileDurably(const string& file_path, const string& content);

  /// 이름 변경이 디스크에 반영되도록 폴더를 fsync하는 함수
  static void SyncDirectory(const string& directory);

  /// 한 엔티티의 Json 구조를 검증하고 EntityState로 변환하는 함수
  [[nodiscard]] static EntityState EntityFromJson(const string& entity_id,
                                                  const json& entity_json,
                                                  size_t window_size);
};

}  // namespace rolling_stdev::engine
