#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#include <sys/stat.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

// 표준 라이브러리
#include <cerrno>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>
#include <vector>

// 외부 라이브러리
#include <nlohmann/json.hpp>

// 파일 헤더
#include "Engines/StateStore.hpp"

// 내부 헤더
#include "Engines/DataUtils.hpp"
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"
#include "Engines/TimeUtils.hpp"

// 네임 스페이스
namespace rolling_stdev {
using namespace exception;
using namespace utils;
}  // namespace rolling_stdev

namespace rolling_stdev::engine {

shared_ptr<Logger>& StateStore::logger_ = Logger::GetLogger();

// 저장된 합과 재계산한 합이 같다고 볼 상대 오차
static constexpr double kSumTolerance = 1e-6;

static json OptionalToJson(const optional<double>& value) {
  return value ? json(*value) : json(nullptr);
}

StateMap StateStore::Load(const string& state_path, const size_t window_size) {
  if (const string& temp_path = GetTempPath(state_path);
      filesystem::exists(temp_path)) {
    logger_->Log(WARN_L,
                 "이전 저장에서 남은 임시 파일 [" + temp_path +
                     "]이(가) 존재합니다. 무시하고 원본 파일을 사용합니다.",
                 __FILE__, __LINE__, true);
  }

  if (!filesystem::exists(state_path)) {
    logger_->Log(INFO_L,
                 "상태 파일 [" + state_path +
                     "]이(가) 존재하지 않아 빈 상태로 시작합니다.",
                 __FILE__, __LINE__, true);
    return {};
  }

  ifstream file(state_path);
  if (!file.is_open()) {
    ThrowCorrupted("상태 파일 [" + state_path + "]을(를) 열 수 없습니다.",
                   __LINE__);
  }

  json state_json;
  try {
    state_json = json::parse(file);
  } catch (const json::parse_error& e) {
    ThrowCorrupted("상태 파일 [" + state_path +
                       "]이(가) 유효한 Json이 아닙니다: " + e.what(),
                   __LINE__);
  }

  StateMap state_map = FromJson(state_json, window_size);

  const auto& high_water_mark = state_map.GetHighWaterMark();
  logger_->Log(INFO_L,
               "상태 파일 [" + state_path + "]에서 엔티티 " +
                   to_string(state_map.Size()) +
                   "개를 로드했습니다. 하이 워터 마크: " +
                   (high_water_mark
                        ? UtcTimestampToUtcDatetime(*high_water_mark)
                        : string("없음")),
               __FILE__, __LINE__, true);

  return state_map;
}

void StateStore::Save(const string& state_path, const StateMap& state_map,
                      const size_t window_size) {
  const string& temp_path = GetTempPath(state_path);
  const string& serialized = ToJson(state_map, window_size).dump(2);

  try {
    if (const auto& parent = filesystem::path(state_path).parent_path();
        !parent.empty() && !filesystem::exists(parent)) {
      filesystem::create_directories(parent);
    }
  } catch (const filesystem::filesystem_error& e) {
    ThrowWriteFailed("상태 파일 폴더를 생성할 수 없습니다: " +
                         string(e.what()),
                     __LINE__);
  }

  WriteFileDurably(temp_path, serialized);

  // 같은 파일 시스템 내 이름 변경은 원자적
  error_code ec;
  filesystem::rename(temp_path, state_path, ec);
  if (ec) {
    error_code remove_ec;
    filesystem::remove(temp_path, remove_ec);

    ThrowWriteFailed("임시 상태 파일을 [" + state_path +
                         "](으)로 이동할 수 없습니다: " + ec.message(),
                     __LINE__);
  }

  // 이름 변경 자체가 디스크에 남도록 폴더 엔트리도 동기화
  const auto& parent = filesystem::path(state_path).parent_path();
  SyncDirectory(parent.empty() ? "." : parent.string());

  logger_->Log(INFO_L,
               "상태 파일 [" + state_path + "]에 엔티티 " +
                   to_string(state_map.Size()) + "개를 저장했습니다.",
               __FILE__, __LINE__, true);
}

json StateStore::ToJson(const StateMap& state_map, const size_t window_size) {
  json entities = json::object();

  for (const auto& [entity_id, entity_state] : state_map) {
    json windows = json::object();

    for (const Field field : kFields) {
      const Window& window = entity_state.GetWindow(field);

      windows[FieldToString(field)] = {
          {"values", window.GetValues()},
          {"sum", window.GetSum()},
          {"sum_sq", window.GetSumSq()},
          {"last_stdev", OptionalToJson(entity_state.GetLastStdev(field))}};
    }

    const auto& last_timestamp = entity_state.GetLastTimestamp();
    entities[entity_id] = {
        {"last_timestamp",
         last_timestamp ? json(*last_timestamp) : json(nullptr)},
        {"windows", windows}};
  }

  const auto& high_water_mark = state_map.GetHighWaterMark();

  return {{"format", kFormatTag},
          {"version", kFormatVersion},
          {"window_size", window_size},
          {"entity_count", state_map.Size()},
          {"high_water_mark",
           high_water_mark ? json(*high_water_mark) : json(nullptr)},
          {"entities", entities}};
}

StateMap StateStore::FromJson(const json& state_json,
                              const size_t window_size) {
  StateMap state_map;

  try {
    if (!state_json.is_object()) {
      ThrowCorrupted("상태 파일의 최상위 구조가 객체가 아닙니다.", __LINE__);
    }

    if (!state_json.contains("format") ||
        state_json.at("format") != kFormatTag) {
      ThrowCorrupted("상태 파일의 포맷 태그가 [" + string(kFormatTag) +
                         "]이(가) 아닙니다.",
                     __LINE__);
    }

    if (const auto version = state_json.at("version").get<int>();
        version != kFormatVersion) {
      ThrowCorrupted("지원하지 않는 상태 파일 버전 " + to_string(version) +
                         "입니다.",
                     __LINE__);
    }

    if (const auto stored_window_size =
            state_json.at("window_size").get<size_t>();
        stored_window_size != window_size) {
      ThrowCorrupted("상태 파일의 윈도우 크기 " +
                         to_string(stored_window_size) +
                         "이(가) 설정된 윈도우 크기 " +
                         to_string(window_size) + "와(과) 다릅니다.",
                     __LINE__);
    }

    const json& entities = state_json.at("entities");
    if (!entities.is_object()) {
      ThrowCorrupted("상태 파일의 entities가 객체가 아닙니다.", __LINE__);
    }

    if (const auto entity_count = state_json.at("entity_count").get<size_t>();
        entity_count != entities.size()) {
      ThrowCorrupted("상태 파일의 엔티티 수 " + to_string(entity_count) +
                         "이(가) 실제 엔티티 수 " +
                         to_string(entities.size()) + "와(과) 다릅니다.",
                     __LINE__);
    }

    const json& high_water_mark_json = state_json.at("high_water_mark");
    optional<int64_t> high_water_mark;
    if (!high_water_mark_json.is_null()) {
      high_water_mark = high_water_mark_json.get<int64_t>();
    }

    for (const auto& [entity_id, entity_json] : entities.items()) {
      EntityState entity_state =
          EntityFromJson(entity_id, entity_json, window_size);

      if (const auto& last_timestamp = entity_state.GetLastTimestamp();
          last_timestamp &&
          (!high_water_mark || *last_timestamp > *high_water_mark)) {
        ThrowCorrupted("엔티티 [" + entity_id +
                           "]의 마지막 타임스탬프가 하이 워터 마크보다 "
                           "최신입니다.",
                       __LINE__);
      }

      state_map.Insert(entity_id, move(entity_state));
    }

    state_map.SetHighWaterMark(high_water_mark);
  } catch (const json::exception& e) {
    ThrowCorrupted("상태 파일 구조가 유효하지 않습니다: " + string(e.what()),
                   __LINE__);
  }

  return state_map;
}

string StateStore::GetTempPath(const string& state_path) {
  return state_path + ".tmp";
}

void StateStore::ThrowCorrupted(const string& message, const int line) {
  logger_->Log(ERROR_L, message, __FILE__, line, true);
  throw StateCorrupted(message);
}

void StateStore::ThrowWriteFailed(const string& message, const int line) {
  logger_->Log(ERROR_L, message, __FILE__, line, true);
  throw StateWriteFailed(message);
}

// 직전 시스템 호출의 errno를 메시지로 변환
static string LastErrorMessage() {
  return error_code(errno, generic_category()).message();
}

void StateStore::WriteFileDurably(const string& file_path,
                                  const string& content) {
#ifdef _WIN32
  const int fd = _open(file_path.c_str(),
                       _O_WRONLY | _O_CREAT | _O_TRUNC | _O_BINARY,
                       _S_IREAD | _S_IWRITE);
#else
  const int fd =
      open(file_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
#endif
  if (fd < 0) {
    ThrowWriteFailed("임시 상태 파일 [" + file_path +
                         "]을(를) 열 수 없습니다: " + LastErrorMessage(),
                     __LINE__);
  }

  string error;
  size_t written = 0;

  while (error.empty() && written < content.size()) {
#ifdef _WIN32
    const auto result =
        _write(fd, content.data() + written,
               static_cast<unsigned int>(content.size() - written));
#else
    const auto result =
        write(fd, content.data() + written, content.size() - written);
#endif
    if (result < 0) {
      if (errno != EINTR) {
        error = "쓰기 실패: " + LastErrorMessage();
      }
    } else {
      written += static_cast<size_t>(result);
    }
  }

  // 이름 변경 전에 내용이 디스크에 기록되어야 함
#ifdef _WIN32
  if (error.empty() && _commit(fd) != 0) {
#else
  if (error.empty() && fsync(fd) != 0) {
#endif
    error = "디스크 동기화 실패: " + LastErrorMessage();
  }

#ifdef _WIN32
  if (_close(fd) != 0 && error.empty()) {
#else
  if (close(fd) != 0 && error.empty()) {
#endif
    error = "닫기 실패: " + LastErrorMessage();
  }

  if (!error.empty()) {
    error_code ec;
    filesystem::remove(file_path, ec);

    ThrowWriteFailed("임시 상태 파일 [" + file_path + "] " + error, __LINE__);
  }
}

void StateStore::SyncDirectory([[maybe_unused]] const string& directory) {
  // Windows는 폴더 핸들의 동기화를 지원하지 않음
#ifndef _WIN32
  const int fd = open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    ThrowWriteFailed("상태 파일 폴더 [" + directory +
                         "]을(를) 열 수 없습니다: " + LastErrorMessage(),
                     __LINE__);
  }

  string error;
  if (fsync(fd) != 0) {
    error = LastErrorMessage();
  }

  if (close(fd) != 0 && error.empty()) {
    error = LastErrorMessage();
  }

  if (!error.empty()) {
    ThrowWriteFailed("상태 파일 폴더 [" + directory +
                         "]을(를) 디스크에 동기화할 수 없습니다: " + error,
                     __LINE__);
  }
#endif
}

EntityState StateStore::EntityFromJson(const string& entity_id,
                                       const json& entity_json,
                                       const size_t window_size) {
  const json& last_timestamp_json = entity_json.at("last_timestamp");
  optional<int64_t> last_timestamp;
  if (!last_timestamp_json.is_null()) {
    last_timestamp = last_timestamp_json.get<int64_t>();
  }

  const json& windows_json = entity_json.at("windows");

  // Window는 기본 생성자가 없으므로 빈 윈도우로 채운 후 교체
  array windows = {Window(window_size), Window(window_size),
                   Window(window_size)};
  array<optional<double>, kNumFields> last_stdevs;

  for (const Field field : kFields) {
    const string& field_name = FieldToString(field);
    const json& window_json = windows_json.at(field_name);
    const auto idx = static_cast<size_t>(field);

    const json& values_json = window_json.at("values");
    if (!values_json.is_array()) {
      ThrowCorrupted("엔티티 [" + entity_id + "]의 [" + field_name +
                         "] 윈도우 값이 배열이 아닙니다.",
                     __LINE__);
    }

    const auto& values = values_json.get<vector<double>>();
    if (values.size() > window_size) {
      ThrowCorrupted("엔티티 [" + entity_id + "]의 [" + field_name +
                         "] 윈도우 값 개수 " + to_string(values.size()) +
                         "이(가) 윈도우 크기 " + to_string(window_size) +
                         "을(를) 초과합니다.",
                     __LINE__);
    }

    if (!last_timestamp && !values.empty()) {
      ThrowCorrupted("엔티티 [" + entity_id +
                         "]의 마지막 타임스탬프가 없지만 [" + field_name +
                         "] 윈도우에 값이 존재합니다.",
                     __LINE__);
    }

    for (const double value : values) {
      if (!isfinite(value)) {
        ThrowCorrupted("엔티티 [" + entity_id + "]의 [" + field_name +
                           "] 윈도우에 유한하지 않은 값이 존재합니다.",
                       __LINE__);
      }
    }

    windows[idx] = Window::Restore(window_size, values);

    if (!IsNearlyEqual(window_json.at("sum").get<double>(),
                       windows[idx].GetSum(), kSumTolerance) ||
        !IsNearlyEqual(window_json.at("sum_sq").get<double>(),
                       windows[idx].GetSumSq(), kSumTolerance)) {
      ThrowCorrupted("엔티티 [" + entity_id + "]의 [" + field_name +
                         "] 윈도우에 저장된 합이 값들로부터 계산한 합과 "
                         "다릅니다.",
                     __LINE__);
    }

    if (const json& last_stdev_json = window_json.at("last_stdev");
        !last_stdev_json.is_null()) {
      last_stdevs[idx] = last_stdev_json.get<double>();
    }
  }

  return {move(windows), last_timestamp, last_stdevs};
}

}  // namespace rolling_stdev::engine
