#pragma once

// 표준 라이브러리
#include <stdexcept>
#include <string>

// 네임 스페이스
using namespace std;

namespace rolling_stdev::exception {

/// 유효하지 않은 값일 때 발생하는 에러
class InvalidValue final : public runtime_error {
 public:
  explicit InvalidValue(const string& message) : runtime_error(message) {}
};

/// 상태 파일이 존재하지만 구조적으로 유효하지 않을 때 발생하는 에러
class StateCorrupted final : public runtime_error {
 public:
  explicit StateCorrupted(const string& message) : runtime_error(message) {}
};

/// 상태 파일 저장에 실패했을 때 발생하는 에러
class StateWriteFailed final : public runtime_error {
 public:
  explicit StateWriteFailed(const string& message) : runtime_error(message) {}
};

}  // namespace rolling_stdev::exception
