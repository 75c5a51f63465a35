#pragma once
// 표준 라이브러리
#include <optional>
#include <string>

// 외부 라이브러리
#include <gtest/gtest.h>

// 내부 헤더
#include "Engines/Config.hpp"
#include "Engines/EntityState.hpp"

using namespace std;
using namespace rolling_stdev::engine;
using namespace rolling_stdev::indicator;
using namespace rolling_stdev::snapshot;

class EntityStateTest : public testing::Test {
 public:
  Config config;

  /// hour 시점에 주어진 값을 가진 스냅샷을 생성하는 함수
  static Snapshot MakeSnapshot(int64_t hour, optional<double> bid,
                               optional<double> mid, optional<double> ask);

  /// 세 필드가 모두 value인 스냅샷을 생성하는 함수
  static Snapshot MakeSnapshot(int64_t hour, double value);

 protected:
  void SetUp() override;
};
