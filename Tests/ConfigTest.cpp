// 표준 라이브러리
#include <fstream>
#include <limits>

// 내부 헤더
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"
#include "Engines/TimeUtils.hpp"

// 파일 헤더
#include "ConfigTest.hpp"

using namespace rolling_stdev::exception;
using namespace rolling_stdev::logger;
using namespace rolling_stdev::utils;

void ConfigTest::SetUp() {
  test_directory = filesystem::temp_directory_path() / "rolling_stdev_config_test";
  filesystem::remove_all(test_directory);
  filesystem::create_directories(test_directory);

  Logger::SetLogDirectory((test_directory / "logs").string());
}

void ConfigTest::TearDown() { filesystem::remove_all(test_directory); }

TEST_F(ConfigTest, DefaultsAreValid) {
  const Config config;

  EXPECT_EQ(config.GetWindowSize(), 20u);
  EXPECT_EQ(config.GetCadence(), kHour);
  EXPECT_EQ(config.GetGapTolerance(), 0);
  EXPECT_EQ(config.GetMinPeriods(), 1u);
  EXPECT_EQ(config.GetMissingValuePolicy(), MissingValuePolicy::CARRY_FORWARD);
  EXPECT_DOUBLE_EQ(config.GetMaxAbsValue(), 1e12);
  EXPECT_NO_THROW(config.Validate());
}

TEST_F(ConfigTest, InvalidValuesAreRejected) {
  EXPECT_THROW(Config().SetWindowSize(0).Validate(), InvalidValue);
  EXPECT_THROW(Config().SetCadence(int64_t{0}).Validate(), InvalidValue);
  EXPECT_THROW(Config().SetGapTolerance(-1).Validate(), InvalidValue);
  EXPECT_THROW(Config().SetMinPeriods(0).Validate(), InvalidValue);
  EXPECT_THROW(Config().SetWindowSize(3).SetMinPeriods(4).Validate(),
               InvalidValue);
  EXPECT_THROW(Config().SetMaxAbsValue(0).Validate(), InvalidValue);
  EXPECT_THROW(
      Config().SetMaxAbsValue(numeric_limits<double>::infinity()).Validate(),
      InvalidValue);
}

TEST_F(ConfigTest, FromJsonReadsAllKeys) {
  const json config_json = {{"windowSize", 10},
                            {"cadence", "30m"},
                            {"gapTolerance", "5m"},
                            {"minPeriods", 3},
                            {"missingValuePolicy", "EMIT_NONE"},
                            {"maxAbsValue", "1e9"},
                            {"statePath", "state/stdev.json"},
                            {"logDirectory", (test_directory / "logs").string()}};

  const Config& config = Config::FromJson(config_json);

  EXPECT_EQ(config.GetWindowSize(), 10u);
  EXPECT_EQ(config.GetCadence(), 30 * kMinute);
  EXPECT_EQ(config.GetGapTolerance(), 5 * kMinute);
  EXPECT_EQ(config.GetMinPeriods(), 3u);
  EXPECT_EQ(config.GetMissingValuePolicy(), MissingValuePolicy::EMIT_NONE);
  EXPECT_DOUBLE_EQ(config.GetMaxAbsValue(), 1e9);
  EXPECT_EQ(config.GetStatePath(), "state/stdev.json");
  EXPECT_EQ(config.GetLogDirectory(), (test_directory / "logs").string());
}

TEST_F(ConfigTest, FromJsonKeepsDefaultsForMissingKeys) {
  const Config& config = Config::FromJson(json{{"windowSize", 5}});

  EXPECT_EQ(config.GetWindowSize(), 5u);
  EXPECT_EQ(config.GetCadence(), kHour);
  EXPECT_EQ(config.GetMissingValuePolicy(), MissingValuePolicy::CARRY_FORWARD);
}

TEST_F(ConfigTest, FromJsonRejectsBadValues) {
  EXPECT_THROW(static_cast<void>(Config::FromJson(json{{"windowSize", -3}})),
               InvalidValue);
  EXPECT_THROW(static_cast<void>(Config::FromJson(json{{"windowSize", 2.5}})),
               InvalidValue);
  EXPECT_THROW(static_cast<void>(Config::FromJson(json{{"cadence", 3600}})),
               InvalidValue);
  EXPECT_THROW(static_cast<void>(Config::FromJson(json{{"cadence", "1y"}})),
               InvalidValue);
  EXPECT_THROW(static_cast<void>(
                   Config::FromJson(json{{"missingValuePolicy", "DROP"}})),
               InvalidValue);
  EXPECT_THROW(static_cast<void>(Config::FromJson(
                   json{{"windowSize", 2}, {"minPeriods", 5}})),
               InvalidValue);
}

TEST_F(ConfigTest, FromFileReadsJsonFile) {
  const auto& config_path = test_directory / "config.json";
  ofstream(config_path) << R"({"windowSize": 7, "cadence": "1d"})";

  const Config& config = Config::FromFile(config_path.string());

  EXPECT_EQ(config.GetWindowSize(), 7u);
  EXPECT_EQ(config.GetCadence(), kDay);
}

TEST_F(ConfigTest, FromFileRejectsMissingOrBrokenFile) {
  EXPECT_THROW(static_cast<void>(Config::FromFile(
                   (test_directory / "missing.json").string())),
               InvalidValue);

  const auto& config_path = test_directory / "broken.json";
  ofstream(config_path) << "{ windowSize: ";

  EXPECT_THROW(static_cast<void>(Config::FromFile(config_path.string())),
               InvalidValue);
}

TEST_F(ConfigTest, MissingValuePolicyStringConversion) {
  for (const auto policy :
       {MissingValuePolicy::CARRY_FORWARD, MissingValuePolicy::EMIT_NONE,
        MissingValuePolicy::RESET_WINDOW}) {
    EXPECT_EQ(ParseMissingValuePolicy(MissingValuePolicyToString(policy)),
              policy);
  }

  EXPECT_THROW(static_cast<void>(ParseMissingValuePolicy("carry_forward")),
               InvalidValue);
}
