// 표준 라이브러리
#include <fstream>

// 내부 헤더
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"
#include "Engines/TimeUtils.hpp"

// 파일 헤더
#include "StateStoreTest.hpp"

using namespace rolling_stdev::exception;
using namespace rolling_stdev::logger;
using namespace rolling_stdev::utils;

// 2024-01-01 00:00:00 UTC
constexpr int64_t kBaseTimestamp = 1704067200000;

StateMap StateStoreTest::MakeStateMap() const {
  StateMap state_map;

  for (int64_t hour = 0; hour < 5; hour++) {
    const int64_t timestamp = kBaseTimestamp + hour * kHour;
    const auto value = static_cast<double>(hour);

    auto& aapl = state_map.GetOrCreate("AAPL", config.GetWindowSize());
    static_cast<void>(aapl.Apply(
        {"AAPL", timestamp, 100.0 + value, 100.5 + value, 101.0 + value},
        config));

    // MSFT는 mid가 비어 있음
    auto& msft = state_map.GetOrCreate("MSFT", config.GetWindowSize());
    static_cast<void>(msft.Apply(
        {"MSFT", timestamp, 300.0 - value, nullopt, 301.0 - value}, config));

    state_map.UpdateHighWaterMark(timestamp);
  }

  return state_map;
}

void StateStoreTest::WriteStateFile(const string& content) const {
  ofstream file(state_path);
  file << content;
}

void StateStoreTest::SetUp() {
  test_directory = filesystem::temp_directory_path() /
                   ("rolling_stdev_state_test_" +
                    string(testing::UnitTest::GetInstance()
                               ->current_test_info()
                               ->name()));
  filesystem::remove_all(test_directory);
  filesystem::create_directories(test_directory);

  Logger::SetLogDirectory((test_directory / "logs").string());

  state_path = (test_directory / "state" / "state.json").string();
  config = Config().SetWindowSize(3);
}

void StateStoreTest::TearDown() { filesystem::remove_all(test_directory); }

TEST_F(StateStoreTest, MissingFileIsColdStart) {
  const auto& state_map = StateStore::Load(state_path, config.GetWindowSize());

  EXPECT_TRUE(state_map.Empty());
  EXPECT_FALSE(state_map.GetHighWaterMark().has_value());
}

TEST_F(StateStoreTest, SaveThenLoadRestoresState) {
  const StateMap& saved = MakeStateMap();
  StateStore::Save(state_path, saved, config.GetWindowSize());

  const StateMap& loaded = StateStore::Load(state_path, config.GetWindowSize());

  ASSERT_EQ(loaded.Size(), 2u);
  EXPECT_EQ(loaded.GetHighWaterMark(), saved.GetHighWaterMark());

  for (const auto& [entity_id, saved_state] : saved) {
    const EntityState* loaded_state = loaded.Find(entity_id);
    ASSERT_NE(loaded_state, nullptr) << entity_id;

    EXPECT_EQ(loaded_state->GetLastTimestamp(),
              saved_state.GetLastTimestamp());

    for (const Field field : kFields) {
      EXPECT_EQ(loaded_state->GetWindow(field).GetValues(),
                saved_state.GetWindow(field).GetValues())
          << entity_id << " " << FieldToString(field);
      EXPECT_EQ(loaded_state->GetLastStdev(field),
                saved_state.GetLastStdev(field))
          << entity_id << " " << FieldToString(field);
    }
  }

  EXPECT_TRUE(loaded.Find("MSFT")->GetWindow(MID).IsEmpty());
  EXPECT_EQ(loaded.Find("AAPL")->GetWindow(BID).GetValues(),
            (vector{102.0, 103.0, 104.0}));
}

TEST_F(StateStoreTest, LevelShiftStateReloadsWithoutCorruption) {
  config = Config().SetWindowSize(20);

  StateMap state_map;
  auto& entity_state = state_map.GetOrCreate("SHIFT", config.GetWindowSize());

  for (int64_t hour = 0; hour < 40; hour++) {
    const auto x = static_cast<double>(hour);
    const double value = hour < 20 ? 9.99e11 + 0.37 * x * x
                                   : 1.0 + 0.01 * static_cast<double>(hour - 20);

    static_cast<void>(entity_state.Apply(
        {"SHIFT", kBaseTimestamp + hour * kHour, value, value, value}, config));
    state_map.UpdateHighWaterMark(kBaseTimestamp + hour * kHour);
  }

  StateStore::Save(state_path, state_map, config.GetWindowSize());

  StateMap loaded;
  ASSERT_NO_THROW(loaded = StateStore::Load(state_path, config.GetWindowSize()));

  const EntityState* loaded_state = loaded.Find("SHIFT");
  ASSERT_NE(loaded_state, nullptr);

  for (const Field field : kFields) {
    const auto& expected = entity_state.GetWindow(field).Stdev();
    const auto& actual = loaded_state->GetWindow(field).Stdev();

    ASSERT_TRUE(actual.has_value());
    EXPECT_NEAR(*actual, *expected, 1e-9) << FieldToString(field);
    EXPECT_NEAR(*actual, 0.0576628129734, 1e-9) << FieldToString(field);
  }
}

TEST_F(StateStoreTest, SavedFileHoldsSerializedState) {
  const StateMap& state_map = MakeStateMap();
  StateStore::Save(state_path, state_map, config.GetWindowSize());

  ifstream file(state_path);
  ASSERT_TRUE(file.is_open());

  EXPECT_EQ(json::parse(file),
            StateStore::ToJson(state_map, config.GetWindowSize()));
}

TEST_F(StateStoreTest, SaveLeavesNoTempFile) {
  StateStore::Save(state_path, MakeStateMap(), config.GetWindowSize());

  EXPECT_TRUE(filesystem::exists(state_path));
  EXPECT_FALSE(filesystem::exists(StateStore::GetTempPath(state_path)));
}

TEST_F(StateStoreTest, SaveReplacesPreviousFile) {
  StateStore::Save(state_path, StateMap(), config.GetWindowSize());
  StateStore::Save(state_path, MakeStateMap(), config.GetWindowSize());

  EXPECT_EQ(StateStore::Load(state_path, config.GetWindowSize()).Size(), 2u);
}

TEST_F(StateStoreTest, StaleTempFileIsIgnored) {
  StateStore::Save(state_path, MakeStateMap(), config.GetWindowSize());

  ofstream(StateStore::GetTempPath(state_path)) << "{ partial";

  EXPECT_EQ(StateStore::Load(state_path, config.GetWindowSize()).Size(), 2u);
}

TEST_F(StateStoreTest, InvalidJsonIsCorrupted) {
  filesystem::create_directories(filesystem::path(state_path).parent_path());
  WriteStateFile("{ \"format\": ");

  EXPECT_THROW(
      static_cast<void>(StateStore::Load(state_path, config.GetWindowSize())),
      StateCorrupted);
}

TEST_F(StateStoreTest, WrongFormatTagIsCorrupted) {
  json state_json = StateStore::ToJson(MakeStateMap(), config.GetWindowSize());
  state_json["format"] = "something_else";

  EXPECT_THROW(static_cast<void>(
                   StateStore::FromJson(state_json, config.GetWindowSize())),
               StateCorrupted);
}

TEST_F(StateStoreTest, WrongVersionIsCorrupted) {
  json state_json = StateStore::ToJson(MakeStateMap(), config.GetWindowSize());
  state_json["version"] = StateStore::kFormatVersion + 1;

  EXPECT_THROW(static_cast<void>(
                   StateStore::FromJson(state_json, config.GetWindowSize())),
               StateCorrupted);
}

TEST_F(StateStoreTest, WindowSizeMismatchIsCorrupted) {
  StateStore::Save(state_path, MakeStateMap(), config.GetWindowSize());

  EXPECT_THROW(static_cast<void>(StateStore::Load(state_path, 5)),
               StateCorrupted);
}

TEST_F(StateStoreTest, SumMismatchIsCorrupted) {
  json state_json = StateStore::ToJson(MakeStateMap(), config.GetWindowSize());
  state_json["entities"]["AAPL"]["windows"]["bid"]["sum"] = 1.0;

  EXPECT_THROW(static_cast<void>(
                   StateStore::FromJson(state_json, config.GetWindowSize())),
               StateCorrupted);
}

TEST_F(StateStoreTest, TooManyValuesIsCorrupted) {
  json state_json = StateStore::ToJson(MakeStateMap(), config.GetWindowSize());

  json& bid = state_json["entities"]["AAPL"]["windows"]["bid"];
  bid["values"] = {1.0, 2.0, 3.0, 4.0};
  bid["sum"] = 10.0;
  bid["sum_sq"] = 30.0;

  EXPECT_THROW(static_cast<void>(
                   StateStore::FromJson(state_json, config.GetWindowSize())),
               StateCorrupted);
}

TEST_F(StateStoreTest, EntityCountMismatchIsCorrupted) {
  json state_json = StateStore::ToJson(MakeStateMap(), config.GetWindowSize());
  state_json["entity_count"] = 3;

  EXPECT_THROW(static_cast<void>(
                   StateStore::FromJson(state_json, config.GetWindowSize())),
               StateCorrupted);
}

TEST_F(StateStoreTest, MissingKeyIsCorrupted) {
  json state_json = StateStore::ToJson(MakeStateMap(), config.GetWindowSize());
  state_json["entities"]["MSFT"].erase("windows");

  EXPECT_THROW(static_cast<void>(
                   StateStore::FromJson(state_json, config.GetWindowSize())),
               StateCorrupted);
}

TEST_F(StateStoreTest, HighWaterMarkBeforeEntityIsCorrupted) {
  json state_json = StateStore::ToJson(MakeStateMap(), config.GetWindowSize());
  state_json["high_water_mark"] = kBaseTimestamp;

  EXPECT_THROW(static_cast<void>(
                   StateStore::FromJson(state_json, config.GetWindowSize())),
               StateCorrupted);
}

TEST_F(StateStoreTest, FailedRenameRaisesWriteFailed) {
  // 상태 파일 경로를 비어 있지 않은 폴더로 만들어 이름 변경을 실패시킴
  filesystem::create_directories(state_path);
  ofstream(filesystem::path(state_path) / "occupied") << "x";

  EXPECT_THROW(
      StateStore::Save(state_path, MakeStateMap(), config.GetWindowSize()),
      StateWriteFailed);
  EXPECT_FALSE(filesystem::exists(StateStore::GetTempPath(state_path)));
  EXPECT_TRUE(filesystem::is_directory(state_path));
}

TEST_F(StateStoreTest, UncreatableDirectoryRaisesWriteFailed) {
  const auto& blocker = test_directory / "blocker";
  ofstream(blocker) << "x";

  EXPECT_THROW(StateStore::Save((blocker / "state.json").string(),
                                MakeStateMap(), config.GetWindowSize()),
               StateWriteFailed);
}

TEST_F(StateStoreTest, UnwritableTempFileKeepsPreviousState) {
  StateStore::Save(state_path, StateMap(), config.GetWindowSize());

  // 임시 파일 경로를 폴더로 막아 쓰기용 열기를 실패시킴
  const auto& temp_path = StateStore::GetTempPath(state_path);
  filesystem::create_directories(temp_path);
  ofstream(filesystem::path(temp_path) / "occupied") << "x";

  EXPECT_THROW(
      StateStore::Save(state_path, MakeStateMap(), config.GetWindowSize()),
      StateWriteFailed);

  EXPECT_TRUE(
      StateStore::Load(state_path, config.GetWindowSize()).Empty());
}
