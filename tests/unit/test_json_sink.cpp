/**
 * @file test_json_sink.cpp
 * @brief Unit tests for the JSON history sink
 */

#include <clipwatch/json_sink.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace clipwatch;
namespace fs = std::filesystem;

class JsonSinkTest : public ::testing::Test {
protected:
  fs::path test_dir;
  fs::path history_path;

  void SetUp() override {
    test_dir = fs::temp_directory_path() /
               ("clipwatch_test_" +
                std::string(::testing::UnitTest::GetInstance()
                                ->current_test_info()
                                ->name()));
    fs::remove_all(test_dir);
    history_path = test_dir / "nested" / "clipboard.json";
  }

  void TearDown() override { fs::remove_all(test_dir); }

  nlohmann::json read_history() {
    std::ifstream file(history_path);
    return nlohmann::json::parse(file);
  }

  static ClipboardRecord text(const std::string &content,
                              std::optional<std::string> owner = {}) {
    return make_record("UTF8_STRING", content, std::move(owner));
  }
};

TEST_F(JsonSinkTest, FirstAppendCreatesArray) {
  JsonFileSink sink(history_path);

  ASSERT_TRUE(sink.append(text("hello world", std::string("xterm"))).is_ok());

  auto history = read_history();
  ASSERT_TRUE(history.is_array());
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0]["type"].get<std::string>(), "text");
  EXPECT_EQ(history[0]["data"]["content"].get<std::string>(), "hello world");
  EXPECT_EQ(history[0]["data"]["owner"].get<std::string>(), "xterm");
  EXPECT_FALSE(history[0]["data"].contains("url"));
}

TEST_F(JsonSinkTest, AppendKeepsEarlierRecords) {
  JsonFileSink sink(history_path);

  ASSERT_TRUE(sink.append(text("one")).is_ok());
  ASSERT_TRUE(sink.append(text("two")).is_ok());

  auto history = read_history();
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0]["data"]["content"].get<std::string>(), "one");
  EXPECT_EQ(history[1]["data"]["content"].get<std::string>(), "two");
}

TEST_F(JsonSinkTest, HtmlRecordCarriesNullUrl) {
  JsonFileSink sink(history_path);

  ASSERT_TRUE(sink.append(make_record("text/html", "<p>hi</p>", std::nullopt))
                  .is_ok());

  auto history = read_history();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0]["type"].get<std::string>(), "html");
  EXPECT_TRUE(history[0]["data"]["url"].is_null());
  EXPECT_TRUE(history[0]["data"]["owner"].is_null());
}

TEST_F(JsonSinkTest, MalformedHistoryStartsOver) {
  fs::create_directories(history_path.parent_path());
  {
    std::ofstream file(history_path);
    file << "{not json";
  }

  JsonFileSink sink(history_path);
  ASSERT_TRUE(sink.append(text("fresh")).is_ok());

  auto history = read_history();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0]["data"]["content"].get<std::string>(), "fresh");
}

TEST_F(JsonSinkTest, NonArrayHistoryStartsOver) {
  fs::create_directories(history_path.parent_path());
  {
    std::ofstream file(history_path);
    file << "{\"type\": \"text\"}";
  }

  JsonFileSink sink(history_path);
  ASSERT_TRUE(sink.append(text("fresh")).is_ok());
  EXPECT_EQ(read_history().size(), 1u);
}

TEST_F(JsonSinkTest, UnwritableLocationIsFileWriteError) {
  fs::create_directories(test_dir);
  fs::path blocker = test_dir / "blocker";
  {
    std::ofstream file(blocker);
    file << "x";
  }

  JsonFileSink sink(blocker / "clipboard.json");
  auto result = sink.append(text("lost"));
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::FileWriteError);
}

TEST_F(JsonSinkTest, DirectoryAtHistoryPathIsFileReadError) {
  fs::create_directories(history_path);

  JsonFileSink sink(history_path);
  auto result = sink.append(text("lost"));
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::FileReadError);

  fs::path tmp = history_path;
  tmp += ".tmp";
  EXPECT_FALSE(fs::exists(tmp));
  EXPECT_TRUE(fs::is_directory(history_path));
}

TEST_F(JsonSinkTest, AsSinkAppends) {
  JsonFileSink history(history_path);
  ClipboardSink sink = history.as_sink();

  ASSERT_TRUE(sink(text("via callable")).is_ok());
  EXPECT_EQ(read_history().size(), 1u);
}

TEST(Rfc3339Test, FormatsUtcWithMicroseconds) {
  Timestamp epoch_plus{std::chrono::microseconds(42)};
  EXPECT_EQ(format_rfc3339(epoch_plus), "1970-01-01T00:00:00.000042Z");

  Timestamp later{std::chrono::seconds(1709296205)};
  EXPECT_EQ(format_rfc3339(later), "2024-03-01T12:30:05.000000Z");
}
