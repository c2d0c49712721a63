/**
 * @file test_config.cpp
 * @brief Unit tests for watcher configuration
 */

#include <clipwatch/config.h>
#include <clipwatch/targets.h>
#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <string>

using namespace clipwatch;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
  std::string saved_xdg;
  std::string saved_home;
  bool had_xdg = false;
  bool had_home = false;

  void SetUp() override {
    if (const char *xdg = std::getenv("XDG_DATA_HOME")) {
      had_xdg = true;
      saved_xdg = xdg;
    }
    if (const char *home = std::getenv("HOME")) {
      had_home = true;
      saved_home = home;
    }
  }

  void TearDown() override {
    restore("XDG_DATA_HOME", had_xdg, saved_xdg);
    restore("HOME", had_home, saved_home);
  }

  static void restore(const char *name, bool had, const std::string &value) {
    if (had) {
      setenv(name, value.c_str(), 1);
    } else {
      unsetenv(name);
    }
  }
};

TEST_F(ConfigTest, Defaults) {
  WatcherConfig config;
  config.load_defaults();

  EXPECT_TRUE(config.display_name.empty());
  EXPECT_EQ(config.output_path.filename().string(), "clipboard.json");
  EXPECT_EQ(config.target_priority, default_target_priority());
  EXPECT_EQ(config.log_level, LogLevel::Info);
  EXPECT_TRUE(config.validate().is_ok());
}

TEST_F(ConfigTest, DataDirFollowsXdgDataHome) {
  setenv("XDG_DATA_HOME", "/srv/data", 1);

  EXPECT_EQ(WatcherConfig::get_default_data_dir().string(),
            "/srv/data/clipwatch");
}

TEST_F(ConfigTest, DataDirFallsBackToHome) {
  unsetenv("XDG_DATA_HOME");
  setenv("HOME", "/home/alex", 1);

  EXPECT_EQ(WatcherConfig::get_default_data_dir().string(),
            "/home/alex/.local/share/clipwatch");
}

TEST_F(ConfigTest, EmptyXdgDataHomeIsIgnored) {
  setenv("XDG_DATA_HOME", "", 1);
  setenv("HOME", "/home/alex", 1);

  EXPECT_EQ(WatcherConfig::get_default_data_dir().string(),
            "/home/alex/.local/share/clipwatch");
}

TEST_F(ConfigTest, ValidateRejectsEmptyOutput) {
  WatcherConfig config;
  config.load_defaults();
  config.output_path.clear();

  auto result = config.validate();
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ConfigTest, ValidateRejectsDirectoryOutput) {
  WatcherConfig config;
  config.load_defaults();
  config.output_path = fs::temp_directory_path();

  EXPECT_TRUE(config.validate().is_error());
}

TEST_F(ConfigTest, ValidateRejectsEmptyPriority) {
  WatcherConfig config;
  config.load_defaults();
  config.target_priority.clear();

  EXPECT_TRUE(config.validate().is_error());

  config.target_priority = {"UTF8_STRING", ""};
  EXPECT_TRUE(config.validate().is_error());
}
