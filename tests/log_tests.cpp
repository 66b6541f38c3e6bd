#include <gtest/gtest.h>
#include "log.hpp"

class LogLevelTests : public ::testing::Test {
protected:
  log_level saved = current_log_level.load();

  void TearDown() override {
    current_log_level.store(saved);
  }
};

TEST_F(LogLevelTests, SetLogLevel_AcceptsKnownNames) {
  EXPECT_TRUE(set_log_level("debug"));
  EXPECT_EQ(current_log_level.load(), log_level::debug);
  EXPECT_TRUE(set_log_level("error"));
  EXPECT_EQ(current_log_level.load(), log_level::error);
  EXPECT_TRUE(set_log_level("off"));
  EXPECT_EQ(current_log_level.load(), log_level::off);
}

TEST_F(LogLevelTests, SetLogLevel_RejectsUnknownNames) {
  ASSERT_TRUE(set_log_level("warn"));
  EXPECT_FALSE(set_log_level("verbose"));
  EXPECT_FALSE(set_log_level(""));
  EXPECT_FALSE(set_log_level(nullptr));
  EXPECT_EQ(current_log_level.load(), log_level::warn);
}

TEST_F(LogLevelTests, LogEnabled_FiltersBelowCurrentLevel) {
  ASSERT_TRUE(set_log_level("info"));
  EXPECT_FALSE(log_enabled(log_level::debug));
  EXPECT_TRUE(log_enabled(log_level::info));
  EXPECT_TRUE(log_enabled(log_level::error));

  ASSERT_TRUE(set_log_level("off"));
  EXPECT_FALSE(log_enabled(log_level::error));
}

TEST_F(LogLevelTests, DebugLogging_WritesToStderr) {
  ASSERT_TRUE(set_log_level("debug"));
  ::testing::internal::CaptureStderr();
  log_debug("BFS from vertex {}", 3);
  log_info("hidden? {}", false);
  std::string err = ::testing::internal::GetCapturedStderr();
  EXPECT_NE(err.find("BFS from vertex 3"), std::string::npos);
  EXPECT_NE(err.find("hidden? false"), std::string::npos);
}

TEST_F(LogLevelTests, SuppressedLevels_WriteNothing) {
  ASSERT_TRUE(set_log_level("error"));
  ::testing::internal::CaptureStderr();
  log_debug("quiet {}", 1);
  log_warn("quiet {}", 2);
  EXPECT_TRUE(::testing::internal::GetCapturedStderr().empty());
}
