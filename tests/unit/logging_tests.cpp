#include "mcphost/utils/logging.hpp"
#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

using namespace mcphost;

// Test fixture for logging tests
class LoggingTest : public ::testing::Test {
protected:
  void SetUp() override {
    saved_level_ = logging::getLevel();
    previous_handler_ = logging::setHandler(
        [this](logging::Level level, const std::string &message,
               const std::string &, int) {
          records_.push_back({level, message});
        });
  }

  void TearDown() override {
    logging::setHandler(previous_handler_);
    logging::setLevel(saved_level_);
    unsetenv("MCPHOST_LOG_LEVEL");
  }

  std::vector<std::pair<logging::Level, std::string>> records_;
  logging::LogHandler previous_handler_;
  logging::Level saved_level_ = logging::Level::Info;
};

TEST_F(LoggingTest, LevelNames) {
  EXPECT_EQ(logging::levelToString(logging::Level::Warning), "WARNING");
  EXPECT_EQ(logging::levelFromString("debug"), logging::Level::Debug);
  EXPECT_EQ(logging::levelFromString("WARN"), logging::Level::Warning);
  EXPECT_THROW(logging::levelFromString("verbose"), std::invalid_argument);
}

TEST_F(LoggingTest, MessagesBelowLevelAreDropped) {
  logging::setLevel(logging::Level::Warning);

  MCPHOST_LOG_INFO("hidden");
  MCPHOST_LOG_WARNING("shown");

  ASSERT_EQ(records_.size(), 1u);
  EXPECT_EQ(records_[0].second, "shown");
}

TEST_F(LoggingTest, ServerMacrosPrefixServerName) {
  logging::setLevel(logging::Level::Debug);

  MCPHOST_SERVER_LOG_DEBUG("cal", "Connected with 2 tools");

  ASSERT_EQ(records_.size(), 1u);
  EXPECT_EQ(records_[0].first, logging::Level::Debug);
  EXPECT_EQ(records_[0].second, "[cal] Connected with 2 tools");
}

TEST_F(LoggingTest, ConfigureFromEnvironment) {
  setenv("MCPHOST_LOG_LEVEL", "error", 1);

  EXPECT_TRUE(logging::configureFromEnvironment());
  EXPECT_EQ(logging::getLevel(), logging::Level::Error);
}

TEST_F(LoggingTest, InvalidEnvironmentLevelIsIgnored) {
  logging::setLevel(logging::Level::Info);
  setenv("MCPHOST_LOG_LEVEL", "loud", 1);

  EXPECT_FALSE(logging::configureFromEnvironment());
  EXPECT_EQ(logging::getLevel(), logging::Level::Info);
  ASSERT_EQ(records_.size(), 1u);
  EXPECT_EQ(records_[0].first, logging::Level::Warning);
}

TEST_F(LoggingTest, EmptyHandlerRestoresDefault) {
  logging::setHandler(nullptr);
  auto restored = logging::setHandler(nullptr);

  EXPECT_TRUE(static_cast<bool>(restored));
}
