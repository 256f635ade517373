#include <gtest/gtest.h>

#include <tuic/log_level.hpp>

using tuic::LogLevel;

TEST(Logging, LevelRoundTrip) {
  auto saved = tuic::log_level();

  for (auto level : {LogLevel::trace, LogLevel::debug, LogLevel::warn,
                     LogLevel::off}) {
    tuic::set_log_level(level);
    EXPECT_EQ(tuic::log_level(), level);
  }

  tuic::set_log_level(saved);
  EXPECT_EQ(tuic::log_level(), saved);
}
