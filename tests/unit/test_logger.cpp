#include "TestFixtures.hpp"
#include "dataset-validator/Logger.hpp"

#include <gtest/gtest.h>

using namespace dsvalidator;
using namespace dsvalidator::test;

TEST(LogLevels, ParseNames) {
  EXPECT_EQ(parse_log_level("trace"), spdlog::level::trace);
  EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
  EXPECT_EQ(parse_log_level("info"), spdlog::level::info);
  EXPECT_EQ(parse_log_level("warning"), spdlog::level::warn);
  EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
  EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
  EXPECT_EQ(parse_log_level("verbose"), spdlog::level::info);
}

class LoggerTest : public ValidatorTest {};

TEST_F(LoggerTest, SecondInitOnlyChangesLevel) {
  auto &logger = ValidatorLogger::instance();
  EXPECT_EQ(logger.level(), spdlog::level::debug);

  auto other = path("second.log");
  logger.init(other.string(), spdlog::level::warn);
  EXPECT_EQ(logger.level(), spdlog::level::warn);
  EXPECT_FALSE(std::filesystem::exists(other));

  LOG_DEBUG("TEST", "run-1", "filtered {}", 1);
  LOG_WARN("TEST", "run-1", "kept {} of {}", 1, 2);
  logger.init(other.string(), spdlog::level::debug);
  EXPECT_EQ(logger.level(), spdlog::level::debug);
}
