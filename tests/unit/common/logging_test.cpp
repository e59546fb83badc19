/// @file logging_test.cpp
/// @brief Tests for rootscope logging utilities

#include <gtest/gtest.h>

#include "common/logging.h"

namespace rootscope {
namespace {

TEST(LoggingTest, InitializeLogging) {
    LogConfig config;
    config.name = "test-logger";
    config.level = LogLevel::kDebug;

    EXPECT_NO_THROW(InitLogging(config));
    EXPECT_NE(GetLogger(), nullptr);
}

TEST(LoggingTest, LogLevelChange) {
    InitLogging();

    EXPECT_NO_THROW(SetLogLevel(LogLevel::kWarn));
    EXPECT_EQ(GetLogger()->level(), spdlog::level::warn);
    EXPECT_NO_THROW(SetLogLevel(LogLevel::kDebug));
    EXPECT_EQ(GetLogger()->level(), spdlog::level::debug);
}

TEST(LoggingTest, ParseLogLevel) {
    EXPECT_EQ(ParseLogLevel("debug"), LogLevel::kDebug);
    EXPECT_EQ(ParseLogLevel("WARN"), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("warning"), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("err"), LogLevel::kError);
    EXPECT_EQ(ParseLogLevel("off"), LogLevel::kOff);
    EXPECT_FALSE(ParseLogLevel("verbose").has_value());
}

TEST(LoggingTest, LoggingMacros) {
    InitLogging();

    // These should not throw
    EXPECT_NO_THROW({
        ROOTSCOPE_LOG_TRACE("Trace message: {}", 1);
        ROOTSCOPE_LOG_DEBUG("Debug message: {}", 2);
        ROOTSCOPE_LOG_INFO("Info message: {}", 3);
        ROOTSCOPE_LOG_WARN("Warn message: {}", 4);
        ROOTSCOPE_LOG_ERROR("Error message: {}", 5);
    });
}

TEST(LoggingTest, FlushLogs) {
    InitLogging();
    ROOTSCOPE_LOG_INFO("Test message");
    EXPECT_NO_THROW(FlushLogs());
}

}  // namespace
}  // namespace rootscope
