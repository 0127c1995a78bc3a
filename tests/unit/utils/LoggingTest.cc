#include "fleet/core/Log.hh"
#include <gtest/gtest.h>

namespace fleet {
namespace Tests {

class LoggingTest : public ::testing::Test {};

TEST_F(LoggingTest, LogInfoDoesNotCrash) {
    FLEET_LOG_INFO("Info message");
    ASSERT_TRUE(true);
}

TEST_F(LoggingTest, LogWarningDoesNotCrash) {
    FLEET_LOG_WARN("Warning message");
    ASSERT_TRUE(true);
}

TEST_F(LoggingTest, DispatchLoggerDoesNotCrash) {
    FLEET_DISPATCH_LOG_INFO("{}: completed", "HandlerA");
    FLEET_DISPATCH_LOG_WARN("{}: failed - {}", "HandlerB", "boom");
    ASSERT_NE(fleet::log::dispatchLogger(), nullptr);
}

TEST_F(LoggingTest, LogWithFormatArgs) {
    FLEET_LOG_INFO("Value: {}, Name: {}", 42, "test");
    ASSERT_TRUE(true);
}

TEST_F(LoggingTest, SetLogLevel) {
    fleet::log::setLevel(quill::LogLevel::Warning);
    FLEET_LOG_WARN("This should appear");
    // Reset to default
    fleet::log::setLevel(quill::LogLevel::Debug);
    ASSERT_TRUE(true);
}

TEST_F(LoggingTest, ParseLevelNames) {
    EXPECT_EQ(fleet::log::parseLevel("trace").value(), quill::LogLevel::TraceL1);
    EXPECT_EQ(fleet::log::parseLevel("debug").value(), quill::LogLevel::Debug);
    EXPECT_EQ(fleet::log::parseLevel("info").value(), quill::LogLevel::Info);
    EXPECT_EQ(fleet::log::parseLevel("warn").value(), quill::LogLevel::Warning);
    EXPECT_EQ(fleet::log::parseLevel("warning").value(), quill::LogLevel::Warning);
    EXPECT_EQ(fleet::log::parseLevel("critical").value(), quill::LogLevel::Critical);
}

TEST_F(LoggingTest, ParseLevelRejectsUnknown) {
    auto level = fleet::log::parseLevel("verbose");
    EXPECT_TRUE(level.isError());
    EXPECT_EQ(level.code(), fleet::ErrorCode::InvalidArgument);
}

} // namespace Tests
} // namespace fleet
