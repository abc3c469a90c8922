#include <gtest/gtest.h>

#include "utils/logging.hpp"

namespace coderun::utils {
namespace {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override { saved_ = GetLogConfig(); }
    void TearDown() override { SetLogConfig(saved_); }

    LogConfig saved_;
};

TEST_F(LoggingTest, ParsesLevelNames) {
    EXPECT_EQ(ParseLogLevel("debug"), LogLevel::kDebug);
    EXPECT_EQ(ParseLogLevel(" INFO "), LogLevel::kInfo);
    EXPECT_EQ(ParseLogLevel("warning"), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("Error"), LogLevel::kError);
    EXPECT_FALSE(ParseLogLevel("verbose").has_value());
}

TEST_F(LoggingTest, DropsMessagesBelowThreshold) {
    SetLogConfig(LogConfig{LogLevel::kWarn});
    ::testing::internal::CaptureStderr();
    Log(LogLevel::kInfo, "runner", "quiet");
    Log(LogLevel::kDebug, "runner", "quieter");
    EXPECT_EQ(::testing::internal::GetCapturedStderr(), "");
}

TEST_F(LoggingTest, WritesTagLevelAndSortedFields) {
    SetLogConfig(LogConfig{LogLevel::kDebug});
    ::testing::internal::CaptureStderr();
    Log(LogLevel::kWarn, "workspace", "failed to remove", {{"path", "/tmp/x"}, {"error", "busy"}});
    EXPECT_EQ(::testing::internal::GetCapturedStderr(),
              "[workspace] WARN failed to remove error=busy path=/tmp/x\n");
}

}  // namespace
}  // namespace coderun::utils
