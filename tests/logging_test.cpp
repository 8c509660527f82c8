/**
 * @file logging_test.cpp
 * @brief Logger level threshold and line format
 */

#include <gtest/gtest.h>

#include "logging.hpp"

using namespace ferry;

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override { Logger::instance().set_level(LogLevel::INFO); }
};

TEST_F(LoggerTest, ThresholdGatesLevels) {
    auto& log = Logger::instance();
    log.set_level(LogLevel::WARN);
    EXPECT_FALSE(log.enabled(LogLevel::INFO));
    EXPECT_TRUE(log.enabled(LogLevel::WARN));
    EXPECT_TRUE(log.enabled(LogLevel::ERROR));
    log.set_level(LogLevel::TRACE);
    EXPECT_TRUE(log.enabled(LogLevel::TRACE));
}

TEST_F(LoggerTest, WritesFormattedLineToStderr) {
    Logger::instance().set_level(LogLevel::DEBUG);
    ::testing::internal::CaptureStderr();
    Logger::instance().log(LogLevel::WARN, "chunk %d of %s", 3, "ten_k.dat");
    std::string out = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(out.find("[WARN] chunk 3 of ten_k.dat\n"), std::string::npos) << out;
}

TEST_F(LoggerTest, BelowThresholdWritesNothing) {
    Logger::instance().set_level(LogLevel::ERROR);
    ::testing::internal::CaptureStderr();
    Logger::instance().log(LogLevel::INFO, "quiet %d", 1);
    EXPECT_EQ(::testing::internal::GetCapturedStderr(), "");
}
