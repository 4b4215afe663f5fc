/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/logger.hpp"
#include <cstdlib>
#include <string>

#include <gtest/gtest.h>

using namespace fanout;

namespace {

class LoggerTest : public ::testing::Test {
protected:
    LogLevel saved = Logger::level();

    void TearDown() override {
        ::unsetenv("FANOUT_LOG_LEVEL");
        Logger::setLevel(saved);
    }
};

}

TEST_F(LoggerTest, ParsesLevelNamesCaseInsensitively) {
    EXPECT_EQ(Logger::parseLevel("ERROR"), LogLevel::ERROR);
    EXPECT_EQ(Logger::parseLevel("Warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("warn"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("trace"), LogLevel::TRACE);
    EXPECT_FALSE(Logger::parseLevel("verbose"));
    EXPECT_FALSE(Logger::parseLevel(""));
}

TEST_F(LoggerTest, EnvironmentSelectsLevel) {
    ::setenv("FANOUT_LOG_LEVEL", "debug", 1);
    Logger::initFromEnv();
    EXPECT_EQ(Logger::level(), LogLevel::DEBUG);

    ::setenv("FANOUT_LOG_LEVEL", "nonsense", 1);
    Logger::initFromEnv();
    EXPECT_EQ(Logger::level(), LogLevel::INFO);
}

TEST_F(LoggerTest, FiltersBelowThresholdAndTagsThread) {
    Logger::setLevel(LogLevel::WARN);
    setThreadName("logger-test");

    ::testing::internal::CaptureStderr();
    LOG_INFO("quiet message");
    LOG_WARN("loud message");
    std::string output = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(output.find("quiet message"), std::string::npos);
    EXPECT_NE(output.find("[WARN ] [logger-test] loud message"), std::string::npos);
}
