/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/config.hpp"
#include "fanout/types.hpp"
#include <cstdlib>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace fanout;

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name_); }

private:
    const char* name_;
};

FlagResult applyAll(Config& config, std::vector<std::string> args, std::string& error) {
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>("prog"));
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    int argc = static_cast<int>(argv.size());
    for (int i = 1; i < argc; ++i) {
        auto result = applyConfigFlag(config, i, argc, argv.data(), error);
        if (result != FlagResult::Applied) {
            return result;
        }
    }
    return FlagResult::Applied;
}

}

TEST(Config, DefaultsAreConsistent) {
    Config config;
    EXPECT_FALSE(config.validate());
    EXPECT_EQ(config.queue.visibilityTimeout, std::chrono::milliseconds(60'000));
    EXPECT_EQ(config.queue.maxDeliveries, 2);
    EXPECT_LT(config.jobTimeout, config.queue.visibilityTimeout);
}

TEST(Config, EnvironmentOverridesDefaults) {
    ScopedEnv workspace("FANOUT_WORKSPACE", "/tmp/ws");
    ScopedEnv port("FANOUT_PORT", "9090");
    ScopedEnv deliveries("FANOUT_MAX_DELIVERIES", "3");

    auto config = Config::fromEnv();
    EXPECT_EQ(config.workspace, "/tmp/ws");
    EXPECT_EQ(config.port, 9090);
    EXPECT_EQ(config.queue.maxDeliveries, 3);
}

TEST(Config, InvalidEnvironmentValueKeepsDefault) {
    ScopedEnv port("FANOUT_PORT", "eighty");
    ScopedEnv poll("FANOUT_POLL_INTERVAL_MS", "-5");

    auto config = Config::fromEnv();
    EXPECT_EQ(config.port, Config{}.port);
    EXPECT_EQ(config.queue.pollInterval, Config{}.queue.pollInterval);
}

TEST(Config, JobTimeoutMustBeShorterThanVisibility) {
    Config config;
    config.jobTimeout = std::chrono::milliseconds(60'000);
    auto problem = config.validate();
    ASSERT_TRUE(problem);
    EXPECT_NE(problem->find("visibility"), std::string::npos);
}

TEST(Config, FlagsOverrideValues) {
    Config config;
    std::string error;
    ASSERT_EQ(applyAll(config, {"--workspace", "ws", "--port", "7000", "--visibility-timeout-ms", "5000",
                                "--job-timeout-ms", "1000"}, error), FlagResult::Applied) << error;
    EXPECT_EQ(config.workspace, "ws");
    EXPECT_EQ(config.port, 7000);
    EXPECT_EQ(config.queue.visibilityTimeout, std::chrono::milliseconds(5000));
    EXPECT_FALSE(config.validate());
}

TEST(Config, FlagErrors) {
    Config config;
    std::string error;
    EXPECT_EQ(applyAll(config, {"--port"}, error), FlagResult::Invalid);
    EXPECT_EQ(applyAll(config, {"--port", "x"}, error), FlagResult::Invalid);
    EXPECT_EQ(applyAll(config, {"--backend", "http"}, error), FlagResult::NotConfigFlag);
}

TEST(ErrorCodes, MapToHttpStatus) {
    EXPECT_EQ(httpStatus(ErrorCode::UnknownService), 404);
    EXPECT_EQ(httpStatus(ErrorCode::JobNotFound), 404);
    EXPECT_EQ(httpStatus(ErrorCode::InvalidRequest), 400);
    EXPECT_EQ(httpStatus(ErrorCode::EnqueueFailure), 503);
    EXPECT_EQ(httpStatus(ErrorCode::BackendFailure), 502);
    EXPECT_EQ(httpStatus(ErrorCode::Timeout), 504);
}

TEST(ErrorCodes, NamesParseBack) {
    for (auto code : {ErrorCode::WorkerCrash, ErrorCode::Cancelled, ErrorCode::StorageFailure}) {
        auto parsed = parseErrorCode(toString(code));
        ASSERT_TRUE(parsed);
        EXPECT_EQ(*parsed, code);
    }
    EXPECT_FALSE(parseErrorCode("Bogus"));
}
