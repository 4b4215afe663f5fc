/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace fanout {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static std::optional<LogLevel> parseLevel(const std::string& name) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for log context; worker instances use their owner id
void setThreadName(const std::string& name);

}

#define LOG_ERROR(msg) ::fanout::Logger::error(msg)
#define LOG_WARN(msg)  ::fanout::Logger::warn(msg)
#define LOG_INFO(msg)  ::fanout::Logger::info(msg)
#define LOG_DEBUG(msg) ::fanout::Logger::debug(msg)
#define LOG_TRACE(msg) ::fanout::Logger::trace(msg)
