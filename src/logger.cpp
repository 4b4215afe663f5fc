/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/logger.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>
#include <utility>

namespace fanout {

namespace {

// Threshold is read on every LOG_* call; names and the stream share one mutex.
std::atomic<int> g_threshold{-1};
std::mutex g_sink_mutex;
std::unordered_map<std::thread::id, std::string> g_thread_names;

std::string threadLabel() {
    auto tid = std::this_thread::get_id();
    {
        std::lock_guard<std::mutex> lock(g_sink_mutex);
        auto it = g_thread_names.find(tid);
        if (it != g_thread_names.end()) {
            return it->second;
        }
    }
    std::ostringstream oss;
    oss << "T" << tid;
    return oss.str();
}

// "2025-01-01 12:00:00.042"
std::string wallClock() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);
    char date[24];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);

    char stamp[32];
    std::snprintf(stamp, sizeof(stamp), "%s.%03d", date, static_cast<int>(millis));
    return stamp;
}

}

void Logger::setLevel(LogLevel level) noexcept {
    g_threshold.store(static_cast<int>(level));
}

void Logger::initFromEnv() noexcept {
    g_threshold.store(static_cast<int>(parseEnvLevel()));
}

LogLevel Logger::level() noexcept {
    int current = g_threshold.load();
    if (current < 0) {
        // First use without explicit setup; racing initializers agree on the value
        int fromEnv = static_cast<int>(parseEnvLevel());
        g_threshold.compare_exchange_strong(current, fromEnv);
        return static_cast<LogLevel>(g_threshold.load());
    }
    return static_cast<LogLevel>(current);
}

std::optional<LogLevel> Logger::parseLevel(const std::string& name) noexcept {
    static const std::pair<const char*, LogLevel> kNames[] = {
        {"error", LogLevel::ERROR}, {"warn", LogLevel::WARN}, {"warning", LogLevel::WARN},
        {"info", LogLevel::INFO}, {"debug", LogLevel::DEBUG}, {"trace", LogLevel::TRACE}
    };

    std::string lowered;
    for (char c : name) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    for (const auto& entry : kNames) {
        if (lowered == entry.first) {
            return entry.second;
        }
    }
    return std::nullopt;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    if (static_cast<int>(level) > static_cast<int>(Logger::level())) {
        return;
    }

    try {
        std::string line = "[" + wallClock() + "] [" + levelToString(level) + "] [" + threadLabel() + "] " + message;
        // stdout belongs to the CLI tools (job ids, results)
        std::lock_guard<std::mutex> lock(g_sink_mutex);
        std::cerr << line << std::endl;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "[logger] dropped %s line: %s\n", levelToString(level), e.what());
    }
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* value = std::getenv("FANOUT_LOG_LEVEL");
    if (!value) {
        return LogLevel::INFO;
    }
    return parseLevel(value).value_or(LogLevel::INFO);
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "?????";
}

void setThreadName(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

}
