/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>

#include "fanout/registry.hpp"

namespace fanout::testing {

// mkdtemp-backed directory removed on scope exit.
class TempDir {
public:
    TempDir() {
        auto pattern = (std::filesystem::temp_directory_path() / "fanout-test-XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = pattern;
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

inline RegistryPtr makeRegistry(const std::string& json) {
    std::string error;
    auto registry = ServiceRegistry::parse(json, error);
    if (!registry) {
        throw std::runtime_error("bad test registry: " + error);
    }
    return registry;
}

// Registry whose services all point at one address.
inline RegistryPtr registryAt(const std::string& address, std::initializer_list<const char*> names) {
    std::string json = R"({"services": [)";
    bool first = true;
    for (const char* name : names) {
        if (!first) json += ",";
        first = false;
        json += std::string(R"({"name": ")") + name + R"(", "address": ")" + address + R"("})";
    }
    json += "]}";
    return makeRegistry(json);
}

inline bool waitFor(const std::function<bool()>& condition,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

}
