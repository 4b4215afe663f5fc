/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/fsio.hpp"
#include "fanout/logger.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace fanout::fsio {

bool writeAtomic(const std::filesystem::path& path, const std::string& content) noexcept {
    try {
        static std::atomic<std::uint64_t> counter{0};
        auto tempPath = path;
        tempPath += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(counter.fetch_add(1));
        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file) return false;
            file << content;
            file.flush();
            if (!file.good()) {
                std::error_code ec;
                std::filesystem::remove(tempPath, ec);
                return false;
            }
        }

        std::error_code ec;
        std::filesystem::rename(tempPath, path, ec);
        if (ec) {
            LOG_ERROR("Failed to publish " + path.string() + ": " + ec.message());
            std::filesystem::remove(tempPath, ec);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to write " + path.string() + ": " + e.what());
        return false;
    }
}

std::optional<std::string> read(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::nullopt;
        }
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read " + path.string() + ": " + e.what());
        return std::nullopt;
    }
}

bool moveDir(const std::filesystem::path& from, const std::filesystem::path& to) noexcept {
    std::error_code ec;
    // rename(2) replaces an empty target directory; terminal states must never be replaced
    if (std::filesystem::exists(to, ec)) {
        return false;
    }
    std::filesystem::rename(from, to, ec);
    if (ec) {
        LOG_TRACE("Move " + from.string() + " -> " + to.string() + " failed: " + ec.message());
        return false;
    }
    return true;
}

std::int64_t nowMillis() noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}
