/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace fanout {

struct QueueOptions {
    std::size_t maxPayloadBytes = 10'000'000; // 10MB
    std::chrono::milliseconds visibilityTimeout{60'000};
    int maxDeliveries = 2;
    std::chrono::milliseconds pollInterval{250};
};

struct Config {
    std::filesystem::path workspace = "workspace";
    std::filesystem::path registryPath = "services.json";
    std::filesystem::path imagesDir = "images";

    std::string host = "0.0.0.0";
    int port = 8080;
    int httpThreads = 8;

    std::chrono::milliseconds syncTimeout{30'000};
    std::size_t syncMaxPayload = 1 << 20;
    std::chrono::milliseconds jobTimeout{45'000};

    QueueOptions queue;

    // Defaults overlaid with FANOUT_* variables; bad values warn and keep the default.
    [[nodiscard]] static Config fromEnv();

    // Returns an error message when settings contradict each other.
    [[nodiscard]] std::optional<std::string> validate() const;
};

enum class FlagResult : uint8_t { NotConfigFlag, Applied, Invalid };

// Consumes a shared flag (--workspace, --registry, --port, ...) at argv[i],
// advancing i past its value.
[[nodiscard]] FlagResult applyConfigFlag(Config& config, int& i, int argc, char* argv[], std::string& error);

// Help text for the flags accepted by applyConfigFlag.
[[nodiscard]] const char* configFlagsHelp() noexcept;

}
