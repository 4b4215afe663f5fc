/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace fanout::fsio {

// Writes content to <path>.tmp then renames over path, so readers see old or new, never partial.
[[nodiscard]] bool writeAtomic(const std::filesystem::path& path, const std::string& content) noexcept;

[[nodiscard]] std::optional<std::string> read(const std::filesystem::path& path) noexcept;

// Rename that reports failure instead of throwing; false when source is gone or target exists.
[[nodiscard]] bool moveDir(const std::filesystem::path& from, const std::filesystem::path& to) noexcept;

// Wall-clock milliseconds since epoch; shared across processes for leases and timestamps.
[[nodiscard]] std::int64_t nowMillis() noexcept;

}
