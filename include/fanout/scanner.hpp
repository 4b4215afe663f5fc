/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "fanout/types.hpp"

namespace fanout {

enum class Phase : uint8_t { Ready, Processing, Done, Failed };

struct Location {
    std::string service;   // empty for Done/Failed
    Phase phase;
    std::filesystem::path path;
};

// Read-only view of the workspace layout shared by the queue and status lookups.
class Scanner {
public:
    explicit Scanner(const std::filesystem::path& workspace) noexcept;

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;
    Scanner(Scanner&&) noexcept = default;
    Scanner& operator=(Scanner&&) noexcept = default;

    // Ready jobs of a service, oldest first.
    [[nodiscard]] std::vector<JobId> ready(const std::string& service) const noexcept;
    [[nodiscard]] std::vector<JobId> processing(const std::string& service) const noexcept;
    [[nodiscard]] std::size_t readyJobCount(const std::string& service) const noexcept;
    [[nodiscard]] std::vector<std::string> services() const noexcept;

    [[nodiscard]] std::optional<Location> locate(const JobId& id) const noexcept;

    [[nodiscard]] std::filesystem::path readyDir(const std::string& service) const;
    [[nodiscard]] std::filesystem::path processingDir(const std::string& service) const;
    [[nodiscard]] std::filesystem::path doneDir() const { return workspace_ / "done"; }
    [[nodiscard]] std::filesystem::path failedDir() const { return workspace_ / "failed"; }
    [[nodiscard]] std::filesystem::path stagingDir() const { return workspace_ / "staging"; }

    [[nodiscard]] static bool isValidJobId(const JobId& id) noexcept;

private:
    std::filesystem::path workspace_;

    [[nodiscard]] std::vector<JobId> listJobs(const std::filesystem::path& dir) const noexcept;
    [[nodiscard]] bool isValidJobDirectory(const std::filesystem::path& dir) const noexcept;
};

}
