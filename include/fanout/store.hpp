/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>

#include "fanout/types.hpp"

namespace fanout {

/**
 * Job-id-addressed artifact storage on the shared workspace.
 *
 * Only the lease holder of a Running job calls put(), and the Succeeded
 * transition happens after it, so an artifact is never rewritten once its
 * job is Succeeded.
 */
class ResultStore final {
public:
    explicit ResultStore(const std::filesystem::path& workspace);

    ResultStore(const ResultStore&) = delete;
    ResultStore& operator=(const ResultStore&) = delete;
    ResultStore(ResultStore&&) noexcept = default;
    ResultStore& operator=(ResultStore&&) noexcept = default;

    // Returns the artifact reference ("results/<job_id>") or nullopt on I/O failure.
    [[nodiscard]] std::optional<std::string> put(const JobId& jobId, const std::string& bytes) const;
    [[nodiscard]] std::optional<std::string> get(const std::string& ref) const;
    [[nodiscard]] bool exists(const std::string& ref) const noexcept;

    [[nodiscard]] static std::string refFor(const JobId& jobId) { return "results/" + jobId; }

private:
    std::filesystem::path root_;

    [[nodiscard]] std::optional<std::filesystem::path> resolve(const std::string& ref) const noexcept;
};

}
