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
#include <vector>

#include "fanout/scanner.hpp"
#include "fanout/store.hpp"
#include "fanout/types.hpp"

namespace fanout {

// Snapshot of one job as seen by a status query.
struct JobView {
    JobId id;
    std::string service;
    Status status = Status::Missing;
    std::int64_t createdAt = 0;
    int deliveries = 0;
    std::string resultRef;
    ErrorCode error = ErrorCode::None;
    std::string message;
    std::int64_t finishedAt = 0;
};

/**
 * Read-only status and result retrieval over the workspace.
 *
 * Never mutates anything; the dispatch server, flw and tests all look jobs
 * up through here.
 */
class Flow {
public:
    explicit Flow(const std::filesystem::path& workspace);

    Flow(const Flow&) = delete;
    Flow& operator=(const Flow&) = delete;

    [[nodiscard]] std::optional<JobView> get(const JobId& id) const noexcept;
    [[nodiscard]] Status status(const JobId& id) const noexcept;
    [[nodiscard]] bool exists(const JobId& id) const noexcept { return status(id) != Status::Missing; }

    // Artifact bytes of a Succeeded job.
    [[nodiscard]] std::optional<std::string> result(const JobId& id) const;

    // Most recently finished jobs, newest first.
    [[nodiscard]] std::vector<JobView> recent(std::size_t max = 10) const noexcept;

private:
    std::filesystem::path workspace_;
    Scanner scanner_;
    ResultStore store_;

    [[nodiscard]] std::optional<JobView> readView(const JobId& id, const Location& location) const;
};

}
