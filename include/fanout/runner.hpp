/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <string>

#include "fanout/backend.hpp"

namespace fanout {

/**
 * Invokes a backend for one payload and normalizes what comes back.
 *
 * Exceptions become BackendFailure, an answer that arrives after the deadline
 * becomes Timeout, and a cancel observed on return becomes Cancelled. The
 * caller always gets a BackendResult.
 */
class Runner final {
public:
    explicit Runner(std::shared_ptr<Backend> backend);

    Runner(const Runner&) = delete;
    Runner& operator=(const Runner&) = delete;

    [[nodiscard]] BackendResult run(const std::string& payload, const JobContext& context) noexcept;

private:
    std::shared_ptr<Backend> backend_;
};

}
