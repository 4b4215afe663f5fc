/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <memory>

#include "fanout/backend.hpp"
#include "fanout/queue.hpp"
#include "fanout/runner.hpp"
#include "fanout/store.hpp"

namespace fanout {

enum class ProcessResult : uint8_t {
    Success,
    Failed,
    LeaseLost      // the outcome could not be recorded; the reaper owns the job now
};

// Takes one dequeued job from Running to a terminal state.
class Processor {
public:
    Processor(JobQueue& queue, const ResultStore& store, std::shared_ptr<Backend> backend,
              std::chrono::milliseconds jobTimeout);

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    [[nodiscard]] ProcessResult process(const Job& job) noexcept;

private:
    JobQueue& queue_;
    const ResultStore& store_;
    Runner runner_;
    std::chrono::milliseconds jobTimeout_;

    [[nodiscard]] ProcessResult fail(const Job& job, ErrorCode code, const std::string& message) noexcept;
};

}
