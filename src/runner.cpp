/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/runner.hpp"
#include "fanout/logger.hpp"
#include <chrono>

namespace fanout {

Runner::Runner(std::shared_ptr<Backend> backend)
    : backend_(std::move(backend)) {
}

BackendResult Runner::run(const std::string& payload, const JobContext& context) noexcept {
    if (!backend_) {
        return BackendResult::failure(ErrorCode::BackendFailure, "No backend configured");
    }

    auto started = std::chrono::steady_clock::now();
    BackendResult result;
    try {
        if (context.cancelled()) {
            return BackendResult::failure(ErrorCode::Cancelled, "Cancelled before execution");
        }
        if (context.expired()) {
            return BackendResult::failure(ErrorCode::Timeout, "Deadline passed before execution");
        }

        result = backend_->process(payload, context);

        if (result.ok && context.expired()) {
            result = BackendResult::failure(ErrorCode::Timeout, backend_->name() + " exceeded its deadline");
        } else if (result.ok && context.cancelled()) {
            result = BackendResult::failure(ErrorCode::Cancelled, "Cancelled during execution");
        } else if (!result.ok && result.error == ErrorCode::None) {
            result.error = ErrorCode::BackendFailure;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Backend " + backend_->name() + " threw: " + e.what());
        return BackendResult::failure(ErrorCode::BackendFailure, std::string("Backend error: ") + e.what());
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    LOG_DEBUG(backend_->name() + (context.id.empty() ? "" : " job " + context.id) + " finished in " +
              std::to_string(elapsed.count()) + "ms" + (result.ok ? "" : std::string(" with ") + toString(result.error)));
    return result;
}

}
