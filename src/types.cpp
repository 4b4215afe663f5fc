/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/types.hpp"

namespace fanout {

const char* toString(Status status) noexcept {
    switch (status) {
        case Status::Queued: return "Queued";
        case Status::Running: return "Running";
        case Status::Succeeded: return "Succeeded";
        case Status::Failed: return "Failed";
        case Status::Missing: return "Missing";
        default: return "Missing";
    }
}

const char* toString(Capability capability) noexcept {
    return capability == Capability::Train ? "train" : "predict";
}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::UnknownService: return "UnknownService";
        case ErrorCode::JobNotFound: return "JobNotFound";
        case ErrorCode::InvalidRequest: return "InvalidRequest";
        case ErrorCode::EnqueueFailure: return "EnqueueFailure";
        case ErrorCode::BackendFailure: return "BackendFailure";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::WorkerCrash: return "WorkerCrash";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::StorageFailure: return "StorageFailure";
        default: return "None";
    }
}

std::optional<Capability> parseCapability(const std::string& value) noexcept {
    if (value == "predict") return Capability::Predict;
    if (value == "train") return Capability::Train;
    return std::nullopt;
}

std::optional<ErrorCode> parseErrorCode(const std::string& value) noexcept {
    static constexpr ErrorCode all[] = {
        ErrorCode::None, ErrorCode::UnknownService, ErrorCode::JobNotFound,
        ErrorCode::InvalidRequest, ErrorCode::EnqueueFailure, ErrorCode::BackendFailure,
        ErrorCode::Timeout, ErrorCode::WorkerCrash, ErrorCode::Cancelled,
        ErrorCode::StorageFailure
    };
    for (ErrorCode code : all) {
        if (value == toString(code)) {
            return code;
        }
    }
    return std::nullopt;
}

int httpStatus(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None: return 200;
        case ErrorCode::UnknownService: return 404;
        case ErrorCode::JobNotFound: return 404;
        case ErrorCode::InvalidRequest: return 400;
        case ErrorCode::EnqueueFailure: return 503;
        case ErrorCode::BackendFailure: return 502;
        case ErrorCode::Timeout: return 504;
        default: return 500;
    }
}

} // namespace fanout
