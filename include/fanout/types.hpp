/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace fanout {

// Job lifecycle states. Missing is only ever a lookup answer, never stored.
enum class Status : std::uint8_t { Queued, Running, Succeeded, Failed, Missing };

enum class Capability : std::uint8_t { Predict, Train };

// Boundary error taxonomy shared by the queue, workers and HTTP surfaces.
enum class ErrorCode : std::uint8_t {
    None = 0,
    UnknownService,
    JobNotFound,
    InvalidRequest,
    EnqueueFailure,
    BackendFailure,
    Timeout,
    WorkerCrash,
    Cancelled,
    StorageFailure
};

// Opaque job identifier: "<epoch-us>_<pid>_<counter>", lexically ordered by enqueue time.
using JobId = std::string;

[[nodiscard]] const char* toString(Status status) noexcept;
[[nodiscard]] const char* toString(Capability capability) noexcept;
[[nodiscard]] const char* toString(ErrorCode code) noexcept;

[[nodiscard]] std::optional<Capability> parseCapability(const std::string& value) noexcept;
[[nodiscard]] std::optional<ErrorCode> parseErrorCode(const std::string& value) noexcept;

// HTTP status a boundary error maps to (500 for codes that only live on jobs).
[[nodiscard]] int httpStatus(ErrorCode code) noexcept;

} // namespace fanout
