/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "fanout/config.hpp"
#include "fanout/registry.hpp"
#include "fanout/types.hpp"

namespace fanout {

class GatewayClient;

// Per-call limits handed to a backend. Synchronous calls carry no job id.
struct JobContext {
    JobId id;
    std::chrono::steady_clock::time_point deadline;
    std::function<bool()> cancelCheck;

    [[nodiscard]] static JobContext withTimeout(std::chrono::milliseconds timeout, JobId id = {});

    [[nodiscard]] bool cancelled() const { return cancelCheck && cancelCheck(); }
    [[nodiscard]] bool expired() const noexcept { return std::chrono::steady_clock::now() >= deadline; }
    [[nodiscard]] std::chrono::milliseconds remaining() const noexcept;
};

struct BackendResult {
    bool ok = false;
    std::string output;
    ErrorCode error = ErrorCode::None;
    std::string message;

    explicit operator bool() const noexcept { return ok; }

    [[nodiscard]] static BackendResult success(std::string output) {
        return {true, std::move(output), ErrorCode::None, ""};
    }
    [[nodiscard]] static BackendResult failure(ErrorCode code, std::string message) {
        return {false, "", code, std::move(message)};
    }
};

/**
 * One opaque inference or training unit.
 *
 * process() may be called concurrently from several worker instances and
 * gateway threads, so implementations keep no per-call state in members.
 */
class Backend {
public:
    virtual ~Backend() = default;

    [[nodiscard]] virtual const std::string& name() const noexcept = 0;
    [[nodiscard]] virtual BackendResult process(const std::string& payload, const JobContext& context) = 0;
};

// Drives a remote service through its gateway's POST /predict.
class HttpBackend final : public Backend {
public:
    HttpBackend(ServiceDescriptor descriptor, std::shared_ptr<GatewayClient> client);

    [[nodiscard]] const std::string& name() const noexcept override { return descriptor_.name; }
    [[nodiscard]] BackendResult process(const std::string& payload, const JobContext& context) override;

private:
    ServiceDescriptor descriptor_;
    std::shared_ptr<GatewayClient> client_;
};

// {"image_file_name": "<name>"} -> 64-bit FNV-1a of the file under imagesDir.
class ImageHashBackend final : public Backend {
public:
    explicit ImageHashBackend(std::filesystem::path imagesDir, std::string name = "image_hash");

    [[nodiscard]] const std::string& name() const noexcept override { return name_; }
    [[nodiscard]] BackendResult process(const std::string& payload, const JobContext& context) override;

    [[nodiscard]] static std::uint64_t fnv1a(const std::string& bytes) noexcept;

private:
    std::filesystem::path imagesDir_;
    std::string name_;
};

// Reports the payload size; stands in for a trained model.
class ExampleModelBackend final : public Backend {
public:
    explicit ExampleModelBackend(std::string name = "example_model");

    [[nodiscard]] const std::string& name() const noexcept override { return name_; }
    [[nodiscard]] BackendResult process(const std::string& payload, const JobContext& context) override;

private:
    std::string name_;
};

// Built-in backend by kind ("image_hash", "example_model"), registered under
// serviceName; nullptr for an unknown kind.
[[nodiscard]] std::shared_ptr<Backend> makeBuiltinBackend(const std::string& kind, const std::string& serviceName,
                                                          const Config& config);

}
