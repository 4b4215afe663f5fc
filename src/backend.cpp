/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/backend.hpp"
#include "fanout/fsio.hpp"
#include "fanout/gateway.hpp"
#include "fanout/logger.hpp"
#include <cstdio>

#include <nlohmann/json.hpp>

namespace fanout {

using nlohmann::json;

JobContext JobContext::withTimeout(std::chrono::milliseconds timeout, JobId id) {
    JobContext context;
    context.id = std::move(id);
    context.deadline = std::chrono::steady_clock::now() + timeout;
    return context;
}

std::chrono::milliseconds JobContext::remaining() const noexcept {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds{0};
}

HttpBackend::HttpBackend(ServiceDescriptor descriptor, std::shared_ptr<GatewayClient> client)
    : descriptor_(std::move(descriptor)), client_(std::move(client)) {
}

BackendResult HttpBackend::process(const std::string& payload, const JobContext& context) {
    auto timeout = context.remaining();
    if (timeout.count() == 0) {
        return BackendResult::failure(ErrorCode::Timeout, "No time left before calling " + descriptor_.address);
    }

    auto response = client_->predict(descriptor_, payload, timeout);
    if (!response) {
        return BackendResult::failure(response.error, response.message);
    }
    return BackendResult::success(std::move(response.body));
}

ImageHashBackend::ImageHashBackend(std::filesystem::path imagesDir, std::string name)
    : imagesDir_(std::move(imagesDir)), name_(std::move(name)) {
}

BackendResult ImageHashBackend::process(const std::string& payload, const JobContext& context) {
    std::string fileName;
    try {
        auto request = json::parse(payload);
        if (!request.is_object() || !request.contains("image_file_name") || !request["image_file_name"].is_string()) {
            return BackendResult::failure(ErrorCode::BackendFailure,
                                          "Malformed payload: expected {\"image_file_name\": <string>}");
        }
        fileName = request["image_file_name"].get<std::string>();
    } catch (const json::exception& e) {
        return BackendResult::failure(ErrorCode::BackendFailure, std::string("Malformed payload: ") + e.what());
    }

    if (fileName.empty() || fileName.find('/') != std::string::npos || fileName == "." || fileName == "..") {
        return BackendResult::failure(ErrorCode::BackendFailure, "Invalid image reference: " + fileName);
    }

    auto bytes = fsio::read(imagesDir_ / fileName);
    if (!bytes) {
        return BackendResult::failure(ErrorCode::BackendFailure, "Image not found: " + fileName);
    }
    if (context.cancelled()) {
        return BackendResult::failure(ErrorCode::Cancelled, "Cancelled while reading image");
    }

    char hex[17];
    std::snprintf(hex, sizeof(hex), "%016llx", static_cast<unsigned long long>(fnv1a(*bytes)));

    json result = {
        {"image_file_name", fileName},
        {"hash", hex},
        {"size", bytes->size()}
    };
    LOG_DEBUG("Hashed " + fileName + " -> " + hex);
    return BackendResult::success(result.dump());
}

std::uint64_t ImageHashBackend::fnv1a(const std::string& bytes) noexcept {
    std::uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : bytes) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

ExampleModelBackend::ExampleModelBackend(std::string name)
    : name_(std::move(name)) {
}

BackendResult ExampleModelBackend::process(const std::string& payload, const JobContext&) {
    json result = {
        {"result", {{"bytes", payload.size()}}},
        {"classes", {"bytes"}}
    };
    return BackendResult::success(result.dump());
}

std::shared_ptr<Backend> makeBuiltinBackend(const std::string& kind, const std::string& serviceName,
                                            const Config& config) {
    if (kind == "image_hash") {
        return std::make_shared<ImageHashBackend>(config.imagesDir, serviceName);
    }
    if (kind == "example_model") {
        return std::make_shared<ExampleModelBackend>(serviceName);
    }
    LOG_ERROR("Unknown built-in backend: " + kind);
    return nullptr;
}

}
