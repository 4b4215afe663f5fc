/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/store.hpp"
#include "fanout/fsio.hpp"
#include "fanout/logger.hpp"

namespace fanout {

ResultStore::ResultStore(const std::filesystem::path& workspace)
    : root_(workspace / "results") {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        LOG_ERROR("Failed to create result store " + root_.string() + ": " + ec.message());
    }
}

std::optional<std::string> ResultStore::put(const JobId& jobId, const std::string& bytes) const {
    if (jobId.empty() || jobId.find('/') != std::string::npos) {
        LOG_ERROR("Refusing to store artifact for malformed job id: " + jobId);
        return std::nullopt;
    }

    if (!fsio::writeAtomic(root_ / jobId, bytes)) {
        LOG_ERROR("Failed to store artifact for job: " + jobId);
        return std::nullopt;
    }

    LOG_DEBUG("Stored artifact for " + jobId + " (" + std::to_string(bytes.size()) + " bytes)");
    return refFor(jobId);
}

std::optional<std::string> ResultStore::get(const std::string& ref) const {
    auto path = resolve(ref);
    if (!path) {
        return std::nullopt;
    }
    return fsio::read(*path);
}

bool ResultStore::exists(const std::string& ref) const noexcept {
    auto path = resolve(ref);
    std::error_code ec;
    return path && std::filesystem::is_regular_file(*path, ec);
}

std::optional<std::filesystem::path> ResultStore::resolve(const std::string& ref) const noexcept {
    static const std::string prefix = "results/";
    if (ref.rfind(prefix, 0) != 0) {
        return std::nullopt;
    }
    std::string id = ref.substr(prefix.size());
    if (id.empty() || id.find('/') != std::string::npos || id == "." || id == "..") {
        return std::nullopt;
    }
    return root_ / id;
}

}
