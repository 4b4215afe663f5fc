/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/scanner.hpp"
#include "fanout/logger.hpp"
#include <algorithm>
#include <cctype>

namespace fanout {

Scanner::Scanner(const std::filesystem::path& workspace) noexcept
    : workspace_(workspace) {
}

std::filesystem::path Scanner::readyDir(const std::string& service) const {
    return workspace_ / "queues" / service / "ready";
}

std::filesystem::path Scanner::processingDir(const std::string& service) const {
    return workspace_ / "queues" / service / "processing";
}

std::vector<JobId> Scanner::ready(const std::string& service) const noexcept {
    auto jobs = listJobs(readyDir(service));
    if (!jobs.empty()) {
        LOG_TRACE("Scanner found " + std::to_string(jobs.size()) + " ready jobs for " + service);
    }
    return jobs;
}

std::vector<JobId> Scanner::processing(const std::string& service) const noexcept {
    return listJobs(processingDir(service));
}

std::size_t Scanner::readyJobCount(const std::string& service) const noexcept {
    return ready(service).size();
}

std::vector<std::string> Scanner::services() const noexcept {
    std::vector<std::string> names;
    try {
        std::error_code ec;
        auto queues = workspace_ / "queues";
        for (std::filesystem::directory_iterator it(queues, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->is_directory(ec)) {
                names.push_back(it->path().filename().string());
            }
        }
        std::sort(names.begin(), names.end());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to list queues: " + std::string(e.what()));
    }
    return names;
}

std::optional<Location> Scanner::locate(const JobId& id) const noexcept {
    if (!isValidJobId(id)) {
        return std::nullopt;
    }
    try {
        std::error_code ec;
        // Lifecycle order: a job only moves forward through these, except for a
        // lease-expiry requeue, which callers cover by retrying a miss.
        for (const auto& service : services()) {
            auto path = readyDir(service) / id;
            if (std::filesystem::exists(path, ec)) {
                return Location{service, Phase::Ready, path};
            }
            path = processingDir(service) / id;
            if (std::filesystem::exists(path, ec)) {
                return Location{service, Phase::Processing, path};
            }
        }
        if (std::filesystem::exists(doneDir() / id, ec)) {
            return Location{"", Phase::Done, doneDir() / id};
        }
        if (std::filesystem::exists(failedDir() / id, ec)) {
            return Location{"", Phase::Failed, failedDir() / id};
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to locate job " + id + ": " + e.what());
    }
    return std::nullopt;
}

bool Scanner::isValidJobId(const JobId& id) noexcept {
    if (id.empty() || id.size() > 64) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isdigit(c) || c == '_';
    });
}

std::vector<JobId> Scanner::listJobs(const std::filesystem::path& dir) const noexcept {
    std::vector<JobId> jobs;
    std::error_code ec;
    try {
        for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            const auto& entry = *it;
            JobId id = entry.path().filename().string();
            if (isValidJobId(id) && isValidJobDirectory(entry.path())) {
                jobs.push_back(id);
            }
        }
        if (ec && ec != std::errc::no_such_file_or_directory) {
            LOG_ERROR("Scanner error in " + dir.string() + ": " + ec.message());
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Scanner error in " + dir.string() + ": " + e.what());
    }

    // Ids start with a zero-padded timestamp, so lexical order is enqueue order
    std::sort(jobs.begin(), jobs.end());
    return jobs;
}

bool Scanner::isValidJobDirectory(const std::filesystem::path& dir) const noexcept {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return false;
    }
    if (!std::filesystem::is_regular_file(dir / "job.json", ec)) {
        LOG_DEBUG("Invalid job directory (missing job.json): " + dir.string());
        return false;
    }
    return true;
}

}
