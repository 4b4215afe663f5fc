/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/flow.hpp"
#include "fanout/fsio.hpp"
#include "fanout/logger.hpp"
#include <algorithm>

#include <nlohmann/json.hpp>

namespace fanout {

using nlohmann::json;

namespace {

constexpr int kLocateAttempts = 3;

}

Flow::Flow(const std::filesystem::path& workspace)
    : workspace_(workspace), scanner_(workspace), store_(workspace) {
    LOG_DEBUG("Flow created for workspace: " + workspace_.string());
}

std::optional<JobView> Flow::get(const JobId& id) const noexcept {
    if (!Scanner::isValidJobId(id)) {
        return std::nullopt;
    }
    try {
        // A requeue moves a job backwards from processing to ready while we
        // scan forwards; one more pass finds it.
        for (int attempt = 0; attempt < kLocateAttempts; ++attempt) {
            auto location = scanner_.locate(id);
            if (!location) {
                continue;
            }
            if (auto view = readView(id, *location)) {
                return view;
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error retrieving job " + id + ": " + e.what());
    }
    return std::nullopt;
}

Status Flow::status(const JobId& id) const noexcept {
    auto view = get(id);
    return view ? view->status : Status::Missing;
}

std::optional<std::string> Flow::result(const JobId& id) const {
    auto view = get(id);
    if (!view || view->status != Status::Succeeded) {
        return std::nullopt;
    }
    return store_.get(view->resultRef);
}

std::vector<JobView> Flow::recent(std::size_t max) const noexcept {
    std::vector<JobView> jobs;
    try {
        for (const auto& [dir, phase] : {std::pair{scanner_.doneDir(), Phase::Done},
                                         std::pair{scanner_.failedDir(), Phase::Failed}}) {
            std::error_code ec;
            for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
                JobId id = it->path().filename().string();
                if (!Scanner::isValidJobId(id)) {
                    continue;
                }
                if (auto view = readView(id, Location{"", phase, it->path()})) {
                    jobs.push_back(std::move(*view));
                }
            }
        }

        std::sort(jobs.begin(), jobs.end(), [](const JobView& a, const JobView& b) {
            return a.finishedAt > b.finishedAt;
        });
        if (jobs.size() > max) {
            jobs.resize(max);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error listing jobs: " + std::string(e.what()));
    }
    return jobs;
}

std::optional<JobView> Flow::readView(const JobId& id, const Location& location) const {
    auto text = fsio::read(location.path / "job.json");
    if (!text) {
        // Moved between locate() and the read
        return std::nullopt;
    }

    JobView view;
    try {
        auto record = json::parse(*text);
        view.id = id;
        view.service = record.value("service", location.service);
        view.createdAt = record.value("created_at", std::int64_t{0});
        view.deliveries = record.value("deliveries", 0);
    } catch (const json::exception& e) {
        LOG_ERROR("Corrupt job record for " + id + ": " + e.what());
        return std::nullopt;
    }

    switch (location.phase) {
        case Phase::Ready:
            // Requeued after a lost lease; it was already Running once
            view.status = view.deliveries > 0 ? Status::Running : Status::Queued;
            return view;
        case Phase::Processing:
            view.status = Status::Running;
            return view;
        case Phase::Done:
        case Phase::Failed:
            break;
    }

    auto outcomeText = fsio::read(location.path / "outcome.json");
    if (!outcomeText) {
        LOG_ERROR("Terminal job without outcome: " + id);
        return std::nullopt;
    }
    try {
        auto outcome = json::parse(*outcomeText);
        view.status = location.phase == Phase::Done ? Status::Succeeded : Status::Failed;
        view.finishedAt = outcome.value("finished_at", std::int64_t{0});
        view.resultRef = outcome.value("result_ref", std::string{});
        view.message = outcome.value("error", std::string{});
        auto code = parseErrorCode(outcome.value("error_code", std::string{"None"}));
        view.error = code ? *code : ErrorCode::StorageFailure;
    } catch (const json::exception& e) {
        LOG_ERROR("Corrupt outcome for " + id + ": " + e.what());
        return std::nullopt;
    }
    return view;
}

}
