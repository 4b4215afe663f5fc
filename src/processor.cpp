/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/processor.hpp"
#include "fanout/logger.hpp"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {
std::mutex g_output_mutex;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    return buf;
}

void printLine(const std::string& jobId, const char* color, const char* state, const std::string& detail) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << "    \033[90m" << timestamp() << "\033[0m  " << jobId << "  " << color << state << "\033[0m";
    if (!detail.empty()) {
        std::cout << "  " << detail;
    }
    std::cout << "\n" << std::flush;
}

}

namespace fanout {

Processor::Processor(JobQueue& queue, const ResultStore& store, std::shared_ptr<Backend> backend,
                     std::chrono::milliseconds jobTimeout)
    : queue_(queue), store_(store), runner_(std::move(backend)), jobTimeout_(jobTimeout) {
}

ProcessResult Processor::process(const Job& job) noexcept {
    LOG_DEBUG("Processing job: " + job.id + " (delivery " + std::to_string(job.deliveries) + ")");
    printLine(job.id, "\033[33m", "running", job.deliveries > 1 ? "redelivery" : "");
    auto startTime = std::chrono::steady_clock::now();

    try {
        auto context = JobContext::withTimeout(jobTimeout_, job.id);
        context.cancelCheck = [this, &job] { return queue_.cancelRequested(job); };

        auto result = runner_.run(job.payload, context);
        if (!result) {
            return fail(job, result.error, result.message);
        }

        // Another instance may own the job by now; its result wins
        if (!queue_.renew(job)) {
            LOG_WARN("Lease lost before storing result for job: " + job.id);
            return ProcessResult::LeaseLost;
        }

        // The artifact must exist before the job can be seen as Succeeded
        auto ref = store_.put(job.id, result.output);
        if (!ref) {
            return fail(job, ErrorCode::StorageFailure, "Failed to store result artifact");
        }

        if (!queue_.ack(job, Outcome::succeeded(*ref))) {
            LOG_ERROR("Failed to record success for job: " + job.id);
            return ProcessResult::LeaseLost;
        }

        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
        std::ostringstream detail;
        detail << std::fixed << std::setprecision(1) << elapsed << "s";
        printLine(job.id, "\033[32m", "done", detail.str());
        LOG_INFO("JOB COMPLETED: " + job.id + " -> " + std::to_string(result.output.size()) + " bytes");
        return ProcessResult::Success;

    } catch (const std::exception& e) {
        LOG_ERROR("Exception processing job " + job.id + ": " + std::string(e.what()));
        return fail(job, ErrorCode::BackendFailure, "Internal processing error: " + std::string(e.what()));
    }
}

ProcessResult Processor::fail(const Job& job, ErrorCode code, const std::string& message) noexcept {
    printLine(job.id, "\033[31m", "failed", toString(code));
    LOG_WARN("Job failed: " + job.id + " - " + toString(code) + ": " + message);
    if (!queue_.ack(job, Outcome::failed(code, message))) {
        LOG_ERROR("Failed to record failure for job: " + job.id);
        return ProcessResult::LeaseLost;
    }
    return ProcessResult::Failed;
}

}
