/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "fanout/config.hpp"
#include "fanout/registry.hpp"
#include "fanout/scanner.hpp"
#include "fanout/types.hpp"

namespace fanout {

// A job handed to one worker instance by dequeue().
struct Job {
    JobId id;
    std::string service;
    std::string payload;
    std::int64_t createdAt = 0;
    int deliveries = 0;
    std::string owner;
};

struct Outcome {
    Status status = Status::Failed;
    std::string resultRef;
    ErrorCode error = ErrorCode::None;
    std::string message;

    [[nodiscard]] static Outcome succeeded(std::string ref) {
        return {Status::Succeeded, std::move(ref), ErrorCode::None, ""};
    }
    [[nodiscard]] static Outcome failed(ErrorCode code, std::string message) {
        return {Status::Failed, "", code, std::move(message)};
    }
};

struct EnqueueResult {
    bool ok = false;
    JobId id;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

enum class CancelResult : uint8_t {
    Cancelled,        // was Queued, now Failed(Cancelled)
    Requested,        // Running, worker will observe the marker
    AlreadyFinished,
    NotFound
};

/**
 * Durable multi-process job queue on a shared workspace directory.
 *
 * Every state change is one rename(2): staging -> ready publishes, ready ->
 * processing claims, processing -> done/failed completes. Two claimers racing
 * for one job cannot both win the rename.
 */
class JobQueue final {
public:
    JobQueue(const std::filesystem::path& workspace, RegistryPtr registry, QueueOptions options = {});
    ~JobQueue();

    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;
    JobQueue(JobQueue&&) = delete;
    JobQueue& operator=(JobQueue&&) = delete;

    [[nodiscard]] EnqueueResult enqueue(const std::string& service, const std::string& payload);

    // Claims the oldest ready job of service. With block, suspends until one is
    // available or shutdown() is called; returns nullopt on shutdown.
    [[nodiscard]] std::optional<Job> dequeue(const std::string& service, const std::string& owner, bool block = true);

    // Completes a job. False when the caller no longer holds the lease.
    [[nodiscard]] bool ack(const Job& job, const Outcome& outcome) noexcept;
    [[nodiscard]] bool renew(const Job& job) noexcept;
    [[nodiscard]] bool cancelRequested(const Job& job) const noexcept;
    [[nodiscard]] CancelResult cancel(const JobId& id);

    // Requeues or fails processing jobs whose lease has expired. Returns jobs touched.
    std::size_t reapExpired(const std::string& service);

    void shutdown() noexcept;
    [[nodiscard]] bool isShutdown() const noexcept { return shutdown_.load(); }

    void setRegistry(RegistryPtr registry);
    [[nodiscard]] RegistryPtr registry() const;

    [[nodiscard]] std::size_t depth(const std::string& service) const noexcept { return scanner_.readyJobCount(service); }
    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }
    [[nodiscard]] const QueueOptions& options() const noexcept { return options_; }

private:
    std::filesystem::path workspace_;
    QueueOptions options_;
    Scanner scanner_;

    mutable std::mutex registryMutex_;
    RegistryPtr registry_;

    std::mutex wakeMutex_;
    std::condition_variable wake_;
    std::uint64_t generation_ = 0;
    std::atomic<bool> shutdown_{false};

    std::mutex leaselessMutex_;
    std::unordered_map<JobId, std::int64_t> leaselessSince_;

    [[nodiscard]] bool createWorkspace() noexcept;
    [[nodiscard]] bool ensureServiceDirs(const std::string& service) noexcept;
    [[nodiscard]] static JobId generateId();

    [[nodiscard]] std::optional<Job> claim(const std::string& service, const JobId& id, const std::string& owner);
    [[nodiscard]] bool finalize(const std::filesystem::path& jobPath, const JobId& id, const Outcome& outcome) noexcept;
    [[nodiscard]] bool writeLease(const std::filesystem::path& jobPath, const std::string& owner) noexcept;
    [[nodiscard]] std::optional<std::string> leaseOwner(const std::filesystem::path& jobPath) const noexcept;
    [[nodiscard]] bool reapOne(const std::string& service, const JobId& id, std::int64_t now);
    void cleanupStaging(const JobId& id) const noexcept;
};

}
