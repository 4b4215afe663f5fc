/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/queue.hpp"
#include "fanout/fsio.hpp"
#include "fanout/logger.hpp"
#include <chrono>
#include <cstdio>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

namespace fanout {

namespace {

using nlohmann::json;

// Lease owner used when cancel() claims a queued job itself.
const std::string kCancelOwnerPrefix = "cancel@";

// Serializes reapers of one service across processes; claims never take it.
class ReapLock {
public:
    explicit ReapLock(const std::filesystem::path& path) {
        fd_ = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
        if (fd_ >= 0 && ::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }
    ~ReapLock() {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }
    ReapLock(const ReapLock&) = delete;
    ReapLock& operator=(const ReapLock&) = delete;

    [[nodiscard]] bool held() const noexcept { return fd_ >= 0; }

private:
    int fd_ = -1;
};

std::optional<json> readJson(const std::filesystem::path& path) noexcept {
    auto text = fsio::read(path);
    if (!text) {
        return std::nullopt;
    }
    try {
        return json::parse(*text);
    } catch (const json::exception& e) {
        LOG_ERROR("Corrupt record " + path.string() + ": " + e.what());
        return std::nullopt;
    }
}

}

JobQueue::JobQueue(const std::filesystem::path& workspace, RegistryPtr registry, QueueOptions options)
    : workspace_(workspace), options_(options), scanner_(workspace), registry_(std::move(registry)) {
    if (!createWorkspace()) {
        LOG_ERROR("Failed to initialize workspace: " + workspace_.string());
    }
}

JobQueue::~JobQueue() {
    shutdown();
}

EnqueueResult JobQueue::enqueue(const std::string& service, const std::string& payload) {
    auto reg = registry();
    if (!reg || !reg->contains(service)) {
        LOG_DEBUG("Rejecting job for unknown service: " + service);
        return {false, "", ErrorCode::UnknownService, "Unknown service: " + service};
    }
    if (payload.empty()) {
        return {false, "", ErrorCode::InvalidRequest, "Payload is empty"};
    }
    if (payload.size() > options_.maxPayloadBytes) {
        LOG_DEBUG("Payload exceeds size limit: " + std::to_string(payload.size()) + " > " +
                  std::to_string(options_.maxPayloadBytes));
        return {false, "", ErrorCode::InvalidRequest,
                "Payload exceeds maximum size limit (" + std::to_string(options_.maxPayloadBytes) + " bytes)"};
    }
    if (!ensureServiceDirs(service)) {
        return {false, "", ErrorCode::EnqueueFailure, "Failed to create queue for " + service};
    }

    JobId jobId = generateId();
    auto stagingPath = scanner_.stagingDir() / jobId;

    std::error_code ec;
    std::filesystem::create_directories(stagingPath, ec);
    if (ec) {
        LOG_ERROR("Failed to create job directory for " + jobId + ": " + ec.message());
        return {false, "", ErrorCode::EnqueueFailure, "Failed to create job directory"};
    }

    json record = {
        {"id", jobId},
        {"service", service},
        {"created_at", fsio::nowMillis()},
        {"deliveries", 0}
    };
    if (!fsio::writeAtomic(stagingPath / "payload", payload) ||
        !fsio::writeAtomic(stagingPath / "job.json", record.dump())) {
        LOG_ERROR("Failed to write job files for: " + jobId);
        cleanupStaging(jobId);
        return {false, "", ErrorCode::EnqueueFailure, "Failed to write job files"};
    }

    if (!fsio::moveDir(stagingPath, scanner_.readyDir(service) / jobId)) {
        LOG_ERROR("Failed to publish job: " + jobId);
        cleanupStaging(jobId);
        return {false, "", ErrorCode::EnqueueFailure, "Failed to publish job"};
    }

    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        ++generation_;
    }
    wake_.notify_all();

    LOG_INFO("Job queued: " + jobId + " -> " + service);
    return {true, jobId, ErrorCode::None, ""};
}

std::optional<Job> JobQueue::dequeue(const std::string& service, const std::string& owner, bool block) {
    if (!ensureServiceDirs(service)) {
        LOG_ERROR("Queue directories unavailable for " + service);
    }

    while (!shutdown_.load()) {
        std::uint64_t seen;
        {
            std::lock_guard<std::mutex> lock(wakeMutex_);
            seen = generation_;
        }

        reapExpired(service);

        for (const auto& id : scanner_.ready(service)) {
            if (shutdown_.load()) {
                return std::nullopt;
            }
            if (auto job = claim(service, id, owner)) {
                return job;
            }
        }

        if (!block) {
            return std::nullopt;
        }

        // Other processes enqueue without notifying us, hence the bounded wait
        std::unique_lock<std::mutex> lock(wakeMutex_);
        wake_.wait_for(lock, options_.pollInterval, [this, seen] {
            return shutdown_.load() || generation_ != seen;
        });
    }
    return std::nullopt;
}

std::optional<Job> JobQueue::claim(const std::string& service, const JobId& id, const std::string& owner) {
    auto readyPath = scanner_.readyDir(service) / id;
    auto processingPath = scanner_.processingDir(service) / id;

    std::error_code ec;
    bool cancelled = std::filesystem::exists(readyPath / "cancel", ec);

    if (!fsio::moveDir(readyPath, processingPath)) {
        LOG_DEBUG("Job already claimed or missing: " + id);
        return std::nullopt;
    }

    // Overwrites any lease a crashed previous holder left behind
    if (!writeLease(processingPath, owner)) {
        LOG_ERROR("Failed to write lease for " + id + ", leaving it for the reaper");
        return std::nullopt;
    }

    if (cancelled) {
        LOG_INFO("Dropping cancelled job: " + id);
        (void)finalize(processingPath, id, Outcome::failed(ErrorCode::Cancelled, "Cancelled before execution"));
        return std::nullopt;
    }

    auto record = readJson(processingPath / "job.json");
    auto payload = fsio::read(processingPath / "payload");
    if (!record || !payload) {
        (void)finalize(processingPath, id, Outcome::failed(ErrorCode::StorageFailure, "Job record unreadable"));
        return std::nullopt;
    }

    Job job;
    try {
        job.id = id;
        job.service = record->value("service", service);
        job.createdAt = record->value("created_at", std::int64_t{0});
        job.deliveries = record->value("deliveries", 0) + 1;
        job.payload = std::move(*payload);
        job.owner = owner;
        (*record)["deliveries"] = job.deliveries;
    } catch (const json::exception& e) {
        (void)finalize(processingPath, id, Outcome::failed(ErrorCode::StorageFailure, std::string("Job record invalid: ") + e.what()));
        return std::nullopt;
    }

    if (!fsio::writeAtomic(processingPath / "job.json", record->dump())) {
        (void)finalize(processingPath, id, Outcome::failed(ErrorCode::StorageFailure, "Failed to record delivery"));
        return std::nullopt;
    }

    LOG_DEBUG("Job " + id + " claimed by " + owner + " (delivery " + std::to_string(job.deliveries) + ")");
    return job;
}

bool JobQueue::ack(const Job& job, const Outcome& outcome) noexcept {
    auto processingPath = scanner_.processingDir(job.service) / job.id;

    auto holder = leaseOwner(processingPath);
    if (!holder || *holder != job.owner) {
        LOG_WARN("Lease lost for job " + job.id + " (owner " + job.owner + "), discarding outcome");
        return false;
    }
    if (outcome.status != Status::Succeeded && outcome.status != Status::Failed) {
        LOG_ERROR("Ack with non-terminal status for job " + job.id);
        return false;
    }
    if (outcome.status == Status::Succeeded && outcome.resultRef.empty()) {
        LOG_ERROR("Ack(Succeeded) without result reference for job " + job.id);
        return false;
    }
    return finalize(processingPath, job.id, outcome);
}

bool JobQueue::renew(const Job& job) noexcept {
    auto processingPath = scanner_.processingDir(job.service) / job.id;
    auto holder = leaseOwner(processingPath);
    if (!holder || *holder != job.owner) {
        return false;
    }
    return writeLease(processingPath, job.owner);
}

bool JobQueue::cancelRequested(const Job& job) const noexcept {
    std::error_code ec;
    return std::filesystem::exists(scanner_.processingDir(job.service) / job.id / "cancel", ec);
}

CancelResult JobQueue::cancel(const JobId& id) {
    for (int attempt = 0; attempt < 3; ++attempt) {
        auto location = scanner_.locate(id);
        if (!location) {
            continue;
        }
        switch (location->phase) {
            case Phase::Done:
            case Phase::Failed:
                return CancelResult::AlreadyFinished;
            case Phase::Processing:
                if (fsio::writeAtomic(location->path / "cancel", "")) {
                    LOG_INFO("Cancellation requested for running job: " + id);
                    return CancelResult::Requested;
                }
                break;
            case Phase::Ready: {
                // Claim it like a worker would, then fail it without running
                if (auto job = claim(location->service, id, kCancelOwnerPrefix + std::to_string(::getpid()))) {
                    if (ack(*job, Outcome::failed(ErrorCode::Cancelled, "Cancelled before execution"))) {
                        LOG_INFO("Cancelled queued job: " + id);
                        return CancelResult::Cancelled;
                    }
                }
                break;
            }
        }
    }
    auto location = scanner_.locate(id);
    if (!location) {
        return CancelResult::NotFound;
    }
    if (location->phase == Phase::Done || location->phase == Phase::Failed) {
        return CancelResult::AlreadyFinished;
    }
    // Lost a race with a worker claim; fall back to the running-job path
    if (fsio::writeAtomic(location->path / "cancel", "")) {
        return CancelResult::Requested;
    }
    return CancelResult::NotFound;
}

std::size_t JobQueue::reapExpired(const std::string& service) {
    auto processing = scanner_.processing(service);
    if (processing.empty()) {
        return 0;
    }

    ReapLock lock(workspace_ / "queues" / service / ".reap.lock");
    if (!lock.held()) {
        return 0;
    }

    std::size_t touched = 0;
    auto now = fsio::nowMillis();
    for (const auto& id : processing) {
        try {
            if (reapOne(service, id, now)) {
                ++touched;
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Error reaping job " + id + ": " + e.what());
        }
    }
    return touched;
}

bool JobQueue::reapOne(const std::string& service, const JobId& id, std::int64_t now) {
    auto processingPath = scanner_.processingDir(service) / id;
    auto lease = readJson(processingPath / "lease.json");

    std::int64_t expiresAt;
    if (lease && lease->contains("expires_at")) {
        expiresAt = lease->value("expires_at", std::int64_t{0});
        std::lock_guard<std::mutex> guard(leaselessMutex_);
        leaselessSince_.erase(id);
    } else {
        // Claimed but the lease never landed (crash between rename and write)
        std::lock_guard<std::mutex> guard(leaselessMutex_);
        auto it = leaselessSince_.emplace(id, now).first;
        expiresAt = it->second + options_.visibilityTimeout.count();
    }

    if (expiresAt > now) {
        return false;
    }

    auto record = readJson(processingPath / "job.json");
    int deliveries = record ? record->value("deliveries", 0) : options_.maxDeliveries;

    {
        std::lock_guard<std::mutex> guard(leaselessMutex_);
        leaselessSince_.erase(id);
    }

    // A cancel that died before its ack must not turn into a delivery
    std::error_code cancelEc;
    bool cancelClaim = lease && lease->contains("owner") && (*lease)["owner"].is_string() &&
                       (*lease)["owner"].get<std::string>().rfind(kCancelOwnerPrefix, 0) == 0;
    if (cancelClaim || std::filesystem::exists(processingPath / "cancel", cancelEc)) {
        LOG_WARN("Job " + id + " was cancelled before its lease expired, marking failed");
        return finalize(processingPath, id, Outcome::failed(ErrorCode::Cancelled,
            cancelClaim ? "Cancelled before execution" : "Cancelled while running"));
    }

    if (deliveries < options_.maxDeliveries) {
        std::error_code ec;
        std::filesystem::remove(processingPath / "lease.json", ec);
        if (fsio::moveDir(processingPath, scanner_.readyDir(service) / id)) {
            LOG_WARN("Requeued job with expired lease: " + id + " (delivery " + std::to_string(deliveries) + ")");
            {
                std::lock_guard<std::mutex> guard(wakeMutex_);
                ++generation_;
            }
            wake_.notify_all();
            return true;
        }
        return false;
    }

    LOG_WARN("Job " + id + " abandoned after " + std::to_string(deliveries) + " deliveries, marking failed");
    return finalize(processingPath, id, Outcome::failed(ErrorCode::WorkerCrash,
        "Worker did not acknowledge within " + std::to_string(options_.visibilityTimeout.count()) +
        "ms on " + std::to_string(deliveries) + " deliveries"));
}

bool JobQueue::finalize(const std::filesystem::path& jobPath, const JobId& id, const Outcome& outcome) noexcept {
    try {
        json record = {
            {"status", toString(outcome.status)},
            {"finished_at", fsio::nowMillis()}
        };
        if (outcome.status == Status::Succeeded) {
            record["result_ref"] = outcome.resultRef;
        } else {
            record["error_code"] = toString(outcome.error);
            record["error"] = outcome.message;
        }

        if (!fsio::writeAtomic(jobPath / "outcome.json", record.dump())) {
            LOG_ERROR("Failed to write outcome for job: " + id);
            return false;
        }

        auto target = (outcome.status == Status::Succeeded ? scanner_.doneDir() : scanner_.failedDir()) / id;
        if (!fsio::moveDir(jobPath, target)) {
            LOG_ERROR("Failed to move job " + id + " to " + target.string());
            return false;
        }

        LOG_DEBUG("Job " + id + " finalized as " + toString(outcome.status));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to finalize job " + id + ": " + e.what());
        return false;
    }
}

bool JobQueue::writeLease(const std::filesystem::path& jobPath, const std::string& owner) noexcept {
    try {
        json lease = {
            {"owner", owner},
            {"expires_at", fsio::nowMillis() + options_.visibilityTimeout.count()}
        };
        return fsio::writeAtomic(jobPath / "lease.json", lease.dump());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to build lease: " + std::string(e.what()));
        return false;
    }
}

std::optional<std::string> JobQueue::leaseOwner(const std::filesystem::path& jobPath) const noexcept {
    auto lease = readJson(jobPath / "lease.json");
    if (!lease || !lease->contains("owner") || !(*lease)["owner"].is_string()) {
        return std::nullopt;
    }
    return (*lease)["owner"].get<std::string>();
}

void JobQueue::shutdown() noexcept {
    if (shutdown_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        ++generation_;
    }
    wake_.notify_all();
}

void JobQueue::setRegistry(RegistryPtr registry) {
    if (registry) {
        for (const auto& service : registry->list()) {
            (void)ensureServiceDirs(service.name);
        }
    }
    std::lock_guard<std::mutex> lock(registryMutex_);
    registry_ = std::move(registry);
}

RegistryPtr JobQueue::registry() const {
    std::lock_guard<std::mutex> lock(registryMutex_);
    return registry_;
}

bool JobQueue::createWorkspace() noexcept {
    try {
        std::filesystem::create_directories(scanner_.stagingDir());
        std::filesystem::create_directories(scanner_.doneDir());
        std::filesystem::create_directories(scanner_.failedDir());
        std::filesystem::create_directories(workspace_ / "queues");

        bool ok = true;
        if (registry_) {
            for (const auto& service : registry_->list()) {
                ok = ensureServiceDirs(service.name) && ok;
            }
        }
        return ok;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create workspace: " + std::string(e.what()));
        return false;
    }
}

bool JobQueue::ensureServiceDirs(const std::string& service) noexcept {
    if (!ServiceRegistry::isValidName(service)) {
        return false;
    }
    std::error_code ec;
    std::filesystem::create_directories(scanner_.readyDir(service), ec);
    if (ec) {
        LOG_ERROR("Failed to create " + scanner_.readyDir(service).string() + ": " + ec.message());
        return false;
    }
    std::filesystem::create_directories(scanner_.processingDir(service), ec);
    if (ec) {
        LOG_ERROR("Failed to create " + scanner_.processingDir(service).string() + ": " + ec.message());
        return false;
    }
    return true;
}

JobId JobQueue::generateId() {
    static std::atomic<std::uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::uint64_t unique = counter.fetch_add(1) % 1000000;

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%016lld_%08d_%06llu",
                  static_cast<long long>(now), static_cast<int>(::getpid()),
                  static_cast<unsigned long long>(unique));
    return buf;
}

void JobQueue::cleanupStaging(const JobId& id) const noexcept {
    std::error_code ec;
    std::filesystem::remove_all(scanner_.stagingDir() / id, ec);
}

}
