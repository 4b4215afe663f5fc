/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/worker.hpp"
#include "fanout/logger.hpp"
#include "fanout/processor.hpp"
#include "fanout/queue.hpp"
#include "fanout/store.hpp"
#include <cstdio>
#include <unistd.h>

namespace fanout {

// Note: Signal handling is done by the CLI (fanout-worker.cpp), not by Worker

Worker::Worker(std::string service, const Config& config, RegistryPtr registry,
               std::shared_ptr<Backend> backend, int instances)
    : service_(std::move(service)), config_(config), registry_(std::move(registry)),
      backend_(std::move(backend)), instances_(instances) {
    LOG_DEBUG("Worker created - service: " + service_ + ", workspace: " + config_.workspace.string() +
              ", instances: " + std::to_string(instances_));
}

Worker::~Worker() {
    shutdown();
}

bool Worker::start() {
    if (running_.load()) {
        LOG_WARN("Worker already running");
        return false;
    }
    if (!registry_ || !registry_->contains(service_)) {
        LOG_ERROR("Service not in registry: " + service_);
        return false;
    }
    if (!backend_) {
        LOG_ERROR("No backend for service: " + service_);
        return false;
    }
    if (instances_ < 1) {
        LOG_ERROR("Worker needs at least one instance");
        return false;
    }

    LOG_INFO("Starting worker for " + service_ + "...");
    LOG_DEBUG("Backend: " + backend_->name());
    LOG_DEBUG("Workspace: " + config_.workspace.string());
    LOG_DEBUG("Instances: " + std::to_string(instances_));
    LOG_DEBUG("Job timeout: " + std::to_string(config_.jobTimeout.count()) + "ms, visibility: " +
              std::to_string(config_.queue.visibilityTimeout.count()) + "ms");

    try {
        queue_ = std::make_unique<JobQueue>(config_.workspace, registry_, config_.queue);
        store_ = std::make_unique<ResultStore>(config_.workspace);
        processor_ = std::make_unique<Processor>(*queue_, *store_, backend_, config_.jobTimeout);

        // Jobs left behind by a previous crash of any instance
        auto reaped = queue_->reapExpired(service_);
        if (reaped > 0) {
            LOG_INFO("Recovered " + std::to_string(reaped) + " abandoned job(s)");
        }

        running_.store(true);
        for (int i = 0; i < instances_; ++i) {
            threads_.emplace_back(&Worker::instanceLoop, this, i);
        }

        LOG_DEBUG("Worker started successfully");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start worker: " + std::string(e.what()));
        running_.store(false);
        queue_.reset();
        return false;
    }
}

void Worker::shutdown() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Shutting down worker for " + service_ + "...");

    if (queue_) {
        queue_->shutdown();
    }
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    processor_.reset();
    store_.reset();
    queue_.reset();

    LOG_INFO("Worker shutdown complete");
}

void Worker::instanceLoop(int instance) {
    const std::string owner = ownerId(instance);
    setThreadName(owner);
    LOG_DEBUG("Instance started: " + owner);

    while (running_.load()) {
        try {
            auto job = queue_->dequeue(service_, owner);
            if (!job) {
                continue;
            }
            (void)processor_->process(*job);
            processed_.fetch_add(1);
        } catch (const std::exception& e) {
            LOG_ERROR("Instance loop error: " + std::string(e.what()));
            std::this_thread::sleep_for(config_.queue.pollInterval);
        }
    }

    LOG_DEBUG("Instance stopped: " + owner);
}

std::string Worker::ownerId(int instance) const {
    char host[256] = {0};
    if (::gethostname(host, sizeof(host) - 1) != 0) {
        std::snprintf(host, sizeof(host), "unknown");
    }
    return service_ + "@" + host + ":" + std::to_string(::getpid()) + "/" + std::to_string(instance);
}

}
