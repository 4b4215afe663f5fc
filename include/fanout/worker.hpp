/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "fanout/backend.hpp"
#include "fanout/config.hpp"
#include "fanout/registry.hpp"

namespace fanout {

class JobQueue;
class Processor;
class ResultStore;

/**
 * Consumer for exactly one service's queue.
 *
 * The service is a constructor argument, never derived from the process or
 * host name. Each instance is an independent thread with its own lease owner
 * id; more throughput means more instances or more processes.
 */
class Worker final {
public:
    Worker(std::string service, const Config& config, RegistryPtr registry,
           std::shared_ptr<Backend> backend, int instances = 1);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;
    Worker(Worker&&) = delete;
    Worker& operator=(Worker&&) = delete;

    [[nodiscard]] bool start();
    // Stops claiming, lets in-flight jobs finish, joins the instances.
    void shutdown() noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] const std::string& service() const noexcept { return service_; }
    [[nodiscard]] std::size_t processed() const noexcept { return processed_.load(); }

private:
    void instanceLoop(int instance);
    [[nodiscard]] std::string ownerId(int instance) const;

    std::string service_;
    Config config_;
    RegistryPtr registry_;
    std::shared_ptr<Backend> backend_;
    int instances_;

    std::unique_ptr<JobQueue> queue_;
    std::unique_ptr<ResultStore> store_;
    std::unique_ptr<Processor> processor_;

    std::atomic<bool> running_{false};
    std::atomic<std::size_t> processed_{0};
    std::vector<std::thread> threads_;
};

}
