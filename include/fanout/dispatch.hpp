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

#include "fanout/config.hpp"
#include "fanout/gateway.hpp"
#include "fanout/registry.hpp"

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace fanout {

class Flow;
class JobQueue;

/**
 * Single HTTP entry point.
 *
 * Routes each request by kind: predict goes to the service's gateway inline
 * (diverted to the queue when the payload is too large for the sync path),
 * train and jobs go to the durable queue and return a job id at once. Status
 * and results are served from the workspace through Flow.
 */
class DispatchServer final {
public:
    DispatchServer(const Config& config, RegistryPtr registry);
    ~DispatchServer();

    DispatchServer(const DispatchServer&) = delete;
    DispatchServer& operator=(const DispatchServer&) = delete;
    DispatchServer(DispatchServer&&) = delete;
    DispatchServer& operator=(DispatchServer&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;

    // Swaps in a new registry snapshot; requests already routed keep the old one.
    void reloadRegistry(RegistryPtr registry);
    [[nodiscard]] RegistryPtr registry() const;

    [[nodiscard]] int port() const noexcept { return boundPort_; }
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

private:
    Config config_;
    std::unique_ptr<JobQueue> queue_;
    std::unique_ptr<Flow> flow_;
    GatewayClient client_;

    std::unique_ptr<httplib::Server> server_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    int boundPort_ = -1;

    void registerRoutes();

    void handlePredict(const httplib::Request& request, httplib::Response& response);
    void handleEnqueue(const std::string& service, const std::string& payload, httplib::Response& response);
    void handleFanOut(const httplib::Request& request, httplib::Response& response);
    void handleJob(const std::string& id, httplib::Response& response);
    void handleResult(const std::string& id, httplib::Response& response);
    void handleCancel(const std::string& id, httplib::Response& response);
    void handleServices(httplib::Response& response);
    void handleService(const std::string& name, httplib::Response& response);
    void handleStatus(httplib::Response& response);
};

}
