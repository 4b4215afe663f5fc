/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "fanout/backend.hpp"
#include "fanout/registry.hpp"
#include "fanout/types.hpp"

namespace httplib {
class Server;
}

namespace fanout {

struct GatewayResult {
    bool ok = false;
    int status = 0;             // HTTP status from the gateway, 0 when none arrived
    std::string body;
    std::string contentType;
    ErrorCode error = ErrorCode::None;
    std::string message;

    explicit operator bool() const noexcept { return ok; }
};

// Caller side of the synchronous path, shared by the dispatch server and HttpBackend.
class GatewayClient final {
public:
    GatewayClient() = default;

    [[nodiscard]] GatewayResult predict(const ServiceDescriptor& service, const std::string& payload,
                                        std::chrono::milliseconds timeout) const;

    // GET /status; true on any 2xx answer.
    [[nodiscard]] bool ping(const ServiceDescriptor& service, std::chrono::milliseconds timeout) const;
};

/**
 * Synchronous Gateway: serves one backend over HTTP.
 *
 *   POST /predict  body is the payload, answered inline with no job record
 *   GET  /status   health probe
 */
class Gateway final {
public:
    Gateway(std::shared_ptr<Backend> backend, std::string host, int port,
            std::chrono::milliseconds timeout, int threads = 4);
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;
    Gateway(Gateway&&) = delete;
    Gateway& operator=(Gateway&&) = delete;

    // Binds and starts serving on a background thread. Port 0 picks a free port.
    [[nodiscard]] bool start();
    void shutdown() noexcept;

    [[nodiscard]] int port() const noexcept { return boundPort_; }
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

private:
    std::shared_ptr<Backend> backend_;
    std::string host_;
    int port_;
    int boundPort_ = -1;
    std::chrono::milliseconds timeout_;
    int threads_;

    std::unique_ptr<httplib::Server> server_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    void registerRoutes();
};

}
