/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/gateway.hpp"
#include "fanout/logger.hpp"
#include "fanout/runner.hpp"
#include <algorithm>

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace fanout {

using nlohmann::json;

namespace {

void setJsonResponse(httplib::Response& response, int status, const json& body) {
    response.status = status;
    response.set_content(body.dump(), "application/json");
}

std::string errorDetail(const std::string& body) {
    try {
        auto parsed = json::parse(body);
        if (parsed.is_object() && parsed.contains("detail") && parsed["detail"].is_string()) {
            return parsed["detail"].get<std::string>();
        }
    } catch (const json::exception&) {
        // Not one of ours; report the raw body
    }
    return body;
}

}

GatewayResult GatewayClient::predict(const ServiceDescriptor& service, const std::string& payload,
                                     std::chrono::milliseconds timeout) const {
    GatewayResult result;
    auto started = std::chrono::steady_clock::now();

    httplib::Client client(service.address);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);

    auto response = client.Post("/predict", payload, "application/octet-stream");
    if (!response) {
        auto elapsed = std::chrono::steady_clock::now() - started;
        auto err = response.error();
        if (err == httplib::Error::Read || elapsed >= timeout) {
            result.error = ErrorCode::Timeout;
            result.message = service.name + " did not answer within " + std::to_string(timeout.count()) + "ms";
        } else {
            result.error = ErrorCode::BackendFailure;
            result.message = service.name + " unreachable at " + service.address + ": " + httplib::to_string(err);
        }
        LOG_WARN(result.message);
        return result;
    }

    result.status = response->status;
    result.body = response->body;
    result.contentType = response->get_header_value("Content-Type");

    if (response->status >= 200 && response->status < 300) {
        result.ok = true;
        return result;
    }
    if (response->status == 504) {
        result.error = ErrorCode::Timeout;
        result.message = service.name + " timed out: " + errorDetail(response->body);
    } else {
        result.error = ErrorCode::BackendFailure;
        result.message = service.name + " returned " + std::to_string(response->status) + ": " +
                         errorDetail(response->body);
    }
    LOG_DEBUG(result.message);
    return result;
}

bool GatewayClient::ping(const ServiceDescriptor& service, std::chrono::milliseconds timeout) const {
    httplib::Client client(service.address);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);

    auto response = client.Get("/status");
    return response && response->status >= 200 && response->status < 300;
}

Gateway::Gateway(std::shared_ptr<Backend> backend, std::string host, int port,
                 std::chrono::milliseconds timeout, int threads)
    : backend_(std::move(backend)), host_(std::move(host)), port_(port), timeout_(timeout), threads_(threads) {
}

Gateway::~Gateway() {
    shutdown();
}

bool Gateway::start() {
    if (running_.load()) {
        LOG_WARN("Gateway is already running");
        return false;
    }
    if (!backend_) {
        LOG_ERROR("Gateway started without a backend");
        return false;
    }

    server_ = std::make_unique<httplib::Server>();
    server_->new_task_queue = [threads = std::max(1, threads_)] {
        return new httplib::ThreadPool(static_cast<std::size_t>(threads));
    };
    registerRoutes();

    if (port_ == 0) {
        boundPort_ = server_->bind_to_any_port(host_);
    } else {
        boundPort_ = server_->bind_to_port(host_, port_) ? port_ : -1;
    }
    if (boundPort_ < 0) {
        LOG_ERROR("Gateway failed to bind " + host_ + ":" + std::to_string(port_));
        server_.reset();
        return false;
    }

    running_.store(true);
    thread_ = std::thread([this] {
        setThreadName("gateway");
        if (!server_->listen_after_bind()) {
            LOG_ERROR("Gateway listener stopped unexpectedly");
        }
    });
    // stop() is a no-op until the listener runs
    for (int i = 0; i < 200 && !server_->is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    LOG_INFO("Gateway for " + backend_->name() + " listening on " + host_ + ":" + std::to_string(boundPort_));
    return true;
}

void Gateway::shutdown() noexcept {
    if (!running_.exchange(false)) {
        return;
    }
    server_->stop();
    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO("Gateway for " + backend_->name() + " stopped");
}

void Gateway::registerRoutes() {
    server_->Post("/predict", [this](const httplib::Request& request, httplib::Response& response) {
        Runner runner(backend_);
        auto result = runner.run(request.body, JobContext::withTimeout(timeout_));
        if (result) {
            response.status = 200;
            response.set_content(result.output, "application/json");
            return;
        }

        int status = 422;
        if (result.error == ErrorCode::Timeout) {
            status = 504;
        } else if (result.error == ErrorCode::Cancelled) {
            status = 500;
        }
        setJsonResponse(response, status, {{"error", toString(result.error)}, {"detail", result.message}});
    });

    server_->Get("/status", [this](const httplib::Request&, httplib::Response& response) {
        setJsonResponse(response, 200, {{"status", "ok"}, {"service", backend_->name()}});
    });
}

}
