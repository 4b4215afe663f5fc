/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/dispatch.hpp"
#include "fanout/flow.hpp"
#include "fanout/logger.hpp"
#include "fanout/queue.hpp"
#include <algorithm>

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace fanout {

using nlohmann::json;

namespace {

constexpr std::size_t kInlineResultLimit = 64 * 1024;
constexpr std::chrono::milliseconds kPingTimeout{2000};

const char* const kServiceRoute = "([A-Za-z0-9_-]+)";
const char* const kJobRoute = "([0-9_]+)";

void setJsonResponse(httplib::Response& response, int status, const json& body) {
    response.status = status;
    response.set_content(body.dump(), "application/json");
}

void setError(httplib::Response& response, ErrorCode code, const std::string& detail) {
    setJsonResponse(response, httpStatus(code), {{"error", toString(code)}, {"detail", detail}});
}

json describe(const ServiceDescriptor& service) {
    return {
        {"name", service.name},
        {"address", service.address},
        {"capability", toString(service.capability)}
    };
}

// Artifacts are usually JSON; anything else is embedded as a string.
json inlineResult(const std::string& bytes) {
    try {
        return json::parse(bytes);
    } catch (const json::exception&) {
        return bytes;
    }
}

}

DispatchServer::DispatchServer(const Config& config, RegistryPtr registry)
    : config_(config),
      queue_(std::make_unique<JobQueue>(config.workspace, std::move(registry), config.queue)),
      flow_(std::make_unique<Flow>(config.workspace)) {
    LOG_DEBUG("Dispatch server created - workspace: " + config_.workspace.string());
}

DispatchServer::~DispatchServer() {
    shutdown();
}

bool DispatchServer::start() {
    if (running_.load()) {
        LOG_WARN("Dispatch server already running");
        return false;
    }

    server_ = std::make_unique<httplib::Server>();
    server_->new_task_queue = [threads = std::max(1, config_.httpThreads)] {
        return new httplib::ThreadPool(static_cast<std::size_t>(threads));
    };
    server_->set_payload_max_length(config_.queue.maxPayloadBytes + 1024);
    registerRoutes();

    if (config_.port == 0) {
        boundPort_ = server_->bind_to_any_port(config_.host);
    } else {
        boundPort_ = server_->bind_to_port(config_.host, config_.port) ? config_.port : -1;
    }
    if (boundPort_ < 0) {
        LOG_ERROR("Failed to bind " + config_.host + ":" + std::to_string(config_.port));
        server_.reset();
        return false;
    }

    running_.store(true);
    thread_ = std::thread([this] {
        setThreadName("http");
        if (!server_->listen_after_bind()) {
            LOG_ERROR("Dispatch listener stopped unexpectedly");
        }
    });
    // stop() is a no-op until the listener runs
    for (int i = 0; i < 200 && !server_->is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    auto reg = registry();
    LOG_INFO("Dispatch listening on " + config_.host + ":" + std::to_string(boundPort_) + " with " +
             std::to_string(reg ? reg->size() : 0) + " service(s)");
    return true;
}

void DispatchServer::shutdown() noexcept {
    if (!running_.exchange(false)) {
        return;
    }
    LOG_INFO("Shutting down dispatch server...");
    server_->stop();
    if (thread_.joinable()) {
        thread_.join();
    }
    queue_->shutdown();
    LOG_INFO("Dispatch server shutdown complete");
}

void DispatchServer::reloadRegistry(RegistryPtr registry) {
    if (!registry) {
        return;
    }
    LOG_INFO("Registry reloaded: " + std::to_string(registry->size()) + " service(s)");
    queue_->setRegistry(std::move(registry));
}

RegistryPtr DispatchServer::registry() const {
    return queue_->registry();
}

void DispatchServer::registerRoutes() {
    const std::string service = kServiceRoute;
    const std::string job = kJobRoute;

    server_->Post("/predict/" + service, [this](const httplib::Request& req, httplib::Response& res) {
        handlePredict(req, res);
    });
    server_->Post("/train/" + service, [this](const httplib::Request& req, httplib::Response& res) {
        handleEnqueue(req.matches[1], req.body, res);
    });
    server_->Post("/jobs/" + service, [this](const httplib::Request& req, httplib::Response& res) {
        handleEnqueue(req.matches[1], req.body, res);
    });
    server_->Post("/jobs", [this](const httplib::Request& req, httplib::Response& res) {
        handleFanOut(req, res);
    });
    server_->Get("/jobs/" + job + "/result", [this](const httplib::Request& req, httplib::Response& res) {
        handleResult(req.matches[1], res);
    });
    server_->Get("/jobs/" + job, [this](const httplib::Request& req, httplib::Response& res) {
        handleJob(req.matches[1], res);
    });
    server_->Delete("/jobs/" + job, [this](const httplib::Request& req, httplib::Response& res) {
        handleCancel(req.matches[1], res);
    });
    server_->Get("/services", [this](const httplib::Request&, httplib::Response& res) {
        handleServices(res);
    });
    server_->Get("/services/" + service, [this](const httplib::Request& req, httplib::Response& res) {
        handleService(req.matches[1], res);
    });
    server_->Get("/status", [this](const httplib::Request&, httplib::Response& res) {
        handleStatus(res);
    });

    server_->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string detail = "Internal error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            detail = e.what();
        } catch (...) {
            detail = "Non-standard exception";
        }
        LOG_ERROR("Unhandled error on " + req.method + " " + req.path + ": " + detail);
        setJsonResponse(res, 500, {{"error", "InternalError"}, {"detail", detail}});
    });
}

void DispatchServer::handlePredict(const httplib::Request& request, httplib::Response& response) {
    const std::string service = request.matches[1];
    auto reg = registry();
    auto descriptor = reg ? reg->resolve(service) : std::nullopt;
    if (!descriptor) {
        setError(response, ErrorCode::UnknownService, "Unknown service: " + service);
        return;
    }
    if (request.body.empty()) {
        setError(response, ErrorCode::InvalidRequest, "Payload is empty");
        return;
    }

    if (request.body.size() > config_.syncMaxPayload) {
        LOG_DEBUG("Predict payload of " + std::to_string(request.body.size()) + " bytes diverted to queue");
        handleEnqueue(service, request.body, response);
        return;
    }

    auto result = client_.predict(*descriptor, request.body, config_.syncTimeout);
    if (!result) {
        setError(response, result.error, result.message);
        return;
    }

    response.status = result.status;
    response.set_content(result.body, result.contentType.empty() ? "application/json" : result.contentType);
}

void DispatchServer::handleEnqueue(const std::string& service, const std::string& payload, httplib::Response& response) {
    auto result = queue_->enqueue(service, payload);
    if (!result) {
        setError(response, result.error, result.message);
        return;
    }
    setJsonResponse(response, 202, {{"job_id", result.id}, {"status", toString(Status::Queued)}});
}

void DispatchServer::handleFanOut(const httplib::Request& request, httplib::Response& response) {
    json body;
    try {
        body = json::parse(request.body);
    } catch (const json::exception& e) {
        setError(response, ErrorCode::InvalidRequest, std::string("Body is not JSON: ") + e.what());
        return;
    }

    if (!body.is_object() || !body.contains("services") || !body["services"].is_array() ||
        !body.contains("payloads") || !body["payloads"].is_array()) {
        setError(response, ErrorCode::InvalidRequest, "Expected {\"services\": [...], \"payloads\": [...]}");
        return;
    }
    if (body["services"].empty()) {
        setError(response, ErrorCode::InvalidRequest, "You must specify services to process payloads with");
        return;
    }
    if (body["payloads"].empty()) {
        setError(response, ErrorCode::InvalidRequest, "You must specify payloads to process");
        return;
    }

    // Validate every name and payload first so a bad entry enqueues nothing
    auto reg = registry();
    std::vector<std::string> services;
    std::vector<std::string> unknown;
    for (const auto& entry : body["services"]) {
        if (!entry.is_string()) {
            setError(response, ErrorCode::InvalidRequest, "Service names must be strings");
            return;
        }
        auto name = entry.get<std::string>();
        if (!reg || !reg->contains(name)) {
            unknown.push_back(name);
        }
        services.push_back(std::move(name));
    }
    if (!unknown.empty()) {
        std::string joined;
        for (const auto& name : unknown) {
            joined += (joined.empty() ? "" : ", ") + name;
        }
        setError(response, ErrorCode::UnknownService, "Unknown services: " + joined);
        return;
    }

    std::vector<std::string> payloads;
    for (const auto& entry : body["payloads"]) {
        std::string payload = entry.is_string() ? entry.get<std::string>() : entry.dump();
        if (payload.empty()) {
            setError(response, ErrorCode::InvalidRequest, "Payload " + std::to_string(payloads.size()) + " is empty");
            return;
        }
        if (payload.size() > config_.queue.maxPayloadBytes) {
            setError(response, ErrorCode::InvalidRequest, "Payload " + std::to_string(payloads.size()) +
                     " exceeds " + std::to_string(config_.queue.maxPayloadBytes) + " bytes");
            return;
        }
        payloads.push_back(std::move(payload));
    }

    json jobs = json::array();
    std::size_t index = 0;
    for (const auto& payload : payloads) {
        for (const auto& service : services) {
            auto result = queue_->enqueue(service, payload);
            if (!result) {
                setJsonResponse(response, httpStatus(result.error), {
                    {"error", toString(result.error)},
                    {"detail", result.message},
                    {"jobs", jobs}
                });
                return;
            }
            jobs.push_back({{"job_id", result.id}, {"service", service}, {"payload_index", index}});
        }
        ++index;
    }

    LOG_INFO("Fanned out " + std::to_string(jobs.size()) + " job(s)");
    setJsonResponse(response, 202, {{"jobs", jobs}});
}

void DispatchServer::handleJob(const std::string& id, httplib::Response& response) {
    auto view = flow_->get(id);
    if (!view) {
        setError(response, ErrorCode::JobNotFound, "Unknown job: " + id);
        return;
    }

    json body = {
        {"job_id", view->id},
        {"service", view->service},
        {"status", toString(view->status)},
        {"created_at", view->createdAt},
        {"deliveries", view->deliveries}
    };
    if (view->status == Status::Succeeded) {
        body["result_ref"] = view->resultRef;
        auto bytes = flow_->result(id);
        if (bytes && bytes->size() <= kInlineResultLimit) {
            body["result"] = inlineResult(*bytes);
        }
    } else if (view->status == Status::Failed) {
        body["error_code"] = toString(view->error);
        body["error"] = view->message;
    }
    setJsonResponse(response, 200, body);
}

void DispatchServer::handleResult(const std::string& id, httplib::Response& response) {
    auto view = flow_->get(id);
    if (!view) {
        setError(response, ErrorCode::JobNotFound, "Unknown job: " + id);
        return;
    }
    if (view->status != Status::Succeeded) {
        setJsonResponse(response, 409, {
            {"error", toString(ErrorCode::InvalidRequest)},
            {"detail", "Job " + id + " has no result, status is " + toString(view->status)}
        });
        return;
    }

    auto bytes = flow_->result(id);
    if (!bytes) {
        LOG_ERROR("Succeeded job without readable artifact: " + id);
        setJsonResponse(response, 500, {{"error", toString(ErrorCode::StorageFailure)}, {"detail", "Result unreadable"}});
        return;
    }
    response.status = 200;
    response.set_content(*bytes, "application/octet-stream");
}

void DispatchServer::handleCancel(const std::string& id, httplib::Response& response) {
    switch (queue_->cancel(id)) {
        case CancelResult::Cancelled:
            setJsonResponse(response, 200, {
                {"job_id", id}, {"status", toString(Status::Failed)}, {"error_code", toString(ErrorCode::Cancelled)}
            });
            return;
        case CancelResult::Requested:
            setJsonResponse(response, 202, {{"job_id", id}, {"status", toString(Status::Running)}, {"cancel", "requested"}});
            return;
        case CancelResult::AlreadyFinished:
            setJsonResponse(response, 409, {
                {"error", toString(ErrorCode::InvalidRequest)}, {"detail", "Job " + id + " already finished"}
            });
            return;
        case CancelResult::NotFound:
            setError(response, ErrorCode::JobNotFound, "Unknown job: " + id);
            return;
    }
}

void DispatchServer::handleServices(httplib::Response& response) {
    json services = json::array();
    if (auto reg = registry()) {
        for (const auto& service : reg->list()) {
            services.push_back(describe(service));
        }
    }
    setJsonResponse(response, 200, {{"services", services}});
}

void DispatchServer::handleService(const std::string& name, httplib::Response& response) {
    auto reg = registry();
    auto descriptor = reg ? reg->resolve(name) : std::nullopt;
    if (!descriptor) {
        setError(response, ErrorCode::UnknownService, "Unknown service: " + name);
        return;
    }

    json body = describe(*descriptor);
    body["available"] = client_.ping(*descriptor, std::min(kPingTimeout, config_.syncTimeout));
    body["queue_depth"] = queue_->depth(name);
    setJsonResponse(response, 200, body);
}

void DispatchServer::handleStatus(httplib::Response& response) {
    json queues = json::object();
    auto reg = registry();
    if (reg) {
        for (const auto& service : reg->list()) {
            queues[service.name] = queue_->depth(service.name);
        }
    }
    setJsonResponse(response, 200, {
        {"status", "ok"},
        {"services", reg ? reg->size() : 0},
        {"queues", queues}
    });
}

}
