/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/config.hpp"
#include "fanout/logger.hpp"
#include <cstdlib>

namespace fanout {

namespace {

std::optional<long long> parsePositive(const std::string& value) {
    try {
        std::size_t used = 0;
        long long parsed = std::stoll(value, &used);
        if (used != value.size() || parsed <= 0) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

long long envNumber(const char* name, long long defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    auto parsed = parsePositive(val);
    if (!parsed) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val + ", using " + std::to_string(defv));
        return defv;
    }
    return *parsed;
}

std::string envString(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : defv;
}

bool setNumber(const std::string& flag, const std::string& value, long long& out, std::string& error) {
    auto parsed = parsePositive(value);
    if (!parsed) {
        error = "Invalid value for " + flag + ": " + value;
        return false;
    }
    out = *parsed;
    return true;
}

}

Config Config::fromEnv() {
    Config c;
    c.workspace = envString("FANOUT_WORKSPACE", c.workspace.string());
    c.registryPath = envString("FANOUT_REGISTRY", c.registryPath.string());
    c.imagesDir = envString("FANOUT_IMAGES_DIR", c.imagesDir.string());
    c.host = envString("FANOUT_HOST", c.host);
    c.port = static_cast<int>(envNumber("FANOUT_PORT", c.port));
    c.httpThreads = static_cast<int>(envNumber("FANOUT_HTTP_THREADS", c.httpThreads));
    c.syncTimeout = std::chrono::milliseconds(envNumber("FANOUT_SYNC_TIMEOUT_MS", c.syncTimeout.count()));
    c.syncMaxPayload = static_cast<std::size_t>(envNumber("FANOUT_SYNC_MAX_PAYLOAD", static_cast<long long>(c.syncMaxPayload)));
    c.jobTimeout = std::chrono::milliseconds(envNumber("FANOUT_JOB_TIMEOUT_MS", c.jobTimeout.count()));

    c.queue.maxPayloadBytes = static_cast<std::size_t>(envNumber("FANOUT_MAX_PAYLOAD", static_cast<long long>(c.queue.maxPayloadBytes)));
    c.queue.visibilityTimeout = std::chrono::milliseconds(envNumber("FANOUT_VISIBILITY_TIMEOUT_MS", c.queue.visibilityTimeout.count()));
    c.queue.maxDeliveries = static_cast<int>(envNumber("FANOUT_MAX_DELIVERIES", c.queue.maxDeliveries));
    c.queue.pollInterval = std::chrono::milliseconds(envNumber("FANOUT_POLL_INTERVAL_MS", c.queue.pollInterval.count()));
    return c;
}

std::optional<std::string> Config::validate() const {
    if (port <= 0 || port > 65535) {
        return "Port out of range: " + std::to_string(port);
    }
    if (jobTimeout >= queue.visibilityTimeout) {
        // A live worker must always ack before its lease can expire
        return "Job timeout (" + std::to_string(jobTimeout.count()) +
               "ms) must be shorter than the visibility timeout (" +
               std::to_string(queue.visibilityTimeout.count()) + "ms)";
    }
    if (queue.maxDeliveries < 1) {
        return "Max deliveries must be at least 1";
    }
    if (syncMaxPayload > queue.maxPayloadBytes) {
        return "Synchronous payload limit exceeds the enqueue limit";
    }
    return std::nullopt;
}

FlagResult applyConfigFlag(Config& config, int& i, int argc, char* argv[], std::string& error) {
    std::string flag = argv[i];
    static const char* known[] = {
        "--workspace", "--registry", "--images", "--host", "--port", "--threads",
        "--sync-timeout-ms", "--job-timeout-ms", "--visibility-timeout-ms",
        "--max-deliveries", "--poll-interval-ms", "--log-level"
    };
    bool isKnown = false;
    for (const char* k : known) {
        if (flag == k) {
            isKnown = true;
            break;
        }
    }
    if (!isKnown) {
        return FlagResult::NotConfigFlag;
    }
    if (i + 1 >= argc) {
        error = flag + " requires a value";
        return FlagResult::Invalid;
    }
    std::string value = argv[++i];

    long long number = 0;
    if (flag == "--workspace") {
        config.workspace = value;
    } else if (flag == "--registry") {
        config.registryPath = value;
    } else if (flag == "--images") {
        config.imagesDir = value;
    } else if (flag == "--host") {
        config.host = value;
    } else if (flag == "--log-level") {
        auto level = Logger::parseLevel(value);
        if (!level) {
            error = "Unknown log level: " + value;
            return FlagResult::Invalid;
        }
        Logger::setLevel(*level);
    } else {
        if (!setNumber(flag, value, number, error)) {
            return FlagResult::Invalid;
        }
        if (flag == "--port") config.port = static_cast<int>(number);
        else if (flag == "--threads") config.httpThreads = static_cast<int>(number);
        else if (flag == "--sync-timeout-ms") config.syncTimeout = std::chrono::milliseconds(number);
        else if (flag == "--job-timeout-ms") config.jobTimeout = std::chrono::milliseconds(number);
        else if (flag == "--visibility-timeout-ms") config.queue.visibilityTimeout = std::chrono::milliseconds(number);
        else if (flag == "--max-deliveries") config.queue.maxDeliveries = static_cast<int>(number);
        else if (flag == "--poll-interval-ms") config.queue.pollInterval = std::chrono::milliseconds(number);
    }
    return FlagResult::Applied;
}

const char* configFlagsHelp() noexcept {
    return "  --workspace <dir>            Shared queue/result directory (FANOUT_WORKSPACE)\n"
           "  --registry <file>            Service registry JSON (FANOUT_REGISTRY)\n"
           "  --images <dir>               Image directory for built-in backends (FANOUT_IMAGES_DIR)\n"
           "  --host <addr>                Listen address (FANOUT_HOST)\n"
           "  --port <n>                   Listen port (FANOUT_PORT)\n"
           "  --threads <n>                HTTP worker threads (FANOUT_HTTP_THREADS)\n"
           "  --sync-timeout-ms <n>        Synchronous call timeout (FANOUT_SYNC_TIMEOUT_MS)\n"
           "  --job-timeout-ms <n>         Per-job processing limit (FANOUT_JOB_TIMEOUT_MS)\n"
           "  --visibility-timeout-ms <n>  Lease length (FANOUT_VISIBILITY_TIMEOUT_MS)\n"
           "  --max-deliveries <n>         Deliveries before WorkerCrash (FANOUT_MAX_DELIVERIES)\n"
           "  --poll-interval-ms <n>       Dequeue wake-up bound (FANOUT_POLL_INTERVAL_MS)\n"
           "  --log-level <level>          ERROR, WARN, INFO, DEBUG, TRACE (FANOUT_LOG_LEVEL)\n";
}

}
