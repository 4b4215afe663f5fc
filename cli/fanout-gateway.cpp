/*
 * fanout - Synchronous gateway (fanout-gateway)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/backend.hpp"
#include "fanout/config.hpp"
#include "fanout/gateway.hpp"
#include "fanout/logger.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace fanout;

constexpr const char* VERSION = "0.1.0";

static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "fanout Synchronous Gateway v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <service> --port <n> [options]\n\n";
    std::cout << "Serves POST /predict and GET /status for one built-in backend.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --backend <kind>             image_hash or example_model (default: the service name)\n";
    std::cout << configFlagsHelp();
    std::cout << "  -h, --help                   Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " image_hash --port 5015 --images ./images\n";
    std::cout << "  " << progName << " example_model --port 5010\n";
}

int main(int argc, char* argv[]) {
    Logger::initFromEnv();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 2 || argv[1][0] == '-') {
        printUsage(argv[0]);
        return 1;
    }

    std::string service = argv[1];
    std::string backendKind = service;
    Config config = Config::fromEnv();

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--backend" && i + 1 < argc) {
            backendKind = argv[++i];
            continue;
        }
        std::string error;
        switch (applyConfigFlag(config, i, argc, argv, error)) {
            case FlagResult::Applied:
                break;
            case FlagResult::Invalid:
                std::cerr << "Error: " << error << "\n";
                return 1;
            case FlagResult::NotConfigFlag:
                std::cerr << "Error: Unknown option: " << arg << "\n";
                return 1;
        }
    }

    auto backend = makeBuiltinBackend(backendKind, service, config);
    if (!backend) {
        std::cerr << "Error: Unknown backend: " << backendKind << "\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    setThreadName("Main");

    try {
        Gateway gateway(backend, config.host, config.port, config.syncTimeout, config.httpThreads);
        if (!gateway.start()) {
            std::cerr << "Failed to start gateway for " << service << "\n";
            return 1;
        }
        std::cout << "  " << service << " (" << backendKind << ") on " << config.host << ":" << gateway.port()
                  << "\n" << std::flush;

        while (!g_shutdown_requested && gateway.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        gateway.shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Gateway error: " + std::string(e.what()));
        return 1;
    }
    return 0;
}
