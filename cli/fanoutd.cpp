/*
 * fanout - Dispatch daemon (fanoutd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/config.hpp"
#include "fanout/dispatch.hpp"
#include "fanout/logger.hpp"
#include "fanout/registry.hpp"
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace fanout;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flags, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;
static volatile sig_atomic_t g_reload_requested = 0;

void signalHandler(int signal) {
    if (signal == SIGHUP) {
        g_reload_requested = 1;
    } else {
        g_shutdown_requested = 1;
    }
}

void printUsage(const char* progName) {
    std::cout << "fanout Dispatch Server v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << configFlagsHelp();
    std::cout << "  -h, --help                   Show this help message\n";
    std::cout << "  -v, --version                Show version\n\n";
    std::cout << "Signals:\n";
    std::cout << "  SIGINT, SIGTERM    Shut down\n";
    std::cout << "  SIGHUP             Reload the service registry\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " --registry config/services.json --workspace ./workspace --port 8080\n";
    std::cout << "  curl -X POST --data-binary @payload.json localhost:8080/jobs/image_hash\n";
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

    Config config = Config::fromEnv();
    for (int i = 1; i < argc; ++i) {
        std::string error;
        switch (applyConfigFlag(config, i, argc, argv, error)) {
            case FlagResult::Applied:
                break;
            case FlagResult::Invalid:
                std::cerr << "Error: " << error << "\n";
                return 1;
            case FlagResult::NotConfigFlag:
                std::cerr << "Error: Unknown option: " << argv[i] << "\n";
                printUsage(argv[0]);
                return 1;
        }
    }

    if (auto problem = config.validate()) {
        std::cerr << "Error: " << *problem << "\n";
        return 1;
    }

    std::string error;
    auto registry = ServiceRegistry::load(config.registryPath, error);
    if (!registry) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);

    setThreadName("Main");

    try {
        DispatchServer server(config, registry);
        if (!server.start()) {
            std::cerr << "Failed to start dispatch server\n";
            return 1;
        }

        std::filesystem::path pidPath = config.workspace / ".fanoutd.pid";
        {
            std::ofstream pf(pidPath);
            if (pf) {
                pf << getpid();
            }
        }

        std::cout << "\n";
        std::cout << "  \033[1mfanout\033[0m " << VERSION << "                    \033[90mdual-path · inference · dispatch\033[0m\n";
        std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n\n";
        std::cout << "    Listening  " << config.host << ":" << server.port() << "\n";
        std::cout << "    Services   " << registry->size() << " (" << config.registryPath.string() << ")\n";
        std::cout << "    Workspace  " << config.workspace.string() << "\n\n" << std::flush;

        while (!g_shutdown_requested && server.isRunning()) {
            if (g_reload_requested) {
                g_reload_requested = 0;
                std::string reloadError;
                if (auto fresh = ServiceRegistry::load(config.registryPath, reloadError)) {
                    server.reloadRegistry(std::move(fresh));
                } else {
                    LOG_ERROR("Registry reload failed, keeping current registry: " + reloadError);
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG_DEBUG("Shutdown requested, stopping dispatch server...");
        {
            std::error_code ec;
            std::filesystem::remove(pidPath, ec);
        }
        server.shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("fanoutd stopped");
    return 0;
}
