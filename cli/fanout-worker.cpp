/*
 * fanout - Queue worker (fanout-worker)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/backend.hpp"
#include "fanout/config.hpp"
#include "fanout/gateway.hpp"
#include "fanout/logger.hpp"
#include "fanout/registry.hpp"
#include "fanout/worker.hpp"
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
    std::cout << "fanout Queue Worker v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <service> [options]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  service       Registered service whose queue this worker consumes\n\n";
    std::cout << "Options:\n";
    std::cout << "  --backend <kind>             http (default): call the service's gateway\n";
    std::cout << "                               image_hash, example_model: run built-in backend in process\n";
    std::cout << "  -n, --instances <n>          Independent consumers in this process (default 1)\n";
    std::cout << configFlagsHelp();
    std::cout << "  -h, --help                   Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " image_hash --workspace ./workspace --registry config/services.json\n";
    std::cout << "  " << progName << " image_hash --backend image_hash --images ./images -n 4\n";
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
    std::string backendKind = "http";
    int instances = 1;
    Config config = Config::fromEnv();

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--backend" && i + 1 < argc) {
            backendKind = argv[++i];
            continue;
        }
        if ((arg == "-n" || arg == "--instances") && i + 1 < argc) {
            try {
                instances = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid instance count\n";
                return 1;
            }
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

    if (instances < 1) {
        std::cerr << "Error: Instance count must be at least 1\n";
        return 1;
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
    auto descriptor = registry->resolve(service);
    if (!descriptor) {
        std::cerr << "Error: Service not in registry: " << service << "\n";
        return 1;
    }

    std::shared_ptr<Backend> backend;
    if (backendKind == "http") {
        backend = std::make_shared<HttpBackend>(*descriptor, std::make_shared<GatewayClient>());
    } else {
        backend = makeBuiltinBackend(backendKind, service, config);
    }
    if (!backend) {
        std::cerr << "Error: Unknown backend: " << backendKind << "\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    setThreadName("Main");

    try {
        Worker worker(service, config, registry, backend, instances);
        if (!worker.start()) {
            std::cerr << "Failed to start worker for " << service << "\n";
            return 1;
        }

        std::cout << "\n  \033[1mWORKING\033[0m\n\n";
        std::cout << "    Service    " << service << "\n";
        std::cout << "    Backend    " << backendKind << (backendKind == "http" ? " -> " + descriptor->address : "") << "\n";
        std::cout << "    Instances  " << instances << "\n";
        std::cout << "    Workspace  " << config.workspace.string() << "\n\n" << std::flush;

        while (!g_shutdown_requested && worker.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        std::cout << "\nShutdown requested, finishing in-flight jobs..." << std::endl;
        worker.shutdown();
        LOG_INFO("Processed " + std::to_string(worker.processed()) + " job(s)");

    } catch (const std::exception& e) {
        LOG_ERROR("Worker error: " + std::string(e.what()));
        return 1;
    }
    return 0;
}
