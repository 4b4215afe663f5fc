/*
 * fanout - Work submission tool (wrk)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/config.hpp"
#include "fanout/logger.hpp"
#include "fanout/queue.hpp"
#include "fanout/registry.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <sstream>
#include <unistd.h>

using namespace fanout;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "fanout Work Submission Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> <service> <payload...> [--registry <file>]\n";
    std::cout << "       " << progName << " <workspace> <service> -     (read payload from stdin)\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Shared queue directory\n";
    std::cout << "  service       Registered service to queue the job for\n";
    std::cout << "  payload       Job payload (can be multiple words)\n";
    std::cout << "  -             Read payload from stdin\n\n";
    std::cout << "Options:\n";
    std::cout << "  --registry <file>  Service registry (default: FANOUT_REGISTRY or ./services.json)\n";
    std::cout << "  -h, --help         Show this help message\n";
    std::cout << "  -v, --version      Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  FANOUT_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  FANOUT_REGISTRY     Service registry file\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace image_hash '{\"image_file_name\": \"cat.png\"}'\n";
    std::cout << "  cat payload.bin | " << progName << " ./workspace example_model -\n";
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; FANOUT_LOG_LEVEL overrides
    if (!std::getenv("FANOUT_LOG_LEVEL")) {
        Logger::setLevel(LogLevel::WARN);
    } else {
        Logger::initFromEnv();
    }

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

    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    Config config = Config::fromEnv();
    config.workspace = argv[1];
    std::string service = argv[2];

    std::vector<std::string> words;
    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--registry") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --registry requires a path\n";
                return 1;
            }
            config.registryPath = argv[++i];
            continue;
        }
        words.push_back(arg);
    }

    std::string payload;
    bool readStdin = (words.size() == 1 && words[0] == "-") || (words.empty() && !isatty(fileno(stdin)));
    if (readStdin) {
        payload.assign((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    } else {
        std::ostringstream joined;
        for (std::size_t i = 0; i < words.size(); ++i) {
            if (i > 0) joined << " ";
            joined << words[i];
        }
        payload = joined.str();
    }

    if (payload.empty()) {
        std::cerr << "Error: Empty payload provided\n";
        return 1;
    }

    std::string error;
    auto registry = ServiceRegistry::load(config.registryPath, error);
    if (!registry) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    try {
        JobQueue queue(config.workspace, registry, config.queue);
        auto result = queue.enqueue(service, payload);
        if (result) {
            // Just the job ID - clean for piping, no noise
            std::cout << result.id << std::endl;
            return 0;
        }
        std::cerr << "Error: " << toString(result.error) << ": " << result.message << std::endl;
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
