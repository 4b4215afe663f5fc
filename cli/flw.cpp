/*
 * fanout - Flow retrieval tool (flw)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/flow.hpp"
#include "fanout/logger.hpp"
#include <chrono>
#include <cstdio>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace fanout;

void printUsage(const char* progName) {
    std::cout << "fanout Flow Retrieval Tool\n\n";
    std::cout << "Usage: " << progName << " <workspace> [job_id] [--wait]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Shared queue directory\n";
    std::cout << "  job_id        Job to retrieve (default: most recently finished job)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --wait    Poll until the job is Succeeded or Failed\n\n";
    std::cout << "Exit status:\n";
    std::cout << "  0  Succeeded, result on stdout\n";
    std::cout << "  1  Failed or unknown job, error on stderr\n";
    std::cout << "  2  Not finished yet (Queued or Running)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace\n";
    std::cout << "  " << progName << " ./workspace 0001731808123456_00012345_000000 --wait\n";
    std::cout << "  wrk ./workspace image_hash '{...}' | " << progName << " ./workspace --wait\n";
}

int main(int argc, char* argv[]) {
    // Silence logs for CLI tool usage
    Logger::setLevel(LogLevel::WARN);

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string workspace = argv[1];
    std::string jobId;
    bool wait = false;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-w" || arg == "--wait") {
            wait = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else {
            jobId = arg;
        }
    }

    // Check piped input for JobID if not provided
    if (jobId.empty() && !isatty(fileno(stdin))) {
        std::cin >> jobId;
    }

    try {
        Flow flow(workspace);

        if (jobId.empty()) {
            auto recent = flow.recent(1);
            if (recent.empty()) {
                std::cerr << "No finished jobs found" << std::endl;
                return 1;
            }
            jobId = recent.front().id;
        }

        auto job = flow.get(jobId);
        while (wait && job && job->status != Status::Succeeded && job->status != Status::Failed) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            job = flow.get(jobId);
        }

        if (!job) {
            std::cerr << "Job not found: " << jobId << std::endl;
            return 1;
        }

        switch (job->status) {
            case Status::Succeeded: {
                auto bytes = flow.result(jobId);
                if (!bytes) {
                    std::cerr << "Result unreadable for job: " << jobId << std::endl;
                    return 1;
                }
                std::cout << *bytes << std::endl;
                return 0;
            }
            case Status::Failed:
                std::cerr << "Job failed: " << jobId << " (" << toString(job->error) << ")" << std::endl;
                if (!job->message.empty()) {
                    std::cerr << "Error: " << job->message << std::endl;
                }
                return 1;
            default:
                std::cerr << "Job not ready: " << jobId << " (status: " << toString(job->status) << ")" << std::endl;
                return 2;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
