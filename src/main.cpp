/*
 * ULIDKIT COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 *
 * This source code is licensed under the UlidKit Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main.cpp
 * @brief Application Entry Point.
 *
 * @details
 * This file contains the `main` function which orchestrates the startup sequence:
 * 1. Argument Parsing.
 * 2. Signal Handling Registration (SIGINT/SIGTERM).
 * 3. Subsystem Initialization (Worker Pool & Handler).
 * 4. Request Loop: one JSON request per stdin line, one JSON response per stdout line.
 */

#include "ulidkit/command/handler.hpp"
#include "ulidkit/infra/logger.hpp"
#include "ulidkit/infra/scheduler.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>

/// @brief Set by the signal handler; the request loop stops before the next line.
static std::atomic<bool> g_stop{false};

/**
 * @brief System Signal Handler.
 *
 * Only flips the stop flag; logging from a signal handler is not async-signal-safe.
 *
 * @param signum The signal identifier (e.g., SIGINT).
 */
void signal_handler(int signum)
{
    (void)signum;
    g_stop.store(true);
}

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [OPTIONS] < requests.jsonl\n"
              << "Reads one JSON request per line and writes one JSON response per line.\n"
              << "Options:\n"
              << "  --log-level LEVEL  trace, debug, info, warn, error, fatal (Default: warn)\n"
              << "  --workers N        Worker threads for parallel streams (Default: CPU count)\n"
              << "  --help             Show this help message\n"
              << "Request:\n"
              << "  {\"op\": \"generate\", \"options\": {\"count\": 3}}\n"
              << "Ops: generate, generate-monotonic, generate-stream, validate,\n"
              << "     validate-detailed, parse, inspect, sort, stream\n";
}

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    // 0. Argument Pre-check
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--help") {
            print_help(argv[0]);
            return 0;
        }
    }

    // 1. Configuration Defaults
    std::size_t workers = 0;

    // 2. Register Signal Handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        // 3. Parse Command Line Arguments
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--log-level" && i + 1 < argc) {
                ulidkit::infra::LogLevel level;
                if (!ulidkit::infra::Logger::parse_level(argv[++i], level)) {
                    throw std::invalid_argument("Unknown log level '" + std::string(argv[i]) +
                                                "'");
                }
                ulidkit::infra::Logger::set_level(level);
            } else if (arg == "--workers" && i + 1 < argc) {
                const int n = std::stoi(argv[++i]);
                if (n < 0) {
                    throw std::invalid_argument("--workers must not be negative");
                }
                workers = static_cast<std::size_t>(n);
            } else {
                throw std::invalid_argument("Unknown argument '" + arg + "' (see --help)");
            }
        }

        // 4. System Bootstrap & Logging
        ulidkit::infra::Logger::log(ulidkit::infra::LogLevel::INFO,
                                    "System: Booting UlidKit v1.0.0...");

        // 5. Initialize Worker Pool
        ulidkit::infra::Scheduler scheduler(workers);
        ulidkit::infra::Logger::log(ulidkit::infra::LogLevel::INFO,
                                    "Config: " + std::to_string(scheduler.size()) +
                                        " worker threads for parallel streams");

        // 6. Initialize Request Handler
        ulidkit::command::Handler handler(&scheduler);

        // 7. Enter Request Loop (Blocking)
        std::string line;
        std::size_t served = 0;
        while (!g_stop.load() && std::getline(std::cin, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            std::cout << handler.process(line) << '\n' << std::flush;
            ++served;
        }

        if (g_stop.load()) {
            ulidkit::infra::Logger::log(ulidkit::infra::LogLevel::WARN,
                                        "System: Interrupt received. Stopping request loop.");
        }
        ulidkit::infra::Logger::log(ulidkit::infra::LogLevel::INFO,
                                    "System: Served " + std::to_string(served) + " requests.");

    } catch (const std::exception& e) {
        ulidkit::infra::Logger::log(ulidkit::infra::LogLevel::FATAL,
                                    "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    ulidkit::infra::Logger::log(ulidkit::infra::LogLevel::INFO, "System: Shutdown complete.");
    return 0;
}
