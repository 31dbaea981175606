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
 * @file logger.cpp
 * @brief Implementation of the thread-safe diagnostic logging utility.
 *
 * @details
 * Formats entries with a local wall-clock timestamp, a severity tag and ANSI
 * color codes, and writes them to `stderr` under a global lock.
 */

#include "ulidkit/infra/logger.hpp"

#include "ulidkit/infra/string.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace ulidkit::infra {

std::mutex Logger::mutex_;
std::atomic<int> Logger::min_level_{static_cast<int>(LogLevel::WARN)};

void Logger::set_level(LogLevel level)
{
    min_level_.store(static_cast<int>(level));
}

LogLevel Logger::level()
{
    return static_cast<LogLevel>(min_level_.load());
}

bool Logger::enabled(LogLevel level)
{
    return static_cast<int>(level) >= min_level_.load();
}

bool Logger::parse_level(const std::string& name, LogLevel& out)
{
    const std::string key = String::to_lower(String::trim(name));
    if (key == "trace") {
        out = LogLevel::TRACE;
    } else if (key == "debug") {
        out = LogLevel::DEBUG;
    } else if (key == "info") {
        out = LogLevel::INFO;
    } else if (key == "warn" || key == "warning") {
        out = LogLevel::WARN;
    } else if (key == "error") {
        out = LogLevel::ERROR;
    } else if (key == "fatal") {
        out = LogLevel::FATAL;
    } else {
        return false;
    }
    return true;
}

/**
 * @brief Dispatches a formatted log entry to `stderr`.
 *
 * Operational Logic:
 * 1. **Filtering**: Drops entries below the configured minimum level.
 * 2. **Synchronization**: Acquires a `lock_guard` to prevent interleaved output.
 * 3. **Stylization**: Injects ANSI escape sequences for visual categorization.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    if (!enabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    auto& stream = std::cerr;

    // Mutex protects std::localtime's internal static buffer.
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    switch (level) {
    case LogLevel::TRACE:
        stream << "\033[90m[TRCE] ";
        break;
    case LogLevel::DEBUG:
        stream << "\033[36m[DBUG] ";
        break;
    case LogLevel::INFO:
        stream << "\033[32m[INFO] ";
        break;
    case LogLevel::WARN:
        stream << "\033[33m[WARN] ";
        break;
    case LogLevel::ERROR:
        stream << "\033[31m[FAIL] ";
        break;
    case LogLevel::FATAL:
        stream << "\033[1;31m[CRIT] ";
        break;
    }

    stream << message << "\033[0m" << std::endl;
}

} // namespace ulidkit::infra
