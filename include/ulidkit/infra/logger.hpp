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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for UlidKit.
 *
 * @details
 * This header declares the `Logger` class, the single reporting interface used by
 * the generator, the sort engine and the streaming engine. Every entry is written
 * to `stderr`: standard output belongs to the request/response channel of the
 * `ulidkit` executable and must never carry diagnostics.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace ulidkit::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-item execution details (slot writes, increments).
    DEBUG, ///< Chunk progress, randomness overflow ticks.
    INFO,  ///< Startup and shutdown of the front end.
    WARN,  ///< Clock rollback reports, cancelled streams.
    ERROR, ///< Failed requests.
    FATAL  ///< Unrecoverable front-end failures.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Entries below the configured minimum level are discarded before the lock is
 * taken, so disabled TRACE calls in the hot paths of the engine stay cheap.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to `stderr`.
     *
     * The output includes a wall-clock timestamp, the severity tag, and the payload.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * ulidkit::infra::Logger::log(LogLevel::DEBUG, "Stream: chunk 3/40 complete.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that reaches the stream.
     *
     * Defaults to `LogLevel::WARN`.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the currently configured minimum severity.
    static LogLevel level();

    /// @brief True when a message of `level` would be written.
    static bool enabled(LogLevel level);

    /**
     * @brief Parses a level name (`trace`, `debug`, `info`, `warn`, `error`, `fatal`).
     *
     * @param name The case-insensitive level name.
     * @param out Receives the parsed level on success.
     * @return false if the name is unknown; `out` is left untouched.
     */
    static bool parse_level(const std::string& name, LogLevel& out);

  private:
    /// @brief Serializes writers so entries from pool workers never interleave.
    static std::mutex mutex_;

    /// @brief Minimum severity; read without the lock on every call.
    static std::atomic<int> min_level_;
};

} // namespace ulidkit::infra
