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
 * @file options.hpp
 * @brief Typed options record consumed by the command dispatcher.
 *
 * @details
 * Requests carry their options as a JSON object. `CommandOptions::from_json`
 * turns that object into this record, rejecting unknown keys and ill-typed
 * values up front, so the operations below only ever see checked values.
 */

#pragma once

#include "ulidkit/core/errors.hpp"
#include "ulidkit/engine/sort.hpp"
#include "ulidkit/engine/stream.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

struct cJSON;

namespace ulidkit::command {

/// @brief Upper bound on `count` for `generate` and `generate-monotonic`.
constexpr std::size_t MAX_GENERATE_COUNT = 10000;

/// @brief Upper bound on `count` for `generate-stream`.
constexpr std::size_t MAX_GENERATE_STREAM_COUNT = 100000;

/// @brief Upper bound on `workers`.
constexpr std::size_t MAX_WORKERS = 256;

/**
 * @enum OutputFormat
 * @brief Presentation of results.
 */
enum class OutputFormat {
    DEFAULT,        ///< Operation-specific default.
    STRING,         ///< Bare canonical string (generate).
    JSON,           ///< Object with decoded fields (generate).
    HEX,            ///< 32 lowercase hex digits of the 16 bytes (generate).
    FULL,           ///< Every parsed field (parse, inspect, stream).
    COMPACT,        ///< `ulid`, `timestamp_ms`, `randomness` (parse, stream).
    TIMESTAMP_ONLY  ///< The timestamp as a number (parse, stream).
};

/// @brief Parses `string|json|hex|full|compact|timestamp-only`. @return false if unknown.
bool parse_output_format(const std::string& name, OutputFormat& out);

/**
 * @class OptionsError
 * @brief An option is unknown, ill-typed, or out of range.
 */
class OptionsError : public core::UlidError {
  public:
    OptionsError(std::string field, const std::string& reason);

    const std::string& field() const { return field_; }

  private:
    std::string field_;
};

/**
 * @struct CommandOptions
 * @brief Every option a request may carry, with its default.
 */
struct CommandOptions {
    std::size_t count = 1;
    std::optional<std::uint64_t> timestamp;
    std::size_t batch_size = engine::DEFAULT_BATCH_SIZE;
    bool parallel = false;
    bool continue_on_error = false;
    bool reverse = false;
    std::optional<std::string> column;
    bool force_unique_timestamps = false;

    /// @brief Pool size for parallel streams; 0 uses the handler's pool.
    std::size_t workers = 0;

    OutputFormat format = OutputFormat::DEFAULT;
    engine::SortMode sort_mode = engine::SortMode::ORDINAL;

    /// @brief Per-item operation of `stream`.
    std::optional<engine::StreamOperation> operation;

    /**
     * @brief Builds options from a JSON object. A null pointer yields defaults.
     *
     * @throws OptionsError on unknown keys, wrong types, or values out of range.
     */
    static CommandOptions from_json(const cJSON* json);
};

} // namespace ulidkit::command
