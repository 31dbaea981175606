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
 * @file options.cpp
 * @brief JSON ingestion and validation of `CommandOptions`.
 */

#include "ulidkit/command/options.hpp"

#include "ulidkit/core/ulid.hpp"
#include "ulidkit/infra/string.hpp"

#include <cJSON.h>
#include <cmath>
#include <utility>

namespace ulidkit::command {

namespace {

/// @brief Largest integer a JSON number (IEEE double) carries exactly.
constexpr double MAX_EXACT_INTEGER = 9007199254740992.0;

std::uint64_t read_unsigned(const cJSON* item, const std::string& field)
{
    if (!cJSON_IsNumber(item)) {
        throw OptionsError(field, "expected a non-negative integer");
    }
    const double d = item->valuedouble;
    if (d < 0 || d != std::floor(d) || d > MAX_EXACT_INTEGER) {
        throw OptionsError(field, "expected a non-negative integer");
    }
    return static_cast<std::uint64_t>(d);
}

bool read_bool(const cJSON* item, const std::string& field)
{
    if (!cJSON_IsBool(item)) {
        throw OptionsError(field, "expected true or false");
    }
    return cJSON_IsTrue(item) != 0;
}

std::string read_string(const cJSON* item, const std::string& field)
{
    if (!cJSON_IsString(item) || !item->valuestring) {
        throw OptionsError(field, "expected a string");
    }
    return item->valuestring;
}

} // namespace

bool parse_output_format(const std::string& name, OutputFormat& out)
{
    const std::string n = infra::String::to_lower(infra::String::trim(name));
    if (n == "string") {
        out = OutputFormat::STRING;
    } else if (n == "json") {
        out = OutputFormat::JSON;
    } else if (n == "hex") {
        out = OutputFormat::HEX;
    } else if (n == "full") {
        out = OutputFormat::FULL;
    } else if (n == "compact") {
        out = OutputFormat::COMPACT;
    } else if (n == "timestamp-only") {
        out = OutputFormat::TIMESTAMP_ONLY;
    } else {
        return false;
    }
    return true;
}

OptionsError::OptionsError(std::string field, const std::string& reason)
    : core::UlidError("Invalid option '" + field + "': " + reason), field_(std::move(field))
{
}

CommandOptions CommandOptions::from_json(const cJSON* json)
{
    CommandOptions opts;
    if (!json || cJSON_IsNull(json)) {
        return opts;
    }
    if (!cJSON_IsObject(json)) {
        throw OptionsError("options", "expected an object");
    }

    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, json)
    {
        const std::string key = item->string ? item->string : "";

        if (key == "count") {
            opts.count = static_cast<std::size_t>(read_unsigned(item, key));
        } else if (key == "timestamp") {
            if (cJSON_IsNull(item)) {
                opts.timestamp.reset();
                continue;
            }
            const std::uint64_t ts = read_unsigned(item, key);
            if (ts > core::MAX_TIMESTAMP) {
                throw OptionsError(key, "timestamp " + std::to_string(ts) +
                                            " exceeds the maximum " +
                                            std::to_string(core::MAX_TIMESTAMP));
            }
            opts.timestamp = ts;
        } else if (key == "batch_size") {
            const std::uint64_t size = read_unsigned(item, key);
            if (size == 0) {
                throw OptionsError(key, "must be at least 1");
            }
            opts.batch_size = static_cast<std::size_t>(size);
        } else if (key == "parallel") {
            opts.parallel = read_bool(item, key);
        } else if (key == "continue_on_error") {
            opts.continue_on_error = read_bool(item, key);
        } else if (key == "reverse") {
            opts.reverse = read_bool(item, key);
        } else if (key == "column") {
            opts.column = read_string(item, key);
        } else if (key == "force_unique_timestamps") {
            opts.force_unique_timestamps = read_bool(item, key);
        } else if (key == "workers") {
            const std::uint64_t workers = read_unsigned(item, key);
            if (workers > MAX_WORKERS) {
                throw OptionsError(key, "at most " + std::to_string(MAX_WORKERS));
            }
            opts.workers = static_cast<std::size_t>(workers);
        } else if (key == "format") {
            const std::string name = read_string(item, key);
            if (!parse_output_format(name, opts.format)) {
                throw OptionsError(key, "unknown format '" + name +
                                            "' (string, json, hex, full, compact, "
                                            "timestamp-only)");
            }
        } else if (key == "sort_mode") {
            const std::string name = read_string(item, key);
            if (!engine::parse_sort_mode(name, opts.sort_mode)) {
                throw OptionsError(key, "unknown mode '" + name + "' (ordinal, timestamp)");
            }
        } else if (key == "operation") {
            const std::string name = read_string(item, key);
            engine::StreamOperation op;
            if (!engine::parse_stream_operation(name, op)) {
                throw OptionsError(key, "unknown operation '" + name +
                                            "' (validate, parse, generate, "
                                            "extract-timestamp, transform)");
            }
            opts.operation = op;
        } else {
            throw OptionsError(key, "unknown option");
        }
    }
    return opts;
}

} // namespace ulidkit::command
