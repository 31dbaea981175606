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
 * @file stream.cpp
 * @brief Non-template parts of the stream engine: operations, generation streams,
 * record resolution and progress reporting.
 */

#include "ulidkit/engine/stream.hpp"

#include "ulidkit/core/codec.hpp"
#include "ulidkit/core/validator.hpp"
#include "ulidkit/infra/string.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace ulidkit::engine {

namespace {

/// @brief Record fields searched, in order, for the ULID of an object item.
const char* const ID_FIELDS[] = {"ulid", "id", "identifier", "uuid"};

/// @brief Longest decimal representation accepted for a timestamp item.
constexpr std::size_t MAX_TIMESTAMP_DIGITS = 15;

std::uint64_t parse_timestamp_item(const std::string& text)
{
    if (text.size() > MAX_TIMESTAMP_DIGITS) {
        throw core::TimestampOutOfRangeError(core::MAX_TIMESTAMP + 1, core::MAX_TIMESTAMP);
    }
    std::uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Invalid timestamp " + infra::String::quote(text) +
                                        ": expected decimal milliseconds");
        }
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return value;
}

} // namespace

StreamAbortError::StreamAbortError(ItemError cause)
    : core::UlidError("Stream aborted at index " + std::to_string(cause.index) + " (" +
                      cause.value + "): " + cause.message),
      cause_(std::move(cause))
{
}

bool parse_stream_operation(const std::string& name, StreamOperation& out)
{
    const std::string n = infra::String::to_lower(infra::String::trim(name));
    if (n == "validate") {
        out = StreamOperation::VALIDATE;
    } else if (n == "parse") {
        out = StreamOperation::PARSE;
    } else if (n == "generate") {
        out = StreamOperation::GENERATE;
    } else if (n == "extract-timestamp") {
        out = StreamOperation::EXTRACT_TIMESTAMP;
    } else if (n == "transform") {
        out = StreamOperation::TRANSFORM;
    } else {
        return false;
    }
    return true;
}

/**
 * @brief Binds a `StreamOperation` to a callable over one text item.
 *
 * Each callable throws on a bad item; `run` turns the exception into an
 * `ItemError` or a `StreamAbortError` according to its failure policy.
 */
StreamEngine::Operation<std::string, StreamValue>
StreamEngine::make_operation(StreamOperation op, core::Generator generator)
{
    switch (op) {
    case StreamOperation::VALIDATE:
        return [](const std::string& text) {
            StreamValue v;
            v.op = StreamOperation::VALIDATE;
            v.ulid = text;
            v.valid = core::Validator::validate(text);
            return v;
        };
    case StreamOperation::PARSE:
        return [](const std::string& text) {
            StreamValue v;
            v.op = StreamOperation::PARSE;
            v.parsed = core::Parser::parse(text);
            v.ulid = v.parsed.canonical;
            v.timestamp_ms = v.parsed.timestamp_ms;
            v.valid = true;
            return v;
        };
    case StreamOperation::GENERATE:
        return [generator](const std::string& text) mutable {
            const std::string trimmed = infra::String::trim(text);
            const core::Ulid id = trimmed.empty()
                                      ? generator.generate()
                                      : generator.generate(parse_timestamp_item(trimmed));
            StreamValue v;
            v.op = StreamOperation::GENERATE;
            v.ulid = id.to_string();
            v.timestamp_ms = id.timestamp_ms();
            v.valid = true;
            return v;
        };
    case StreamOperation::EXTRACT_TIMESTAMP:
        return [](const std::string& text) {
            StreamValue v;
            v.op = StreamOperation::EXTRACT_TIMESTAMP;
            v.timestamp_ms = core::Parser::extract_timestamp(text);
            v.valid = true;
            return v;
        };
    case StreamOperation::TRANSFORM:
        return [](const std::string& text) {
            StreamValue v;
            v.op = StreamOperation::TRANSFORM;
            const core::Ulid id = core::Ulid::from_string(text);
            v.ulid = id.to_string();
            v.timestamp_ms = id.timestamp_ms();
            v.valid = true;
            return v;
        };
    }
    throw std::invalid_argument("Unknown stream operation");
}

/**
 * @brief Produces a strictly increasing ID sequence in chunks.
 *
 * @details
 * Operational Logic:
 * 1. **Validation**: Batch size and the fixed base timestamp are checked once.
 * 2. **Observation**: Per ID, the base timestamp or a fresh clock reading.
 * 3. **Uniqueness**: With `force_unique_timestamps`, a reading at or below the
 *    last issued timestamp is raised to `last + 1`.
 * 4. **Issue**: `next_monotonic` on the single stream-wide context, so order
 *    holds across chunk boundaries.
 * 5. **Emission**: Whole chunks to the sink, or into the outcome.
 *
 * Any failure aborts the stream with the index of the ID that could not be issued.
 */
BatchOutcome<core::Ulid> StreamEngine::generate_stream(core::Generator& generator,
                                                       const GenerateStreamOptions& options,
                                                       const Sink<core::Ulid>& sink)
{
    check_batch_size(options.batch_size);
    if (options.timestamp && *options.timestamp > core::MAX_TIMESTAMP) {
        throw core::TimestampOutOfRangeError(*options.timestamp, core::MAX_TIMESTAMP);
    }

    const std::size_t total_chunks = (options.count + options.batch_size - 1) / options.batch_size;
    std::size_t next_decile = 1;

    // One context for the whole call: chunk boundaries are invisible to ordering.
    core::GenerationContext context;
    BatchOutcome<core::Ulid> outcome;

    while (outcome.processed < options.count) {
        if (options.cancel && options.cancel->load()) {
            outcome.cancelled = true;
            log_cancelled(outcome.processed);
            break;
        }

        const std::size_t n = std::min(options.batch_size, options.count - outcome.processed);
        std::vector<Outcome<core::Ulid>> results(n);

        for (std::size_t i = 0; i < n; ++i) {
            const std::size_t index = outcome.processed + i;
            std::uint64_t observed =
                options.timestamp ? *options.timestamp : generator.clock().now_ms();
            try {
                if (options.force_unique_timestamps && context.has_last &&
                    observed <= context.last_timestamp_ms) {
                    if (context.last_timestamp_ms == core::MAX_TIMESTAMP) {
                        throw core::GenerationError(
                            "Timestamp space exhausted: no unique timestamp after " +
                            std::to_string(core::MAX_TIMESTAMP));
                    }
                    observed = context.last_timestamp_ms + 1;
                }
                results[i].index = index;
                results[i].value = generator.next_monotonic(context, observed);
            } catch (const std::exception& e) {
                ItemError error = make_item_error(index, std::to_string(observed), e);
                log_abort(error);
                throw StreamAbortError(std::move(error));
            }
        }

        outcome.processed += n;
        outcome.chunks++;
        if (sink) {
            sink(results);
        } else {
            for (auto& slot : results) {
                outcome.items.push_back(std::move(slot));
            }
        }
        log_progress(outcome.chunks, total_chunks, outcome.processed, next_decile);
    }

    return outcome;
}

std::string StreamEngine::item_text(const cJSON* item)
{
    if (cJSON_IsString(item) && item->valuestring) {
        return item->valuestring;
    }
    if (cJSON_IsObject(item)) {
        for (const char* name : ID_FIELDS) {
            const cJSON* field = cJSON_GetObjectItemCaseSensitive(item, name);
            if (cJSON_IsString(field) && field->valuestring) {
                return field->valuestring;
            }
        }
        throw std::invalid_argument(
            "No ULID field found: record must contain 'ulid', 'id', 'identifier' or 'uuid'");
    }
    throw std::invalid_argument("Expected a string or a record containing a ULID");
}

std::string StreamEngine::describe_item(const cJSON* const& item)
{
    if (!item) {
        return "null";
    }
    char* printed = cJSON_PrintUnformatted(item);
    if (!printed) {
        return "<unprintable>";
    }
    std::string out = infra::String::quote(printed);
    std::free(printed);
    return out;
}

std::string StreamEngine::describe_text(const std::string& item)
{
    return infra::String::quote(item);
}

void StreamEngine::check_batch_size(std::size_t batch_size)
{
    if (batch_size == 0) {
        throw std::invalid_argument("batch_size must be at least 1");
    }
}

/// @brief Maps an exception to its stable error kind.
ItemError StreamEngine::make_item_error(std::size_t index, std::string value,
                                        const std::exception& e)
{
    ItemError error;
    error.index = index;
    error.value = std::move(value);
    error.message = e.what();

    if (const auto* decode = dynamic_cast<const core::DecodeException*>(&e)) {
        error.kind = core::to_string(decode->error().kind);
    } else if (dynamic_cast<const core::TimestampOutOfRangeError*>(&e)) {
        error.kind = "timestamp_out_of_range";
    } else if (dynamic_cast<const core::ClockRollbackError*>(&e)) {
        error.kind = "clock_rollback";
    } else if (dynamic_cast<const core::GenerationError*>(&e)) {
        error.kind = "generation_failed";
    } else if (dynamic_cast<const std::invalid_argument*>(&e)) {
        error.kind = "invalid_input";
    } else {
        error.kind = "operation_failed";
    }
    return error;
}

// Logs each 10 % step crossed by this chunk, at most once per step.
void StreamEngine::log_progress(std::size_t chunks_done, std::size_t total_chunks,
                                std::size_t processed, std::size_t& next_decile)
{
    if (total_chunks <= 10 || next_decile > 10) {
        return;
    }
    std::size_t reached = 0;
    while (next_decile <= 10 && chunks_done * 10 >= next_decile * total_chunks) {
        reached = next_decile++;
    }
    if (reached > 0) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Stream: " + std::to_string(reached * 10) + "% (" +
                               std::to_string(chunks_done) + "/" + std::to_string(total_chunks) +
                               " chunks, " + std::to_string(processed) + " items).");
    }
}

void StreamEngine::log_cancelled(std::size_t processed)
{
    infra::Logger::log(infra::LogLevel::WARN, "Stream: Cancelled after " +
                                                  std::to_string(processed) + " items.");
}

void StreamEngine::log_abort(const ItemError& error)
{
    infra::Logger::log(infra::LogLevel::DEBUG, "Stream: Aborting at index " +
                                                   std::to_string(error.index) + " (" +
                                                   error.kind + ").");
}

} // namespace ulidkit::engine
