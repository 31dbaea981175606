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
 * @file handler.cpp
 * @brief Implementation of the request processing pipeline.
 *
 * @details
 * Every request goes through the same lifecycle:
 * 1. **Ingest**: Parse the raw JSON and the `options` object.
 * 2. **Execute**: Route `op` to the core or engine layer.
 * 3. **Respond**: Serialize the result, or map the exception that ended the
 *    request to a structured error object.
 */

#include "ulidkit/command/handler.hpp"

#include "ulidkit/command/options.hpp"
#include "ulidkit/core/parser.hpp"
#include "ulidkit/core/validator.hpp"
#include "ulidkit/engine/sort.hpp"
#include "ulidkit/engine/stream.hpp"
#include "ulidkit/infra/logger.hpp"
#include "ulidkit/infra/string.hpp"

#include <cJSON.h>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <memory>
#include <stdexcept>

namespace ulidkit::command {

namespace {

struct JsonDeleter {
    void operator()(cJSON* item) const { cJSON_Delete(item); }
};
using JsonPtr = std::unique_ptr<cJSON, JsonDeleter>;

/**
 * @brief The request itself is malformed (missing `op`, wrong `input` type).
 */
class RequestError : public core::UlidError {
  public:
    explicit RequestError(const std::string& what) : core::UlidError(what) {}
};

std::string serialize(cJSON* root)
{
    char* printed = cJSON_PrintUnformatted(root);
    if (!printed) {
        return "{\"status\":\"error\",\"error\":{\"kind\":\"internal\","
               "\"message\":\"Response serialization failed\"}}";
    }
    std::string out(printed);
    std::free(printed);
    return out;
}

std::string error_response(const std::string& kind, const std::string& message,
                           const std::function<void(cJSON*)>& details = nullptr)
{
    infra::Logger::log(infra::LogLevel::ERROR, "Handler: " + kind + ": " + message);

    JsonPtr root(cJSON_CreateObject());
    cJSON_AddStringToObject(root.get(), "status", "error");
    cJSON* error = cJSON_AddObjectToObject(root.get(), "error");
    cJSON_AddStringToObject(error, "kind", kind.c_str());
    cJSON_AddStringToObject(error, "message", message.c_str());
    if (details) {
        details(error);
    }
    return serialize(root.get());
}

std::string require_string(const cJSON* input)
{
    if (!cJSON_IsString(input) || !input->valuestring) {
        throw RequestError("'input' must be a string");
    }
    return input->valuestring;
}

void require_array(const cJSON* input)
{
    if (!cJSON_IsArray(input)) {
        throw RequestError("'input' must be an array");
    }
}

void check_count(std::size_t count, std::size_t max, const char* op)
{
    if (count > max) {
        throw OptionsError("count", std::to_string(count) + " exceeds the maximum of " +
                                        std::to_string(max) + " for " + op);
    }
}

// ----------------------------------------------------------------------------
// Rendering
// ----------------------------------------------------------------------------

cJSON* render_ulid(const core::Ulid& id, OutputFormat format)
{
    switch (format) {
    case OutputFormat::DEFAULT:
    case OutputFormat::STRING:
        return cJSON_CreateString(id.to_string().c_str());
    case OutputFormat::HEX:
        return cJSON_CreateString(id.to_hex().c_str());
    case OutputFormat::JSON: {
        cJSON* obj = cJSON_CreateObject();
        const core::Randomness r = id.randomness();
        cJSON_AddStringToObject(obj, "ulid", id.to_string().c_str());
        cJSON_AddNumberToObject(obj, "timestamp_ms", static_cast<double>(id.timestamp_ms()));
        cJSON_AddStringToObject(obj, "timestamp_iso8601",
                                infra::String::iso8601_utc(id.timestamp_ms()).c_str());
        cJSON_AddStringToObject(obj, "randomness_hex",
                                infra::String::to_hex(r.data(), r.size()).c_str());
        return obj;
    }
    default:
        throw OptionsError("format", "generate supports string, json or hex");
    }
}

cJSON* render_parsed(const core::ParsedUlid& parsed, OutputFormat format)
{
    switch (format) {
    case OutputFormat::TIMESTAMP_ONLY:
        return cJSON_CreateNumber(static_cast<double>(parsed.timestamp_ms));
    case OutputFormat::COMPACT: {
        cJSON* obj = cJSON_CreateObject();
        cJSON_AddStringToObject(obj, "ulid", parsed.canonical.c_str());
        cJSON_AddNumberToObject(obj, "timestamp_ms", static_cast<double>(parsed.timestamp_ms));
        cJSON_AddStringToObject(obj, "randomness", parsed.randomness_hex.c_str());
        return obj;
    }
    case OutputFormat::DEFAULT:
    case OutputFormat::FULL: {
        cJSON* obj = cJSON_CreateObject();
        cJSON_AddStringToObject(obj, "ulid", parsed.source_string.c_str());
        cJSON_AddStringToObject(obj, "canonical", parsed.canonical.c_str());
        cJSON_AddNumberToObject(obj, "timestamp_ms", static_cast<double>(parsed.timestamp_ms));
        cJSON_AddStringToObject(obj, "timestamp_iso8601", parsed.timestamp_iso8601.c_str());
        cJSON_AddNumberToObject(obj, "timestamp_unix_seconds",
                                static_cast<double>(parsed.timestamp_unix_seconds));
        cJSON_AddStringToObject(obj, "randomness_hex", parsed.randomness_hex.c_str());
        cJSON_AddBoolToObject(obj, "is_valid", parsed.is_valid);
        return obj;
    }
    default:
        throw OptionsError("format", "parse supports full, compact or timestamp-only");
    }
}

cJSON* render_report(const core::ValidationReport& report)
{
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddBoolToObject(obj, "is_valid", report.is_valid);
    cJSON_AddNumberToObject(obj, "length", static_cast<double>(report.length));
    cJSON_AddBoolToObject(obj, "is_canonical", report.is_canonical);
    if (!report.is_valid) {
        cJSON_AddStringToObject(obj, "kind", core::to_string(report.failure_kind));
        cJSON_AddStringToObject(obj, "message", report.message.c_str());
    }
    if (report.failure_position) {
        cJSON_AddNumberToObject(obj, "position", static_cast<double>(*report.failure_position));
        cJSON_AddStringToObject(obj, "character", std::string(1, report.character).c_str());
    }
    return obj;
}

cJSON* render_inspected(const core::InspectedUlid& inspected, OutputFormat format)
{
    cJSON* obj = render_parsed(inspected.parsed, format == OutputFormat::DEFAULT
                                                     ? OutputFormat::FULL
                                                     : format);
    if (!cJSON_IsObject(obj)) {
        return obj;
    }
    cJSON_AddNumberToObject(obj, "age_seconds", static_cast<double>(inspected.age_seconds));
    cJSON_AddStringToObject(obj, "age_human", inspected.age_human.c_str());
    cJSON_AddNumberToObject(obj, "entropy_bits", inspected.entropy_bits);
    cJSON_AddNumberToObject(obj, "timestamp_bits", inspected.timestamp_bits);
    cJSON_AddNumberToObject(obj, "randomness_bits", inspected.randomness_bits);
    cJSON_AddNumberToObject(obj, "total_bits", inspected.total_bits);
    cJSON_AddNumberToObject(obj, "randomness_char_entropy", inspected.randomness_char_entropy);
    return obj;
}

cJSON* render_stream_value(const engine::StreamValue& value, OutputFormat format)
{
    switch (value.op) {
    case engine::StreamOperation::VALIDATE:
        return cJSON_CreateBool(value.valid);
    case engine::StreamOperation::PARSE:
        return render_parsed(value.parsed, format);
    case engine::StreamOperation::GENERATE:
        return cJSON_CreateString(value.ulid.c_str());
    case engine::StreamOperation::EXTRACT_TIMESTAMP:
        return cJSON_CreateNumber(static_cast<double>(value.timestamp_ms));
    case engine::StreamOperation::TRANSFORM:
        if (format == OutputFormat::COMPACT) {
            cJSON* obj = cJSON_CreateObject();
            cJSON_AddStringToObject(obj, "ulid", value.ulid.c_str());
            return obj;
        }
        if (format == OutputFormat::TIMESTAMP_ONLY) {
            return cJSON_CreateNumber(static_cast<double>(value.timestamp_ms));
        }
        return cJSON_CreateString(value.ulid.c_str());
    }
    return cJSON_CreateNull();
}

cJSON* render_item_error(const engine::ItemError& error)
{
    cJSON* wrapper = cJSON_CreateObject();
    cJSON* obj = cJSON_AddObjectToObject(wrapper, "error");
    cJSON_AddNumberToObject(obj, "index", static_cast<double>(error.index));
    cJSON_AddStringToObject(obj, "kind", error.kind.c_str());
    cJSON_AddStringToObject(obj, "message", error.message.c_str());
    cJSON_AddStringToObject(obj, "value", error.value.c_str());
    return wrapper;
}

/// @brief Text handed to a stream operation for one JSON item.
std::string stream_item_text(const cJSON* item, engine::StreamOperation op)
{
    if (op == engine::StreamOperation::GENERATE) {
        if (!item || cJSON_IsNull(item)) {
            return "";
        }
        if (cJSON_IsNumber(item)) {
            const double d = item->valuedouble;
            if (d < 0 || d != std::floor(d)) {
                throw std::invalid_argument("Timestamp must be a non-negative integer");
            }
            if (d > static_cast<double>(core::MAX_TIMESTAMP)) {
                throw core::TimestampOutOfRangeError(static_cast<std::uint64_t>(d),
                                                     core::MAX_TIMESTAMP);
            }
            return std::to_string(static_cast<std::uint64_t>(d));
        }
    }
    return engine::StreamEngine::item_text(item);
}

} // namespace

Handler::Handler(infra::Scheduler* scheduler, core::Generator generator)
    : scheduler_(scheduler), generator_(generator), shared_(generator)
{
}

/**
 * @brief Processes a raw request and generates a JSON response.
 *
 * Exceptions never escape: each error type of the core maps to a `kind` and
 * carries the fields that locate the problem (index, position, field).
 */
std::string Handler::process(const std::string& raw_json)
{
    // [Safety Check] Short-circuit empty payloads.
    if (infra::String::trim(raw_json).empty()) {
        return error_response("invalid_request", "Empty request payload");
    }

    // 1. INGEST PHASE
    JsonPtr req(cJSON_Parse(raw_json.c_str()));
    if (!req) {
        return error_response("invalid_json", "Invalid JSON syntax");
    }
    if (!cJSON_IsObject(req.get())) {
        return error_response("invalid_request", "Request must be a JSON object");
    }

    const cJSON* op_item = cJSON_GetObjectItemCaseSensitive(req.get(), "op");
    if (!cJSON_IsString(op_item) || !op_item->valuestring) {
        return error_response("invalid_request", "Missing required field 'op'");
    }
    const std::string op = op_item->valuestring;
    const cJSON* input = cJSON_GetObjectItemCaseSensitive(req.get(), "input");

    // 2. EXECUTE PHASE
    try {
        const CommandOptions options =
            CommandOptions::from_json(cJSON_GetObjectItemCaseSensitive(req.get(), "options"));
        JsonPtr data(dispatch(op, input, options));

        // 3. RESPOND PHASE
        JsonPtr resp(cJSON_CreateObject());
        cJSON_AddStringToObject(resp.get(), "status", "ok");
        cJSON_AddItemToObject(resp.get(), "data", data.release());
        return serialize(resp.get());

    } catch (const OptionsError& e) {
        return error_response("invalid_option", e.what(), [&](cJSON* err) {
            cJSON_AddStringToObject(err, "field", e.field().c_str());
        });
    } catch (const core::DecodeException& e) {
        const core::DecodeError& d = e.error();
        return error_response(core::to_string(d.kind), e.what(), [&](cJSON* err) {
            cJSON_AddNumberToObject(err, "length", static_cast<double>(d.actual_length));
            if (d.kind != core::DecodeErrorKind::INVALID_LENGTH) {
                cJSON_AddNumberToObject(err, "position", static_cast<double>(d.position));
                cJSON_AddStringToObject(err, "character", std::string(1, d.character).c_str());
            }
        });
    } catch (const engine::MalformedKeyError& e) {
        return error_response("malformed_key", e.what(), [&](cJSON* err) {
            cJSON_AddNumberToObject(err, "index", static_cast<double>(e.index()));
            cJSON_AddStringToObject(err, "key", e.key().c_str());
        });
    } catch (const engine::StreamAbortError& e) {
        return error_response("stream_aborted", e.what(), [&](cJSON* err) {
            cJSON_AddNumberToObject(err, "index", static_cast<double>(e.index()));
            cJSON_AddStringToObject(err, "value", e.value().c_str());
            cJSON_AddStringToObject(err, "cause", e.cause().kind.c_str());
        });
    } catch (const core::TimestampOutOfRangeError& e) {
        return error_response("timestamp_out_of_range", e.what(), [&](cJSON* err) {
            cJSON_AddNumberToObject(err, "timestamp", static_cast<double>(e.timestamp()));
            cJSON_AddNumberToObject(err, "max", static_cast<double>(e.max_timestamp()));
        });
    } catch (const core::ClockRollbackError& e) {
        return error_response("clock_rollback", e.what(), [&](cJSON* err) {
            cJSON_AddNumberToObject(err, "observed_ms", static_cast<double>(e.observed_ms()));
            cJSON_AddNumberToObject(err, "last_ms", static_cast<double>(e.last_ms()));
        });
    } catch (const core::GenerationError& e) {
        return error_response("generation_failed", e.what());
    } catch (const RequestError& e) {
        return error_response("invalid_request", e.what());
    } catch (const std::invalid_argument& e) {
        return error_response("invalid_request", e.what());
    } catch (const std::exception& e) {
        return error_response("internal", e.what());
    }
}

cJSON* Handler::dispatch(const std::string& op, const cJSON* input,
                         const CommandOptions& options)
{
    if (op == "generate") {
        return generate(options);
    } else if (op == "generate-monotonic") {
        return generate_monotonic(options);
    } else if (op == "generate-stream") {
        return generate_stream(options);
    } else if (op == "validate") {
        if (cJSON_IsArray(input)) {
            JsonPtr out(cJSON_CreateArray());
            const cJSON* item = nullptr;
            cJSON_ArrayForEach(item, input)
            {
                const bool valid = cJSON_IsString(item) && item->valuestring &&
                                   core::Validator::validate(item->valuestring);
                cJSON_AddItemToArray(out.get(), cJSON_CreateBool(valid));
            }
            return out.release();
        }
        return cJSON_CreateBool(core::Validator::validate(require_string(input)));
    } else if (op == "validate-detailed") {
        return render_report(core::Validator::validate_detailed(require_string(input)));
    } else if (op == "parse") {
        return render_parsed(core::Parser::parse(require_string(input)), options.format);
    } else if (op == "inspect") {
        return render_inspected(core::Parser::inspect(require_string(input), generator_.clock()),
                                options.format);
    } else if (op == "sort") {
        return sort(input, options);
    } else if (op == "stream") {
        return stream(input, options);
    }
    throw RequestError("Unknown op '" + op + "'");
}

cJSON* Handler::generate(const CommandOptions& options)
{
    check_count(options.count, MAX_GENERATE_COUNT, "generate");

    if (options.count == 1) {
        const core::Ulid id =
            options.timestamp ? generator_.generate(*options.timestamp) : generator_.generate();
        return render_ulid(id, options.format);
    }

    const std::vector<core::Ulid> ids = options.timestamp
                                            ? generator_.generate_bulk(options.count,
                                                                       *options.timestamp)
                                            : generator_.generate_bulk(options.count);
    JsonPtr out(cJSON_CreateArray());
    for (const auto& id : ids) {
        cJSON_AddItemToArray(out.get(), render_ulid(id, options.format));
    }
    return out.release();
}

cJSON* Handler::generate_monotonic(const CommandOptions& options)
{
    check_count(options.count, MAX_GENERATE_COUNT, "generate-monotonic");

    // An explicit timestamp starts a fresh, request-local sequence; otherwise the
    // handler-wide context continues from the previous request.
    const std::vector<core::Ulid> ids =
        options.timestamp ? generator_.generate_monotonic_batch(options.count, *options.timestamp)
                          : shared_.next_batch(options.count, core::RollbackPolicy::REPORT);

    JsonPtr out(cJSON_CreateArray());
    for (const auto& id : ids) {
        cJSON_AddItemToArray(out.get(), render_ulid(id, options.format));
    }
    return out.release();
}

cJSON* Handler::generate_stream(const CommandOptions& options)
{
    check_count(options.count, MAX_GENERATE_STREAM_COUNT, "generate-stream");

    engine::GenerateStreamOptions gen;
    gen.count = options.count;
    gen.batch_size = options.batch_size;
    gen.timestamp = options.timestamp;
    gen.force_unique_timestamps = options.force_unique_timestamps;

    JsonPtr out(cJSON_CreateArray());
    cJSON* array = out.get();
    engine::StreamEngine::generate_stream(
        generator_, gen, [array](std::vector<engine::Outcome<core::Ulid>>& chunk) {
            for (const auto& slot : chunk) {
                cJSON_AddItemToArray(array, cJSON_CreateString(slot.value->to_string().c_str()));
            }
        });
    return out.release();
}

cJSON* Handler::sort(const cJSON* input, const CommandOptions& options)
{
    require_array(input);

    if (options.column) {
        JsonPtr records(cJSON_Duplicate(input, 1));
        if (!records) {
            throw std::runtime_error("Failed to copy records for sorting");
        }
        engine::SortEngine::sort_records(records.get(), *options.column, options.reverse,
                                         options.sort_mode);
        return records.release();
    }

    std::vector<std::string> ids;
    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, input)
    {
        if (!cJSON_IsString(item) || !item->valuestring) {
            throw engine::MalformedKeyError(ids.size(), "",
                                            "Item is not a string; use 'column' for records");
        }
        ids.emplace_back(item->valuestring);
    }
    engine::SortEngine::sort_strings(ids, options.reverse, options.sort_mode);

    JsonPtr out(cJSON_CreateArray());
    for (const auto& id : ids) {
        cJSON_AddItemToArray(out.get(), cJSON_CreateString(id.c_str()));
    }
    return out.release();
}

cJSON* Handler::stream(const cJSON* input, const CommandOptions& options)
{
    require_array(input);
    if (!options.operation) {
        throw OptionsError("operation", "required for stream");
    }

    std::vector<const cJSON*> items;
    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, input)
    {
        items.push_back(item);
    }

    const engine::StreamOperation kind = *options.operation;
    const auto per_text = engine::StreamEngine::make_operation(kind, generator_);
    const engine::StreamEngine::Operation<const cJSON*, engine::StreamValue> op =
        [per_text, kind](const cJSON* const& json) { return per_text(stream_item_text(json, kind)); };

    engine::StreamOptions stream_options;
    stream_options.batch_size = options.batch_size;
    stream_options.parallel = options.parallel;
    stream_options.continue_on_error = options.continue_on_error;
    stream_options.workers = options.workers;
    stream_options.scheduler = options.workers == 0 ? scheduler_ : nullptr;
    stream_options.expected_items = items.size();

    JsonPtr results(cJSON_CreateArray());
    cJSON* array = results.get();
    const OutputFormat format = options.format;
    const auto outcome = engine::StreamEngine::run<const cJSON*, engine::StreamValue>(
        engine::StreamEngine::from_vector(items), op, stream_options,
        engine::StreamEngine::describe_item,
        [array, format](std::vector<engine::Outcome<engine::StreamValue>>& chunk) {
            for (const auto& slot : chunk) {
                cJSON_AddItemToArray(array, slot.ok() ? render_stream_value(*slot.value, format)
                                                      : render_item_error(*slot.error));
            }
        });

    JsonPtr out(cJSON_CreateObject());
    cJSON_AddItemToObject(out.get(), "results", results.release());
    cJSON_AddNumberToObject(out.get(), "processed", static_cast<double>(outcome.processed));
    cJSON_AddNumberToObject(out.get(), "failed", static_cast<double>(outcome.failed));
    cJSON_AddNumberToObject(out.get(), "chunks", static_cast<double>(outcome.chunks));
    return out.release();
}

} // namespace ulidkit::command
