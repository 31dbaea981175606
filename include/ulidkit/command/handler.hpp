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
 * @file handler.hpp
 * @brief JSON request dispatcher in front of the ULID core.
 *
 * @details
 * The `Handler` is the only place where JSON and the core meet:
 * 1. **Ingest:** Parse the raw request and its `options` object.
 * 2. **Dispatch:** Route `op` to the codec, generator, sort or stream engine.
 * 3. **Emit:** Serialize the result, or the exception that ended the request,
 *    into a standardized response.
 */

#pragma once

#include "ulidkit/core/generator.hpp"
#include "ulidkit/infra/scheduler.hpp"

#include <string>

struct cJSON;

namespace ulidkit::command {

struct CommandOptions;

/**
 * @class Handler
 * @brief Stateful request processor.
 *
 * Holds one `SharedGenerator`, so `generate-monotonic` requests without an
 * explicit timestamp stay strictly increasing across requests.
 */
class Handler {
  public:
    /**
     * @param scheduler Pool for parallel streams; may be null, in which case a
     * parallel stream creates its own pool.
     * @param generator Source of new IDs.
     */
    explicit Handler(infra::Scheduler* scheduler = nullptr,
                     core::Generator generator = core::Generator());

    Handler(const Handler&) = delete;
    Handler& operator=(const Handler&) = delete;

    /**
     * @brief Processes one request and returns the serialized response.
     *
     * Never throws.
     *
     * **Response Formats:**
     * - **Success:** `{"status": "ok", "data": <result>}`
     * - **Error:** `{"status": "error", "error": {"kind": "...", "message": "...", ...}}`
     *
     * @code
     * // Example Request Payload:
     * {
     * "op": "generate",
     * "options": { "count": 3, "format": "json" }
     * }
     * @endcode
     */
    std::string process(const std::string& raw_json);

  private:
    cJSON* dispatch(const std::string& op, const cJSON* input, const CommandOptions& options);

    cJSON* generate(const CommandOptions& options);
    cJSON* generate_monotonic(const CommandOptions& options);
    cJSON* generate_stream(const CommandOptions& options);
    cJSON* sort(const cJSON* input, const CommandOptions& options);
    cJSON* stream(const cJSON* input, const CommandOptions& options);

    infra::Scheduler* scheduler_;
    core::Generator generator_;
    core::SharedGenerator shared_;
};

} // namespace ulidkit::command
