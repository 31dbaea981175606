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
 * @file stream_test.cpp
 * @brief Unit tests for the batch/stream engine.
 *
 * @details
 * Order preservation is checked across batch sizes and both dispatch modes.
 * Failure policy, cancellation and the generation stream are covered with
 * injected clocks and entropy.
 */

#include "framework.hpp"
#include "ulidkit/core/generator.hpp"
#include "ulidkit/engine/stream.hpp"
#include "ulidkit/infra/clock.hpp"
#include "ulidkit/infra/entropy.hpp"
#include "ulidkit/infra/scheduler.hpp"

#include <atomic>
#include <cJSON.h>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using ulidkit::engine::BatchOutcome;
using ulidkit::engine::GenerateStreamOptions;
using ulidkit::engine::Outcome;
using ulidkit::engine::StreamAbortError;
using ulidkit::engine::StreamEngine;
using ulidkit::engine::StreamOperation;
using ulidkit::engine::StreamOptions;
using ulidkit::engine::StreamValue;

namespace {

constexpr std::uint64_t T0 = 1700000000000ULL;

std::vector<std::string> mixed_inputs(std::size_t n)
{
    ulidkit::infra::ManualClock clock(T0);
    ulidkit::infra::FixedEntropy entropy({0x11, 0x22, 0x33, 0x44, 0x55});
    ulidkit::core::Generator gen(clock, entropy);

    std::vector<std::string> items;
    for (std::size_t i = 0; i < n; ++i) {
        if (i % 7 == 3) {
            items.push_back("bad-" + std::to_string(i));
        } else {
            items.push_back(gen.generate(T0 + i).to_string());
        }
    }
    return items;
}

} // namespace

/**
 * @brief Output order equals input order for every batch size and dispatch mode.
 */
void test_stream_preserves_order()
{
    const std::vector<std::string> inputs = mixed_inputs(257);
    ulidkit::infra::Scheduler pool(4);

    const StreamEngine::Operation<std::string, std::size_t> op = [](const std::string& s) {
        // Slow down a little so parallel slices finish out of order.
        volatile std::size_t spin = 0;
        for (std::size_t i = 0; i < (s.size() % 5) * 1000; ++i) {
            spin = spin + i;
        }
        return s.size();
    };

    for (std::size_t batch : {1u, 7u, 11u, 64u, 1000u}) {
        for (bool parallel : {false, true}) {
            StreamOptions options;
            options.batch_size = batch;
            options.parallel = parallel;
            options.continue_on_error = true;
            options.scheduler = &pool;

            const BatchOutcome<std::size_t> outcome =
                StreamEngine::run_text(StreamEngine::from_vector(inputs), op, options);
            ASSERT_EQ(outcome.items.size(), inputs.size());
            for (std::size_t i = 0; i < inputs.size(); ++i) {
                ASSERT_EQ(outcome.items[i].index, i);
                ASSERT_EQ(*outcome.items[i].value, inputs[i].size());
            }
            ASSERT_EQ(outcome.chunks, (inputs.size() + batch - 1) / batch);
        }
    }
}

/**
 * @brief With continue_on_error every input yields exactly one outcome, errors in place.
 */
void test_stream_continue_on_error_cardinality()
{
    const std::vector<std::string> inputs = mixed_inputs(100);
    StreamOptions options;
    options.batch_size = 16;
    options.parallel = true;
    options.workers = 3;
    options.continue_on_error = true;

    const auto op = StreamEngine::make_operation(StreamOperation::PARSE, ulidkit::core::Generator());
    const BatchOutcome<StreamValue> outcome =
        StreamEngine::run_text(StreamEngine::from_vector(inputs), op, options);

    ASSERT_EQ(outcome.items.size(), inputs.size());
    ASSERT_EQ(outcome.processed, inputs.size());
    std::size_t failures = 0;
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        const Outcome<StreamValue>& slot = outcome.items[i];
        if (i % 7 == 3) {
            ASSERT_FALSE(slot.ok());
            ASSERT_EQ(slot.error->index, i);
            ASSERT_EQ(slot.error->kind, std::string("invalid_length"));
            ASSERT_TRUE(slot.error->value.find("bad-") != std::string::npos);
            failures++;
        } else {
            ASSERT_TRUE(slot.ok());
            ASSERT_EQ(slot.value->parsed.timestamp_ms, T0 + i);
        }
    }
    ASSERT_EQ(outcome.failed, failures);
}

/**
 * @brief Fail-fast reports the lowest failing index and keeps earlier chunks emitted.
 */
void test_stream_fail_fast()
{
    const std::vector<std::string> inputs = mixed_inputs(40);
    StreamOptions options;
    options.batch_size = 2;
    options.continue_on_error = false;

    std::size_t emitted = 0;
    const auto op =
        StreamEngine::make_operation(StreamOperation::TRANSFORM, ulidkit::core::Generator());
    bool thrown = false;
    try {
        StreamEngine::run_text<StreamValue>(
            StreamEngine::from_vector(inputs), op, options,
            [&emitted](std::vector<Outcome<StreamValue>>& chunk) { emitted += chunk.size(); });
    } catch (const StreamAbortError& e) {
        thrown = true;
        ASSERT_EQ(e.index(), static_cast<size_t>(3));
        ASSERT_EQ(e.value(), std::string("'bad-3'"));
        ASSERT_EQ(e.cause().kind, std::string("invalid_length"));
    }
    ASSERT_TRUE(thrown);
    // Chunk [0,1] was emitted; chunk [2,3] failed as a whole.
    ASSERT_EQ(emitted, static_cast<size_t>(2));
}

/**
 * @brief Parallel fail-fast still reports the lowest index in the chunk.
 */
void test_stream_fail_fast_parallel_lowest_index()
{
    std::vector<std::string> inputs(50, "01ARZ3NDEKTSV4RRFFQ69G5FAV");
    inputs[41] = "late-bad";
    inputs[17] = "early-bad";

    StreamOptions options;
    options.batch_size = 50;
    options.parallel = true;
    options.workers = 4;

    const auto op =
        StreamEngine::make_operation(StreamOperation::VALIDATE, ulidkit::core::Generator());
    // VALIDATE never fails, so wrap it in an operation that does.
    const StreamEngine::Operation<std::string, bool> strict = [](const std::string& s) {
        if (s.size() != 26) {
            throw std::invalid_argument("bad item");
        }
        return true;
    };
    ASSERT_TRUE(op(inputs[17]).valid == false);

    try {
        StreamEngine::run_text(StreamEngine::from_vector(inputs), strict, options);
        ulidkit::test::fail_no_throw(__FILE__, __LINE__, "run_text", "StreamAbortError");
    } catch (const StreamAbortError& e) {
        ASSERT_EQ(e.index(), static_cast<size_t>(17));
        ASSERT_EQ(e.cause().kind, std::string("invalid_input"));
    }
}

/**
 * @brief A cancelled stream stops at a chunk boundary and emits only whole chunks.
 */
void test_stream_cancellation()
{
    const std::vector<std::string> inputs(100, "01ARZ3NDEKTSV4RRFFQ69G5FAV");
    std::atomic<bool> cancel{false};

    StreamOptions options;
    options.batch_size = 10;
    options.cancel = &cancel;

    const StreamEngine::Operation<std::string, bool> op = [](const std::string&) { return true; };
    std::size_t chunks_seen = 0;
    const BatchOutcome<bool> outcome = StreamEngine::run_text<bool>(
        StreamEngine::from_vector(inputs), op, options,
        [&](std::vector<Outcome<bool>>& chunk) {
            ASSERT_EQ(chunk.size(), static_cast<size_t>(10));
            if (++chunks_seen == 3) {
                cancel = true;
            }
        });

    ASSERT_TRUE(outcome.cancelled);
    ASSERT_EQ(outcome.chunks, static_cast<size_t>(3));
    ASSERT_EQ(outcome.processed, static_cast<size_t>(30));
    ASSERT_TRUE(outcome.items.empty());
}

/**
 * @brief Zero batch size is rejected; an empty source yields an empty outcome.
 */
void test_stream_edge_cases()
{
    const std::vector<std::string> none;
    const StreamEngine::Operation<std::string, bool> op = [](const std::string&) { return true; };

    StreamOptions zero;
    zero.batch_size = 0;
    ASSERT_THROWS(StreamEngine::run_text(StreamEngine::from_vector(none), op, zero),
                  std::invalid_argument);

    const BatchOutcome<bool> empty =
        StreamEngine::run_text(StreamEngine::from_vector(none), op, StreamOptions());
    ASSERT_TRUE(empty.items.empty());
    ASSERT_EQ(empty.chunks, static_cast<size_t>(0));
    ASSERT_FALSE(empty.cancelled);
}

/**
 * @brief Each named operation produces its documented value.
 */
void test_stream_operations()
{
    ulidkit::infra::ManualClock clock(T0);
    ulidkit::infra::FixedEntropy entropy({0x00});
    ulidkit::core::Generator gen(clock, entropy);

    const std::string id = "01arz3ndektsv4rrffq69g5fav";

    const StreamValue v = StreamEngine::make_operation(StreamOperation::VALIDATE, gen)(id);
    ASSERT_TRUE(v.valid);

    const StreamValue ts = StreamEngine::make_operation(StreamOperation::EXTRACT_TIMESTAMP, gen)(id);
    ASSERT_EQ(ts.timestamp_ms, static_cast<std::uint64_t>(1469922850259ULL));

    const StreamValue t = StreamEngine::make_operation(StreamOperation::TRANSFORM, gen)(id);
    ASSERT_EQ(t.ulid, std::string("01ARZ3NDEKTSV4RRFFQ69G5FAV"));

    const auto generate = StreamEngine::make_operation(StreamOperation::GENERATE, gen);
    ASSERT_EQ(generate("").timestamp_ms, T0);
    ASSERT_EQ(generate("1469918176385").ulid, std::string("01ARYZ6S410000000000000000"));
    ASSERT_THROWS(generate("12ab"), std::invalid_argument);
    ASSERT_THROWS(generate("281474976710656"), ulidkit::core::TimestampOutOfRangeError);

    StreamOperation parsed;
    ASSERT_TRUE(ulidkit::engine::parse_stream_operation("extract-timestamp", parsed));
    ASSERT_TRUE(parsed == StreamOperation::EXTRACT_TIMESTAMP);
    ASSERT_FALSE(ulidkit::engine::parse_stream_operation("hash", parsed));
}

/**
 * @brief Records resolve their ULID from the first present id field.
 */
void test_stream_record_items()
{
    cJSON* items = cJSON_Parse("[\"01ARZ3NDEKTSV4RRFFQ69G5FAV\","
                               "{\"uuid\":\"x\",\"id\":\"01AN4Z07BY79KA1307SR9X4MV3\"},"
                               "{\"identifier\":\"01ARYZ6S410000000000000000\"},"
                               "{\"name\":\"nothing\"},"
                               "7]");
    ASSERT_TRUE(items != nullptr);

    ASSERT_EQ(StreamEngine::item_text(cJSON_GetArrayItem(items, 0)),
              std::string("01ARZ3NDEKTSV4RRFFQ69G5FAV"));
    ASSERT_EQ(StreamEngine::item_text(cJSON_GetArrayItem(items, 1)),
              std::string("01AN4Z07BY79KA1307SR9X4MV3"));
    ASSERT_EQ(StreamEngine::item_text(cJSON_GetArrayItem(items, 2)),
              std::string("01ARYZ6S410000000000000000"));
    ASSERT_THROWS(StreamEngine::item_text(cJSON_GetArrayItem(items, 3)), std::invalid_argument);
    ASSERT_THROWS(StreamEngine::item_text(cJSON_GetArrayItem(items, 4)), std::invalid_argument);
    ASSERT_EQ(StreamEngine::describe_item(cJSON_GetArrayItem(items, 4)), std::string("'7'"));

    cJSON_Delete(items);
}

/**
 * @brief A generation stream is strictly increasing across chunk boundaries.
 */
void test_generate_stream_monotonic_across_chunks()
{
    ulidkit::infra::ManualClock clock(T0);
    ulidkit::infra::FixedEntropy entropy({0x7F, 0x00, 0x80});
    ulidkit::core::Generator gen(clock, entropy);

    GenerateStreamOptions options;
    options.count = 2500;
    options.batch_size = 100;

    const BatchOutcome<ulidkit::core::Ulid> outcome = StreamEngine::generate_stream(gen, options);
    ASSERT_EQ(outcome.items.size(), static_cast<size_t>(2500));
    ASSERT_EQ(outcome.chunks, static_cast<size_t>(25));
    for (std::size_t i = 1; i < outcome.items.size(); ++i) {
        ASSERT_TRUE(*outcome.items[i - 1].value < *outcome.items[i].value);
    }
    // The clock never moved: everything shares one millisecond.
    ASSERT_EQ(outcome.items.back().value->timestamp_ms(), T0);
}

/**
 * @brief Forced unique timestamps give each ID its own millisecond, across chunks.
 */
void test_generate_stream_force_unique()
{
    ulidkit::infra::ManualClock clock(0);
    ulidkit::infra::FixedEntropy entropy({0x42});
    ulidkit::core::Generator gen(clock, entropy);

    GenerateStreamOptions options;
    options.count = 30;
    options.batch_size = 7;
    options.timestamp = T0;
    options.force_unique_timestamps = true;

    const BatchOutcome<ulidkit::core::Ulid> outcome = StreamEngine::generate_stream(gen, options);
    ASSERT_EQ(outcome.items.size(), static_cast<size_t>(30));
    for (std::size_t i = 0; i < outcome.items.size(); ++i) {
        ASSERT_EQ(outcome.items[i].value->timestamp_ms(), T0 + i);
    }

    GenerateStreamOptions bad;
    bad.count = 1;
    bad.timestamp = ulidkit::core::MAX_TIMESTAMP + 1;
    ASSERT_THROWS(StreamEngine::generate_stream(gen, bad), ulidkit::core::TimestampOutOfRangeError);
}

/**
 * @brief Forcing unique timestamps past the maximum aborts with the failing index.
 */
void test_generate_stream_exhaustion()
{
    ulidkit::infra::ManualClock clock(0);
    ulidkit::infra::FixedEntropy entropy({0x01});
    ulidkit::core::Generator gen(clock, entropy);

    GenerateStreamOptions options;
    options.count = 5;
    options.timestamp = ulidkit::core::MAX_TIMESTAMP - 1;
    options.force_unique_timestamps = true;

    try {
        StreamEngine::generate_stream(gen, options);
        ulidkit::test::fail_no_throw(__FILE__, __LINE__, "generate_stream", "StreamAbortError");
    } catch (const StreamAbortError& e) {
        ASSERT_EQ(e.index(), static_cast<size_t>(2));
        ASSERT_EQ(e.cause().kind, std::string("generation_failed"));
    }
}
