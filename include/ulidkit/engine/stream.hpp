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
 * @file stream.hpp
 * @brief Chunked, order-preserving batch processing over a pull source.
 *
 * @details
 * `StreamEngine::run` pulls at most `batch_size` items at a time, applies one
 * operation to each item and emits the chunk whole, in input order.
 *
 * **Pipeline per chunk:**
 * 1. **Pull**: up to `batch_size` items from the source; every item keeps its
 *    global input index.
 * 2. **Dispatch**: sequentially, or as slices submitted to the `Scheduler`.
 *    Each item writes into its own pre-sized result slot, so completion order
 *    never leaks into output order.
 * 3. **Settle**: with `continue_on_error = false` the lowest failing index in the
 *    chunk aborts the call; otherwise failures stay in their slots as errors.
 * 4. **Emit**: to the sink (bounded memory) or into the returned outcome.
 *
 * Cancellation is checked before each chunk; a chunk is never emitted partially.
 */

#pragma once

#include "ulidkit/core/errors.hpp"
#include "ulidkit/core/generator.hpp"
#include "ulidkit/core/parser.hpp"
#include "ulidkit/core/ulid.hpp"
#include "ulidkit/infra/logger.hpp"
#include "ulidkit/infra/scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct cJSON;

namespace ulidkit::engine {

/// @brief Items per chunk when the caller does not choose.
constexpr std::size_t DEFAULT_BATCH_SIZE = 1000;

/// @brief Chunks of this size or smaller are never dispatched to the pool.
constexpr std::size_t MIN_PARALLEL_CHUNK = 10;

/**
 * @struct StreamOptions
 * @brief Tuning and failure policy of one `run` call.
 */
struct StreamOptions {
    std::size_t batch_size = DEFAULT_BATCH_SIZE;
    bool parallel = false;
    bool continue_on_error = false;

    /// @brief Pool used for parallel chunks. When null, a pool of `workers`
    /// threads is created for the duration of the call.
    infra::Scheduler* scheduler = nullptr;
    std::size_t workers = 0;

    /// @brief Checked before each chunk; may be flipped from any thread.
    const std::atomic<bool>* cancel = nullptr;

    /// @brief Total input size if known (0 = unknown); enables progress logging.
    std::size_t expected_items = 0;
};

/**
 * @struct ItemError
 * @brief Why one item failed.
 */
struct ItemError {
    std::size_t index = 0;
    std::string value;   ///< Printable rendering of the input item.
    std::string kind;    ///< Stable identifier, e.g. `invalid_character`.
    std::string message;
};

/**
 * @struct Outcome
 * @brief Result slot of one input item: exactly one of `value` or `error` is set.
 */
template <typename T> struct Outcome {
    std::size_t index = 0;
    std::optional<T> value;
    std::optional<ItemError> error;

    bool ok() const { return value.has_value(); }
};

/**
 * @struct BatchOutcome
 * @brief Aggregate result of a `run` call.
 */
template <typename T> struct BatchOutcome {
    /// @brief Emitted outcomes in input order; empty when a sink consumed them.
    std::vector<Outcome<T>> items;
    std::size_t processed = 0;
    std::size_t failed = 0;
    std::size_t chunks = 0;
    bool cancelled = false;
};

/**
 * @class StreamAbortError
 * @brief First failure of a fail-fast stream, located by input index.
 */
class StreamAbortError : public core::UlidError {
  public:
    explicit StreamAbortError(ItemError cause);

    std::size_t index() const { return cause_.index; }
    const std::string& value() const { return cause_.value; }
    const ItemError& cause() const { return cause_; }

  private:
    ItemError cause_;
};

/**
 * @enum StreamOperation
 * @brief Per-item operations available to command-driven streams.
 */
enum class StreamOperation { VALIDATE, PARSE, GENERATE, EXTRACT_TIMESTAMP, TRANSFORM };

/// @brief Parses `validate`, `parse`, `generate`, `extract-timestamp`, `transform`.
bool parse_stream_operation(const std::string& name, StreamOperation& out);

/**
 * @struct StreamValue
 * @brief Typed result of one `StreamOperation` on one item.
 *
 * Which fields carry data depends on `op`:
 * - VALIDATE: `valid`, `ulid` (the input text)
 * - PARSE: `parsed`
 * - GENERATE: `ulid`, `timestamp_ms`
 * - EXTRACT_TIMESTAMP: `timestamp_ms`
 * - TRANSFORM: `ulid` (canonical)
 */
struct StreamValue {
    StreamOperation op = StreamOperation::VALIDATE;
    bool valid = false;
    std::string ulid;
    std::uint64_t timestamp_ms = 0;
    core::ParsedUlid parsed;
};

/**
 * @struct GenerateStreamOptions
 * @brief Parameters of `StreamEngine::generate_stream`.
 */
struct GenerateStreamOptions {
    std::size_t count = 0;
    std::size_t batch_size = DEFAULT_BATCH_SIZE;

    /// @brief Fixed base timestamp; the clock is read per ID when absent.
    std::optional<std::uint64_t> timestamp;

    /// @brief Give every ID its own millisecond: `max(base, previous + 1)`.
    bool force_unique_timestamps = false;

    const std::atomic<bool>* cancel = nullptr;
};

/**
 * @class StreamEngine
 * @brief Batch/stream orchestration.
 */
class StreamEngine {
  public:
    template <typename In> using Source = std::function<std::optional<In>()>;
    template <typename In, typename Out> using Operation = std::function<Out(const In&)>;
    template <typename Out> using Sink = std::function<void(std::vector<Outcome<Out>>&)>;

    /**
     * @brief Wraps a vector as a pull source. The vector must outlive the source.
     */
    template <typename In> static Source<In> from_vector(const std::vector<In>& items)
    {
        auto cursor = std::make_shared<std::size_t>(0);
        return [&items, cursor]() -> std::optional<In> {
            if (*cursor >= items.size()) {
                return std::nullopt;
            }
            return items[(*cursor)++];
        };
    }

    /**
     * @brief Applies `op` to every item of `source`.
     *
     * @param sink Optional consumer of each finished chunk. When set, outcomes
     * are handed over chunk by chunk and not retained, bounding memory to one
     * chunk.
     * @param describe Renders an item for error reports.
     * @throws StreamAbortError on the first failure when `continue_on_error` is false.
     * @throws std::invalid_argument if `batch_size` is 0.
     */
    template <typename In, typename Out>
    static BatchOutcome<Out> run(const Source<In>& source, const Operation<In, Out>& op,
                                 const StreamOptions& options,
                                 const std::function<std::string(const In&)>& describe,
                                 const Sink<Out>& sink = nullptr)
    {
        check_batch_size(options.batch_size);

        std::unique_ptr<infra::Scheduler> owned_pool;
        infra::Scheduler* pool = options.parallel ? options.scheduler : nullptr;
        if (options.parallel && !pool) {
            owned_pool = std::make_unique<infra::Scheduler>(options.workers);
            pool = owned_pool.get();
        }

        const std::size_t total_chunks =
            options.expected_items == 0
                ? 0
                : (options.expected_items + options.batch_size - 1) / options.batch_size;
        std::size_t next_decile = 1;

        BatchOutcome<Out> outcome;
        std::vector<In> chunk;
        chunk.reserve(std::min(options.batch_size, MAX_RESERVE));

        while (true) {
            if (options.cancel && options.cancel->load()) {
                outcome.cancelled = true;
                log_cancelled(outcome.processed);
                break;
            }

            chunk.clear();
            while (chunk.size() < options.batch_size) {
                std::optional<In> item = source();
                if (!item) {
                    break;
                }
                chunk.push_back(std::move(*item));
            }
            if (chunk.empty()) {
                break;
            }

            const std::size_t base = outcome.processed;
            std::vector<Outcome<Out>> results(chunk.size());
            auto process_range = [&](std::size_t begin, std::size_t end) {
                for (std::size_t i = begin; i < end; ++i) {
                    Outcome<Out>& slot = results[i];
                    slot.index = base + i;
                    try {
                        slot.value = op(chunk[i]);
                    } catch (const std::exception& e) {
                        slot.error = make_item_error(base + i, describe(chunk[i]), e);
                    }
                }
            };

            if (pool && chunk.size() > MIN_PARALLEL_CHUNK) {
                const std::size_t slices = std::min(pool->size(), chunk.size());
                const std::size_t per_slice = (chunk.size() + slices - 1) / slices;
                std::vector<std::future<void>> pending;
                pending.reserve(slices);
                for (std::size_t begin = 0; begin < chunk.size(); begin += per_slice) {
                    const std::size_t end = std::min(begin + per_slice, chunk.size());
                    pending.push_back(pool->submit([&process_range, begin, end] {
                        process_range(begin, end);
                    }));
                }
                // Wait for every slice before looking at any slot.
                for (auto& f : pending) {
                    f.wait();
                }
                for (auto& f : pending) {
                    f.get();
                }
            } else {
                process_range(0, chunk.size());
            }

            std::size_t chunk_failed = 0;
            for (const auto& slot : results) {
                if (!slot.ok()) {
                    if (!options.continue_on_error) {
                        log_abort(*slot.error);
                        throw StreamAbortError(*slot.error);
                    }
                    ++chunk_failed;
                }
            }

            outcome.processed += results.size();
            outcome.failed += chunk_failed;
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

    /// @brief `run` over plain strings, described by quoting.
    template <typename Out>
    static BatchOutcome<Out> run_text(const Source<std::string>& source,
                                      const Operation<std::string, Out>& op,
                                      const StreamOptions& options,
                                      const Sink<Out>& sink = nullptr)
    {
        return run<std::string, Out>(source, op, options, describe_text, sink);
    }

    /**
     * @brief The per-item function for a `StreamOperation` over ULID text.
     *
     * GENERATE reads the item as an optional decimal timestamp: empty means
     * "now". Every call draws fresh randomness from `generator`; no context
     * is shared between items.
     */
    static Operation<std::string, StreamValue> make_operation(StreamOperation op,
                                                              core::Generator generator);

    /**
     * @brief Produces `options.count` strictly increasing ULIDs in chunks.
     *
     * One `GenerationContext` spans the whole call, so ordering holds across
     * chunk boundaries. Always sequential.
     *
     * @throws TimestampOutOfRangeError if the base timestamp exceeds 48 bits.
     * @throws StreamAbortError if generation fails (timestamp space exhausted).
     */
    static BatchOutcome<core::Ulid> generate_stream(core::Generator& generator,
                                                    const GenerateStreamOptions& options,
                                                    const Sink<core::Ulid>& sink = nullptr);

    /**
     * @brief Resolves the ULID text of a JSON item.
     *
     * Strings are returned as is; objects use the first string field among
     * `ulid`, `id`, `identifier`, `uuid`.
     *
     * @throws std::invalid_argument for other item types or objects without such a field.
     */
    static std::string item_text(const cJSON* item);

    /// @brief Compact JSON rendering of an item for error reports.
    static std::string describe_item(const cJSON* const& item);

    /// @brief Quoted, truncated rendering of a text item.
    static std::string describe_text(const std::string& item);

  private:
    /// @brief Upper bound on the up-front reservation for one chunk.
    static constexpr std::size_t MAX_RESERVE = 65536;

    static void check_batch_size(std::size_t batch_size);
    static ItemError make_item_error(std::size_t index, std::string value,
                                     const std::exception& e);
    static void log_progress(std::size_t chunks_done, std::size_t total_chunks,
                             std::size_t processed, std::size_t& next_decile);
    static void log_cancelled(std::size_t processed);
    static void log_abort(const ItemError& error);
};

} // namespace ulidkit::engine
