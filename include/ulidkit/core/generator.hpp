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
 * @file generator.hpp
 * @brief ULID generation: single, bulk and monotonic.
 *
 * @details
 * This header declares the `Generator`, which owns the monotonic-increment
 * algorithm, and the `SharedGenerator`, which wraps one long-lived
 * `GenerationContext` behind a mutex for callers that need ordering across calls.
 *
 * **Monotonic algorithm** (`Generator::next_monotonic`):
 * 1. First ID, or the clock moved forward: fresh randomness at the new timestamp.
 * 2. Same millisecond: the previous 80-bit randomness plus one, same timestamp.
 * 3. Randomness was all ones: advance the timestamp by one millisecond and draw
 *    fresh randomness.
 *
 * Monotonicity holds per context. A context is either local to one batch call or
 * explicitly shared through `SharedGenerator`; there is no process-wide state.
 */

#pragma once

#include "ulidkit/core/ulid.hpp"
#include "ulidkit/infra/clock.hpp"
#include "ulidkit/infra/entropy.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace ulidkit::core {

/**
 * @struct GenerationContext
 * @brief State carried between consecutive monotonic IDs.
 */
struct GenerationContext {
    /// @brief Timestamp of the last issued ID; may run ahead of the clock after
    /// a randomness overflow.
    std::uint64_t last_timestamp_ms = 0;
    Randomness last_randomness{};
    bool has_last = false;

    /// @brief Highest raw clock reading seen by a shared context. Rollback is
    /// judged against this, never against `last_timestamp_ms`.
    std::uint64_t last_observed_ms = 0;
};

/**
 * @enum RollbackPolicy
 * @brief What a shared context does when the clock is seen moving backwards.
 */
enum class RollbackPolicy {
    REPORT,    ///< Throw `ClockRollbackError` and leave the context untouched.
    USE_LATEST ///< Proceed at the last issued timestamp (the later of the two).
};

/**
 * @class Generator
 * @brief Produces ULIDs from an injected clock and entropy source.
 *
 * A `Generator` holds no mutable state of its own and is safe to share between
 * threads as long as the injected sources are.
 */
class Generator {
  public:
    /// @brief Uses the system clock and the OpenSSL CSPRNG.
    Generator();

    /**
     * @brief Uses caller-owned sources; both must outlive the generator.
     */
    Generator(const infra::Clock& clock, infra::EntropySource& entropy);

    /// @brief One ULID at the current time with fresh randomness.
    Ulid generate();

    /**
     * @brief One ULID at a caller-chosen time (migration, back-dating, tests).
     *
     * @throws TimestampOutOfRangeError if `timestamp_ms` exceeds 48 bits.
     */
    Ulid generate(std::uint64_t timestamp_ms);

    /**
     * @brief `count` independent ULIDs, each with fresh randomness.
     *
     * IDs sharing a millisecond are only probabilistically ordered; use
     * `generate_monotonic_batch` when order matters.
     */
    std::vector<Ulid> generate_bulk(std::size_t count);

    /// @brief As above, all at `timestamp_ms`.
    std::vector<Ulid> generate_bulk(std::size_t count, std::uint64_t timestamp_ms);

    /**
     * @brief `count` strictly increasing ULIDs, reading the clock for each ID.
     *
     * A clock that moves backwards inside the batch is clamped to the last issued
     * timestamp, so the batch never decreases.
     *
     * @throws GenerationError if the timestamp space is exhausted.
     */
    std::vector<Ulid> generate_monotonic_batch(std::size_t count);

    /**
     * @brief `count` strictly increasing ULIDs starting at `timestamp_ms`.
     *
     * Consecutive IDs share the timestamp and differ by randomness + 1, except
     * where the randomness overflows and the timestamp ticks forward.
     *
     * @code
     * auto ids = generator.generate_monotonic_batch(3, 1700000000000);
     * // ids[1].randomness() == ids[0].randomness() + 1
     * @endcode
     */
    std::vector<Ulid> generate_monotonic_batch(std::size_t count, std::uint64_t timestamp_ms);

    /**
     * @brief One step of the monotonic algorithm against `context`.
     *
     * @param context The context to continue; updated on success.
     * @param observed_ms The clock (or supplied) timestamp for this ID. Values
     * below the context's last timestamp are treated as equal to it.
     */
    Ulid next_monotonic(GenerationContext& context, std::uint64_t observed_ms);

    /**
     * @brief Adds one to an 80-bit big-endian integer.
     *
     * @return false if the value was all ones; it has then wrapped to zero.
     */
    static bool increment(Randomness& randomness);

    const infra::Clock& clock() const { return *clock_; }

  private:
    Randomness fresh_randomness();

    const infra::Clock* clock_;
    infra::EntropySource* entropy_;
};

/**
 * @class SharedGenerator
 * @brief One monotonic context shared by every caller, guarded by one mutex.
 *
 * Use this in long-lived services where IDs issued by different threads or
 * different requests must still be strictly increasing.
 */
class SharedGenerator {
  public:
    explicit SharedGenerator(Generator generator = Generator());

    /**
     * @brief Next ID at the current clock time.
     *
     * @throws ClockRollbackError when the clock reads earlier than the last issued
     * timestamp and `policy` is `REPORT`. The context is unchanged in that case.
     */
    Ulid next(RollbackPolicy policy = RollbackPolicy::REPORT);

    /// @brief Next ID at a supplied timestamp; rollback rules as in `next()`.
    Ulid next_at(std::uint64_t timestamp_ms, RollbackPolicy policy = RollbackPolicy::REPORT);

    /**
     * @brief `count` consecutive IDs issued under one lock acquisition.
     *
     * Either the whole batch is issued or, on a reported rollback, none of it.
     */
    std::vector<Ulid> next_batch(std::size_t count,
                                 RollbackPolicy policy = RollbackPolicy::REPORT);

    /// @brief Copy of the current context.
    GenerationContext snapshot() const;

  private:
    static std::uint64_t resolve_rollback(const GenerationContext& context,
                                          std::uint64_t observed_ms, RollbackPolicy policy);
    Ulid issue(GenerationContext& context, std::uint64_t observed_ms, RollbackPolicy policy);

    Generator generator_;
    mutable std::mutex mutex_;
    GenerationContext context_;
};

} // namespace ulidkit::core
