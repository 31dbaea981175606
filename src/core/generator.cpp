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
 * @file generator.cpp
 * @brief Implementation of single, bulk and monotonic ULID generation.
 */

#include "ulidkit/core/generator.hpp"

#include "ulidkit/core/errors.hpp"
#include "ulidkit/infra/logger.hpp"

#include <string>

namespace ulidkit::core {

Generator::Generator()
    : clock_(&infra::SystemClock::instance()), entropy_(&infra::SecureEntropy::instance())
{
}

Generator::Generator(const infra::Clock& clock, infra::EntropySource& entropy)
    : clock_(&clock), entropy_(&entropy)
{
}

Randomness Generator::fresh_randomness()
{
    Randomness r{};
    try {
        entropy_->fill(r.data(), r.size());
    } catch (const std::exception& e) {
        throw GenerationError(std::string("Randomness unavailable: ") + e.what());
    }
    return r;
}

Ulid Generator::generate()
{
    return generate(clock_->now_ms());
}

Ulid Generator::generate(std::uint64_t timestamp_ms)
{
    if (timestamp_ms > MAX_TIMESTAMP) {
        throw TimestampOutOfRangeError(timestamp_ms, MAX_TIMESTAMP);
    }
    return Ulid(timestamp_ms, fresh_randomness());
}

std::vector<Ulid> Generator::generate_bulk(std::size_t count)
{
    std::vector<Ulid> out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(generate());
    }
    return out;
}

std::vector<Ulid> Generator::generate_bulk(std::size_t count, std::uint64_t timestamp_ms)
{
    std::vector<Ulid> out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(generate(timestamp_ms));
    }
    return out;
}

std::vector<Ulid> Generator::generate_monotonic_batch(std::size_t count)
{
    GenerationContext context;
    std::vector<Ulid> out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(next_monotonic(context, clock_->now_ms()));
    }
    return out;
}

std::vector<Ulid> Generator::generate_monotonic_batch(std::size_t count,
                                                      std::uint64_t timestamp_ms)
{
    if (timestamp_ms > MAX_TIMESTAMP) {
        throw TimestampOutOfRangeError(timestamp_ms, MAX_TIMESTAMP);
    }
    GenerationContext context;
    std::vector<Ulid> out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(next_monotonic(context, timestamp_ms));
    }
    return out;
}

/**
 * @brief Issues the next ID of a monotonic sequence.
 *
 * Operational Logic:
 * 1. **New millisecond**: fresh randomness at `observed_ms`.
 * 2. **Same (or earlier) millisecond**: previous randomness + 1 at the last timestamp.
 * 3. **Randomness exhausted**: tick to `last + 1` with fresh randomness. This is
 *    not an error for the caller; only running out of 48-bit timestamps is.
 */
Ulid Generator::next_monotonic(GenerationContext& context, std::uint64_t observed_ms)
{
    std::uint64_t ts = 0;
    Randomness r{};

    if (!context.has_last || observed_ms > context.last_timestamp_ms) {
        if (observed_ms > MAX_TIMESTAMP) {
            throw TimestampOutOfRangeError(observed_ms, MAX_TIMESTAMP);
        }
        ts = observed_ms;
        r = fresh_randomness();
    } else {
        ts = context.last_timestamp_ms;
        r = context.last_randomness;
        if (!increment(r)) {
            if (ts == MAX_TIMESTAMP) {
                throw GenerationError("Timestamp space exhausted: randomness overflow at the "
                                      "maximum timestamp " +
                                      std::to_string(MAX_TIMESTAMP));
            }
            ++ts;
            r = fresh_randomness();
            infra::Logger::log(infra::LogLevel::DEBUG,
                               "Generator: Randomness exhausted, advancing to " +
                                   std::to_string(ts) + " ms.");
        }
    }

    context.last_timestamp_ms = ts;
    context.last_randomness = r;
    context.has_last = true;
    return Ulid(ts, r);
}

bool Generator::increment(Randomness& randomness)
{
    // Big-endian: carry from the last byte towards the first.
    for (auto it = randomness.rbegin(); it != randomness.rend(); ++it) {
        if (*it != 0xFF) {
            ++(*it);
            return true;
        }
        *it = 0;
    }
    return false;
}

// ============================================================================
// SharedGenerator
// ============================================================================

SharedGenerator::SharedGenerator(Generator generator) : generator_(generator) {}

/**
 * @brief Maps a raw clock reading to the timestamp the next ID is issued at.
 *
 * Operational Logic:
 * 1. **Forward**: at or past the last issued timestamp, the reading is used as is.
 * 2. **Behind a virtual tick**: a randomness overflow may have pushed the last
 *    issued timestamp past the clock. If the reading has not gone below the
 *    highest reading seen, the clock did not move backwards: continue at the
 *    last issued timestamp.
 * 3. **Rollback**: the reading is below the highest reading seen. `USE_LATEST`
 *    continues at the last issued timestamp; `REPORT` throws.
 */
std::uint64_t SharedGenerator::resolve_rollback(const GenerationContext& context,
                                                std::uint64_t observed_ms,
                                                RollbackPolicy policy)
{
    if (!context.has_last || observed_ms >= context.last_timestamp_ms) {
        return observed_ms;
    }
    if (observed_ms >= context.last_observed_ms) {
        return context.last_timestamp_ms;
    }
    if (policy == RollbackPolicy::USE_LATEST) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Generator: Clock rollback of " +
                               std::to_string(context.last_observed_ms - observed_ms) +
                               " ms absorbed at the last issued timestamp.");
        return context.last_timestamp_ms;
    }
    infra::Logger::log(infra::LogLevel::WARN,
                       "Generator: Clock rollback detected (observed " +
                           std::to_string(observed_ms) + " ms, last issued " +
                           std::to_string(context.last_timestamp_ms) + " ms).");
    throw ClockRollbackError(observed_ms, context.last_timestamp_ms);
}

Ulid SharedGenerator::issue(GenerationContext& context, std::uint64_t observed_ms,
                            RollbackPolicy policy)
{
    const std::uint64_t ts = resolve_rollback(context, observed_ms, policy);
    const Ulid id = generator_.next_monotonic(context, ts);
    if (observed_ms > context.last_observed_ms) {
        context.last_observed_ms = observed_ms;
    }
    return id;
}

Ulid SharedGenerator::next(RollbackPolicy policy)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return issue(context_, generator_.clock().now_ms(), policy);
}

Ulid SharedGenerator::next_at(std::uint64_t timestamp_ms, RollbackPolicy policy)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return issue(context_, timestamp_ms, policy);
}

std::vector<Ulid> SharedGenerator::next_batch(std::size_t count, RollbackPolicy policy)
{
    std::lock_guard<std::mutex> lock(mutex_);

    // Work on a copy so a rollback halfway through leaves the shared context intact.
    GenerationContext working = context_;
    std::vector<Ulid> out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(issue(working, generator_.clock().now_ms(), policy));
    }
    context_ = working;
    return out;
}

GenerationContext SharedGenerator::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return context_;
}

} // namespace ulidkit::core
