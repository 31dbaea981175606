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
 * @file clock.cpp
 * @brief Implementation of the millisecond time sources.
 */

#include "ulidkit/infra/clock.hpp"

#include <chrono>

namespace ulidkit::infra {

std::uint64_t SystemClock::now_ms() const
{
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

const SystemClock& SystemClock::instance()
{
    static const SystemClock clock;
    return clock;
}

ManualClock::ManualClock(std::uint64_t start_ms) : now_(start_ms) {}

std::uint64_t ManualClock::now_ms() const
{
    return now_.load();
}

void ManualClock::set(std::uint64_t ms)
{
    now_.store(ms);
}

void ManualClock::advance(std::uint64_t delta_ms)
{
    now_.fetch_add(delta_ms);
}

} // namespace ulidkit::infra
