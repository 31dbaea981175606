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
 * @file clock.hpp
 * @brief Millisecond time sources for the generator and the parser.
 *
 * @details
 * The generator never reads the system clock directly. It is handed a `Clock`,
 * which lets tests pin, freeze and rewind time to exercise the same-millisecond
 * and clock-rollback paths deterministically.
 */

#pragma once

#include <atomic>
#include <cstdint>

namespace ulidkit::infra {

/**
 * @class Clock
 * @brief Abstract source of Unix-epoch milliseconds.
 */
class Clock {
  public:
    virtual ~Clock() = default;

    /// @brief Current time in milliseconds since 1970-01-01T00:00:00Z.
    virtual std::uint64_t now_ms() const = 0;
};

/**
 * @class SystemClock
 * @brief Reads `std::chrono::system_clock` at millisecond resolution.
 */
class SystemClock : public Clock {
  public:
    std::uint64_t now_ms() const override;

    /// @brief Process-wide instance used when no clock is injected.
    static const SystemClock& instance();
};

/**
 * @class ManualClock
 * @brief A clock whose value only changes when told to.
 *
 * Thread-safe: the value is an atomic so pool workers may read it while a
 * test thread advances it.
 */
class ManualClock : public Clock {
  public:
    explicit ManualClock(std::uint64_t start_ms = 0);

    std::uint64_t now_ms() const override;

    /// @brief Jumps to an absolute time; moving backwards is allowed.
    void set(std::uint64_t ms);

    /// @brief Moves forward by `delta_ms`.
    void advance(std::uint64_t delta_ms);

  private:
    std::atomic<std::uint64_t> now_;
};

} // namespace ulidkit::infra
