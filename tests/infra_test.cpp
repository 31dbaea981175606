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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure (String, Logger, Scheduler, Clock, Entropy).
 */

#include "framework.hpp"
#include "ulidkit/infra/clock.hpp"
#include "ulidkit/infra/entropy.hpp"
#include "ulidkit/infra/logger.hpp"
#include "ulidkit/infra/scheduler.hpp"
#include "ulidkit/infra/string.hpp"

#include <atomic>
#include <cstdint>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

using ulidkit::infra::String;

/**
 * @brief Tests the `String::trim` algorithm with nominal input.
 *
 * Padding is removed; internal whitespace survives.
 */
void test_string_trim()
{
    std::string dirty = "   hello ulidkit   ";
    ASSERT_EQ(String::trim(dirty), std::string("hello ulidkit"));
}

/**
 * @brief Whitespace-only input collapses to the empty string.
 */
void test_string_trim_empty()
{
    std::string result = String::trim("  \t\n  \r ");
    ASSERT_EQ(result, std::string(""));
    ASSERT_EQ(result.length(), static_cast<size_t>(0));
}

/**
 * @brief Case folding only touches ASCII letters.
 */
void test_string_case_folding()
{
    ASSERT_EQ(String::to_upper("01arz3_x"), std::string("01ARZ3_X"));
    ASSERT_EQ(String::to_lower("WARN"), std::string("warn"));
}

/**
 * @brief Hex rendering is lowercase and two digits per byte.
 */
void test_string_to_hex()
{
    const std::uint8_t bytes[] = {0x00, 0x0f, 0xa0, 0xff};
    ASSERT_EQ(String::to_hex(bytes, 4), std::string("000fa0ff"));
    ASSERT_EQ(String::to_hex(bytes, 0), std::string(""));
}

/**
 * @brief ISO-8601 formatting at the epoch, a known instant and a leap day.
 */
void test_string_iso8601()
{
    ASSERT_EQ(String::iso8601_utc(0), std::string("1970-01-01T00:00:00.000Z"));
    ASSERT_EQ(String::iso8601_utc(1469922850259ULL), std::string("2016-07-30T23:54:10.259Z"));
    // 2024-02-29T12:00:00.001Z
    ASSERT_EQ(String::iso8601_utc(1709208000001ULL), std::string("2024-02-29T12:00:00.001Z"));
}

/**
 * @brief Quoting escapes control bytes and truncates long values.
 */
void test_string_quote()
{
    ASSERT_EQ(String::quote("abc"), std::string("'abc'"));
    ASSERT_EQ(String::quote(std::string("a\nb")), std::string("'a\\x0Ab'"));
    ASSERT_EQ(String::quote("abcdef", 3), std::string("'abc...'"));
}

/**
 * @brief Level names parse case-insensitively; unknown names leave the output alone.
 */
void test_logger_parse_level()
{
    using ulidkit::infra::Logger;
    using ulidkit::infra::LogLevel;

    LogLevel level = LogLevel::FATAL;
    ASSERT_TRUE(Logger::parse_level("debug", level));
    ASSERT_TRUE(level == LogLevel::DEBUG);
    ASSERT_TRUE(Logger::parse_level(" Trace ", level));
    ASSERT_TRUE(level == LogLevel::TRACE);
    ASSERT_FALSE(Logger::parse_level("verbose", level));
    ASSERT_TRUE(level == LogLevel::TRACE);
}

/**
 * @brief The minimum level gates `enabled`.
 */
void test_logger_threshold()
{
    using ulidkit::infra::Logger;
    using ulidkit::infra::LogLevel;

    const LogLevel saved = Logger::level();
    Logger::set_level(LogLevel::WARN);
    ASSERT_FALSE(Logger::enabled(LogLevel::DEBUG));
    ASSERT_TRUE(Logger::enabled(LogLevel::WARN));
    ASSERT_TRUE(Logger::enabled(LogLevel::FATAL));
    Logger::set_level(saved);
}

/**
 * @brief `submit` returns results, and task exceptions surface through the future.
 */
void test_scheduler_submit()
{
    ulidkit::infra::Scheduler pool(3);
    ASSERT_EQ(pool.size(), static_cast<size_t>(3));

    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(pool.submit([i] { return i * i; }));
    }
    int sum = 0;
    for (auto& f : results) {
        sum += f.get();
    }
    ASSERT_EQ(sum, 2470);

    auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    ASSERT_THROWS(failing.get(), std::runtime_error);
}

/**
 * @brief The destructor drains queued work before joining.
 */
void test_scheduler_drains_on_shutdown()
{
    std::atomic<int> done{0};
    {
        ulidkit::infra::Scheduler pool(2);
        for (int i = 0; i < 100; ++i) {
            pool.enqueue([&done] { done++; });
        }
    }
    ASSERT_EQ(done.load(), 100);
}

/**
 * @brief A manual clock only moves when told to, including backwards.
 */
void test_manual_clock()
{
    ulidkit::infra::ManualClock clock(1000);
    ASSERT_EQ(clock.now_ms(), static_cast<std::uint64_t>(1000));
    clock.advance(5);
    ASSERT_EQ(clock.now_ms(), static_cast<std::uint64_t>(1005));
    clock.set(10);
    ASSERT_EQ(clock.now_ms(), static_cast<std::uint64_t>(10));
}

/**
 * @brief The system clock reads a plausible, post-2020 time.
 */
void test_system_clock()
{
    const std::uint64_t now = ulidkit::infra::SystemClock::instance().now_ms();
    ASSERT_TRUE(now > 1577836800000ULL);
}

/**
 * @brief The fixed source cycles its pattern and counts consumption.
 */
void test_fixed_entropy()
{
    ulidkit::infra::FixedEntropy source({1, 2, 3});
    std::uint8_t buf[5] = {};
    source.fill(buf, 5);
    ASSERT_EQ(static_cast<int>(buf[0]), 1);
    ASSERT_EQ(static_cast<int>(buf[3]), 1);
    ASSERT_EQ(static_cast<int>(buf[4]), 2);
    ASSERT_EQ(source.consumed(), static_cast<size_t>(5));

    ASSERT_THROWS(ulidkit::infra::FixedEntropy(std::vector<std::uint8_t>{}),
                  std::invalid_argument);
}

/**
 * @brief Two CSPRNG draws of 16 bytes differ.
 */
void test_secure_entropy()
{
    std::uint8_t a[16] = {};
    std::uint8_t b[16] = {};
    ulidkit::infra::SecureEntropy::instance().fill(a, sizeof(a));
    ulidkit::infra::SecureEntropy::instance().fill(b, sizeof(b));
    ASSERT_NE(String::to_hex(a, 16), String::to_hex(b, 16));
}
