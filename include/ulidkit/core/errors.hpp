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
 * @file errors.hpp
 * @brief Error taxonomy of the codec and the generator.
 *
 * @details
 * Decoding failures are plain values (`DecodeError`) because validation is a
 * hot, expected-to-fail path; the non-throwing codec entry points hand them back
 * through an out-parameter. Everything else in the core is reported with
 * exceptions derived from `UlidError`, itself a `std::runtime_error`, so the
 * front end can catch the whole family at one boundary.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace ulidkit::core {

/**
 * @enum DecodeErrorKind
 * @brief The rule a candidate ULID string violated.
 */
enum class DecodeErrorKind {
    NONE,              ///< No failure recorded.
    INVALID_LENGTH,    ///< Length differs from 26.
    INVALID_CHARACTER, ///< A character outside the Crockford alphabet.
    TIMESTAMP_OVERFLOW ///< Leading character above '7'; the timestamp exceeds 48 bits.
};

/// @brief Stable identifier for a kind (`invalid_length`, ...), used in JSON errors.
const char* to_string(DecodeErrorKind kind);

/**
 * @struct DecodeError
 * @brief Structured diagnostics for a rejected ULID string.
 */
struct DecodeError {
    DecodeErrorKind kind = DecodeErrorKind::NONE;
    std::size_t actual_length = 0; ///< Input length (always filled).
    std::size_t position = 0;      ///< Offending index for INVALID_CHARACTER, 0 otherwise.
    char character = '\0';         ///< Offending byte for INVALID_CHARACTER / TIMESTAMP_OVERFLOW.

    /// @brief Human-readable description naming the offending position and character.
    std::string message() const;
};

/**
 * @class UlidError
 * @brief Root of every exception thrown by the UlidKit core.
 */
class UlidError : public std::runtime_error {
  public:
    explicit UlidError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class DecodeException
 * @brief Throwing wrapper around a `DecodeError` (e.g. `Ulid::from_string`).
 */
class DecodeException : public UlidError {
  public:
    explicit DecodeException(DecodeError error);

    const DecodeError& error() const { return error_; }

  private:
    DecodeError error_;
};

/**
 * @class TimestampOutOfRangeError
 * @brief A timestamp above 2^48-1 was handed to the encoder or the generator.
 */
class TimestampOutOfRangeError : public UlidError {
  public:
    TimestampOutOfRangeError(std::uint64_t timestamp, std::uint64_t max_timestamp);

    std::uint64_t timestamp() const { return timestamp_; }
    std::uint64_t max_timestamp() const { return max_timestamp_; }

  private:
    std::uint64_t timestamp_;
    std::uint64_t max_timestamp_;
};

/**
 * @class ClockRollbackError
 * @brief A shared generation context observed the clock moving backwards.
 *
 * Recoverable: no state was changed. The caller may retry with the later of the
 * two timestamps (see `RollbackPolicy::USE_LATEST`).
 */
class ClockRollbackError : public UlidError {
  public:
    ClockRollbackError(std::uint64_t observed_ms, std::uint64_t last_ms);

    std::uint64_t observed_ms() const { return observed_ms_; }
    std::uint64_t last_ms() const { return last_ms_; }

  private:
    std::uint64_t observed_ms_;
    std::uint64_t last_ms_;
};

/**
 * @class GenerationError
 * @brief Generation cannot continue (timestamp space exhausted, entropy failure).
 */
class GenerationError : public UlidError {
  public:
    explicit GenerationError(const std::string& reason) : UlidError(reason) {}
};

} // namespace ulidkit::core
