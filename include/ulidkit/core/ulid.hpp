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
 * @file ulid.hpp
 * @brief The ULID value type.
 *
 * @details
 * A ULID is a 128-bit unsigned integer stored as 16 big-endian bytes:
 *
 * - bytes `[0, 6)`: 48-bit millisecond timestamp since the Unix epoch
 * - bytes `[6, 16)`: 80 bits of randomness
 *
 * Because the bytes are big-endian, comparing them lexicographically is the same
 * as comparing the 128-bit values, which is in turn the same as comparing the
 * canonical 26-character strings ordinally. Every relational operator below is a
 * byte comparison.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace ulidkit::core {

/// @brief Length of the canonical text encoding.
constexpr std::size_t ULID_STRING_LENGTH = 26;

/// @brief Number of leading characters carrying the timestamp.
constexpr std::size_t TIMESTAMP_CHARS = 10;

/// @brief Number of trailing characters carrying the randomness.
constexpr std::size_t RANDOMNESS_CHARS = 16;

/// @brief Size of the binary form.
constexpr std::size_t ULID_BYTES = 16;

/// @brief Size of the randomness payload.
constexpr std::size_t RANDOMNESS_BYTES = 10;

/// @brief Largest encodable timestamp: 2^48 - 1 (year 10889).
constexpr std::uint64_t MAX_TIMESTAMP = (1ULL << 48) - 1;

constexpr unsigned TIMESTAMP_BITS = 48;
constexpr unsigned RANDOMNESS_BITS = 80;
constexpr unsigned TOTAL_BITS = 128;

/// @brief Crockford Base32 alphabet (no I, L, O, U), in symbol-value order.
constexpr char CROCKFORD_ALPHABET[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

using Randomness = std::array<std::uint8_t, RANDOMNESS_BYTES>;
using UlidBytes = std::array<std::uint8_t, ULID_BYTES>;

/**
 * @class Ulid
 * @brief Immutable 128-bit identifier.
 *
 * Default construction yields the all-zero ULID (`00000000000000000000000000`).
 */
class Ulid {
  public:
    Ulid();

    /**
     * @brief Assembles a ULID from its parts.
     *
     * @throws TimestampOutOfRangeError if `timestamp_ms` exceeds `MAX_TIMESTAMP`.
     */
    Ulid(std::uint64_t timestamp_ms, const Randomness& randomness);

    /// @brief Wraps a 16-byte big-endian buffer. Every bit pattern is a valid ULID.
    static Ulid from_bytes(const UlidBytes& bytes);

    /**
     * @brief Decodes a 26-character string (case-insensitive).
     *
     * @throws DecodeException carrying the structured `DecodeError`.
     */
    static Ulid from_string(const std::string& text);

    std::uint64_t timestamp_ms() const;
    Randomness randomness() const;
    const UlidBytes& bytes() const { return bytes_; }

    /// @brief Canonical uppercase 26-character encoding.
    std::string to_string() const;

    /// @brief Lowercase hex of the 16 bytes (32 characters).
    std::string to_hex() const;

    bool operator==(const Ulid& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Ulid& other) const { return bytes_ != other.bytes_; }
    bool operator<(const Ulid& other) const { return bytes_ < other.bytes_; }
    bool operator<=(const Ulid& other) const { return bytes_ <= other.bytes_; }
    bool operator>(const Ulid& other) const { return bytes_ > other.bytes_; }
    bool operator>=(const Ulid& other) const { return bytes_ >= other.bytes_; }

  private:
    UlidBytes bytes_;
};

std::ostream& operator<<(std::ostream& os, const Ulid& id);

} // namespace ulidkit::core
