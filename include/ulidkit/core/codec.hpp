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
 * @file codec.hpp
 * @brief Crockford Base32 transcoding between the binary and text forms.
 *
 * @details
 * The 128-bit value is written as 26 five-bit groups, most significant first.
 * 26 * 5 = 130 bits, so the leading character only carries 3 bits of the value;
 * a leading character above '7' would need bits 128 and 129 and is therefore a
 * timestamp overflow, never a silent truncation.
 *
 * Decoding is case-insensitive. The ambiguous letters I, L, O and U are not part
 * of the alphabet and are rejected like any other foreign character.
 */

#pragma once

#include "ulidkit/core/errors.hpp"
#include "ulidkit/core/ulid.hpp"

#include <cstdint>
#include <string>

namespace ulidkit::core {

/**
 * @class Codec
 * @brief Stateless encoder/decoder for the 26-character ULID text form.
 */
class Codec {
  public:
    /**
     * @brief Encodes a timestamp and randomness payload.
     *
     * @param timestamp_ms Milliseconds since the Unix epoch, at most `MAX_TIMESTAMP`.
     * @param randomness The 10-byte (80-bit) payload, big-endian.
     * @return std::string Canonical uppercase 26-character text.
     *
     * @throws TimestampOutOfRangeError if `timestamp_ms` does not fit in 48 bits.
     *
     * @code
     * Randomness zero{};
     * Codec::encode(1469918176385, zero); // "01ARYZ6S410000000000000000"
     * @endcode
     */
    static std::string encode(std::uint64_t timestamp_ms, const Randomness& randomness);

    /// @brief Encodes a ULID value; never throws for a constructed `Ulid`.
    static std::string encode(const Ulid& ulid);

    /**
     * @brief Decodes text into its timestamp and randomness.
     *
     * Checks are applied in order: length, then every character (the first foreign
     * character wins), then the leading-character range.
     *
     * @param text Candidate ULID, any case.
     * @param timestamp_ms Receives the timestamp on success.
     * @param randomness Receives the payload on success.
     * @param error Receives the diagnostics on failure.
     * @return true on success; on failure the outputs other than `error` are untouched.
     */
    static bool decode(const std::string& text, std::uint64_t& timestamp_ms,
                       Randomness& randomness, DecodeError& error);

    /// @brief Same as above, producing a `Ulid`.
    static bool decode(const std::string& text, Ulid& out, DecodeError& error);

    /**
     * @brief Runs only the checks of `decode` and reports the first failure.
     *
     * @return A `DecodeError` whose kind is `NONE` when `text` would decode.
     */
    static DecodeError check(const std::string& text);

    /**
     * @brief Symbol value of a character, or -1 if it is outside the alphabet.
     *
     * Lowercase letters map to the value of their uppercase form.
     */
    static int symbol_value(char c);

    /// @brief True when every character of `text` is an uppercase alphabet symbol.
    static bool is_canonical(const std::string& text);
};

} // namespace ulidkit::core
