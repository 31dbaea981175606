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
 * @file codec.cpp
 * @brief Implementation of the Crockford Base32 codec.
 *
 * @details
 * The 128-bit value is handled as a pair of 64-bit words `(hi, lo)`. Encoding
 * extracts 5-bit digits at bit offsets 125, 120, ..., 0; decoding shifts each
 * digit into the pair from the right.
 */

#include "ulidkit/core/codec.hpp"

#include <array>

namespace ulidkit::core {

namespace {

/// @brief Reverse lookup table over all 256 byte values; -1 marks foreign bytes.
std::array<signed char, 256> build_decode_table()
{
    std::array<signed char, 256> table{};
    table.fill(-1);
    for (int v = 0; v < 32; ++v) {
        const char upper = CROCKFORD_ALPHABET[v];
        table[static_cast<unsigned char>(upper)] = static_cast<signed char>(v);
        if (upper >= 'A' && upper <= 'Z') {
            table[static_cast<unsigned char>(upper - 'A' + 'a')] = static_cast<signed char>(v);
        }
    }
    return table;
}

const std::array<signed char, 256>& decode_table()
{
    static const std::array<signed char, 256> table = build_decode_table();
    return table;
}

/// @brief Extracts the 5-bit digit whose most significant bit sits at `125 - 5 * index`.
unsigned extract_digit(std::uint64_t hi, std::uint64_t lo, int index)
{
    const int shift = 125 - 5 * index;
    if (shift == 0) {
        return static_cast<unsigned>(lo & 0x1F);
    }
    if (shift < 64) {
        // The digit may straddle the word boundary.
        const std::uint64_t part = (hi << (64 - shift)) | (lo >> shift);
        return static_cast<unsigned>(part & 0x1F);
    }
    return static_cast<unsigned>((hi >> (shift - 64)) & 0x1F);
}

} // namespace

int Codec::symbol_value(char c)
{
    return decode_table()[static_cast<unsigned char>(c)];
}

bool Codec::is_canonical(const std::string& text)
{
    for (char c : text) {
        if (symbol_value(c) < 0 || (c >= 'a' && c <= 'z')) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Renders a timestamp and randomness pair as 26 Crockford characters.
 *
 * @details
 * The 128-bit value is packed into two words: `hi` carries the 48-bit timestamp
 * and the first two randomness bytes, `lo` the remaining eight.
 *
 * Operational Logic:
 * 1. **Range Check**: Timestamps above 48 bits are rejected before any packing.
 * 2. **Packing**: Big-endian, so the timestamp occupies the most significant bits.
 * 3. **Emission**: 26 groups of 5 bits, most significant first. The leading group
 *    has only 3 significant bits, which is why it never exceeds `7`.
 *
 * @throws TimestampOutOfRangeError if `timestamp_ms` exceeds `MAX_TIMESTAMP`.
 */
std::string Codec::encode(std::uint64_t timestamp_ms, const Randomness& randomness)
{
    if (timestamp_ms > MAX_TIMESTAMP) {
        throw TimestampOutOfRangeError(timestamp_ms, MAX_TIMESTAMP);
    }

    // hi = 48-bit timestamp followed by the first 2 randomness bytes.
    std::uint64_t hi = timestamp_ms << 16;
    hi |= static_cast<std::uint64_t>(randomness[0]) << 8;
    hi |= static_cast<std::uint64_t>(randomness[1]);

    std::uint64_t lo = 0;
    for (std::size_t i = 2; i < RANDOMNESS_BYTES; ++i) {
        lo = (lo << 8) | randomness[i];
    }

    std::string out(ULID_STRING_LENGTH, '0');
    for (int i = 0; i < static_cast<int>(ULID_STRING_LENGTH); ++i) {
        out[static_cast<std::size_t>(i)] = CROCKFORD_ALPHABET[extract_digit(hi, lo, i)];
    }
    return out;
}

std::string Codec::encode(const Ulid& ulid)
{
    return encode(ulid.timestamp_ms(), ulid.randomness());
}

/**
 * @brief Finds the first structural fault of `text`, without decoding it.
 *
 * Rules are applied in a fixed order, and only the first failing one is
 * reported: length, then alphabet (first offending position), then the
 * leading-character range.
 */
DecodeError Codec::check(const std::string& text)
{
    DecodeError error;
    error.actual_length = text.size();

    if (text.size() != ULID_STRING_LENGTH) {
        error.kind = DecodeErrorKind::INVALID_LENGTH;
        return error;
    }

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (symbol_value(text[i]) < 0) {
            error.kind = DecodeErrorKind::INVALID_CHARACTER;
            error.position = i;
            error.character = text[i];
            return error;
        }
    }

    // The leading digit holds bits 125..127 plus two bits beyond the 128-bit value.
    if (symbol_value(text[0]) > 7) {
        error.kind = DecodeErrorKind::TIMESTAMP_OVERFLOW;
        error.position = 0;
        error.character = text[0];
    }
    return error;
}

/**
 * @brief Decodes `text` into its timestamp and randomness.
 *
 * Every character is shifted into a 128-bit accumulator held as two words;
 * `check` has already guaranteed that the top two bits shifted out are zero.
 *
 * @return false with `error` set if `text` is malformed; outputs are untouched.
 */
bool Codec::decode(const std::string& text, std::uint64_t& timestamp_ms, Randomness& randomness,
                   DecodeError& error)
{
    error = check(text);
    if (error.kind != DecodeErrorKind::NONE) {
        return false;
    }

    std::uint64_t hi = 0;
    std::uint64_t lo = 0;
    for (char c : text) {
        const auto v = static_cast<std::uint64_t>(symbol_value(c));
        hi = (hi << 5) | (lo >> 59);
        lo = (lo << 5) | v;
    }

    timestamp_ms = hi >> 16;
    randomness[0] = static_cast<std::uint8_t>((hi >> 8) & 0xFF);
    randomness[1] = static_cast<std::uint8_t>(hi & 0xFF);
    for (std::size_t i = 0; i < 8; ++i) {
        randomness[2 + i] = static_cast<std::uint8_t>((lo >> ((7 - i) * 8)) & 0xFF);
    }
    return true;
}

bool Codec::decode(const std::string& text, Ulid& out, DecodeError& error)
{
    std::uint64_t ts = 0;
    Randomness r{};
    if (!decode(text, ts, r, error)) {
        return false;
    }
    out = Ulid(ts, r);
    return true;
}

} // namespace ulidkit::core
