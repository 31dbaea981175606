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
 * @file parser.hpp
 * @brief Decomposition of ULID strings into human-facing views.
 *
 * @details
 * `parse` decodes and derives the timestamp representations; `inspect` adds
 * point-in-time metadata (age relative to a clock, entropy figures). Nothing is
 * cached: every call recomputes from the source string.
 *
 * `inspect` surfaces the embedded creation time on purpose. Anything that hands
 * a ULID to an untrusted party also hands over that timestamp.
 */

#pragma once

#include "ulidkit/core/errors.hpp"
#include "ulidkit/core/ulid.hpp"
#include "ulidkit/infra/clock.hpp"

#include <cstdint>
#include <string>

namespace ulidkit::core {

/**
 * @struct ParsedUlid
 * @brief Read-only decomposition of one ULID string.
 */
struct ParsedUlid {
    std::string source_string;           ///< Input exactly as given.
    std::string canonical;               ///< Uppercase re-encoding.
    std::uint64_t timestamp_ms = 0;
    std::string timestamp_iso8601;       ///< `YYYY-MM-DDTHH:MM:SS.mmmZ`
    std::uint64_t timestamp_unix_seconds = 0;
    Randomness randomness_bytes{};
    std::string randomness_hex;          ///< 20 lowercase hex digits.
    bool is_valid = false;
};

/**
 * @struct InspectedUlid
 * @brief `ParsedUlid` plus derived metadata, valid at the moment of the call.
 */
struct InspectedUlid {
    ParsedUlid parsed;

    /// @brief Seconds between the embedded timestamp and the clock; negative if in the future.
    std::int64_t age_seconds = 0;
    std::string age_human;

    unsigned entropy_bits = RANDOMNESS_BITS;
    unsigned timestamp_bits = TIMESTAMP_BITS;
    unsigned randomness_bits = RANDOMNESS_BITS;
    unsigned total_bits = TOTAL_BITS;

    /// @brief Shannon entropy (bits per symbol) of the randomness hex digits.
    double randomness_char_entropy = 0.0;
};

/**
 * @class Parser
 * @brief Stateless parse and inspect entry points.
 */
class Parser {
  public:
    /**
     * @brief Parses `text` without throwing.
     *
     * @return false with `error` filled when `text` is not a valid ULID.
     */
    static bool parse(const std::string& text, ParsedUlid& out, DecodeError& error);

    /**
     * @brief Parses `text`.
     *
     * @throws DecodeException on malformed input.
     *
     * @code
     * auto p = Parser::parse("01AN4Z07BY79KA1307SR9X4MV3");
     * // p.timestamp_ms == 1465824320894
     * @endcode
     */
    static ParsedUlid parse(const std::string& text);

    /**
     * @brief Inspects `text` against a supplied wall-clock reading without throwing.
     */
    static bool inspect(const std::string& text, std::uint64_t now_ms, InspectedUlid& out,
                        DecodeError& error);

    /**
     * @brief Inspects `text` against `clock`.
     *
     * @throws DecodeException on malformed input.
     */
    static InspectedUlid inspect(const std::string& text,
                                 const infra::Clock& clock = infra::SystemClock::instance());

    /// @brief Extracts only the timestamp. @throws DecodeException on malformed input.
    static std::uint64_t extract_timestamp(const std::string& text);

    /// @brief "N seconds ago", "N minutes ago", ... or "in the future" for non-positive ages.
    static std::string describe_age(std::int64_t age_seconds);

    /// @brief Shannon entropy in bits per character of `text`; 0 for an empty string.
    static double char_entropy(const std::string& text);
};

} // namespace ulidkit::core
