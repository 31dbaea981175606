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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * Static helpers used by the codec (case folding), the parser (hex and
 * ISO-8601 rendering) and the front end (input line sanitizing).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace ulidkit::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed copy; empty if `s` is entirely whitespace.
     *
     * @code
     * std::string clean = ulidkit::infra::String::trim("  01ARZ3NDEKTSV4RRFFQ69G5FAV\n");
     * @endcode
     */
    static std::string trim(const std::string& s);

    /// @brief ASCII upper-casing; bytes outside `a-z` are copied unchanged.
    static std::string to_upper(const std::string& s);

    /// @brief ASCII lower-casing; bytes outside `A-Z` are copied unchanged.
    static std::string to_lower(const std::string& s);

    /**
     * @brief Renders a byte buffer as lowercase hexadecimal, two digits per byte.
     */
    static std::string to_hex(const std::uint8_t* data, std::size_t len);

    /**
     * @brief Formats milliseconds since the Unix epoch as `YYYY-MM-DDTHH:MM:SS.mmmZ` (UTC).
     *
     * Uses the proleptic Gregorian calendar, so the whole 48-bit timestamp range
     * (up to year 10889) renders without relying on the platform's `time_t` width.
     */
    static std::string iso8601_utc(std::uint64_t ms);

    /**
     * @brief Quotes a value for inclusion in an error message.
     *
     * Non-printable bytes are rendered as `\xHH` and long values are cut with an
     * ellipsis so user input can never flood a diagnostic.
     */
    static std::string quote(const std::string& s, std::size_t max_len = 64);
};

} // namespace ulidkit::infra
