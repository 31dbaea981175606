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
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 */

#include "ulidkit/infra/string.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace ulidkit::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note The use of `static_cast<unsigned char>` prevents undefined behavior with
 * `std::isspace` on negative `char` values.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::string String::to_upper(const std::string& s)
{
    std::string out = s;
    for (char& c : out) {
        if (c >= 'a' && c <= 'z') {
            c = static_cast<char>(c - 'a' + 'A');
        }
    }
    return out;
}

std::string String::to_lower(const std::string& s)
{
    std::string out = s;
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

std::string String::to_hex(const std::uint8_t* data, std::size_t len)
{
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

/**
 * @brief Formats an epoch-millisecond value as an ISO-8601 UTC timestamp.
 *
 * Implementation Strategy:
 * Splits the value into whole days and the millisecond-of-day, then converts the
 * day count to a civil date with Howard Hinnant's `civil_from_days` algorithm.
 */
std::string String::iso8601_utc(std::uint64_t ms)
{
    const std::uint64_t ms_per_day = 86400000ULL;
    const std::int64_t days = static_cast<std::int64_t>(ms / ms_per_day);
    std::uint64_t rem = ms % ms_per_day;

    const unsigned millis = static_cast<unsigned>(rem % 1000);
    rem /= 1000;
    const unsigned sec = static_cast<unsigned>(rem % 60);
    rem /= 60;
    const unsigned min = static_cast<unsigned>(rem % 60);
    const unsigned hour = static_cast<unsigned>(rem / 60);

    // civil_from_days: shift the epoch to 0000-03-01 so leap days fall at year end.
    const std::int64_t z = days + 719468;
    const std::int64_t era = z / 146097;
    const std::int64_t doe = z - era * 146097;
    const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const std::int64_t mp = (5 * doy + 2) / 153;
    const std::int64_t day = doy - (153 * mp + 2) / 5 + 1;
    const std::int64_t month = mp < 10 ? mp + 3 : mp - 9;
    const std::int64_t year = yoe + era * 400 + (month <= 2 ? 1 : 0);

    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << year << "-" << std::setw(2) << month << "-"
       << std::setw(2) << day << "T" << std::setw(2) << hour << ":" << std::setw(2) << min << ":"
       << std::setw(2) << sec << "." << std::setw(3) << millis << "Z";
    return ss.str();
}

std::string String::quote(const std::string& s, std::size_t max_len)
{
    static const char digits[] = "0123456789ABCDEF";
    std::string out = "'";
    const std::size_t n = std::min(s.size(), max_len);
    for (std::size_t i = 0; i < n; ++i) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (std::isprint(c)) {
            out.push_back(static_cast<char>(c));
        } else {
            out += "\\x";
            out.push_back(digits[c >> 4]);
            out.push_back(digits[c & 0x0F]);
        }
    }
    if (s.size() > max_len) {
        out += "...";
    }
    out += "'";
    return out;
}

} // namespace ulidkit::infra
