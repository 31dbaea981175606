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
 * @file parser.cpp
 * @brief Implementation of parse and inspect.
 */

#include "ulidkit/core/parser.hpp"

#include "ulidkit/core/codec.hpp"
#include "ulidkit/infra/string.hpp"

#include <cmath>
#include <map>
#include <utility>

namespace ulidkit::core {

namespace {

constexpr std::int64_t SECONDS_PER_MINUTE = 60;
constexpr std::int64_t SECONDS_PER_HOUR = 3600;
constexpr std::int64_t SECONDS_PER_DAY = 86400;

} // namespace

/**
 * @brief Decomposes `text` into every derived representation.
 *
 * The source string is kept as given; `canonical` is the uppercase
 * re-encoding. `out` is only assigned on success.
 */
bool Parser::parse(const std::string& text, ParsedUlid& out, DecodeError& error)
{
    std::uint64_t ts = 0;
    Randomness r{};
    if (!Codec::decode(text, ts, r, error)) {
        return false;
    }

    ParsedUlid parsed;
    parsed.source_string = text;
    parsed.canonical = Codec::encode(ts, r);
    parsed.timestamp_ms = ts;
    parsed.timestamp_iso8601 = infra::String::iso8601_utc(ts);
    parsed.timestamp_unix_seconds = ts / 1000;
    parsed.randomness_bytes = r;
    parsed.randomness_hex = infra::String::to_hex(r.data(), r.size());
    parsed.is_valid = true;

    out = std::move(parsed);
    return true;
}

ParsedUlid Parser::parse(const std::string& text)
{
    ParsedUlid out;
    DecodeError error;
    if (!parse(text, out, error)) {
        throw DecodeException(error);
    }
    return out;
}

/**
 * @brief `parse` plus age and entropy statistics relative to `now_ms`.
 *
 * Age truncates towards zero; an ID from the future has a negative age.
 */
bool Parser::inspect(const std::string& text, std::uint64_t now_ms, InspectedUlid& out,
                     DecodeError& error)
{
    InspectedUlid inspected;
    if (!parse(text, inspected.parsed, error)) {
        return false;
    }

    // Both operands are below 2^48, so the signed difference cannot overflow.
    const std::int64_t delta_ms = static_cast<std::int64_t>(now_ms) -
                                  static_cast<std::int64_t>(inspected.parsed.timestamp_ms);
    inspected.age_seconds = delta_ms / 1000;
    inspected.age_human = describe_age(inspected.age_seconds);
    inspected.randomness_char_entropy = char_entropy(inspected.parsed.randomness_hex);

    out = std::move(inspected);
    return true;
}

InspectedUlid Parser::inspect(const std::string& text, const infra::Clock& clock)
{
    InspectedUlid out;
    DecodeError error;
    if (!inspect(text, clock.now_ms(), out, error)) {
        throw DecodeException(error);
    }
    return out;
}

std::uint64_t Parser::extract_timestamp(const std::string& text)
{
    std::uint64_t ts = 0;
    Randomness r{};
    DecodeError error;
    if (!Codec::decode(text, ts, r, error)) {
        throw DecodeException(error);
    }
    return ts;
}

std::string Parser::describe_age(std::int64_t age_seconds)
{
    if (age_seconds <= 0) {
        return "in the future";
    }
    if (age_seconds < SECONDS_PER_MINUTE) {
        return std::to_string(age_seconds) + " seconds ago";
    }
    if (age_seconds < SECONDS_PER_HOUR) {
        return std::to_string(age_seconds / SECONDS_PER_MINUTE) + " minutes ago";
    }
    if (age_seconds < SECONDS_PER_DAY) {
        return std::to_string(age_seconds / SECONDS_PER_HOUR) + " hours ago";
    }
    return std::to_string(age_seconds / SECONDS_PER_DAY) + " days ago";
}

double Parser::char_entropy(const std::string& text)
{
    if (text.empty()) {
        return 0.0;
    }
    std::map<char, std::size_t> counts;
    for (char c : text) {
        counts[c]++;
    }
    const double total = static_cast<double>(text.size());
    double entropy = 0.0;
    for (const auto& [symbol, count] : counts) {
        const double p = static_cast<double>(count) / total;
        entropy -= p * std::log2(p);
    }
    return entropy;
}

} // namespace ulidkit::core
