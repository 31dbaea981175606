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
 * @file validator_test.cpp
 * @brief Unit tests for validation, parsing and inspection.
 */

#include "framework.hpp"
#include "ulidkit/core/errors.hpp"
#include "ulidkit/core/parser.hpp"
#include "ulidkit/core/validator.hpp"
#include "ulidkit/infra/clock.hpp"

#include <cmath>
#include <cstdint>
#include <string>

using ulidkit::core::DecodeError;
using ulidkit::core::DecodeErrorKind;
using ulidkit::core::InspectedUlid;
using ulidkit::core::ParsedUlid;
using ulidkit::core::Parser;
using ulidkit::core::ValidationReport;
using ulidkit::core::Validator;

/**
 * @brief Boolean validation over the documented malformed scenarios.
 */
void test_validate_scenarios()
{
    ASSERT_TRUE(Validator::validate("01ARZ3NDEKTSV4RRFFQ69G5FAV"));
    ASSERT_TRUE(Validator::validate("01arz3ndektsv4rrffq69g5fav"));
    ASSERT_TRUE(Validator::validate("7ZZZZZZZZZZZZZZZZZZZZZZZZZ"));

    ASSERT_FALSE(Validator::validate("INVALID_ULID_1"));
    ASSERT_FALSE(Validator::validate(""));
    ASSERT_FALSE(Validator::validate("01ARZ3NDEKTSV4RRFFQ69G5FA"));
    ASSERT_FALSE(Validator::validate("8ZZZZZZZZZZZZZZZZZZZZZZZZZ"));
    ASSERT_FALSE(Validator::validate("01ARZ3NDEKTSV4RRFFQ69G5FAL"));
}

/**
 * @brief Detailed validation names the failed rule and locates it.
 */
void test_validate_detailed()
{
    ValidationReport ok = Validator::validate_detailed("01ARZ3NDEKTSV4RRFFQ69G5FAV");
    ASSERT_TRUE(ok.is_valid);
    ASSERT_TRUE(ok.is_canonical);
    ASSERT_TRUE(ok.message.empty());
    ASSERT_FALSE(ok.failure_position.has_value());

    ValidationReport lower = Validator::validate_detailed("01arz3ndektsv4rrffq69g5fav");
    ASSERT_TRUE(lower.is_valid);
    ASSERT_FALSE(lower.is_canonical);

    ValidationReport short_input = Validator::validate_detailed("01ARZ3NDEKTSV4RRFFQ69G5FA");
    ASSERT_FALSE(short_input.is_valid);
    ASSERT_TRUE(short_input.failure_kind == DecodeErrorKind::INVALID_LENGTH);
    ASSERT_EQ(short_input.length, static_cast<size_t>(25));
    ASSERT_FALSE(short_input.failure_position.has_value());

    ValidationReport bad_char = Validator::validate_detailed("01ARZ3NDEKTSV4RRFFQ69G5FAU");
    ASSERT_TRUE(bad_char.failure_kind == DecodeErrorKind::INVALID_CHARACTER);
    ASSERT_EQ(*bad_char.failure_position, static_cast<size_t>(25));
    ASSERT_EQ(bad_char.character, 'U');
    ASSERT_TRUE(bad_char.message.find("position 25") != std::string::npos);

    ValidationReport overflow = Validator::validate_detailed("8ZZZZZZZZZZZZZZZZZZZZZZZZZ");
    ASSERT_TRUE(overflow.failure_kind == DecodeErrorKind::TIMESTAMP_OVERFLOW);
    ASSERT_EQ(*overflow.failure_position, static_cast<size_t>(0));
}

/**
 * @brief Parsing derives every representation of the timestamp and randomness.
 */
void test_parse_fields()
{
    const ParsedUlid p = Parser::parse("01ARZ3NDEKTSV4RRFFQ69G5FAV");
    ASSERT_TRUE(p.is_valid);
    ASSERT_EQ(p.timestamp_ms, static_cast<std::uint64_t>(1469922850259ULL));
    ASSERT_EQ(p.timestamp_unix_seconds, static_cast<std::uint64_t>(1469922850ULL));
    ASSERT_EQ(p.timestamp_iso8601, std::string("2016-07-30T23:54:10.259Z"));
    ASSERT_EQ(p.randomness_hex, std::string("d6764c61efb99302bd5b"));
    ASSERT_EQ(p.canonical, std::string("01ARZ3NDEKTSV4RRFFQ69G5FAV"));

    const ParsedUlid q = Parser::parse("01an4z07by79ka1307sr9x4mv3");
    ASSERT_EQ(q.source_string, std::string("01an4z07by79ka1307sr9x4mv3"));
    ASSERT_EQ(q.canonical, std::string("01AN4Z07BY79KA1307SR9X4MV3"));
    ASSERT_EQ(q.timestamp_ms, static_cast<std::uint64_t>(1465824320894ULL));
    ASSERT_EQ(q.randomness_hex, std::string("3a66a08c07ce13d25363"));
}

/**
 * @brief Malformed input fails parsing with the matching kind, both styles.
 */
void test_parse_errors()
{
    ParsedUlid out;
    DecodeError error;
    ASSERT_FALSE(Parser::parse("INVALID_ULID_1", out, error));
    ASSERT_TRUE(error.kind == DecodeErrorKind::INVALID_LENGTH ||
                error.kind == DecodeErrorKind::INVALID_CHARACTER);
    ASSERT_FALSE(out.is_valid);

    ASSERT_THROWS(Parser::parse("8ZZZZZZZZZZZZZZZZZZZZZZZZZ"), ulidkit::core::DecodeException);
    ASSERT_THROWS(Parser::extract_timestamp("short"), ulidkit::core::DecodeException);
    ASSERT_EQ(Parser::extract_timestamp("01ARYZ6S410000000000000000"),
              static_cast<std::uint64_t>(1469918176385ULL));
}

/**
 * @brief Inspection computes age against the supplied clock.
 */
void test_inspect_age()
{
    // 1469922850259 ms + 90 seconds.
    ulidkit::infra::ManualClock clock(1469922850259ULL + 90000);
    const InspectedUlid info = Parser::inspect("01ARZ3NDEKTSV4RRFFQ69G5FAV", clock);
    ASSERT_EQ(info.age_seconds, static_cast<std::int64_t>(90));
    ASSERT_EQ(info.age_human, std::string("1 minutes ago"));
    ASSERT_EQ(info.entropy_bits, 80u);
    ASSERT_EQ(info.total_bits, 128u);
    ASSERT_TRUE(info.randomness_char_entropy > 0.0 && info.randomness_char_entropy <= 4.0);

    clock.set(1469922850259ULL - 5000);
    const InspectedUlid future = Parser::inspect("01ARZ3NDEKTSV4RRFFQ69G5FAV", clock);
    ASSERT_EQ(future.age_seconds, static_cast<std::int64_t>(-5));
    ASSERT_EQ(future.age_human, std::string("in the future"));
}

/**
 * @brief Age descriptions per unit, and character entropy extremes.
 */
void test_inspect_helpers()
{
    ASSERT_EQ(Parser::describe_age(5), std::string("5 seconds ago"));
    ASSERT_EQ(Parser::describe_age(7200), std::string("2 hours ago"));
    ASSERT_EQ(Parser::describe_age(3 * 86400 + 10), std::string("3 days ago"));
    ASSERT_EQ(Parser::describe_age(0), std::string("in the future"));

    ASSERT_TRUE(Parser::char_entropy("") == 0.0);
    ASSERT_TRUE(Parser::char_entropy("aaaa") == 0.0);
    ASSERT_TRUE(std::fabs(Parser::char_entropy("0123456789abcdef") - 4.0) < 1e-9);
}
