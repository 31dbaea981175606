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
 * @file errors.cpp
 * @brief Message construction for the core error taxonomy.
 */

#include "ulidkit/core/errors.hpp"

#include "ulidkit/infra/string.hpp"

#include <string>

namespace ulidkit::core {

const char* to_string(DecodeErrorKind kind)
{
    switch (kind) {
    case DecodeErrorKind::NONE:
        return "none";
    case DecodeErrorKind::INVALID_LENGTH:
        return "invalid_length";
    case DecodeErrorKind::INVALID_CHARACTER:
        return "invalid_character";
    case DecodeErrorKind::TIMESTAMP_OVERFLOW:
        return "timestamp_overflow";
    }
    return "unknown";
}

std::string DecodeError::message() const
{
    switch (kind) {
    case DecodeErrorKind::NONE:
        return "No error";
    case DecodeErrorKind::INVALID_LENGTH:
        return "Invalid length: expected 26 characters, got " + std::to_string(actual_length);
    case DecodeErrorKind::INVALID_CHARACTER:
        return "Invalid character " + infra::String::quote(std::string(1, character)) +
               " at position " + std::to_string(position) +
               " (valid characters: 0123456789ABCDEFGHJKMNPQRSTVWXYZ)";
    case DecodeErrorKind::TIMESTAMP_OVERFLOW:
        return "Timestamp overflow: leading character " +
               infra::String::quote(std::string(1, character)) +
               " encodes a timestamp above 2^48-1 (maximum leading character is '7')";
    }
    return "Unknown decode error";
}

DecodeException::DecodeException(DecodeError error)
    : UlidError(error.message()), error_(error)
{
}

TimestampOutOfRangeError::TimestampOutOfRangeError(std::uint64_t timestamp,
                                                   std::uint64_t max_timestamp)
    : UlidError("Timestamp " + std::to_string(timestamp) + " is out of range (max: " +
                std::to_string(max_timestamp) + ")"),
      timestamp_(timestamp), max_timestamp_(max_timestamp)
{
}

ClockRollbackError::ClockRollbackError(std::uint64_t observed_ms, std::uint64_t last_ms)
    : UlidError("Clock rollback detected: observed " + std::to_string(observed_ms) +
                " ms after issuing at " + std::to_string(last_ms) + " ms"),
      observed_ms_(observed_ms), last_ms_(last_ms)
{
}

} // namespace ulidkit::core
