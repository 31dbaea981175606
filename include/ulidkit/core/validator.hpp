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
 * @file validator.hpp
 * @brief Structural validation of candidate ULID strings.
 *
 * @details
 * `validate` is a total boolean check; `validate_detailed` runs the same rules and
 * reports which one failed and where. Both accept exactly the strings that
 * `Codec::decode` accepts: length 26, Crockford symbols in either case, and a
 * leading character no greater than '7'.
 */

#pragma once

#include "ulidkit/core/errors.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace ulidkit::core {

/**
 * @struct ValidationReport
 * @brief Diagnostic superset of the boolean validation result.
 */
struct ValidationReport {
    bool is_valid = false;
    DecodeErrorKind failure_kind = DecodeErrorKind::NONE;

    /// @brief Offending index; present for character and overflow failures.
    std::optional<std::size_t> failure_position;

    std::size_t length = 0;
    char character = '\0';

    /// @brief Empty when valid; otherwise the `DecodeError` message.
    std::string message;

    /// @brief True when the input is valid and already uppercase.
    bool is_canonical = false;
};

/**
 * @class Validator
 * @brief Stateless validation entry points.
 */
class Validator {
  public:
    /**
     * @brief True when `text` is a well-formed ULID. Never throws.
     *
     * @code
     * Validator::validate("01ARZ3NDEKTSV4RRFFQ69G5FAV"); // true
     * Validator::validate("INVALID_ULID_1");             // false
     * @endcode
     */
    static bool validate(const std::string& text);

    /**
     * @brief Validates and reports the first violated rule.
     *
     * Rules are checked in order: length, alphabet, timestamp range.
     */
    static ValidationReport validate_detailed(const std::string& text);
};

} // namespace ulidkit::core
