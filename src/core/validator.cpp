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
 * @file validator.cpp
 * @brief Implementation of the structural validator.
 */

#include "ulidkit/core/validator.hpp"

#include "ulidkit/core/codec.hpp"

namespace ulidkit::core {

bool Validator::validate(const std::string& text)
{
    return Codec::check(text).kind == DecodeErrorKind::NONE;
}

/**
 * @brief Names the rule `text` breaks and where.
 *
 * Length failures carry no position; character and overflow failures carry the
 * offending index and character.
 */
ValidationReport Validator::validate_detailed(const std::string& text)
{
    const DecodeError error = Codec::check(text);

    ValidationReport report;
    report.length = text.size();
    report.failure_kind = error.kind;

    if (error.kind == DecodeErrorKind::NONE) {
        report.is_valid = true;
        report.is_canonical = Codec::is_canonical(text);
        return report;
    }

    report.message = error.message();
    if (error.kind != DecodeErrorKind::INVALID_LENGTH) {
        report.failure_position = error.position;
        report.character = error.character;
    }
    return report;
}

} // namespace ulidkit::core
