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
 * @file ulid.cpp
 * @brief Implementation of the ULID value type.
 */

#include "ulidkit/core/ulid.hpp"

#include "ulidkit/core/codec.hpp"
#include "ulidkit/core/errors.hpp"
#include "ulidkit/infra/string.hpp"

namespace ulidkit::core {

Ulid::Ulid() : bytes_{} {}

Ulid::Ulid(std::uint64_t timestamp_ms, const Randomness& randomness) : bytes_{}
{
    if (timestamp_ms > MAX_TIMESTAMP) {
        throw TimestampOutOfRangeError(timestamp_ms, MAX_TIMESTAMP);
    }
    // Timestamp: 6 bytes, big-endian.
    for (std::size_t i = 0; i < 6; ++i) {
        bytes_[i] = static_cast<std::uint8_t>((timestamp_ms >> ((5 - i) * 8)) & 0xFF);
    }
    for (std::size_t i = 0; i < RANDOMNESS_BYTES; ++i) {
        bytes_[6 + i] = randomness[i];
    }
}

Ulid Ulid::from_bytes(const UlidBytes& bytes)
{
    Ulid ulid;
    ulid.bytes_ = bytes;
    return ulid;
}

Ulid Ulid::from_string(const std::string& text)
{
    Ulid ulid;
    DecodeError error;
    if (!Codec::decode(text, ulid, error)) {
        throw DecodeException(error);
    }
    return ulid;
}

std::uint64_t Ulid::timestamp_ms() const
{
    std::uint64_t ts = 0;
    for (std::size_t i = 0; i < 6; ++i) {
        ts = (ts << 8) | bytes_[i];
    }
    return ts;
}

Randomness Ulid::randomness() const
{
    Randomness r{};
    for (std::size_t i = 0; i < RANDOMNESS_BYTES; ++i) {
        r[i] = bytes_[6 + i];
    }
    return r;
}

std::string Ulid::to_string() const
{
    return Codec::encode(*this);
}

std::string Ulid::to_hex() const
{
    return infra::String::to_hex(bytes_.data(), bytes_.size());
}

std::ostream& operator<<(std::ostream& os, const Ulid& id)
{
    return os << id.to_string();
}

} // namespace ulidkit::core
