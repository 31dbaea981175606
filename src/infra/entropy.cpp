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
 * @file entropy.cpp
 * @brief Implementation of the randomness sources.
 */

#include "ulidkit/infra/entropy.hpp"

#include <climits>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace ulidkit::infra {

/**
 * @brief Draws `len` bytes from OpenSSL's DRBG.
 *
 * `RAND_bytes` is thread-safe in OpenSSL 1.1.0 and later and reseeds itself from
 * the operating system, so no per-thread state is kept here.
 */
void SecureEntropy::fill(std::uint8_t* out, std::size_t len)
{
    while (len > 0) {
        const int chunk = len > static_cast<std::size_t>(INT_MAX) ? INT_MAX : static_cast<int>(len);
        if (RAND_bytes(out, chunk) != 1) {
            const unsigned long code = ERR_get_error();
            throw std::runtime_error("Entropy: CSPRNG failure (OpenSSL error " +
                                     std::to_string(code) + ")");
        }
        out += chunk;
        len -= static_cast<std::size_t>(chunk);
    }
}

SecureEntropy& SecureEntropy::instance()
{
    static SecureEntropy source;
    return source;
}

FixedEntropy::FixedEntropy(std::vector<std::uint8_t> pattern)
    : pattern_(std::move(pattern)), cursor_(0), consumed_(0)
{
    if (pattern_.empty()) {
        throw std::invalid_argument("Entropy: fixed pattern must not be empty");
    }
}

void FixedEntropy::fill(std::uint8_t* out, std::size_t len)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t i = 0; i < len; ++i) {
        out[i] = pattern_[cursor_];
        cursor_ = (cursor_ + 1) % pattern_.size();
    }
    consumed_ += len;
}

std::size_t FixedEntropy::consumed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return consumed_;
}

} // namespace ulidkit::infra
