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
 * @file entropy.hpp
 * @brief Randomness sources for the 80-bit ULID payload.
 *
 * @details
 * Production generation uses `SecureEntropy`, backed by OpenSSL's CSPRNG
 * (`RAND_bytes`). `FixedEntropy` replays a caller-chosen byte sequence and exists
 * so the monotonic-overflow path can be forced on demand.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace ulidkit::infra {

/**
 * @class EntropySource
 * @brief Abstract provider of random bytes.
 *
 * Implementations must be safe to call from several threads at once.
 */
class EntropySource {
  public:
    virtual ~EntropySource() = default;

    /**
     * @brief Fills `len` bytes at `out`.
     *
     * @throws std::runtime_error if the underlying source cannot deliver.
     */
    virtual void fill(std::uint8_t* out, std::size_t len) = 0;
};

/**
 * @class SecureEntropy
 * @brief CSPRNG-backed entropy via OpenSSL `RAND_bytes`.
 */
class SecureEntropy : public EntropySource {
  public:
    void fill(std::uint8_t* out, std::size_t len) override;

    /// @brief Process-wide instance used when no source is injected.
    static SecureEntropy& instance();
};

/**
 * @class FixedEntropy
 * @brief Cycles through a fixed byte pattern.
 *
 * @code
 * FixedEntropy all_ones(std::vector<std::uint8_t>(10, 0xFF)); // forces overflow
 * @endcode
 */
class FixedEntropy : public EntropySource {
  public:
    explicit FixedEntropy(std::vector<std::uint8_t> pattern);

    void fill(std::uint8_t* out, std::size_t len) override;

    /// @brief Total number of bytes handed out so far.
    std::size_t consumed() const;

  private:
    std::vector<std::uint8_t> pattern_;
    std::size_t cursor_;
    std::size_t consumed_;
    mutable std::mutex mutex_;
};

} // namespace ulidkit::infra
