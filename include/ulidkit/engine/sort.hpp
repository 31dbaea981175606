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
 * @file sort.hpp
 * @brief Stable ordering of ULID-keyed sequences.
 *
 * @details
 * The engine works in two phases:
 * 1. **Key resolution**: every key is checked (and canonicalized) in input order.
 *    The first malformed key raises `MalformedKeyError` before anything moves.
 * 2. **Permutation**: a stable sort computes the new order of indices, which is
 *    then applied to the container in one step.
 *
 * A failed sort therefore never leaves the caller's container half-sorted.
 *
 * **Modes:**
 * - `ORDINAL`: byte-wise comparison of the canonical uppercase keys.
 * - `TIMESTAMP`: numeric comparison of the decoded timestamp, then randomness.
 *
 * Both modes yield the same order for valid keys.
 */

#pragma once

#include "ulidkit/core/errors.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

struct cJSON;

namespace ulidkit::engine {

/**
 * @enum SortMode
 * @brief Comparison strategy used by the sort engine.
 */
enum class SortMode {
    ORDINAL,  ///< Canonical string compare.
    TIMESTAMP ///< Decoded (timestamp, randomness) compare.
};

/// @brief Parses `ordinal` or `timestamp` (case-insensitive). @return false if unknown.
bool parse_sort_mode(const std::string& name, SortMode& out);

/**
 * @class MalformedKeyError
 * @brief A sort key is not a valid ULID, or the key field is missing.
 */
class MalformedKeyError : public core::UlidError {
  public:
    MalformedKeyError(std::size_t index, std::string key, std::string cause);

    std::size_t index() const { return index_; }
    const std::string& key() const { return key_; }
    const std::string& cause() const { return cause_; }

  private:
    std::size_t index_;
    std::string key_;
    std::string cause_;
};

/**
 * @class SortEngine
 * @brief Stateless sort entry points.
 */
class SortEngine {
  public:
    /**
     * @brief Computes the stable sorted order of `keys`.
     *
     * @return A permutation: position `i` of the result holds the input index
     * that belongs at output position `i`.
     * @throws MalformedKeyError for the lowest-index invalid key.
     */
    static std::vector<std::size_t> order(const std::vector<std::string>& keys,
                                          bool reverse = false,
                                          SortMode mode = SortMode::ORDINAL);

    /**
     * @brief Sorts `items` by `key_fn(item)`.
     *
     * `key_fn` must return something convertible to `std::string`.
     *
     * @code
     * SortEngine::sort(events, [](const Event& e) { return e.id; });
     * @endcode
     */
    template <typename T, typename KeyFn>
    static void sort(std::vector<T>& items, KeyFn key_fn, bool reverse = false,
                     SortMode mode = SortMode::ORDINAL)
    {
        std::vector<std::string> keys;
        keys.reserve(items.size());
        for (const auto& item : items) {
            keys.emplace_back(key_fn(item));
        }

        const std::vector<std::size_t> perm = order(keys, reverse, mode);

        std::vector<T> sorted;
        sorted.reserve(items.size());
        for (std::size_t idx : perm) {
            sorted.push_back(std::move(items[idx]));
        }
        items.swap(sorted);
    }

    /// @brief Sorts bare ULID strings. Keys keep their original casing.
    static void sort_strings(std::vector<std::string>& ids, bool reverse = false,
                             SortMode mode = SortMode::ORDINAL);

    /**
     * @brief Sorts a cJSON array of objects by the string field `column`.
     *
     * Records are relinked, not copied, so every other field is preserved.
     *
     * @throws MalformedKeyError when a record lacks `column`, holds a non-string
     * value there, or holds an invalid ULID. The array is untouched in that case.
     * @throws std::invalid_argument if `array` is not a JSON array.
     */
    static void sort_records(cJSON* array, const std::string& column, bool reverse = false,
                             SortMode mode = SortMode::ORDINAL);
};

} // namespace ulidkit::engine
