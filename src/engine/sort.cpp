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
 * @file sort.cpp
 * @brief Implementation of the sort engine (key resolution, permutation, record relinking).
 */

#include "ulidkit/engine/sort.hpp"

#include "ulidkit/core/codec.hpp"
#include "ulidkit/core/ulid.hpp"
#include "ulidkit/infra/logger.hpp"
#include "ulidkit/infra/string.hpp"

#include <algorithm>
#include <cJSON.h>
#include <stdexcept>
#include <utility>

namespace ulidkit::engine {

bool parse_sort_mode(const std::string& name, SortMode& out)
{
    const std::string n = infra::String::to_lower(infra::String::trim(name));
    if (n == "ordinal") {
        out = SortMode::ORDINAL;
        return true;
    }
    if (n == "timestamp") {
        out = SortMode::TIMESTAMP;
        return true;
    }
    return false;
}

MalformedKeyError::MalformedKeyError(std::size_t index, std::string key, std::string cause)
    : core::UlidError("Malformed sort key at index " + std::to_string(index) + " (" +
                      infra::String::quote(key) + "): " + cause),
      index_(index), key_(std::move(key)), cause_(std::move(cause))
{
}

/**
 * @brief Computes the stable sorting permutation of `keys`.
 *
 * @details
 * Operational Logic:
 * 1. **Resolution**: Every key is decoded up front. The first malformed key, in
 *    input order, raises `MalformedKeyError` before anything has moved.
 * 2. **Key Projection**: `ORDINAL` compares the uppercased text byte-wise;
 *    `TIMESTAMP` compares the decoded timestamp, then the randomness. Both give
 *    the same order.
 * 3. **Permutation**: `std::stable_sort` over indices. `reverse` flips the
 *    comparator, so equal keys keep their input order in both directions.
 *
 * @return `perm` such that `keys[perm[0]], keys[perm[1]], ...` is sorted.
 */
std::vector<std::size_t> SortEngine::order(const std::vector<std::string>& keys, bool reverse,
                                           SortMode mode)
{
    // Phase 1: resolve every key before anything is reordered.
    std::vector<std::string> canonical;
    std::vector<core::Ulid> decoded;
    if (mode == SortMode::ORDINAL) {
        canonical.reserve(keys.size());
    } else {
        decoded.reserve(keys.size());
    }

    for (std::size_t i = 0; i < keys.size(); ++i) {
        core::Ulid value;
        core::DecodeError error;
        if (!core::Codec::decode(keys[i], value, error)) {
            throw MalformedKeyError(i, keys[i], error.message());
        }
        if (mode == SortMode::ORDINAL) {
            canonical.push_back(infra::String::to_upper(keys[i]));
        } else {
            decoded.push_back(value);
        }
    }

    // Phase 2: stable permutation. Reversing the comparator (not the output)
    // keeps equal keys in input order.
    std::vector<std::size_t> perm(keys.size());
    for (std::size_t i = 0; i < perm.size(); ++i) {
        perm[i] = i;
    }

    if (mode == SortMode::ORDINAL) {
        std::stable_sort(perm.begin(), perm.end(), [&](std::size_t a, std::size_t b) {
            return reverse ? canonical[b] < canonical[a] : canonical[a] < canonical[b];
        });
    } else {
        std::stable_sort(perm.begin(), perm.end(), [&](std::size_t a, std::size_t b) {
            const core::Ulid& x = decoded[a];
            const core::Ulid& y = decoded[b];
            if (x.timestamp_ms() != y.timestamp_ms()) {
                return reverse ? y.timestamp_ms() < x.timestamp_ms()
                               : x.timestamp_ms() < y.timestamp_ms();
            }
            return reverse ? y.randomness() < x.randomness() : x.randomness() < y.randomness();
        });
    }

    infra::Logger::log(infra::LogLevel::TRACE,
                       "Sort: Ordered " + std::to_string(keys.size()) + " keys.");
    return perm;
}

void SortEngine::sort_strings(std::vector<std::string>& ids, bool reverse, SortMode mode)
{
    sort(ids, [](const std::string& s) { return s; }, reverse, mode);
}

/**
 * @brief Reorders the records of a cJSON array by the ULID in `column`.
 *
 * Keys are collected and validated first; the array is relinked only once the
 * whole permutation is known, so a failure leaves it untouched.
 */
void SortEngine::sort_records(cJSON* array, const std::string& column, bool reverse,
                              SortMode mode)
{
    if (!array || !cJSON_IsArray(array)) {
        throw std::invalid_argument("Column sort expects an array of records");
    }

    std::vector<cJSON*> records;
    std::vector<std::string> keys;
    cJSON* record = nullptr;
    cJSON_ArrayForEach(record, array)
    {
        const std::size_t index = records.size();
        cJSON* field =
            cJSON_IsObject(record) ? cJSON_GetObjectItemCaseSensitive(record, column.c_str())
                                   : nullptr;
        if (!field) {
            throw MalformedKeyError(index, "", "Record has no field '" + column + "'");
        }
        if (!cJSON_IsString(field) || !field->valuestring) {
            throw MalformedKeyError(index, "", "Field '" + column + "' is not a string");
        }
        records.push_back(record);
        keys.emplace_back(field->valuestring);
    }

    const std::vector<std::size_t> perm = order(keys, reverse, mode);

    // Detach every record, then relink in the new order. The nodes themselves
    // (and their fields) are never copied.
    while (array->child) {
        cJSON_DetachItemViaPointer(array, array->child);
    }
    for (std::size_t idx : perm) {
        cJSON_AddItemToArray(array, records[idx]);
    }
}

} // namespace ulidkit::engine
