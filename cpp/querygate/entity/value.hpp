/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <folly/dynamic.h>
#include <folly/json.h>

#include <optional>
#include <string>
#include <string_view>

namespace querygate {

/**
 * Leaf values, records, bound parameters and search bodies are all dynamically typed documents.
 */
using Value = folly::dynamic;

} // namespace querygate

namespace querygate::entity {

/// Orders two values of compatible type. Integers and doubles compare numerically. Returns nullopt when
/// the values are not comparable (different types, null, containers).
std::optional<int> compare_values(const Value& left, const Value& right);

/// Equality with numeric promotion, so 1 == 1.0.
bool values_equal(const Value& left, const Value& right);

/// Looks up a possibly dotted path ("address.city") in an object. Returns nullptr if any segment is missing.
const Value* lookup_path(const Value& record, std::string_view path);

inline bool is_scalar(const Value& value) {
    return !value.isArray() && !value.isObject() && !value.isNull();
}

inline std::string to_json(const Value& value) {
    folly::json::serialization_opts opts;
    opts.sort_keys = true;
    return folly::json::serialize(value, opts);
}

} // namespace querygate::entity
