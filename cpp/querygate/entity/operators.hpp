/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/entity/field_type.hpp>
#include <querygate/entity/value.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace querygate::entity {

enum class ScalarOperator : uint8_t {
    EQ,
    NEQ,
    GT,
    GTE,
    LT,
    LTE,
    IN,
    NIN,
    IS_NULL,
    LIKE,
    NLIKE,
    ILIKE,
    NILIKE,
    STARTS_WITH,
    ISTARTS_WITH,
    ENDS_WITH,
    IENDS_WITH,
    CONTAINS,
    ICONTAINS,
    // Advanced, only exposed when the backend feature is detected
    MATCHES,
    SIMILAR,
    FUZZY,
    WITHIN_DISTANCE
};

enum class ArrayOperator : uint8_t {
    INCLUDES,
    EXCLUDES,
    INCLUDES_ALL,
    EXCLUDES_ALL,
    INCLUDES_ANY,
    EXCLUDES_ANY,
    IS_EMPTY,
    IS_NULL
};

enum class JsonOperator : uint8_t {
    HAS_KEY,
    HAS_ANY_KEYS,
    PATH_EXISTS,
    IS_NULL
};

using Operator = std::variant<ScalarOperator, ArrayOperator, JsonOperator>;
using OperatorSet = std::set<Operator>;

/// The value an operator expects on the right hand side
enum class ValueShape : uint8_t {
    SCALAR,
    LIST,
    BOOLEAN,
    STRING,
    STRING_LIST,
    /// {"lat": .., "lon": .., "distance": <metres>}
    GEO_DISTANCE
};

std::string_view operator_symbol(const Operator& op);

FieldCategory operator_category(const Operator& op);

/// Canonical form of a symbol: leading underscore, snake case. "gte" and "_includesAll" normalize
/// to "_gte" and "_includes_all".
std::string normalize_operator_symbol(std::string_view symbol);

/// Resolves a symbol within the vocabulary of a field category. nullopt if the symbol is unknown for it.
std::optional<Operator> parse_operator(FieldCategory category, std::string_view symbol);

const std::vector<Operator>& all_operators(FieldCategory category);

ValueShape expected_value_shape(const Operator& op);

bool value_matches_shape(const Value& value, ValueShape shape);

std::string_view value_shape_name(ValueShape shape);

/// Operators whose value is a list of items, subject to the adapter's list size limit
inline bool takes_list(const Operator& op) {
    const auto shape = expected_value_shape(op);
    return shape == ValueShape::LIST || shape == ValueShape::STRING_LIST;
}

bool is_pattern_match(const Operator& op);

} // namespace querygate::entity

namespace fmt {
template<>
struct formatter<querygate::entity::Operator> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const querygate::entity::Operator& op, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "{}", querygate::entity::operator_symbol(op));
    }
};
}
