/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/entity/operators.hpp>
#include <querygate/util/preconditions.hpp>
#include <querygate/util/variant.hpp>

#include <array>
#include <cctype>
#include <utility>

namespace querygate::entity {

namespace {

constexpr std::array<std::pair<ScalarOperator, std::string_view>, 23> scalar_symbols{{
    {ScalarOperator::EQ, "_eq"},
    {ScalarOperator::NEQ, "_neq"},
    {ScalarOperator::GT, "_gt"},
    {ScalarOperator::GTE, "_gte"},
    {ScalarOperator::LT, "_lt"},
    {ScalarOperator::LTE, "_lte"},
    {ScalarOperator::IN, "_in"},
    {ScalarOperator::NIN, "_nin"},
    {ScalarOperator::IS_NULL, "_is_null"},
    {ScalarOperator::LIKE, "_like"},
    {ScalarOperator::NLIKE, "_nlike"},
    {ScalarOperator::ILIKE, "_ilike"},
    {ScalarOperator::NILIKE, "_nilike"},
    {ScalarOperator::STARTS_WITH, "_starts_with"},
    {ScalarOperator::ISTARTS_WITH, "_istarts_with"},
    {ScalarOperator::ENDS_WITH, "_ends_with"},
    {ScalarOperator::IENDS_WITH, "_iends_with"},
    {ScalarOperator::CONTAINS, "_contains"},
    {ScalarOperator::ICONTAINS, "_icontains"},
    {ScalarOperator::MATCHES, "_matches"},
    {ScalarOperator::SIMILAR, "_similar"},
    {ScalarOperator::FUZZY, "_fuzzy"},
    {ScalarOperator::WITHIN_DISTANCE, "_within_distance"}
}};

constexpr std::array<std::pair<ArrayOperator, std::string_view>, 8> array_symbols{{
    {ArrayOperator::INCLUDES, "_includes"},
    {ArrayOperator::EXCLUDES, "_excludes"},
    {ArrayOperator::INCLUDES_ALL, "_includes_all"},
    {ArrayOperator::EXCLUDES_ALL, "_excludes_all"},
    {ArrayOperator::INCLUDES_ANY, "_includes_any"},
    {ArrayOperator::EXCLUDES_ANY, "_excludes_any"},
    {ArrayOperator::IS_EMPTY, "_is_empty"},
    {ArrayOperator::IS_NULL, "_is_null"}
}};

constexpr std::array<std::pair<JsonOperator, std::string_view>, 4> json_symbols{{
    {JsonOperator::HAS_KEY, "_has_key"},
    {JsonOperator::HAS_ANY_KEYS, "_has_any_keys"},
    {JsonOperator::PATH_EXISTS, "_path_exists"},
    {JsonOperator::IS_NULL, "_is_null"}
}};

template<typename Table>
std::string_view lookup_symbol(const Table& table, typename Table::value_type::first_type op) {
    for (const auto& [candidate, symbol] : table) {
        if (candidate == op)
            return symbol;
    }
    util::raise_rte("No symbol registered for operator {}", static_cast<int>(op));
}

template<typename Table>
std::optional<Operator> lookup_operator(const Table& table, std::string_view symbol) {
    for (const auto& [op, candidate] : table) {
        if (candidate == symbol)
            return Operator{op};
    }
    return std::nullopt;
}

template<typename Table>
std::vector<Operator> operators_of(const Table& table) {
    std::vector<Operator> output;
    output.reserve(table.size());
    for (const auto& entry : table)
        output.emplace_back(entry.first);

    return output;
}

} // namespace

std::string_view operator_symbol(const Operator& op) {
    return util::variant_match(op,
        [](ScalarOperator o) { return lookup_symbol(scalar_symbols, o); },
        [](ArrayOperator o) { return lookup_symbol(array_symbols, o); },
        [](JsonOperator o) { return lookup_symbol(json_symbols, o); }
    );
}

FieldCategory operator_category(const Operator& op) {
    return util::variant_match(op,
        [](ScalarOperator) { return FieldCategory::SCALAR; },
        [](ArrayOperator) { return FieldCategory::ARRAY; },
        [](JsonOperator) { return FieldCategory::JSON; }
    );
}

std::string normalize_operator_symbol(std::string_view symbol) {
    std::string output;
    output.reserve(symbol.size() + 4);
    if (symbol.empty() || symbol.front() != '_')
        output.push_back('_');

    for (auto c : symbol) {
        if (std::isupper(static_cast<unsigned char>(c))) {
            output.push_back('_');
            output.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        } else {
            output.push_back(c);
        }
    }
    return output;
}

std::optional<Operator> parse_operator(FieldCategory category, std::string_view symbol) {
    const auto canonical = normalize_operator_symbol(symbol);
    switch (category) {
    case FieldCategory::SCALAR: return lookup_operator(scalar_symbols, canonical);
    case FieldCategory::ARRAY: return lookup_operator(array_symbols, canonical);
    case FieldCategory::JSON: return lookup_operator(json_symbols, canonical);
    }
    return std::nullopt;
}

const std::vector<Operator>& all_operators(FieldCategory category) {
    static const std::vector<Operator> scalar = operators_of(scalar_symbols);
    static const std::vector<Operator> array = operators_of(array_symbols);
    static const std::vector<Operator> json = operators_of(json_symbols);
    switch (category) {
    case FieldCategory::SCALAR: return scalar;
    case FieldCategory::ARRAY: return array;
    case FieldCategory::JSON: return json;
    }
    util::raise_rte("Unknown field category {}", static_cast<int>(category));
}

ValueShape expected_value_shape(const Operator& op) {
    return util::variant_match(op,
        [](ScalarOperator o) {
            switch (o) {
            case ScalarOperator::IN:
            case ScalarOperator::NIN:
                return ValueShape::LIST;
            case ScalarOperator::IS_NULL:
                return ValueShape::BOOLEAN;
            case ScalarOperator::LIKE:
            case ScalarOperator::NLIKE:
            case ScalarOperator::ILIKE:
            case ScalarOperator::NILIKE:
            case ScalarOperator::STARTS_WITH:
            case ScalarOperator::ISTARTS_WITH:
            case ScalarOperator::ENDS_WITH:
            case ScalarOperator::IENDS_WITH:
            case ScalarOperator::CONTAINS:
            case ScalarOperator::ICONTAINS:
            case ScalarOperator::MATCHES:
            case ScalarOperator::SIMILAR:
            case ScalarOperator::FUZZY:
                return ValueShape::STRING;
            case ScalarOperator::WITHIN_DISTANCE:
                return ValueShape::GEO_DISTANCE;
            default:
                return ValueShape::SCALAR;
            }
        },
        [](ArrayOperator o) {
            switch (o) {
            case ArrayOperator::INCLUDES:
            case ArrayOperator::EXCLUDES:
                return ValueShape::SCALAR;
            case ArrayOperator::IS_EMPTY:
            case ArrayOperator::IS_NULL:
                return ValueShape::BOOLEAN;
            default:
                return ValueShape::LIST;
            }
        },
        [](JsonOperator o) {
            switch (o) {
            case JsonOperator::HAS_KEY:
            case JsonOperator::PATH_EXISTS:
                return ValueShape::STRING;
            case JsonOperator::HAS_ANY_KEYS:
                return ValueShape::STRING_LIST;
            default:
                return ValueShape::BOOLEAN;
            }
        }
    );
}

bool value_matches_shape(const Value& value, ValueShape shape) {
    switch (shape) {
    case ValueShape::SCALAR:
        return is_scalar(value);
    case ValueShape::LIST:
        if (!value.isArray())
            return false;
        for (const auto& item : value) {
            if (!is_scalar(item))
                return false;
        }
        return true;
    case ValueShape::BOOLEAN:
        return value.isBool();
    case ValueShape::STRING:
        return value.isString();
    case ValueShape::STRING_LIST:
        if (!value.isArray())
            return false;
        for (const auto& item : value) {
            if (!item.isString())
                return false;
        }
        return true;
    case ValueShape::GEO_DISTANCE: {
        if (!value.isObject())
            return false;
        const auto* lat = value.get_ptr("lat");
        const auto* lon = value.get_ptr("lon");
        const auto* distance = value.get_ptr("distance");
        return lat && lat->isNumber() && lon && lon->isNumber() && distance && distance->isNumber()
            && distance->asDouble() >= 0.0;
    }
    }
    return false;
}

std::string_view value_shape_name(ValueShape shape) {
    switch (shape) {
    case ValueShape::SCALAR: return "a scalar";
    case ValueShape::LIST: return "a list of scalars";
    case ValueShape::BOOLEAN: return "a boolean";
    case ValueShape::STRING: return "a string";
    case ValueShape::STRING_LIST: return "a list of strings";
    case ValueShape::GEO_DISTANCE: return "an object with numeric lat, lon and distance";
    }
    return "unknown";
}

bool is_pattern_match(const Operator& op) {
    const auto* scalar = std::get_if<ScalarOperator>(&op);
    if (scalar == nullptr)
        return false;

    switch (*scalar) {
    case ScalarOperator::LIKE:
    case ScalarOperator::NLIKE:
    case ScalarOperator::ILIKE:
    case ScalarOperator::NILIKE:
    case ScalarOperator::STARTS_WITH:
    case ScalarOperator::ISTARTS_WITH:
    case ScalarOperator::ENDS_WITH:
    case ScalarOperator::IENDS_WITH:
    case ScalarOperator::CONTAINS:
    case ScalarOperator::ICONTAINS:
    case ScalarOperator::MATCHES:
    case ScalarOperator::SIMILAR:
    case ScalarOperator::FUZZY:
        return true;
    default:
        return false;
    }
}

} // namespace querygate::entity
