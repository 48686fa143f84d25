/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/filter/filter_parser.hpp>
#include <querygate/log/log.hpp>
#include <querygate/util/preconditions.hpp>

#include <folly/json.h>

#include <algorithm>

namespace querygate::filter {

namespace {

constexpr std::string_view AND_KEY = "_and";
constexpr std::string_view OR_KEY = "_or";
constexpr std::string_view NOT_KEY = "_not";

class Parser {
public:
    explicit Parser(const entity::FieldDescriptorTable& fields) :
        fields_(fields) {
    }

    FilterExpression parse_filter(const Value& raw, const std::string& path) const {
        structural::check<ErrorCode::E_MALFORMED_FILTER>(raw.isObject(),
            "Filter at {} must be an object, got {}", path, raw.typeName());

        // Object iteration order is unspecified, sort so equal documents give equal trees
        std::vector<std::string> keys;
        keys.reserve(raw.size());
        for (const auto& key : raw.keys()) {
            structural::check<ErrorCode::E_MALFORMED_FILTER>(key.isString(), "Filter keys at {} must be strings", path);
            keys.push_back(key.getString());
        }
        std::sort(keys.begin(), keys.end());

        std::vector<FilterExpression> nodes;
        nodes.reserve(keys.size());
        for (const auto& key : keys)
            nodes.push_back(parse_entry(key, raw[key], path));

        if (nodes.size() == 1)
            return std::move(nodes.front());

        return FilterExpression::all_of(std::move(nodes));
    }

private:
    FilterExpression parse_entry(const std::string& key, const Value& value, const std::string& path) const {
        if (key == AND_KEY || key == OR_KEY) {
            const auto child_path = fmt::format("{}.{}", path, key);
            structural::check<ErrorCode::E_MALFORMED_FILTER>(value.isArray(),
                "{} must be a list of filters, got {}", child_path, value.typeName());

            std::vector<FilterExpression> children;
            children.reserve(value.size());
            for (size_t i = 0; i < value.size(); ++i)
                children.push_back(parse_filter(value[i], fmt::format("{}[{}]", child_path, i)));

            return key == AND_KEY ? FilterExpression::all_of(std::move(children)) : FilterExpression::any_of(std::move(children));
        }

        if (key == NOT_KEY)
            return FilterExpression::negation(parse_filter(value, fmt::format("{}.{}", path, key)));

        structural::check<ErrorCode::E_UNKNOWN_COMBINATOR>(key.empty() || key.front() != '_',
            "Unknown combinator '{}' at {}, expected one of _and, _or, _not", key, path);
        structural::check<ErrorCode::E_EMPTY_FIELD_NAME>(!key.empty(), "Empty field name at {}", path);

        const auto* field = fields_.find(key);
        structural::check<ErrorCode::E_UNKNOWN_FIELD>(field != nullptr, "Unknown field '{}' at {}", key, path);
        return parse_leaf(*field, value, fmt::format("{}.{}", path, key));
    }

    FilterExpression parse_leaf(const entity::FieldDescriptor& field, const Value& raw_ops, const std::string& path) const {
        structural::check<ErrorCode::E_MALFORMED_FILTER>(raw_ops.isObject() && !raw_ops.empty(),
            "Operators for field '{}' at {} must be a non-empty object", field.name_, path);

        OperatorMap operators;
        for (const auto& [raw_symbol, value] : raw_ops.items()) {
            structural::check<ErrorCode::E_MALFORMED_FILTER>(raw_symbol.isString(), "Operator keys at {} must be strings", path);
            const auto& symbol = raw_symbol.getString();
            auto op = entity::parse_operator(field.type_.category_, symbol);
            structural::check<ErrorCode::E_UNKNOWN_OPERATOR>(op.has_value(),
                "Operator '{}' is not defined for {} field '{}'", symbol, field.type_, field.name_);

            const auto shape = entity::expected_value_shape(*op);
            structural::check<ErrorCode::E_INVALID_OPERATOR_VALUE>(entity::value_matches_shape(value, shape),
                "Operator {} on field '{}' expects {}, got {}", *op, field.name_, entity::value_shape_name(shape), entity::to_json(value));

            auto [_, inserted] = operators.try_emplace(*op, value);
            structural::check<ErrorCode::E_MALFORMED_FILTER>(inserted,
                "Operator {} given more than once for field '{}'", *op, field.name_);
        }
        return FilterExpression::leaf(field.name_, std::move(operators));
    }

    const entity::FieldDescriptorTable& fields_;
};

} // namespace

FilterExpression parse(const Value& raw, const entity::FieldDescriptorTable& fields) {
    auto expression = Parser{fields}.parse_filter(raw, "$");
    QUERYGATE_DEBUG(log::filter(), "Parsed filter {}", expression);
    return expression;
}

FilterExpression parse_json(std::string_view text, const entity::FieldDescriptorTable& fields) {
    Value raw;
    try {
        raw = folly::parseJson(folly::StringPiece{text.data(), text.size()});
    } catch (const std::exception& e) {
        structural::raise<ErrorCode::E_INVALID_FILTER_JSON>("Filter is not valid JSON: {}", e.what());
    }
    return parse(raw, fields);
}

} // namespace querygate::filter
