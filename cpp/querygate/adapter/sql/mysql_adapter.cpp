/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/adapter/sql/mysql_adapter.hpp>

#include <fmt/format.h>

namespace querygate::adapter::sql {

using namespace entity;

namespace {

// Largest row count MySQL accepts, the documented way to request an offset without a limit
constexpr std::string_view MAX_ROWS = "18446744073709551615";

SqlFragment contains_path(const std::string& column, const Value& paths) {
    SqlFragment fragment{fmt::format("JSON_CONTAINS_PATH({}, 'one', ", column), {}};
    append_placeholders(fragment, paths);
    fragment.sql_.push_back(')');
    return fragment;
}

} // namespace

std::string MySqlAdapter::quote_identifier(std::string_view identifier) const {
    std::string quoted{"`"};
    for (auto c : identifier) {
        if (c == '`')
            quoted.push_back('`');
        quoted.push_back(c);
    }
    quoted.push_back('`');
    return quoted;
}

std::string_view MySqlAdapter::explain_prefix() const {
    return "EXPLAIN FORMAT=JSON ";
}

std::string MySqlAdapter::limit_clause(std::optional<uint64_t> limit, uint64_t offset) const {
    if (!limit && offset > 0)
        return fmt::format(" LIMIT {} OFFSET {}", MAX_ROWS, offset);

    return SqlAdapter::limit_clause(limit, offset);
}

SqlFragment MySqlAdapter::pattern_match(const std::string& column, std::string like_pattern, bool case_insensitive, bool negated) const {
    const auto* keyword = negated ? "NOT LIKE" : "LIKE";
    if (case_insensitive)
        return SqlFragment{fmt::format("LOWER({}) {} LOWER(?)", column, keyword), {Value(std::move(like_pattern))}};

    return SqlFragment{fmt::format("{} {} ? COLLATE utf8mb4_bin", column, keyword), {Value(std::move(like_pattern))}};
}

SqlFragment MySqlAdapter::array_condition(const std::string& column, ArrayOperator op, const Value& value) const {
    switch (op) {
    case ArrayOperator::INCLUDES:
        return SqlFragment{fmt::format("JSON_CONTAINS({}, JSON_ARRAY(?))", column), {value}};
    case ArrayOperator::EXCLUDES:
        return SqlFragment{
            fmt::format("({0} IS NOT NULL AND NOT COALESCE(JSON_CONTAINS({0}, JSON_ARRAY(?)), FALSE))", column), {value}};
    case ArrayOperator::INCLUDES_ANY:
        return SqlFragment{fmt::format("JSON_OVERLAPS({}, ?)", column), {Value(to_json(value))}};
    case ArrayOperator::EXCLUDES_ALL:
        return SqlFragment{
            fmt::format("({0} IS NOT NULL AND NOT COALESCE(JSON_OVERLAPS({0}, ?), FALSE))", column), {Value(to_json(value))}};
    case ArrayOperator::IS_EMPTY:
        return value.getBool()
            ? SqlFragment::literal(fmt::format("JSON_LENGTH({}) = 0", column))
            : SqlFragment::literal(fmt::format("({0} IS NULL OR JSON_LENGTH({0}) > 0)", column));
    default:
        break;
    }
    raise_unsupported(op);
}

SqlFragment MySqlAdapter::json_condition(const std::string& column, JsonOperator op, const Value& value) const {
    switch (op) {
    case JsonOperator::HAS_KEY:
        return contains_path(column, Value::array(json_key_path(value.getString())));
    case JsonOperator::HAS_ANY_KEYS: {
        Value paths = Value::array;
        for (const auto& key : value)
            paths.push_back(json_key_path(key.getString()));
        return contains_path(column, paths);
    }
    case JsonOperator::PATH_EXISTS:
        return contains_path(column, Value::array(value));
    case JsonOperator::IS_NULL:
        break;
    }
    raise_unsupported(op);
}

SqlFragment MySqlAdapter::advanced_condition(const std::string& column, ScalarOperator op, const Value& value) const {
    switch (op) {
    case ScalarOperator::MATCHES:
        return SqlFragment{fmt::format("MATCH({}) AGAINST (? IN NATURAL LANGUAGE MODE)", column), {value}};
    case ScalarOperator::WITHIN_DISTANCE:
        return SqlFragment{
            fmt::format("ST_Distance_Sphere({}, POINT(?, ?)) <= ?", column),
            {value["lon"], value["lat"], value["distance"]}};
    default:
        break;
    }
    raise_unsupported(op);
}

} // namespace querygate::adapter::sql
