/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/adapter/sql/postgres_adapter.hpp>

#include <fmt/format.h>

namespace querygate::adapter::sql {

using namespace entity;

std::string PostgresAdapter::quote_identifier(std::string_view identifier) const {
    std::string quoted{"\""};
    for (auto c : identifier) {
        if (c == '"')
            quoted.push_back('"');
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

std::string_view PostgresAdapter::explain_prefix() const {
    return "EXPLAIN (FORMAT JSON) ";
}

std::string PostgresAdapter::render_placeholders(const std::string& sql) const {
    std::string rendered;
    rendered.reserve(sql.size() + 8);
    size_t index = 0;
    char quote = 0;
    for (auto c : sql) {
        if (quote != 0) {
            if (c == quote)
                quote = 0;
            rendered.push_back(c);
        } else if (c == '"' || c == '\'') {
            quote = c;
            rendered.push_back(c);
        } else if (c == '?') {
            fmt::format_to(std::back_inserter(rendered), "${}", ++index);
        } else {
            rendered.push_back(c);
        }
    }
    return rendered;
}

SqlFragment PostgresAdapter::pattern_match(const std::string& column, std::string like_pattern, bool case_insensitive, bool negated) const {
    return SqlFragment{
        fmt::format("{} {}{} ?", column, negated ? "NOT " : "", case_insensitive ? "ILIKE" : "LIKE"),
        {Value(std::move(like_pattern))}};
}

SqlFragment PostgresAdapter::array_condition(const std::string& column, ArrayOperator op, const Value& value) const {
    switch (op) {
    case ArrayOperator::INCLUDES:
        return SqlFragment{fmt::format("? = ANY({})", column), {value}};
    case ArrayOperator::EXCLUDES:
        return SqlFragment{fmt::format("({0} IS NOT NULL AND NOT COALESCE(? = ANY({0}), FALSE))", column), {value}};
    case ArrayOperator::INCLUDES_ALL:
        return SqlFragment{fmt::format("{} @> ?", column), {value}};
    case ArrayOperator::EXCLUDES_ANY:
        return SqlFragment{fmt::format("({0} IS NOT NULL AND NOT COALESCE({0} @> ?, FALSE))", column), {value}};
    case ArrayOperator::INCLUDES_ANY:
        return SqlFragment{fmt::format("{} && ?", column), {value}};
    case ArrayOperator::EXCLUDES_ALL:
        return SqlFragment{fmt::format("({0} IS NOT NULL AND NOT COALESCE({0} && ?, FALSE))", column), {value}};
    case ArrayOperator::IS_EMPTY:
        return value.getBool()
            ? SqlFragment::literal(fmt::format("cardinality({}) = 0", column))
            : SqlFragment::literal(fmt::format("({0} IS NULL OR cardinality({0}) > 0)", column));
    case ArrayOperator::IS_NULL:
        break;
    }
    raise_unsupported(op);
}

SqlFragment PostgresAdapter::json_condition(const std::string& column, JsonOperator op, const Value& value) const {
    switch (op) {
    case JsonOperator::HAS_KEY:
        return SqlFragment{fmt::format("jsonb_exists({}, ?)", column), {value}};
    case JsonOperator::HAS_ANY_KEYS:
        return SqlFragment{fmt::format("jsonb_exists_any({}, ?)", column), {value}};
    case JsonOperator::PATH_EXISTS:
        return SqlFragment{fmt::format("jsonb_path_exists({}, CAST(? AS jsonpath))", column), {value}};
    case JsonOperator::IS_NULL:
        break;
    }
    raise_unsupported(op);
}

SqlFragment PostgresAdapter::advanced_condition(const std::string& column, ScalarOperator op, const Value& value) const {
    switch (op) {
    case ScalarOperator::MATCHES:
        return SqlFragment{fmt::format("to_tsvector({}) @@ plainto_tsquery(?)", column), {value}};
    case ScalarOperator::SIMILAR:
        return SqlFragment{fmt::format("{} % ?", column), {value}};
    case ScalarOperator::WITHIN_DISTANCE:
        return SqlFragment{
            fmt::format("ST_DWithin({}::geography, ST_SetSRID(ST_MakePoint(?, ?), 4326)::geography, ?)", column),
            {value["lon"], value["lat"], value["distance"]}};
    default:
        break;
    }
    raise_unsupported(op);
}

} // namespace querygate::adapter::sql
