/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/adapter/sql/sqlite_adapter.hpp>

#include <fmt/format.h>

namespace querygate::adapter::sql {

using namespace entity;

namespace {

/// LIKE pattern with backslash escapes to the equivalent case-sensitive GLOB pattern
std::string like_to_glob(std::string_view pattern) {
    std::string glob;
    glob.reserve(pattern.size());
    auto append_literal = [&glob](char c) {
        if (c == '*' || c == '?' || c == '[')
            glob.append(fmt::format("[{}]", c));
        else
            glob.push_back(c);
    };
    for (size_t i = 0; i < pattern.size(); ++i) {
        const auto c = pattern[i];
        if (c == '\\' && i + 1 < pattern.size())
            append_literal(pattern[++i]);
        else if (c == '%')
            glob.push_back('*');
        else if (c == '_')
            glob.push_back('?');
        else
            append_literal(c);
    }
    return glob;
}

SqlFragment any_element(const std::string& column, std::string_view keyword, const Value& items) {
    SqlFragment fragment{fmt::format("EXISTS (SELECT 1 FROM json_each({}) WHERE json_each.value {} (", column, keyword), {}};
    append_placeholders(fragment, items);
    fragment.sql_.append("))");
    return fragment;
}

SqlFragment present_and_not(const std::string& column, SqlFragment inner) {
    inner.sql_ = fmt::format("({} IS NOT NULL AND NOT {})", column, inner.sql_);
    return inner;
}

SqlFragment any_path_present(const std::string& column, const std::vector<std::string>& paths) {
    std::vector<SqlFragment> parts;
    for (const auto& path : paths)
        parts.push_back(SqlFragment{fmt::format("json_type({}, ?) IS NOT NULL", column), {Value(path)}});

    auto joined = join_fragments(std::move(parts), " OR ");
    joined.sql_ = fmt::format("({})", joined.sql_);
    return joined;
}

} // namespace

std::string SqliteAdapter::quote_identifier(std::string_view identifier) const {
    std::string quoted{"\""};
    for (auto c : identifier) {
        if (c == '"')
            quoted.push_back('"');
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

std::string_view SqliteAdapter::explain_prefix() const {
    return "EXPLAIN QUERY PLAN ";
}

std::string SqliteAdapter::limit_clause(std::optional<uint64_t> limit, uint64_t offset) const {
    if (!limit && offset > 0)
        return fmt::format(" LIMIT -1 OFFSET {}", offset);

    return SqlAdapter::limit_clause(limit, offset);
}

SqlFragment SqliteAdapter::pattern_match(const std::string& column, std::string like_pattern, bool case_insensitive, bool negated) const {
    const auto* negation = negated ? "NOT " : "";
    if (case_insensitive)
        return SqlFragment{fmt::format("{} {}LIKE ? ESCAPE '\\'", column, negation), {Value(std::move(like_pattern))}};

    return SqlFragment{fmt::format("{} {}GLOB ?", column, negation), {Value(like_to_glob(like_pattern))}};
}

SqlFragment SqliteAdapter::array_condition(const std::string& column, ArrayOperator op, const Value& value) const {
    switch (op) {
    case ArrayOperator::INCLUDES:
        return any_element(column, "IN", Value::array(value));
    case ArrayOperator::EXCLUDES:
        return present_and_not(column, any_element(column, "IN", Value::array(value)));
    case ArrayOperator::INCLUDES_ANY:
        return any_element(column, "IN", value);
    case ArrayOperator::EXCLUDES_ALL:
        return present_and_not(column, any_element(column, "IN", value));
    case ArrayOperator::IS_EMPTY:
        return value.getBool()
            ? SqlFragment::literal(fmt::format("json_array_length({}) = 0", column))
            : SqlFragment::literal(fmt::format("({0} IS NULL OR json_array_length({0}) > 0)", column));
    default:
        break;
    }
    raise_unsupported(op);
}

SqlFragment SqliteAdapter::json_condition(const std::string& column, JsonOperator op, const Value& value) const {
    switch (op) {
    case JsonOperator::HAS_KEY:
        return SqlFragment{fmt::format("json_type({}, ?) IS NOT NULL", column), {Value(json_key_path(value.getString()))}};
    case JsonOperator::HAS_ANY_KEYS: {
        std::vector<std::string> paths;
        for (const auto& key : value)
            paths.push_back(json_key_path(key.getString()));
        return any_path_present(column, paths);
    }
    case JsonOperator::PATH_EXISTS:
        return SqlFragment{fmt::format("json_type({}, ?) IS NOT NULL", column), {value}};
    case JsonOperator::IS_NULL:
        break;
    }
    raise_unsupported(op);
}

SqlFragment SqliteAdapter::advanced_condition(const std::string& column, ScalarOperator op, const Value& value) const {
    if (op == ScalarOperator::MATCHES)
        return SqlFragment{fmt::format("{} MATCH ?", column), {value}};

    raise_unsupported(op);
}

} // namespace querygate::adapter::sql
