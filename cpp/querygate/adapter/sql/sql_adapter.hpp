/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/adapter/adapter.hpp>
#include <querygate/adapter/sql/sql_fragment.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace querygate::adapter::sql {

/**
 * Shared compilation for the relational family. Comparison, membership and LIKE-style operators are common,
 * dialects supply identifier quoting, placeholder syntax and the array, JSON and advanced operators.
 *
 * Every predicate other than IS NULL is false on a NULL column, and negation is rendered null-safe, so the
 * compiled predicate has the same two-valued semantics as the in-memory adapter.
 */
class SqlAdapter : public Adapter {
public:
    using Adapter::Adapter;

    /// SQL text with the dialect's placeholder syntax
    [[nodiscard]] std::string render(const SqlFragment& fragment) const { return render_placeholders(fragment.sql_); }

    /// SELECT * FROM source WHERE predicate, with ordering and the result window of the options
    [[nodiscard]] SqlFragment select_statement(const SqlFragment& where, const QueryOptions& opts) const;

    /// Plan-only form of select_statement, rendered
    [[nodiscard]] SqlFragment explain_statement(const SqlFragment& where, const QueryOptions& opts) const;

    /// Quoted column reference, qualified by the association if the field has one
    [[nodiscard]] std::string column_reference(const entity::FieldDescriptor& field) const;

protected:
    [[nodiscard]] virtual std::string quote_identifier(std::string_view identifier) const = 0;

    [[nodiscard]] virtual std::string_view explain_prefix() const = 0;

    [[nodiscard]] virtual std::string render_placeholders(const std::string& sql) const { return sql; }

    [[nodiscard]] virtual std::string limit_clause(std::optional<uint64_t> limit, uint64_t offset) const;

    /// like_pattern is in LIKE syntax with backslash escapes
    [[nodiscard]] virtual SqlFragment pattern_match(const std::string& column, std::string like_pattern, bool case_insensitive, bool negated) const = 0;

    /// Called with non-empty lists only, empty-list semantics are resolved before dispatch
    [[nodiscard]] virtual SqlFragment array_condition(const std::string& column, entity::ArrayOperator op, const Value& value) const = 0;

    [[nodiscard]] virtual SqlFragment json_condition(const std::string& column, entity::JsonOperator op, const Value& value) const = 0;

    /// Full text, similarity, fuzzy and geo operators
    [[nodiscard]] virtual SqlFragment advanced_condition(const std::string& column, entity::ScalarOperator op, const Value& value) const = 0;

    [[noreturn]] void raise_unsupported(const entity::Operator& op) const;

private:
    QueryBody do_apply_operator(const entity::FieldDescriptor& field, const entity::Operator& op, const Value& value) const final;
    QueryBody do_combine_and(std::vector<QueryBody> bodies) const final;
    QueryBody do_combine_or(std::vector<QueryBody> bodies) const final;
    QueryBody do_negate(QueryBody body) const final;
    QueryBody do_match_all() const final;
    std::string do_signature(const QueryBody& body) const final;
    [[nodiscard]] size_t body_index() const final { return body_index_of<SqlFragment>(); }

    [[nodiscard]] SqlFragment scalar_condition(const std::string& column, entity::ScalarOperator op, const Value& value) const;
    [[nodiscard]] SqlFragment quoted_path(std::string_view path) const;
};

/// "$.\"key\"", a JSON path addressing one top level key
std::string json_key_path(std::string_view key);

/// Joins fragments with the given separator, concatenating their parameters
SqlFragment join_fragments(std::vector<SqlFragment> fragments, std::string_view separator);

} // namespace querygate::adapter::sql
