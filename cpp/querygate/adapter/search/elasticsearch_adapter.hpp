/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/adapter/adapter.hpp>
#include <querygate/adapter/search/search_query.hpp>

namespace querygate::adapter::search {

/**
 * Compiles to Elasticsearch query DSL. Every leaf is a filter-context clause, no scoring.
 *
 * An empty array is not indexed, so _is_empty cannot tell an empty array from a missing one: _is_empty true
 * also matches null and missing fields on this backend.
 */
class ElasticsearchAdapter final : public Adapter {
public:
    using Adapter::Adapter;

    /// Full search request body: query, size, from and sort
    [[nodiscard]] Value to_search_request(const SearchQuery& query, const QueryOptions& opts) const;

private:
    QueryBody do_apply_operator(const entity::FieldDescriptor& field, const entity::Operator& op, const Value& value) const override;
    QueryBody do_combine_and(std::vector<QueryBody> bodies) const override;
    QueryBody do_combine_or(std::vector<QueryBody> bodies) const override;
    QueryBody do_negate(QueryBody body) const override;
    QueryBody do_match_all() const override;
    std::string do_signature(const QueryBody& body) const override;
    [[nodiscard]] size_t body_index() const override { return body_index_of<SearchQuery>(); }

    [[nodiscard]] Value scalar_clause(const std::string& field, entity::ScalarOperator op, const Value& value) const;
    [[nodiscard]] Value array_clause(const std::string& field, entity::ArrayOperator op, const Value& value) const;
    [[nodiscard]] Value json_clause(const std::string& field, entity::JsonOperator op, const Value& value) const;
    [[noreturn]] void raise_unsupported(const entity::Operator& op) const;
};

/// LIKE pattern with backslash escapes to a wildcard query pattern
std::string like_to_wildcard(std::string_view pattern);

/// "$.a.b[0]" relative to field f becomes "f.a.b"
std::string json_path_to_field(std::string_view field, std::string_view json_path);

} // namespace querygate::adapter::search
