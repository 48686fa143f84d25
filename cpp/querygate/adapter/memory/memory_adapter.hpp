/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/adapter/adapter.hpp>
#include <querygate/adapter/memory/memory_predicate.hpp>

namespace querygate::adapter::memory {

/**
 * Filters collections of records held in process. Association fields are looked up as dotted paths.
 */
class MemoryAdapter final : public Adapter {
public:
    using Adapter::Adapter;

    /// Filters the dataset (an array of records), then orders it with nulls last and applies the result window
    [[nodiscard]] Value execute(const MemoryPredicate& predicate, const Value& dataset, const QueryOptions& opts) const;

private:
    QueryBody do_apply_operator(const entity::FieldDescriptor& field, const entity::Operator& op, const Value& value) const override;
    QueryBody do_combine_and(std::vector<QueryBody> bodies) const override;
    QueryBody do_combine_or(std::vector<QueryBody> bodies) const override;
    QueryBody do_negate(QueryBody body) const override;
    QueryBody do_match_all() const override;
    std::string do_signature(const QueryBody& body) const override;
    [[nodiscard]] size_t body_index() const override { return body_index_of<MemoryPredicate>(); }
};

} // namespace querygate::adapter::memory
