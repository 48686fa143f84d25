/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/adapter/memory/memory_adapter.hpp>

#include <algorithm>

namespace querygate::adapter::memory {

using namespace entity;

namespace {

std::vector<MemoryPredicate> predicates(std::vector<QueryBody> bodies) {
    std::vector<MemoryPredicate> output;
    output.reserve(bodies.size());
    for (auto& body : bodies)
        output.push_back(std::get<MemoryPredicate>(std::move(body)));

    return output;
}

/// Negative, zero or positive. Missing and null sort after everything else.
int compare_for_sort(const Value& left, const Value& right, const OrderBy& order) {
    const auto* a = lookup_path(left, order.column_);
    const auto* b = lookup_path(right, order.column_);
    const bool a_null = a == nullptr || a->isNull();
    const bool b_null = b == nullptr || b->isNull();
    if (a_null || b_null)
        return static_cast<int>(a_null) - static_cast<int>(b_null);

    const auto cmp = compare_values(*a, *b).value_or(0);
    return order.direction_ == SortDirection::DESC ? -cmp : cmp;
}

} // namespace

QueryBody MemoryAdapter::do_apply_operator(const FieldDescriptor& field, const Operator& op, const Value& value) const {
    return MemoryPredicate::condition(field.qualified_column(), op, value);
}

QueryBody MemoryAdapter::do_combine_and(std::vector<QueryBody> bodies) const {
    return MemoryPredicate::all_of(predicates(std::move(bodies)));
}

QueryBody MemoryAdapter::do_combine_or(std::vector<QueryBody> bodies) const {
    return MemoryPredicate::any_of(predicates(std::move(bodies)));
}

QueryBody MemoryAdapter::do_negate(QueryBody body) const {
    return MemoryPredicate::negation(std::get<MemoryPredicate>(std::move(body)));
}

QueryBody MemoryAdapter::do_match_all() const {
    return MemoryPredicate::always();
}

std::string MemoryAdapter::do_signature(const QueryBody& body) const {
    return std::get<MemoryPredicate>(body).describe();
}

Value MemoryAdapter::execute(const MemoryPredicate& predicate, const Value& dataset, const QueryOptions& opts) const {
    util::check_arg(dataset.isArray(), "In-memory datasets must be arrays of records, got {}", dataset.typeName());
    auto matched = predicate.filter(dataset);
    std::vector<Value> rows(matched.begin(), matched.end());
    if (!opts.order_by_.empty()) {
        std::stable_sort(rows.begin(), rows.end(), [&opts](const Value& left, const Value& right) {
            for (const auto& order : opts.order_by_) {
                if (auto cmp = compare_for_sort(left, right, order); cmp != 0)
                    return cmp < 0;
            }
            return false;
        });
    }

    Value result = Value::array;
    const auto begin = std::min<uint64_t>(opts.offset_, rows.size());
    const auto end = opts.limit_ ? begin + std::min<uint64_t>(*opts.limit_, rows.size() - begin) : rows.size();
    for (auto i = begin; i < end; ++i)
        result.push_back(std::move(rows[i]));

    return result;
}

} // namespace querygate::adapter::memory
