/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/adapter/adapter.hpp>
#include <querygate/log/log.hpp>

namespace querygate::adapter {

Adapter::Adapter(AdapterCapabilities capabilities, std::shared_ptr<BackendConnector> connector) :
    capabilities_(std::move(capabilities)),
    connector_(std::move(connector)) {
}

CompiledQuery Adapter::apply_operator(const entity::FieldDescriptor& field, const entity::Operator& op, const Value& value) const {
    util::check(!field.is_custom(), "Custom field '{}' must not reach the {} adapter", field.name_, name());
    util::check(capabilities_.supports(field.type_, op),
        "Operator {} on {} field '{}' is not supported by the {} adapter", op, field.type_, field.name_, name());

    QueryShape shape;
    shape.conditions_ = 1;
    if (entity::takes_list(op) && value.isArray()) {
        shape.membership_lists_ = 1;
        shape.membership_items_ = value.size();
    }
    if (entity::is_pattern_match(op))
        shape.pattern_matches_ = 1;

    if (field.association_)
        shape.associations_.insert(*field.association_);

    QUERYGATE_TRACE(log::adapter(), "{} compiling {} {} {}", name(), field.name_, op, entity::to_json(value));
    return CompiledQuery{do_apply_operator(field, op, value), std::move(shape)};
}

std::vector<QueryBody> Adapter::take_bodies(std::vector<CompiledQuery>& queries, QueryShape& shape) const {
    std::vector<QueryBody> bodies;
    bodies.reserve(queries.size());
    for (auto& query : queries) {
        internal::check<ErrorCode::E_ADAPTER_MISMATCH>(accepts(query),
            "Query body alternative {} cannot be composed by the {} adapter", query.body_.index(), name());
        shape.merge(query.shape_);
        bodies.push_back(std::move(query.body_));
    }
    return bodies;
}

CompiledQuery Adapter::combine_and(std::vector<CompiledQuery> queries) const {
    if (queries.size() == 1)
        return std::move(queries.front());

    QueryShape shape;
    auto bodies = take_bodies(queries, shape);
    if (bodies.size() > 1)
        ++shape.and_groups_;

    return CompiledQuery{do_combine_and(std::move(bodies)), std::move(shape)};
}

CompiledQuery Adapter::combine_or(std::vector<CompiledQuery> queries) const {
    if (queries.size() == 1)
        return std::move(queries.front());

    QueryShape shape;
    auto bodies = take_bodies(queries, shape);
    if (bodies.size() > 1)
        shape.or_branches_ += static_cast<uint32_t>(bodies.size() - 1);

    return CompiledQuery{do_combine_or(std::move(bodies)), std::move(shape)};
}

CompiledQuery Adapter::negate(CompiledQuery query) const {
    internal::check<ErrorCode::E_ADAPTER_MISMATCH>(accepts(query),
        "Query body alternative {} cannot be negated by the {} adapter", query.body_.index(), name());
    auto shape = std::move(query.shape_);
    ++shape.negations_;
    return CompiledQuery{do_negate(std::move(query.body_)), std::move(shape)};
}

CompiledQuery Adapter::match_all() const {
    return CompiledQuery{do_match_all(), QueryShape{}};
}

std::string Adapter::signature(const CompiledQuery& query) const {
    internal::check<ErrorCode::E_ADAPTER_MISMATCH>(accepts(query),
        "Query body alternative {} was not produced by the {} adapter", query.body_.index(), name());
    return do_signature(query.body_);
}

} // namespace querygate::adapter
