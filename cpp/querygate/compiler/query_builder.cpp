/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/compiler/query_builder.hpp>
#include <querygate/log/log.hpp>
#include <querygate/util/variant.hpp>

#include <algorithm>

namespace querygate::compiler {

using namespace entity;
using namespace filter;

namespace {

template<typename Visitor>
void for_each_leaf(const FilterExpression& expression, Visitor&& visitor) {
    util::variant_match(expression.node().value_,
        [&](const AndNode& node) {
            for (const auto& child : node.children_)
                for_each_leaf(child, visitor);
        },
        [&](const OrNode& node) {
            for (const auto& child : node.children_)
                for_each_leaf(child, visitor);
        },
        [&](const NotNode& node) { for_each_leaf(node.child_, visitor); },
        [&](const LeafNode& node) { visitor(node); }
    );
}

} // namespace

QueryBuilder::QueryBuilder(
        const adapter::Adapter& adapter,
        const FieldDescriptorTable& fields,
        const AuthorizedFieldSet& authorized,
        const CustomFilterRegistry& custom_filters) :
    adapter_(adapter),
    fields_(fields),
    authorized_(authorized),
    custom_filters_(custom_filters) {
}

void QueryBuilder::check_authorized(const FilterExpression& expression) const {
    if (authorized_.is_all())
        return;

    std::vector<std::string> unauthorized;
    for_each_leaf(expression, [&](const LeafNode& leaf) {
        if (!authorized_.permits(leaf.field_)
            && std::find(unauthorized.begin(), unauthorized.end(), leaf.field_) == unauthorized.end())
            unauthorized.push_back(leaf.field_);
    });

    if (!unauthorized.empty()) {
        auto msg = fmt::format("{} Not authorized to filter on: {}",
                               error_code_data<ErrorCode::E_UNAUTHORIZED_FIELD>.name_, fmt::join(unauthorized, ", "));
        log::filter().info(msg);
        throw UnauthorizedFieldException(msg, std::move(unauthorized));
    }
}

QueryBuilder::PreparedLeaf QueryBuilder::prepare_leaf(const LeafNode& leaf) const {
    const auto& field = fields_.at(leaf.field_);
    PreparedLeaf prepared{&field, {}};
    prepared.conditions_.reserve(leaf.operators_.size());

    if (field.is_custom()) {
        structural::check<ErrorCode::E_MISSING_CUSTOM_FILTER>(custom_filters_.find(field.name_) != nullptr,
            "Custom field '{}' has no registered filter", field.name_);
    }

    const auto& max_items = adapter_.capabilities().limits().max_in_clause_items_;
    for (const auto& [op, value] : leaf.operators_) {
        if (!field.is_custom() && !adapter_.capabilities().supports(field.type_, op)) {
            auto msg = fmt::format("{} Operator {} is not supported on {} field '{}' by the {} adapter",
                                   error_code_data<ErrorCode::E_UNSUPPORTED_OPERATOR>.name_, op, field.type_, field.name_, adapter_.name());
            throw UnsupportedOperatorException(msg, field.name_, std::string{operator_symbol(op)}, std::string{adapter_.name()});
        }

        if (max_items && takes_list(op) && value.isArray() && value.size() > *max_items) {
            capability::raise<ErrorCode::E_TOO_MANY_LIST_ITEMS>(
                "Operator {} on field '{}' has {} items, the {} adapter accepts at most {}",
                op, field.name_, value.size(), adapter_.name(), *max_items);
        }

        // Only member values are coerced, the booleans of _is_null and _is_empty pass through
        const auto shape = expected_value_shape(op);
        const bool member_value = shape == ValueShape::SCALAR || shape == ValueShape::LIST;
        auto internal_value = field.enum_definition_ && member_value ? field.enum_definition_->coerce(value, field.name_) : value;
        prepared.conditions_.push_back(PreparedCondition{op, std::move(internal_value)});
    }
    return prepared;
}

void QueryBuilder::prepare(const FilterExpression& expression, std::vector<PreparedLeaf>& leaves) const {
    for_each_leaf(expression, [&](const LeafNode& leaf) {
        leaves.push_back(prepare_leaf(leaf));
    });
}

adapter::CompiledQuery QueryBuilder::dispatch_leaf(const PreparedLeaf& leaf) const {
    const auto& field = *leaf.field_;
    std::vector<adapter::CompiledQuery> parts;
    parts.reserve(leaf.conditions_.size());

    if (field.is_custom()) {
        const auto& filter = *custom_filters_.find(field.name_);
        for (const auto& condition : leaf.conditions_) {
            auto query = filter(adapter_.match_all(), condition.op_, condition.value_);
            internal::check<ErrorCode::E_CUSTOM_FILTER_MISMATCH>(adapter_.accepts(query),
                "Custom filter for '{}' returned a query the {} adapter did not produce", field.name_, adapter_.name());
            ++query.shape_.custom_fragments_;
            parts.push_back(std::move(query));
        }
    } else {
        for (const auto& condition : leaf.conditions_)
            parts.push_back(adapter_.apply_operator(field, condition.op_, condition.value_));
    }
    return adapter_.combine_and(std::move(parts));
}

adapter::CompiledQuery QueryBuilder::dispatch(
        const FilterExpression& expression,
        const std::vector<PreparedLeaf>& leaves,
        size_t& cursor) const {
    auto compile_children = [&](const std::vector<FilterExpression>& children) {
        std::vector<adapter::CompiledQuery> compiled;
        compiled.reserve(children.size());
        for (const auto& child : children)
            compiled.push_back(dispatch(child, leaves, cursor));
        return compiled;
    };

    return util::variant_match(expression.node().value_,
        [&](const AndNode& node) { return adapter_.combine_and(compile_children(node.children_)); },
        [&](const OrNode& node) { return adapter_.combine_or(compile_children(node.children_)); },
        [&](const NotNode& node) { return adapter_.negate(dispatch(node.child_, leaves, cursor)); },
        [&](const LeafNode&) {
            util::check(cursor < leaves.size(), "Leaf {} was not prepared", cursor);
            return dispatch_leaf(leaves[cursor++]);
        }
    );
}

adapter::CompiledQuery QueryBuilder::compile(const FilterExpression& expression) const {
    check_authorized(expression);

    std::vector<PreparedLeaf> leaves;
    leaves.reserve(expression.leaf_count());
    prepare(expression, leaves);

    size_t cursor = 0;
    auto compiled = dispatch(expression, leaves, cursor);
    QUERYGATE_DEBUG(log::filter(), "Compiled {} for the {} adapter", expression, adapter_.name());
    return compiled;
}

adapter::CompiledQuery compile(
        const FilterExpression& expression,
        const FieldDescriptorTable& fields,
        const AuthorizedFieldSet& authorized,
        const adapter::Adapter& adapter,
        const CustomFilterRegistry& custom_filters) {
    return QueryBuilder{adapter, fields, authorized, custom_filters}.compile(expression);
}

} // namespace querygate::compiler
