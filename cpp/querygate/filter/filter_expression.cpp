/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/filter/filter_expression.hpp>
#include <querygate/util/variant.hpp>

#include <algorithm>

namespace querygate::filter {

namespace {

void collect_fields(const FilterExpression& expr, std::vector<std::string>& fields) {
    util::variant_match(expr.node().value_,
        [&fields](const AndNode& n) { for (const auto& c : n.children_) collect_fields(c, fields); },
        [&fields](const OrNode& n) { for (const auto& c : n.children_) collect_fields(c, fields); },
        [&fields](const NotNode& n) { collect_fields(n.child_, fields); },
        [&fields](const LeafNode& n) {
            if (std::find(fields.begin(), fields.end(), n.field_) == fields.end())
                fields.push_back(n.field_);
        }
    );
}

Value children_to_dynamic(const std::vector<FilterExpression>& children) {
    Value output = Value::array;
    for (const auto& child : children)
        output.push_back(child.to_dynamic());

    return output;
}

bool children_equal(const std::vector<FilterExpression>& left, const std::vector<FilterExpression>& right) {
    return left.size() == right.size() && std::equal(left.begin(), left.end(), right.begin());
}

} // namespace

FilterExpression FilterExpression::all_of(std::vector<FilterExpression> children) {
    return FilterExpression{std::make_shared<const FilterNode>(FilterNode{AndNode{std::move(children)}})};
}

FilterExpression FilterExpression::any_of(std::vector<FilterExpression> children) {
    return FilterExpression{std::make_shared<const FilterNode>(FilterNode{OrNode{std::move(children)}})};
}

FilterExpression FilterExpression::negation(FilterExpression child) {
    return FilterExpression{std::make_shared<const FilterNode>(FilterNode{NotNode{std::move(child)}})};
}

FilterExpression FilterExpression::leaf(std::string field, OperatorMap operators) {
    return FilterExpression{std::make_shared<const FilterNode>(FilterNode{LeafNode{std::move(field), std::move(operators)}})};
}

size_t FilterExpression::leaf_count() const {
    return util::variant_match(node_->value_,
        [](const AndNode& n) {
            size_t count = 0;
            for (const auto& c : n.children_) count += c.leaf_count();
            return count;
        },
        [](const OrNode& n) {
            size_t count = 0;
            for (const auto& c : n.children_) count += c.leaf_count();
            return count;
        },
        [](const NotNode& n) { return n.child_.leaf_count(); },
        [](const LeafNode&) { return size_t{1}; }
    );
}

std::vector<std::string> FilterExpression::referenced_fields() const {
    std::vector<std::string> fields;
    collect_fields(*this, fields);
    return fields;
}

Value FilterExpression::to_dynamic() const {
    return util::variant_match(node_->value_,
        [](const AndNode& n) -> Value { return Value::object("_and", children_to_dynamic(n.children_)); },
        [](const OrNode& n) -> Value { return Value::object("_or", children_to_dynamic(n.children_)); },
        [](const NotNode& n) -> Value { return Value::object("_not", n.child_.to_dynamic()); },
        [](const LeafNode& n) -> Value {
            Value ops = Value::object;
            for (const auto& [op, value] : n.operators_)
                ops[std::string{entity::operator_symbol(op)}] = value;

            return Value::object(n.field_, std::move(ops));
        }
    );
}

std::string FilterExpression::to_string() const {
    return entity::to_json(to_dynamic());
}

bool FilterExpression::operator==(const FilterExpression& other) const {
    if (node_ == other.node_)
        return true;

    const auto& left = node_->value_;
    const auto& right = other.node_->value_;
    if (left.index() != right.index())
        return false;

    return util::variant_match(left,
        [&right](const AndNode& n) { return children_equal(n.children_, std::get<AndNode>(right).children_); },
        [&right](const OrNode& n) { return children_equal(n.children_, std::get<OrNode>(right).children_); },
        [&right](const NotNode& n) { return n.child_ == std::get<NotNode>(right).child_; },
        [&right](const LeafNode& n) {
            const auto& other_leaf = std::get<LeafNode>(right);
            return n.field_ == other_leaf.field_ && n.operators_ == other_leaf.operators_;
        }
    );
}

} // namespace querygate::filter
