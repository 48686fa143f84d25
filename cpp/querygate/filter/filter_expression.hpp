/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/entity/operators.hpp>
#include <querygate/entity/value.hpp>

#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace querygate::filter {

using entity::Operator;

/// Operators applied to one field, implicitly ANDed. Ordered so that equal inputs give equal trees.
using OperatorMap = std::map<Operator, Value>;

struct FilterNode;

/**
 * Immutable filter tree. Copies share structure, nothing in the tree can be mutated after construction.
 */
class FilterExpression {
public:
    static FilterExpression all_of(std::vector<FilterExpression> children);
    static FilterExpression any_of(std::vector<FilterExpression> children);
    static FilterExpression negation(FilterExpression child);
    static FilterExpression leaf(std::string field, OperatorMap operators);

    [[nodiscard]] const FilterNode& node() const { return *node_; }

    /// Number of leaves
    [[nodiscard]] size_t leaf_count() const;

    /// Field names referenced by leaves, in order of first appearance
    [[nodiscard]] std::vector<std::string> referenced_fields() const;

    /// Renders back to the input document shape
    [[nodiscard]] Value to_dynamic() const;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const FilterExpression& other) const;

private:
    explicit FilterExpression(std::shared_ptr<const FilterNode> node) :
        node_(std::move(node)) {
    }

    std::shared_ptr<const FilterNode> node_;
};

struct AndNode {
    std::vector<FilterExpression> children_;
};

struct OrNode {
    std::vector<FilterExpression> children_;
};

struct NotNode {
    FilterExpression child_;
};

struct LeafNode {
    std::string field_;
    OperatorMap operators_;
};

struct FilterNode {
    std::variant<AndNode, OrNode, NotNode, LeafNode> value_;
};

} // namespace querygate::filter

namespace fmt {
template<>
struct formatter<querygate::filter::FilterExpression> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const querygate::filter::FilterExpression& expr, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "{}", expr.to_string());
    }
};
}
