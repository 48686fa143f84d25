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

#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace querygate::adapter::memory {

using CustomPredicate = std::function<bool(const Value& record)>;

struct PredicateNode;

/**
 * A predicate over in-memory records (folly::dynamic objects). Immutable, copies share structure.
 */
class MemoryPredicate {
public:
    static MemoryPredicate condition(std::string path, entity::Operator op, Value value);
    static MemoryPredicate all_of(std::vector<MemoryPredicate> children);
    static MemoryPredicate any_of(std::vector<MemoryPredicate> children);
    static MemoryPredicate negation(MemoryPredicate child);
    /// Opaque predicate, compared by its description
    static MemoryPredicate custom(std::string description, CustomPredicate predicate);

    static MemoryPredicate always() { return all_of({}); }

    [[nodiscard]] bool matches(const Value& record) const;

    /// Records of the dataset (an array) that match, in their original order
    [[nodiscard]] Value filter(const Value& dataset) const;

    /// Canonical rendering, also the structural identity of the predicate
    [[nodiscard]] std::string describe() const;

    [[nodiscard]] const PredicateNode& node() const { return *node_; }

    bool operator==(const MemoryPredicate& other) const {
        return node_ == other.node_ || describe() == other.describe();
    }

private:
    explicit MemoryPredicate(std::shared_ptr<const PredicateNode> node) :
        node_(std::move(node)) {
    }

    std::shared_ptr<const PredicateNode> node_;
};

struct ConditionNode {
    std::string path_;
    entity::Operator op_;
    Value value_;
};

struct AllOfNode {
    std::vector<MemoryPredicate> children_;
};

struct AnyOfNode {
    std::vector<MemoryPredicate> children_;
};

struct NegationNode {
    MemoryPredicate child_;
};

struct CustomNode {
    std::string description_;
    CustomPredicate predicate_;
};

struct PredicateNode {
    std::variant<ConditionNode, AllOfNode, AnyOfNode, NegationNode, CustomNode> value_;
};

/// Evaluates one operator against the field value found in a record. field is nullptr when the field is missing.
bool evaluate_condition(const Value* field, const entity::Operator& op, const Value& value);

/// SQL LIKE semantics: % matches any run, _ any single character, backslash escapes
bool like_match(std::string_view text, std::string_view pattern, bool case_insensitive);

} // namespace querygate::adapter::memory
