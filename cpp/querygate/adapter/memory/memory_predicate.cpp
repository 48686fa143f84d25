/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/adapter/memory/memory_predicate.hpp>
#include <querygate/util/preconditions.hpp>
#include <querygate/util/variant.hpp>

#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>

namespace querygate::adapter::memory {

using namespace entity;

namespace {

bool present(const Value* field) {
    return field != nullptr && !field->isNull();
}

std::string lower(std::string_view input) {
    std::string output(input);
    std::transform(output.begin(), output.end(), output.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return output;
}

bool contains_value(const Value& haystack, const Value& needle) {
    return std::any_of(haystack.begin(), haystack.end(), [&needle](const Value& item) {
        return values_equal(item, needle);
    });
}

bool string_test(const Value* field, const Value& value, bool case_insensitive, auto&& test) {
    if (!present(field) || !field->isString())
        return false;

    if (case_insensitive)
        return test(lower(field->getString()), lower(value.getString()));

    return test(std::string_view{field->getString()}, std::string_view{value.getString()});
}

bool evaluate_scalar(const Value* field, ScalarOperator op, const Value& value) {
    auto compare = [field, &value](auto&& predicate) {
        if (!present(field))
            return false;
        auto order = compare_values(*field, value);
        return order.has_value() && predicate(*order);
    };
    auto starts_with = [](std::string_view s, std::string_view prefix) { return s.starts_with(prefix); };
    auto ends_with = [](std::string_view s, std::string_view suffix) { return s.ends_with(suffix); };
    auto contains = [](std::string_view s, std::string_view part) { return s.find(part) != std::string_view::npos; };

    switch (op) {
    case ScalarOperator::EQ: return present(field) && values_equal(*field, value);
    case ScalarOperator::NEQ: return present(field) && !values_equal(*field, value);
    case ScalarOperator::GT: return compare([](int o) { return o > 0; });
    case ScalarOperator::GTE: return compare([](int o) { return o >= 0; });
    case ScalarOperator::LT: return compare([](int o) { return o < 0; });
    case ScalarOperator::LTE: return compare([](int o) { return o <= 0; });
    case ScalarOperator::IN: return present(field) && contains_value(value, *field);
    case ScalarOperator::NIN: return present(field) && !contains_value(value, *field);
    case ScalarOperator::IS_NULL: return value.getBool() != present(field);
    case ScalarOperator::LIKE:
    case ScalarOperator::ILIKE:
        return present(field) && field->isString()
            && like_match(field->getString(), value.getString(), op == ScalarOperator::ILIKE);
    case ScalarOperator::NLIKE:
    case ScalarOperator::NILIKE:
        return present(field) && field->isString()
            && !like_match(field->getString(), value.getString(), op == ScalarOperator::NILIKE);
    case ScalarOperator::STARTS_WITH: return string_test(field, value, false, starts_with);
    case ScalarOperator::ISTARTS_WITH: return string_test(field, value, true, starts_with);
    case ScalarOperator::ENDS_WITH: return string_test(field, value, false, ends_with);
    case ScalarOperator::IENDS_WITH: return string_test(field, value, true, ends_with);
    case ScalarOperator::CONTAINS: return string_test(field, value, false, contains);
    case ScalarOperator::ICONTAINS: return string_test(field, value, true, contains);
    case ScalarOperator::MATCHES:
    case ScalarOperator::SIMILAR:
    case ScalarOperator::FUZZY:
    case ScalarOperator::WITHIN_DISTANCE:
        break;
    }
    util::raise_rte("Operator {} cannot be evaluated in memory", Operator{op});
}

bool evaluate_array(const Value* field, ArrayOperator op, const Value& value) {
    const bool is_array = present(field) && field->isArray();
    switch (op) {
    case ArrayOperator::INCLUDES: return is_array && contains_value(*field, value);
    case ArrayOperator::EXCLUDES: return is_array && !contains_value(*field, value);
    case ArrayOperator::INCLUDES_ALL:
        return is_array && std::all_of(value.begin(), value.end(), [field](const Value& item) { return contains_value(*field, item); });
    case ArrayOperator::EXCLUDES_ANY:
        return is_array && !std::all_of(value.begin(), value.end(), [field](const Value& item) { return contains_value(*field, item); });
    case ArrayOperator::INCLUDES_ANY:
        return is_array && std::any_of(value.begin(), value.end(), [field](const Value& item) { return contains_value(*field, item); });
    case ArrayOperator::EXCLUDES_ALL:
        return is_array && std::none_of(value.begin(), value.end(), [field](const Value& item) { return contains_value(*field, item); });
    case ArrayOperator::IS_EMPTY: {
        const bool empty = is_array && field->empty();
        return value.getBool() == empty;
    }
    case ArrayOperator::IS_NULL: return value.getBool() != present(field);
    }
    util::raise_rte("Unknown array operator {}", static_cast<int>(op));
}

bool evaluate_json(const Value* field, JsonOperator op, const Value& value) {
    const bool is_object = present(field) && field->isObject();
    switch (op) {
    case JsonOperator::HAS_KEY: return is_object && field->get_ptr(value.getString()) != nullptr;
    case JsonOperator::HAS_ANY_KEYS:
        return is_object && std::any_of(value.begin(), value.end(), [field](const Value& key) {
            return field->get_ptr(key.getString()) != nullptr;
        });
    case JsonOperator::PATH_EXISTS: {
        std::string_view path = value.getString();
        if (path.starts_with("$."))
            path.remove_prefix(2);
        return is_object && lookup_path(*field, path) != nullptr;
    }
    case JsonOperator::IS_NULL: return value.getBool() != present(field);
    }
    util::raise_rte("Unknown json operator {}", static_cast<int>(op));
}

std::vector<std::string> describe_children(const std::vector<MemoryPredicate>& children) {
    std::vector<std::string> output;
    output.reserve(children.size());
    for (const auto& child : children)
        output.push_back(child.describe());

    return output;
}

} // namespace

MemoryPredicate MemoryPredicate::condition(std::string path, Operator op, Value value) {
    return MemoryPredicate{std::make_shared<const PredicateNode>(PredicateNode{ConditionNode{std::move(path), op, std::move(value)}})};
}

MemoryPredicate MemoryPredicate::all_of(std::vector<MemoryPredicate> children) {
    return MemoryPredicate{std::make_shared<const PredicateNode>(PredicateNode{AllOfNode{std::move(children)}})};
}

MemoryPredicate MemoryPredicate::any_of(std::vector<MemoryPredicate> children) {
    return MemoryPredicate{std::make_shared<const PredicateNode>(PredicateNode{AnyOfNode{std::move(children)}})};
}

MemoryPredicate MemoryPredicate::negation(MemoryPredicate child) {
    return MemoryPredicate{std::make_shared<const PredicateNode>(PredicateNode{NegationNode{std::move(child)}})};
}

MemoryPredicate MemoryPredicate::custom(std::string description, CustomPredicate predicate) {
    util::check_arg(static_cast<bool>(predicate), "Custom predicate '{}' has no function", description);
    return MemoryPredicate{std::make_shared<const PredicateNode>(PredicateNode{CustomNode{std::move(description), std::move(predicate)}})};
}

bool MemoryPredicate::matches(const Value& record) const {
    return util::variant_match(node_->value_,
        [&record](const ConditionNode& n) {
            const auto* field = lookup_path(record, n.path_);
            return util::variant_match(n.op_,
                [field, &n](ScalarOperator op) { return evaluate_scalar(field, op, n.value_); },
                [field, &n](ArrayOperator op) { return evaluate_array(field, op, n.value_); },
                [field, &n](JsonOperator op) { return evaluate_json(field, op, n.value_); }
            );
        },
        [&record](const AllOfNode& n) {
            return std::all_of(n.children_.begin(), n.children_.end(), [&record](const auto& c) { return c.matches(record); });
        },
        [&record](const AnyOfNode& n) {
            return std::any_of(n.children_.begin(), n.children_.end(), [&record](const auto& c) { return c.matches(record); });
        },
        [&record](const NegationNode& n) { return !n.child_.matches(record); },
        [&record](const CustomNode& n) { return n.predicate_(record); }
    );
}

Value MemoryPredicate::filter(const Value& dataset) const {
    util::check_arg(dataset.isArray(), "In-memory dataset must be a list of records, got {}", dataset.typeName());
    Value output = Value::array;
    for (const auto& record : dataset) {
        if (matches(record))
            output.push_back(record);
    }
    return output;
}

std::string MemoryPredicate::describe() const {
    return util::variant_match(node_->value_,
        [](const ConditionNode& n) { return fmt::format("{} {} {}", n.path_, n.op_, to_json(n.value_)); },
        [](const AllOfNode& n) { return fmt::format("AND({})", fmt::join(describe_children(n.children_), ", ")); },
        [](const AnyOfNode& n) { return fmt::format("OR({})", fmt::join(describe_children(n.children_), ", ")); },
        [](const NegationNode& n) { return fmt::format("NOT({})", n.child_.describe()); },
        [](const CustomNode& n) { return fmt::format("CUSTOM({})", n.description_); }
    );
}

bool evaluate_condition(const Value* field, const Operator& op, const Value& value) {
    return util::variant_match(op,
        [field, &value](ScalarOperator o) { return evaluate_scalar(field, o, value); },
        [field, &value](ArrayOperator o) { return evaluate_array(field, o, value); },
        [field, &value](JsonOperator o) { return evaluate_json(field, o, value); }
    );
}

bool like_match(std::string_view text, std::string_view pattern, bool case_insensitive) {
    auto same = [case_insensitive](char a, char b) {
        if (case_insensitive)
            return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
        return a == b;
    };

    // Iterative wildcard matching with single-star backtracking
    size_t t = 0;
    size_t p = 0;
    size_t star_p = std::string_view::npos;
    size_t star_t = 0;
    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '%') {
            star_p = p++;
            star_t = t;
            continue;
        }
        if (p < pattern.size()) {
            if (pattern[p] == '_') {
                ++p;
                ++t;
                continue;
            }
            const bool escaped = pattern[p] == '\\' && p + 1 < pattern.size();
            const char expected = escaped ? pattern[p + 1] : pattern[p];
            if (same(text[t], expected)) {
                p += escaped ? 2 : 1;
                ++t;
                continue;
            }
        }
        if (star_p == std::string_view::npos)
            return false;

        p = star_p + 1;
        t = ++star_t;
    }
    while (p < pattern.size() && pattern[p] == '%')
        ++p;

    return p == pattern.size();
}

} // namespace querygate::adapter::memory
