/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <gtest/gtest.h>

#include <querygate/filter/filter_parser.hpp>
#include <querygate/util/error_code.hpp>

using namespace querygate;
using namespace querygate::entity;
using namespace querygate::filter;

namespace {

FieldDescriptorTable test_fields() {
    return FieldDescriptorTable{
        FieldDescriptor::storage("age", FieldType::scalar(FieldKind::INTEGER)),
        FieldDescriptor::storage("status", FieldType::scalar(FieldKind::STRING)),
        FieldDescriptor::storage("tags", FieldType::array(FieldKind::STRING)),
        FieldDescriptor::storage("meta", FieldType::json())
    };
}

} // namespace

TEST(FilterParser, SingleFieldIsALeaf) {
    auto fields = test_fields();
    auto expr = parse(Value(Value::object("age", Value(Value::object("gte", 18)))), fields);
    const auto* leaf = std::get_if<LeafNode>(&expr.node().value_);
    ASSERT_NE(leaf, nullptr);
    EXPECT_EQ(leaf->field_, "age");
    ASSERT_EQ(leaf->operators_.size(), 1u);
    EXPECT_EQ(leaf->operators_.begin()->first, Operator{ScalarOperator::GTE});
    EXPECT_EQ(leaf->operators_.begin()->second, Value(18));
}

TEST(FilterParser, SiblingFieldsAreConjoinedInKeyOrder) {
    auto fields = test_fields();
    auto expr = parse_json(R"({"status": {"_eq": "active"}, "age": {"_gt": 1, "_lt": 99}})", fields);
    const auto* conjunction = std::get_if<AndNode>(&expr.node().value_);
    ASSERT_NE(conjunction, nullptr);
    ASSERT_EQ(conjunction->children_.size(), 2u);
    EXPECT_EQ(expr.referenced_fields(), (std::vector<std::string>{"age", "status"}));
    EXPECT_EQ(expr.leaf_count(), 2u);
}

TEST(FilterParser, Combinators) {
    auto fields = test_fields();
    auto expr = parse_json(R"({
        "_or": [
            {"status": {"_eq": "active"}},
            {"_not": {"tags": {"_includes": "vip"}}}
        ]
    })", fields);
    const auto* disjunction = std::get_if<OrNode>(&expr.node().value_);
    ASSERT_NE(disjunction, nullptr);
    ASSERT_EQ(disjunction->children_.size(), 2u);
    EXPECT_NE(std::get_if<NotNode>(&disjunction->children_[1].node().value_), nullptr);
    EXPECT_EQ(expr.to_string(), R"({"_or":[{"status":{"_eq":"active"}},{"_not":{"tags":{"_includes":"vip"}}}]})");
}

TEST(FilterParser, OperatorsAreResolvedPerCategory) {
    auto fields = test_fields();
    auto expr = parse_json(R"({"tags": {"includesAll": ["a", "b"]}, "meta": {"_has_key": "owner"}})", fields);
    const auto& children = std::get<AndNode>(expr.node().value_).children_;
    EXPECT_EQ(std::get<LeafNode>(children[0].node().value_).operators_.begin()->first, Operator{JsonOperator::HAS_KEY});
    EXPECT_EQ(std::get<LeafNode>(children[1].node().value_).operators_.begin()->first, Operator{ArrayOperator::INCLUDES_ALL});
}

TEST(FilterParser, EqualDocumentsGiveEqualTrees) {
    auto fields = test_fields();
    auto left = parse_json(R"({"age": {"_gte": 18}, "status": {"_in": ["a", "b"]}})", fields);
    auto right = parse_json(R"({"status": {"_in": ["a", "b"]}, "age": {"_gte": 18}})", fields);
    EXPECT_EQ(left, right);
    auto different = parse_json(R"({"status": {"_in": ["a"]}, "age": {"_gte": 18}})", fields);
    EXPECT_FALSE(left == different);
}

TEST(FilterParser, StructuralErrors) {
    auto fields = test_fields();
    EXPECT_THROW(parse_json(R"({"_xor": []})", fields), StructuralException);
    EXPECT_THROW(parse_json(R"({"salary": {"_eq": 1}})", fields), StructuralException);
    EXPECT_THROW(parse_json(R"({"age": {"_includes": 1}})", fields), StructuralException);
    EXPECT_THROW(parse_json(R"({"tags": {"_eq": "a"}})", fields), StructuralException);
    EXPECT_THROW(parse_json(R"({"age": {"_in": 3}})", fields), StructuralException);
    EXPECT_THROW(parse_json(R"({"age": {}})", fields), StructuralException);
    EXPECT_THROW(parse_json(R"({"_and": {"age": {"_eq": 1}}})", fields), StructuralException);
    EXPECT_THROW(parse_json(R"({"age": {"_eq": 1, "eq": 2}})", fields), StructuralException);
    EXPECT_THROW(parse_json(R"([1, 2])", fields), StructuralException);
    EXPECT_THROW(parse_json("{not json", fields), StructuralException);
}

TEST(FilterParser, EmptyCombinatorsAreKept) {
    auto fields = test_fields();
    auto expr = parse_json(R"({"_and": []})", fields);
    const auto* conjunction = std::get_if<AndNode>(&expr.node().value_);
    ASSERT_NE(conjunction, nullptr);
    EXPECT_TRUE(conjunction->children_.empty());
    EXPECT_EQ(expr.leaf_count(), 0u);
}
