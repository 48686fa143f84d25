/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <gtest/gtest.h>

#include <querygate/entity/operators.hpp>
#include <querygate/util/error_code.hpp>

using namespace querygate;
using namespace querygate::entity;

TEST(Operators, NormalizesSymbols) {
    EXPECT_EQ(normalize_operator_symbol("gte"), "_gte");
    EXPECT_EQ(normalize_operator_symbol("_gte"), "_gte");
    EXPECT_EQ(normalize_operator_symbol("includesAll"), "_includes_all");
    EXPECT_EQ(normalize_operator_symbol("_isNull"), "_is_null");
}

TEST(Operators, ParsesWithinCategory) {
    EXPECT_EQ(parse_operator(FieldCategory::SCALAR, "eq"), Operator{ScalarOperator::EQ});
    EXPECT_EQ(parse_operator(FieldCategory::SCALAR, "_istartsWith"), Operator{ScalarOperator::ISTARTS_WITH});
    EXPECT_EQ(parse_operator(FieldCategory::ARRAY, "_includes_any"), Operator{ArrayOperator::INCLUDES_ANY});
    EXPECT_EQ(parse_operator(FieldCategory::JSON, "hasAnyKeys"), Operator{JsonOperator::HAS_ANY_KEYS});

    // _is_null exists in every vocabulary, as a different operator
    EXPECT_EQ(parse_operator(FieldCategory::ARRAY, "_is_null"), Operator{ArrayOperator::IS_NULL});
    EXPECT_EQ(parse_operator(FieldCategory::JSON, "_is_null"), Operator{JsonOperator::IS_NULL});

    EXPECT_FALSE(parse_operator(FieldCategory::ARRAY, "_eq").has_value());
    EXPECT_FALSE(parse_operator(FieldCategory::SCALAR, "_includes").has_value());
    EXPECT_FALSE(parse_operator(FieldCategory::SCALAR, "_between").has_value());
}

TEST(Operators, SymbolsRoundTrip) {
    for (auto category : {FieldCategory::SCALAR, FieldCategory::ARRAY, FieldCategory::JSON}) {
        for (const auto& op : all_operators(category)) {
            EXPECT_EQ(operator_category(op), category);
            EXPECT_EQ(parse_operator(category, operator_symbol(op)), op) << operator_symbol(op);
        }
    }
    EXPECT_EQ(all_operators(FieldCategory::SCALAR).size(), 23u);
    EXPECT_EQ(all_operators(FieldCategory::ARRAY).size(), 8u);
    EXPECT_EQ(all_operators(FieldCategory::JSON).size(), 4u);
}

TEST(Operators, ValueShapes) {
    EXPECT_EQ(expected_value_shape(ScalarOperator::IN), ValueShape::LIST);
    EXPECT_EQ(expected_value_shape(ScalarOperator::IS_NULL), ValueShape::BOOLEAN);
    EXPECT_EQ(expected_value_shape(ArrayOperator::INCLUDES), ValueShape::SCALAR);
    EXPECT_EQ(expected_value_shape(ArrayOperator::INCLUDES_ALL), ValueShape::LIST);
    EXPECT_EQ(expected_value_shape(JsonOperator::HAS_ANY_KEYS), ValueShape::STRING_LIST);
    EXPECT_EQ(expected_value_shape(ScalarOperator::WITHIN_DISTANCE), ValueShape::GEO_DISTANCE);

    EXPECT_TRUE(value_matches_shape(Value::array(1, "a", 2.5), ValueShape::LIST));
    EXPECT_FALSE(value_matches_shape(Value::array(1, Value::array(2)), ValueShape::LIST));
    EXPECT_FALSE(value_matches_shape(Value(nullptr), ValueShape::SCALAR));
    EXPECT_TRUE(value_matches_shape(Value::array(), ValueShape::STRING_LIST));
    EXPECT_FALSE(value_matches_shape(Value::array("a", 1), ValueShape::STRING_LIST));
    EXPECT_TRUE(value_matches_shape(Value::object("lat", 51.5)("lon", -0.1)("distance", 500), ValueShape::GEO_DISTANCE));
    EXPECT_FALSE(value_matches_shape(Value::object("lat", 51.5)("lon", -0.1)("distance", -1), ValueShape::GEO_DISTANCE));
    EXPECT_FALSE(value_matches_shape(Value::object("lat", 51.5), ValueShape::GEO_DISTANCE));
}

TEST(Operators, ListAndPatternClassification) {
    EXPECT_TRUE(takes_list(ScalarOperator::NIN));
    EXPECT_TRUE(takes_list(JsonOperator::HAS_ANY_KEYS));
    EXPECT_FALSE(takes_list(ArrayOperator::INCLUDES));
    EXPECT_TRUE(is_pattern_match(ScalarOperator::ICONTAINS));
    EXPECT_FALSE(is_pattern_match(ScalarOperator::EQ));
    EXPECT_FALSE(is_pattern_match(ArrayOperator::INCLUDES_ANY));
}
