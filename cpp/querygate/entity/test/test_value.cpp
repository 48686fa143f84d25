/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <gtest/gtest.h>

#include <querygate/entity/value.hpp>

using namespace querygate;
using namespace querygate::entity;

TEST(Value, CompareWithNumericPromotion) {
    EXPECT_EQ(compare_values(Value(1), Value(2.5)), -1);
    EXPECT_EQ(compare_values(Value(3.0), Value(3)), 0);
    EXPECT_EQ(compare_values(Value("b"), Value("a")), 1);
    EXPECT_FALSE(compare_values(Value("1"), Value(1)).has_value());
    EXPECT_FALSE(compare_values(Value(nullptr), Value(1)).has_value());
    EXPECT_TRUE(values_equal(Value(1), Value(1.0)));
    EXPECT_FALSE(values_equal(Value(1), Value("1")));
}

TEST(Value, LookupDottedPath) {
    auto record = Value::object("id", 1)("author", Value::object("name", "ada")("address", Value::object("city", "London")));
    ASSERT_NE(lookup_path(record, "author.address.city"), nullptr);
    EXPECT_EQ(*lookup_path(record, "author.address.city"), Value("London"));
    EXPECT_EQ(lookup_path(record, "author.age"), nullptr);
    EXPECT_EQ(lookup_path(record, "id.name"), nullptr);
}

TEST(Value, CanonicalJson) {
    EXPECT_EQ(to_json(Value::object("b", 1)("a", 2)), R"({"a":2,"b":1})");
}
