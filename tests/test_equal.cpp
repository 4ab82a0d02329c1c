/**
 * @file test_equal.cpp
 * @brief Tests for structural equality using Google Test
 */

#include <gtest/gtest.h>
#include "jpatch/Equal.hpp"

#include <limits>

using namespace jpatch;

namespace {
    const double kNaN = std::numeric_limits<double>::quiet_NaN();
}

// ============================================================================
// Primitives
// ============================================================================

TEST(IsEqual, Numbers) {
    EXPECT_TRUE(is_equal(Value(42), Value(42)));
    EXPECT_FALSE(is_equal(Value(42), Value(100)));
}

TEST(IsEqual, IntegerEqualsFloatOfSameValue) {
    EXPECT_TRUE(is_equal(Value(1), Value(1.0)));
    EXPECT_TRUE(is_equal(Value(3u), Value(3)));
}

TEST(IsEqual, Strings) {
    EXPECT_TRUE(is_equal(Value("hello"), Value("hello")));
    EXPECT_FALSE(is_equal(Value("hello"), Value("world")));
}

TEST(IsEqual, Booleans) {
    EXPECT_TRUE(is_equal(Value(true), Value(true)));
    EXPECT_TRUE(is_equal(Value(false), Value(false)));
    EXPECT_FALSE(is_equal(Value(true), Value(false)));
}

TEST(IsEqual, Null) {
    EXPECT_TRUE(is_equal(Value(nullptr), Value(nullptr)));
    EXPECT_FALSE(is_equal(Value(nullptr), Value(false)));
    EXPECT_FALSE(is_equal(Value(nullptr), Value(0)));
}

TEST(IsEqual, NaNEqualsNaN) {
    EXPECT_TRUE(is_equal(Value(kNaN), Value(kNaN)));
    EXPECT_FALSE(is_equal(Value(kNaN), Value(123)));
    EXPECT_FALSE(is_equal(Value(123), Value(kNaN)));
}

TEST(IsEqual, NoTypeCoercion) {
    EXPECT_FALSE(is_equal(Value(42), Value("42")));
    EXPECT_FALSE(is_equal(Value(1), Value(true)));
    EXPECT_FALSE(is_equal(Value::array(), Value::object()));
}

// ============================================================================
// Objects
// ============================================================================

TEST(IsEqual, EmptyObjects) {
    EXPECT_TRUE(is_equal(Value::object(), Value::object()));
}

TEST(IsEqual, KeyOrderIsIgnored) {
    Value a = {{"a", 1}, {"b", 2}};
    Value b = Value::object();
    b["b"] = 2;
    b["a"] = 1;
    EXPECT_TRUE(is_equal(a, b));
}

TEST(IsEqual, DifferentKeys) {
    EXPECT_FALSE(is_equal(Value{{"a", 1}}, Value{{"b", 1}}));
}

TEST(IsEqual, ExtraKey) {
    EXPECT_FALSE(is_equal(Value{{"a", 1}}, Value{{"a", 1}, {"b", 2}}));
    EXPECT_FALSE(is_equal(Value{{"a", 1}, {"b", 2}}, Value{{"a", 1}}));
}

TEST(IsEqual, NestedObjects) {
    Value a = {{"a", {{"b", 2}, {"c", 3}}}};
    Value same = {{"a", {{"b", 2}, {"c", 3}}}};
    Value other = {{"a", {{"b", 2}, {"c", 4}}}};
    EXPECT_TRUE(is_equal(a, same));
    EXPECT_FALSE(is_equal(a, other));
}

// ============================================================================
// Arrays
// ============================================================================

TEST(IsEqual, Arrays) {
    EXPECT_TRUE(is_equal(Value::array({1, 2, 3}), Value::array({1, 2, 3})));
    EXPECT_TRUE(is_equal(Value::array(), Value::array()));
    EXPECT_FALSE(is_equal(Value::array({1, 2}), Value::array({1, 2, 3})));
    EXPECT_FALSE(is_equal(Value::array({1, 2, 3}), Value::array({1, 2, 4})));
    EXPECT_FALSE(is_equal(Value::array({"1", "2"}), Value::array({1, 2})));
}

TEST(IsEqual, ArrayOrderMatters) {
    EXPECT_FALSE(is_equal(Value::array({1, 2}), Value::array({2, 1})));
}

TEST(IsEqual, ArraysOfNestedObjects) {
    Value a = Value::array({
        {{"id", 1}, {"meta", {{"active", true}, {"tags", Value::array({"test", "beta"})}}}},
        {{"id", 2}, {"meta", {{"active", false}, {"tags", Value::array({"release"})}}}}
    });
    Value same = a;
    Value other = a;
    other[0]["meta"]["tags"][1] = "prod";

    EXPECT_TRUE(is_equal(a, same));
    EXPECT_FALSE(is_equal(a, other));
}

TEST(IsEqual, NaNInsideContainers) {
    EXPECT_TRUE(is_equal(Value::array({kNaN}), Value::array({kNaN})));
    EXPECT_TRUE(is_equal(Value{{"x", kNaN}}, Value{{"x", kNaN}}));
}
