/**
 * @file test_operation.cpp
 * @brief Tests for the patch operation JSON codec (GoogleTest)
 */

#include <gtest/gtest.h>
#include "jpatch/Operation.hpp"
#include "jpatch/Errors.hpp"

#include <string>

using namespace jpatch;

// ============================================================================
// parse_operation - each kind
// ============================================================================

TEST(ParseOperation, Add) {
    auto op = parse_operation(Value{{"op", "add"}, {"path", "/a"}, {"value", {{"k", 1}}}});
    ASSERT_TRUE(std::holds_alternative<AddOp>(op));
    const auto& add = std::get<AddOp>(op);
    EXPECT_EQ(add.path, "/a");
    EXPECT_EQ(add.value, (Value{{"k", 1}}));
}

TEST(ParseOperation, Remove) {
    auto op = parse_operation(Value{{"op", "remove"}, {"path", "/a/0"}});
    ASSERT_TRUE(std::holds_alternative<RemoveOp>(op));
    EXPECT_EQ(std::get<RemoveOp>(op).path, "/a/0");
}

TEST(ParseOperation, Replace) {
    auto op = parse_operation(Value{{"op", "replace"}, {"path", "/a"}, {"value", 3}});
    ASSERT_TRUE(std::holds_alternative<ReplaceOp>(op));
    EXPECT_EQ(std::get<ReplaceOp>(op).value, 3);
}

TEST(ParseOperation, MoveAndCopy) {
    auto mv = parse_operation(Value{{"op", "move"}, {"from", "/a"}, {"path", "/b"}});
    ASSERT_TRUE(std::holds_alternative<MoveOp>(mv));
    EXPECT_EQ(std::get<MoveOp>(mv).from, "/a");
    EXPECT_EQ(std::get<MoveOp>(mv).path, "/b");

    auto cp = parse_operation(Value{{"op", "copy"}, {"from", "/x"}, {"path", "/y"}});
    ASSERT_TRUE(std::holds_alternative<CopyOp>(cp));
    EXPECT_EQ(std::get<CopyOp>(cp).from, "/x");
    EXPECT_EQ(std::get<CopyOp>(cp).path, "/y");
}

TEST(ParseOperation, Test) {
    auto op = parse_operation(Value{{"op", "test"}, {"path", "/a"}, {"value", "x"}});
    ASSERT_TRUE(std::holds_alternative<TestOp>(op));
    EXPECT_EQ(std::get<TestOp>(op).value, "x");
}

TEST(ParseOperation, NullValueIsAllowed) {
    auto op = parse_operation(Value{{"op", "add"}, {"path", "/a"}, {"value", nullptr}});
    ASSERT_TRUE(std::holds_alternative<AddOp>(op));
    EXPECT_TRUE(std::get<AddOp>(op).value.is_null());
}

TEST(ParseOperation, ExtraMembersAreIgnored) {
    auto op = parse_operation(Value{{"op", "remove"}, {"path", "/a"}, {"comment", "bye"}});
    EXPECT_TRUE(std::holds_alternative<RemoveOp>(op));
}

// ============================================================================
// parse_operation - errors
// ============================================================================

TEST(ParseOperationErrors, UnknownOpIsRejected) {
    try {
        parse_operation(Value{{"op", "frobnicate"}, {"path", "/a"}});
        FAIL() << "Should have thrown InvalidOperation";
    } catch (const InvalidOperation& e) {
        EXPECT_STREQ(e.what(), "Unknown operation: frobnicate");
    }
}

TEST(ParseOperationErrors, MissingOp) {
    EXPECT_THROW(parse_operation(Value{{"path", "/a"}}), InvalidOperation);
    EXPECT_THROW(parse_operation(Value{{"op", 1}, {"path", "/a"}}), InvalidOperation);
}

TEST(ParseOperationErrors, NotAnObject) {
    EXPECT_THROW(parse_operation(Value::array({1, 2})), InvalidOperation);
    EXPECT_THROW(parse_operation(Value("add")), InvalidOperation);
}

TEST(ParseOperationErrors, MissingValue) {
    try {
        parse_operation(Value{{"op", "add"}, {"path", "/a"}});
        FAIL() << "Should have thrown InvalidOperation";
    } catch (const InvalidOperation& e) {
        EXPECT_STREQ(e.what(), "Missing 'value' in add operation");
    }
}

TEST(ParseOperationErrors, MissingFrom) {
    EXPECT_THROW(parse_operation(Value{{"op", "move"}, {"path", "/b"}}), InvalidOperation);
    EXPECT_THROW(parse_operation(Value{{"op", "copy"}, {"path", "/b"}}), InvalidOperation);
}

TEST(ParseOperationErrors, PathMustBeString) {
    try {
        parse_operation(Value{{"op", "remove"}, {"path", 3}});
        FAIL() << "Should have thrown InvalidOperation";
    } catch (const InvalidOperation& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("'path' must be a string"), std::string::npos);
        EXPECT_NE(msg.find("integer"), std::string::npos);
    }
}

// ============================================================================
// parse_patch
// ============================================================================

TEST(ParsePatch, KeepsOrder) {
    Value patch = Value::array({
        {{"op", "add"}, {"path", "/baz"}, {"value", 0}},
        {{"op", "remove"}, {"path", "/foo"}},
        {{"op", "test"}, {"path", "/baz"}, {"value", 0}}
    });
    auto ops = parse_patch(patch);
    ASSERT_EQ(ops.size(), 3u);
    EXPECT_EQ(op_name(ops[0]), "add");
    EXPECT_EQ(op_name(ops[1]), "remove");
    EXPECT_EQ(op_name(ops[2]), "test");
}

TEST(ParsePatch, EmptyArray) {
    EXPECT_TRUE(parse_patch(Value::array()).empty());
}

TEST(ParsePatch, NotAnArray) {
    EXPECT_THROW(parse_patch(Value::object()), InvalidOperation);
}

TEST(ParsePatch, ErrorNamesFailingIndex) {
    Value patch = Value::array({
        {{"op", "remove"}, {"path", "/a"}},
        {{"op", "nope"}, {"path", "/b"}}
    });
    try {
        parse_patch(patch);
        FAIL() << "Should have thrown InvalidOperation";
    } catch (const InvalidOperation& e) {
        EXPECT_STREQ(e.what(), "Operation 1: Unknown operation: nope");
    }
}

// ============================================================================
// to_json / op_name
// ============================================================================

TEST(OperationToJson, Shapes) {
    EXPECT_EQ(to_json(Operation{AddOp{"/a", 1}}),
              (Value{{"op", "add"}, {"path", "/a"}, {"value", 1}}));
    EXPECT_EQ(to_json(Operation{RemoveOp{"/a"}}),
              (Value{{"op", "remove"}, {"path", "/a"}}));
    EXPECT_EQ(to_json(Operation{MoveOp{"/a", "/b"}}),
              (Value{{"op", "move"}, {"from", "/a"}, {"path", "/b"}}));
    EXPECT_EQ(to_json(Operation{TestOp{"/a", nullptr}}),
              (Value{{"op", "test"}, {"path", "/a"}, {"value", nullptr}}));
}

TEST(OperationToJson, PatchDecodesBackToSameShape) {
    Value patch = Value::array({
        {{"op", "copy"}, {"from", "/a"}, {"path", "/b"}},
        {{"op", "replace"}, {"path", "/b"}, {"value", Value::array({1, 2})}}
    });
    EXPECT_EQ(to_json(parse_patch(patch)), patch);
}

TEST(OpName, AllKinds) {
    EXPECT_EQ(op_name(AddOp{"/a", 1}), "add");
    EXPECT_EQ(op_name(RemoveOp{"/a"}), "remove");
    EXPECT_EQ(op_name(ReplaceOp{"/a", 1}), "replace");
    EXPECT_EQ(op_name(MoveOp{"/a", "/b"}), "move");
    EXPECT_EQ(op_name(CopyOp{"/a", "/b"}), "copy");
    EXPECT_EQ(op_name(TestOp{"/a", 1}), "test");
}
