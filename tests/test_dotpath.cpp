/**
 * @file test_dotpath.cpp
 * @brief Tests for dot-path utilities using Google Test
 */

#include <gtest/gtest.h>
#include "patchmaker/DotPath.hpp"

using namespace patchmaker;

// ============================================================================
// split_dot_path
// ============================================================================

TEST(SplitDotPath, Basic) {
    auto segs = split_dot_path("metadata.annotations.owner");
    ASSERT_EQ(segs.size(), 3u);
    EXPECT_EQ(segs[0], "metadata");
    EXPECT_EQ(segs[1], "annotations");
    EXPECT_EQ(segs[2], "owner");
}

TEST(SplitDotPath, EmptyAndRepeatedDots) {
    EXPECT_TRUE(split_dot_path("").empty());
    EXPECT_EQ(split_dot_path("a..b"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(split_dot_path(".a."), (std::vector<std::string>{"a"}));
}

// ============================================================================
// find_by_dot
// ============================================================================

TEST(FindByDot, ObjectsAndArrays) {
    Value doc = Value::parse(R"({"spec":{"ports":[{"name":"http"},{"name":"https"}]}})");

    const Value* name = find_by_dot(doc, "spec.ports.1.name");
    ASSERT_NE(name, nullptr);
    EXPECT_EQ(*name, "https");

    EXPECT_EQ(find_by_dot(doc, ""), &doc);
}

TEST(FindByDot, MissingPathsReturnNull) {
    Value doc = {{"a", {{"b", 1}}}, {"list", {1, 2}}};

    EXPECT_EQ(find_by_dot(doc, "a.c"), nullptr);
    EXPECT_EQ(find_by_dot(doc, "a.b.c"), nullptr);  // through a scalar
    EXPECT_EQ(find_by_dot(doc, "list.2"), nullptr);
    EXPECT_EQ(find_by_dot(doc, "list.01"), nullptr);
    EXPECT_EQ(find_by_dot(doc, "list.x"), nullptr);
}

TEST(FindByDot, OverflowingIndexReturnsNull) {
    Value doc = {{"items", {"a", "b"}}};
    EXPECT_EQ(find_by_dot(doc, "items.18446744073709551617"), nullptr);
    EXPECT_EQ(find_by_dot(doc, "items.184467440737095516160"), nullptr);
}

// ============================================================================
// set_by_dot
// ============================================================================

TEST(SetByDot, CreatesIntermediates) {
    Value doc = Value::object();
    set_by_dot(doc, "metadata.annotations.owner", "ops");
    EXPECT_EQ(doc, Value::parse(R"({"metadata":{"annotations":{"owner":"ops"}}})"));
}

TEST(SetByDot, OverwritesNonObjectIntermediate) {
    Value doc = {{"log", "loud"}};
    set_by_dot(doc, "log.level", "debug");
    EXPECT_EQ(doc["log"]["level"], "debug");
}

TEST(SetByDot, EmptyPathReplacesRoot) {
    Value doc = {{"a", 1}};
    set_by_dot(doc, "", Value({1, 2}));
    EXPECT_EQ(doc, Value({1, 2}));
}

// ============================================================================
// erase_by_dot
// ============================================================================

TEST(EraseByDot, RemovesNestedKey) {
    Value doc = {{"metadata", {{"name", "web"}, {"generation", 3}}}};
    EXPECT_TRUE(erase_by_dot(doc, "metadata.generation"));
    EXPECT_EQ(doc, Value::parse(R"({"metadata":{"name":"web"}})"));
}

TEST(EraseByDot, RemovesArrayElement) {
    Value doc = {{"items", {"a", "b", "c"}}};
    EXPECT_TRUE(erase_by_dot(doc, "items.1"));
    EXPECT_EQ(doc["items"], Value({"a", "c"}));
}

TEST(EraseByDot, MissingPathIsNoOp) {
    Value doc = {{"a", {{"b", 1}}}};
    const Value before = doc;

    EXPECT_FALSE(erase_by_dot(doc, "status"));
    EXPECT_FALSE(erase_by_dot(doc, "a.b.c"));
    EXPECT_FALSE(erase_by_dot(doc, "x.y"));
    EXPECT_FALSE(erase_by_dot(doc, ""));
    EXPECT_EQ(doc, before);
}

TEST(EraseByDot, OverflowingIndexIsMissing) {
    Value doc = {{"items", {"keep", "also"}}};
    const Value before = doc;

    // 2^64 and 2^64 + 1 would wrap to 0 and 1 in a 64-bit size_t
    EXPECT_FALSE(erase_by_dot(doc, "items.18446744073709551616"));
    EXPECT_FALSE(erase_by_dot(doc, "items.18446744073709551617"));
    EXPECT_FALSE(erase_by_dot(doc, "items.99999999999999999999999999"));
    EXPECT_EQ(doc, before);
}
