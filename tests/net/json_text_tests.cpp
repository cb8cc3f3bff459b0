/**
 * @file json_text_tests.cpp
 * @brief Unit tests for the JSON text helpers
 */

#include <gtest/gtest.h>
#include "nightfall/net/json_text.h"

using namespace nightfall;
using namespace nightfall::net;

// ============================================================================
// Reading
// ============================================================================

TEST(JsonTextTest, ObjectMembersInDocumentOrder) {
    auto members = json::object_members(R"({"b":1, "a":"x", "c":{"d":[1,2]}})");
    ASSERT_TRUE(members.has_value());
    ASSERT_EQ(members->size(), 3u);
    EXPECT_EQ((*members)[0].first, "b");
    EXPECT_EQ((*members)[0].second, "1");
    EXPECT_EQ((*members)[1].first, "a");
    EXPECT_EQ((*members)[1].second, "\"x\"");
    EXPECT_EQ((*members)[2].first, "c");
    EXPECT_EQ((*members)[2].second, R"({"d":[1,2]})");
}

TEST(JsonTextTest, EmptyObject) {
    auto members = json::object_members("  { }  ");
    ASSERT_TRUE(members.has_value());
    EXPECT_TRUE(members->empty());
}

TEST(JsonTextTest, MalformedObjects) {
    EXPECT_FALSE(json::object_members("").has_value());
    EXPECT_FALSE(json::object_members("[1]").has_value());
    EXPECT_FALSE(json::object_members(R"({"a":1)").has_value());
    EXPECT_FALSE(json::object_members(R"({"a" 1})").has_value());
    EXPECT_FALSE(json::object_members(R"({"a":1} trailing)").has_value());
}

TEST(JsonTextTest, NestedKeyDoesNotShadowTopLevel) {
    std::string text = R"({"inner":{"id":"nested"},"id":"outer"})";
    EXPECT_EQ(json::find_string(text, "id"), "outer");

    std::string only_nested = R"({"inner":{"id":"nested"}})";
    EXPECT_FALSE(json::find_raw(only_nested, "id").has_value());
}

TEST(JsonTextTest, BracesInsideStringsAreIgnored) {
    std::string text = R"({"message":"a } and { b","id":"m1"})";
    EXPECT_EQ(json::find_string(text, "message"), "a } and { b");
    EXPECT_EQ(json::find_string(text, "id"), "m1");
}

TEST(JsonTextTest, ArrayElements) {
    auto elements = json::array_elements(R"([1, "two", {"three":3}, [4]])");
    ASSERT_TRUE(elements.has_value());
    ASSERT_EQ(elements->size(), 4u);
    EXPECT_EQ((*elements)[1], "\"two\"");
    EXPECT_EQ((*elements)[2], R"({"three":3})");
    EXPECT_EQ((*elements)[3], "[4]");

    EXPECT_TRUE(json::array_elements("[]")->empty());
    EXPECT_FALSE(json::array_elements("[1,").has_value());
}

TEST(JsonTextTest, TypedLookups) {
    std::string text = R"({"n":42,"s":"17","t":true,"f":false,"z":null})";
    EXPECT_EQ(json::find_int(text, "n"), 42);
    EXPECT_EQ(json::find_int(text, "s"), 17);
    EXPECT_EQ(json::find_int(text, "missing", -1), -1);
    EXPECT_TRUE(json::find_bool(text, "t"));
    EXPECT_FALSE(json::find_bool(text, "f", true));
    EXPECT_TRUE(json::find_bool(text, "n", true));
    EXPECT_EQ(json::find_string(text, "z", "fallback"), "fallback");
}

TEST(JsonTextTest, ToIntRejectsNonNumbers) {
    EXPECT_EQ(json::to_int("\"abc\"", 5), 5);
    EXPECT_EQ(json::to_int("-12"), -12);
    EXPECT_EQ(json::to_int("true", 3), 3);
}

TEST(JsonTextTest, UnquoteEscapes) {
    EXPECT_EQ(json::unquote(R"("line\nbreak")"), "line\nbreak");
    EXPECT_EQ(json::unquote(R"("say \"hi\"")"), "say \"hi\"");
    EXPECT_EQ(json::unquote(R"("é")"), "\xC3\xA9");
    EXPECT_EQ(json::unquote(R"("😀")"), "\xF0\x9F\x98\x80");
    EXPECT_EQ(json::unquote("123"), "123");
}

// ============================================================================
// Writing
// ============================================================================

TEST(JsonTextTest, QuoteEscapesControlCharacters) {
    EXPECT_EQ(json::quote("plain"), "\"plain\"");
    EXPECT_EQ(json::quote("a\"b\\c"), R"("a\"b\\c")");
    EXPECT_EQ(json::quote("tab\there"), R"("tab\there")");
    EXPECT_EQ(json::quote(std::string(1, '\x01')), R"("\u0001")");
}

TEST(JsonTextTest, QuoteThenUnquoteRestoresText) {
    std::string text = "multi\nline \"quoted\" \\ text";
    EXPECT_EQ(json::unquote(json::quote(text)), text);
}

TEST(JsonTextTest, ObjectBuilder) {
    json::ObjectBuilder builder;
    builder.add("name", "alice")
           .add_int("count", 3)
           .add_bool("ok", true)
           .add_raw("list", "[1,2]")
           .add_raw("empty", "");
    EXPECT_EQ(builder.str(), R"({"name":"alice","count":3,"ok":true,"list":[1,2],"empty":null})");

    EXPECT_EQ(json::ObjectBuilder().str(), "{}");
}

TEST(JsonTextTest, MakeArray) {
    EXPECT_EQ(json::make_array({}), "[]");
    EXPECT_EQ(json::make_array({"1", "\"a\""}), R"([1,"a"])");
}
