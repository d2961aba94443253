#include <docgate/core/json.hpp>
#include <gtest/gtest.h>

using namespace docgate;

TEST(JsonTest, ParsesNestedDocument) {
    Json j = Json::parse("{\"name\": \"Docs\", \"n\": 3, \"ok\": true, \"list\": [1, 2.5, null],"
                         " \"obj\": {\"k\": \"v\"}}");
    ASSERT_TRUE(j.is_object());
    EXPECT_EQ("Docs", j.get_string("name"));
    EXPECT_EQ(3, j.get_int("n"));
    EXPECT_TRUE(j.get_bool("ok"));
    ASSERT_TRUE(j["list"].is_array());
    EXPECT_EQ(3u, j["list"].size());
    EXPECT_DOUBLE_EQ(2.5, j["list"][1].as_number());
    EXPECT_TRUE(j["list"][2].is_null());
    EXPECT_EQ("v", j["obj"].get_string("k"));
}

TEST(JsonTest, MissingKeysReturnNullAndDefaults) {
    Json j = Json::parse("{\"a\": 1}");
    EXPECT_TRUE(j["missing"].is_null());
    EXPECT_TRUE(j["missing"]["deeper"].is_null());
    EXPECT_EQ("fallback", j.get_string("missing", "fallback"));
    EXPECT_EQ(7, j.get_int("missing", 7));
    EXPECT_FALSE(j.has("missing"));
    EXPECT_TRUE(j.has("a"));
}

TEST(JsonTest, DecodesEscapesAndSurrogatePairs) {
    Json j = Json::parse("\"a\\n\\\"b\\\" \\u00e9 \\ud83d\\ude00\"");
    EXPECT_EQ("a\n\"b\" \xC3\xA9 \xF0\x9F\x98\x80", j.as_string());
}

TEST(JsonTest, DumpIsCompactAndEscaped) {
    Json j = Json::object();
    j.set("text", "line1\nline2 \"quoted\"");
    j.set("n", 42);
    j.set("flag", false);
    EXPECT_EQ("{\"flag\":false,\"n\":42,\"text\":\"line1\\nline2 \\\"quoted\\\"\"}", j.dump());
}

TEST(JsonTest, DumpThenParsePreservesStructure) {
    Json arr = Json::array();
    arr.push("x").push(1.5).push(Json());
    Json j = Json::object();
    j.set("arr", arr);

    Json back = Json::parse(j.dump(2));
    EXPECT_EQ("x", back["arr"][0].as_string());
    EXPECT_DOUBLE_EQ(1.5, back["arr"][1].as_number());
    EXPECT_TRUE(back["arr"][2].is_null());
}

TEST(JsonTest, RejectsMalformedInput) {
    EXPECT_THROW(Json::parse(""), JsonParseError);
    EXPECT_THROW(Json::parse("{\"a\": }"), JsonParseError);
    EXPECT_THROW(Json::parse("[1, 2"), JsonParseError);
    EXPECT_THROW(Json::parse("\"unterminated"), JsonParseError);
    EXPECT_THROW(Json::parse("{} trailing"), JsonParseError);
    EXPECT_THROW(Json::parse("tru"), JsonParseError);
}

TEST(JsonTest, ParseErrorReportsPosition) {
    try {
        Json::parse("[1, x]");
        FAIL() << "expected JsonParseError";
    } catch (const JsonParseError& e) {
        EXPECT_EQ(4u, e.position());
    }
}

TEST(JsonTest, RejectsExcessiveNesting) {
    std::string deep(200, '[');
    deep += std::string(200, ']');
    EXPECT_THROW(Json::parse(deep), JsonParseError);
}
