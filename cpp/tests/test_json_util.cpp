#include <gtest/gtest.h>
#include "cvforge/util/JsonUtil.hpp"

using cvforge::util::findPath;
using cvforge::util::parseJson;
using cvforge::util::readDouble;
using cvforge::util::readInt;
using cvforge::util::readString;

TEST(JsonUtilTest, MalformedTextThrowsJsonError) {
    EXPECT_THROW(parseJson("{\"title\": "), cvforge::util::JsonError);
    EXPECT_TRUE(parseJson("[]").is_array());
}

TEST(JsonUtilTest, FindPathWalksObjectsAndArrays) {
    auto completion = parseJson(R"({"choices": [{"message": {"role": "assistant", "content": "Dear team"}}]})");

    const auto* content = findPath(completion, "choices.0.message.content");
    ASSERT_NE(content, nullptr);
    EXPECT_EQ(content->as_string(), "Dear team");

    EXPECT_EQ(findPath(completion, "choices.1.message"), nullptr);
    EXPECT_EQ(findPath(completion, "choices.first"), nullptr);
    EXPECT_EQ(findPath(completion, "choices.0.message.content.more"), nullptr);
    EXPECT_EQ(findPath(completion, ""), &completion);
}

TEST(JsonUtilTest, ReadersCoerceLeniently) {
    auto object = parseJson(R"({"port": "8080", "threads": 4.0, "name": "cvforge", "version": 2,
                               "temperature": "0.25", "broken": "12abc", "flag": true})").as_object();

    EXPECT_EQ(readInt(object, "port"), 8080);
    EXPECT_EQ(readInt(object, "threads"), 4);
    EXPECT_EQ(readInt(object, "broken"), std::nullopt);
    EXPECT_EQ(readInt(object, "flag"), std::nullopt);
    EXPECT_EQ(readInt(object, "missing"), std::nullopt);

    EXPECT_EQ(readString(object, "name"), "cvforge");
    EXPECT_EQ(readString(object, "version"), "2");
    EXPECT_EQ(readString(object, "flag"), std::nullopt);

    EXPECT_DOUBLE_EQ(readDouble(object, "temperature").value_or(-1), 0.25);
    EXPECT_DOUBLE_EQ(readDouble(object, "version").value_or(-1), 2.0);
    EXPECT_EQ(readDouble(object, "name"), std::nullopt);
}
