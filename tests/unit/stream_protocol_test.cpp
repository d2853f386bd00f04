#include "bridge/stream_protocol.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

using namespace ccproxy::bridge;

TEST(StreamProtocolTest, EncodesUserMessageAsOneLine) {
    std::string line = encode_user_message("Say \"hi\"\nplease");

    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');
    // Embedded newlines must be escaped, never framing
    EXPECT_EQ(line.find('\n'), line.size() - 1);

    auto json = nlohmann::json::parse(line);
    EXPECT_EQ(json["type"], "user");
    EXPECT_EQ(json["message"]["role"], "user");
    EXPECT_EQ(json["message"]["content"], "Say \"hi\"\nplease");
}

TEST(StreamProtocolTest, ParsesAssistantTextBlocksInOrder) {
    auto event = parse_stream_line(
        R"({"type":"assistant","message":{"content":[{"type":"text","text":"Hel"},)"
        R"({"type":"tool_use","name":"x"},{"type":"text","text":"lo"}]}})");

    ASSERT_TRUE(event.has_value());
    auto *assistant = std::get_if<AssistantEvent>(&*event);
    ASSERT_NE(assistant, nullptr);
    ASSERT_EQ(assistant->text_blocks.size(), 2u);
    EXPECT_EQ(assistant->text_blocks[0], "Hel");
    EXPECT_EQ(assistant->text_blocks[1], "lo");
}

TEST(StreamProtocolTest, AssistantWithoutContentHasNoText) {
    auto event = parse_stream_line(R"({"type":"assistant","message":{}})");

    ASSERT_TRUE(event.has_value());
    auto *assistant = std::get_if<AssistantEvent>(&*event);
    ASSERT_NE(assistant, nullptr);
    EXPECT_TRUE(assistant->text_blocks.empty());
}

TEST(StreamProtocolTest, ParsesResult) {
    auto event = parse_stream_line(R"({"type":"result","subtype":"success","result":"done","is_error":false})");

    ASSERT_TRUE(event.has_value());
    auto *result = std::get_if<ResultEvent>(&*event);
    ASSERT_NE(result, nullptr);
    ASSERT_TRUE(result->result.has_value());
    EXPECT_EQ(*result->result, "done");
    EXPECT_FALSE(result->is_error);
    EXPECT_EQ(result->subtype, "success");
}

TEST(StreamProtocolTest, ResultWithoutResultField) {
    auto event = parse_stream_line(R"({"type":"result"})");

    ASSERT_TRUE(event.has_value());
    auto *result = std::get_if<ResultEvent>(&*event);
    ASSERT_NE(result, nullptr);
    EXPECT_FALSE(result->result.has_value());
}

TEST(StreamProtocolTest, ResultErrorFlags) {
    auto flagged = parse_stream_line(R"({"type":"result","is_error":true,"result":"boom"})");
    ASSERT_TRUE(flagged.has_value());
    EXPECT_TRUE(std::get<ResultEvent>(*flagged).is_error);

    auto by_subtype = parse_stream_line(R"({"type":"result","subtype":"error_max_turns"})");
    ASSERT_TRUE(by_subtype.has_value());
    EXPECT_TRUE(std::get<ResultEvent>(*by_subtype).is_error);
}

TEST(StreamProtocolTest, OtherTypesAreReported) {
    auto event = parse_stream_line(R"({"type":"system","subtype":"init"})");

    ASSERT_TRUE(event.has_value());
    auto *other = std::get_if<OtherEvent>(&*event);
    ASSERT_NE(other, nullptr);
    EXPECT_EQ(other->type, "system");
}

TEST(StreamProtocolTest, MalformedLinesAreDiscarded) {
    EXPECT_FALSE(parse_stream_line("").has_value());
    EXPECT_FALSE(parse_stream_line("not json").has_value());
    EXPECT_FALSE(parse_stream_line("{\"type\":\"result\"").has_value());
    EXPECT_FALSE(parse_stream_line("[1,2,3]").has_value());
    EXPECT_FALSE(parse_stream_line("\"result\"").has_value());
    EXPECT_FALSE(parse_stream_line(R"({"kind":"result"})").has_value());
    EXPECT_FALSE(parse_stream_line(R"({"type":42})").has_value());
}
