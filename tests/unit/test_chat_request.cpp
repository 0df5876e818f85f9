#include <gtest/gtest.h>
#include "chat_request.h"

using json = nlohmann::json;

TEST(ChatRequestTest, ParseFullRequest) {
    json body = {
        {"model", "gpt-4o"},
        {"messages", {
            {{"role", "system"}, {"content", "Be brief."}},
            {{"role", "user"}, {"content", "Hi"}}
        }},
        {"temperature", 0.3},
        {"max_tokens", 128},
        {"stream", true}
    };

    ChatRequest request = ChatRequest::from_json(body);

    EXPECT_EQ(request.model, "gpt-4o");
    ASSERT_EQ(request.messages.size(), 2u);
    EXPECT_EQ(request.messages[0].role, Message::SYSTEM);
    EXPECT_EQ(request.messages[1].text(), "Hi");
    ASSERT_TRUE(request.temperature.has_value());
    EXPECT_DOUBLE_EQ(*request.temperature, 0.3);
    EXPECT_EQ(request.max_tokens, 128);
    EXPECT_TRUE(request.stream);
}

TEST(ChatRequestTest, OptionalFieldsDefault) {
    ChatRequest request = ChatRequest::from_json({
        {"messages", json::array()},
        {"temperature", nullptr}
    });

    EXPECT_TRUE(request.model.empty());
    EXPECT_TRUE(request.messages.empty());
    EXPECT_FALSE(request.temperature.has_value());
    EXPECT_FALSE(request.max_tokens.has_value());
    EXPECT_FALSE(request.stream);
}

TEST(ChatRequestTest, IntegerTemperatureAccepted) {
    ChatRequest request = ChatRequest::from_json({{"messages", json::array()}, {"temperature", 1}});
    EXPECT_DOUBLE_EQ(request.temperature.value_or(0.0), 1.0);
}

TEST(ChatRequestTest, RejectsMalformedBodies) {
    EXPECT_THROW(ChatRequest::from_json(json::array()), RequestError);
    EXPECT_THROW(ChatRequest::from_json({{"model", "gpt-4"}}), RequestError);
    EXPECT_THROW(ChatRequest::from_json({{"messages", "hello"}}), RequestError);
    EXPECT_THROW(ChatRequest::from_json({{"messages", json::array()}, {"model", 3}}), RequestError);
    EXPECT_THROW(ChatRequest::from_json({{"messages", json::array()}, {"stream", "yes"}}), RequestError);
    EXPECT_THROW(ChatRequest::from_json({{"messages", json::array()}, {"max_tokens", 1.5}}), RequestError);
    EXPECT_THROW(ChatRequest::from_json({{"messages", json::array()}, {"temperature", "hot"}}), RequestError);
}

TEST(ChatRequestTest, MaxTokensOutOfRange) {
    json body = {{"messages", json::array()}};

    body["max_tokens"] = 4294967297ULL;
    EXPECT_THROW(ChatRequest::from_json(body), RequestError);
    body["max_tokens"] = 2147483648LL;
    EXPECT_THROW(ChatRequest::from_json(body), RequestError);
    body["max_tokens"] = 0;
    EXPECT_THROW(ChatRequest::from_json(body), RequestError);
    body["max_tokens"] = -5;
    EXPECT_THROW(ChatRequest::from_json(body), RequestError);

    body["max_tokens"] = 2147483647;
    EXPECT_EQ(ChatRequest::from_json(body).max_tokens, 2147483647);
    body["max_tokens"] = 1;
    EXPECT_EQ(ChatRequest::from_json(body).max_tokens, 1);
}

TEST(ChatRequestTest, BadMessageNamesItsIndex) {
    json body = {{"messages", {{{"role", "user"}, {"content", "ok"}}, {{"content", "no role"}}}}};

    try {
        ChatRequest::from_json(body);
        FAIL() << "expected RequestError";
    } catch (const RequestError& e) {
        EXPECT_EQ(e.status, 400);
        EXPECT_NE(std::string(e.what()).find("messages[1]"), std::string::npos);
    }
}
