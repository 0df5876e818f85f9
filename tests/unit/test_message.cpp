#include <gtest/gtest.h>
#include "message.h"
#include <sstream>

using json = nlohmann::json;

// =============================================================================
// Role conversion tests
// =============================================================================

TEST(MessageTest, StringToRoleKnown) {
    EXPECT_EQ(Message::stringToRole("system"), Message::SYSTEM);
    EXPECT_EQ(Message::stringToRole("user"), Message::USER);
    EXPECT_EQ(Message::stringToRole("assistant"), Message::ASSISTANT);
    EXPECT_EQ(Message::stringToRole("tool"), Message::TOOL_RESPONSE);
    EXPECT_EQ(Message::stringToRole("function"), Message::FUNCTION);
}

TEST(MessageTest, StringToRoleUnknown) {
    EXPECT_EQ(Message::stringToRole("developer"), Message::OTHER);
    EXPECT_EQ(Message::stringToRole(""), Message::OTHER);
}

// =============================================================================
// Wire form tests
// =============================================================================

TEST(MessageTest, ConstructorBuildsWireObject) {
    Message msg(Message::USER, "hello world");

    EXPECT_EQ(msg.role, Message::USER);
    EXPECT_EQ(msg.content, "hello world");
    EXPECT_EQ(msg.wire["role"], "user");
    EXPECT_EQ(msg.wire["content"], "hello world");
    EXPECT_EQ(msg.serialize(), msg.wire.dump());
}

TEST(MessageTest, FromJsonKeepsUnknownFields) {
    json j = {
        {"role", "tool"},
        {"content", "42"},
        {"tool_call_id", "call_123"},
        {"name", "calculator"}
    };
    Message msg = Message::from_json(j);

    EXPECT_EQ(msg.role, Message::TOOL_RESPONSE);
    EXPECT_EQ(msg.wire["tool_call_id"], "call_123");
    EXPECT_EQ(msg.wire["name"], "calculator");
    EXPECT_EQ(msg.wire, j);
}

TEST(MessageTest, FromJsonKeepsUnrecognisedRoleString) {
    Message msg = Message::from_json({{"role", "developer"}, {"content", "be brief"}});
    EXPECT_EQ(msg.role, Message::OTHER);
    EXPECT_EQ(msg.get_role(), "developer");
}

TEST(MessageTest, FromJsonNullContent) {
    json j = {
        {"role", "assistant"},
        {"content", nullptr},
        {"tool_calls", json::array({{{"id", "call_1"}, {"type", "function"}}})}
    };
    Message msg = Message::from_json(j);

    EXPECT_TRUE(msg.content.is_null());
    EXPECT_EQ(msg.text(), "");
    EXPECT_TRUE(msg.wire.contains("tool_calls"));
}

TEST(MessageTest, FromJsonRejectsMalformed) {
    EXPECT_THROW(Message::from_json(json("hello")), std::invalid_argument);
    EXPECT_THROW(Message::from_json({{"content", "no role"}}), std::invalid_argument);
    EXPECT_THROW(Message::from_json({{"role", 7}, {"content", "x"}}), std::invalid_argument);
}

TEST(MessageTest, TextJoinsStructuredParts) {
    json j = {
        {"role", "user"},
        {"content", json::array({
            {{"type", "text"}, {"text", "first"}},
            {{"type", "image_url"}, {"image_url", {{"url", "http://x/y.png"}}}},
            {{"type", "text"}, {"text", "second"}}
        })}
    };
    EXPECT_EQ(Message::from_json(j).text(), "first\nsecond");
}

// =============================================================================
// Stream operator tests
// =============================================================================

TEST(MessageTest, StreamOperatorBasic) {
    Message msg(Message::USER, "hello");

    std::ostringstream oss;
    oss << msg;

    EXPECT_EQ(oss.str(), "user: hello");
}

TEST(MessageTest, StreamOperatorLongContent) {
    // Content longer than 100 chars should be truncated
    std::string long_content(150, 'x');
    Message msg(Message::ASSISTANT, long_content);

    std::ostringstream oss;
    oss << msg;

    std::string output = oss.str();
    EXPECT_TRUE(output.find("...") != std::string::npos);
    EXPECT_LT(output.size(), long_content.size());
}

// =============================================================================
// Roundtrip tests (stringToRole <-> get_role)
// =============================================================================

TEST(MessageTest, RoleRoundtrip) {
    std::vector<std::pair<Message::Role, std::string>> cases = {
        {Message::SYSTEM, "system"},
        {Message::USER, "user"},
        {Message::ASSISTANT, "assistant"},
        {Message::TOOL_RESPONSE, "tool"},
        {Message::FUNCTION, "function"}
    };

    for (const auto& [role, str] : cases) {
        Message msg(role, "content");
        EXPECT_EQ(msg.get_role(), str);
        EXPECT_EQ(Message::stringToRole(msg.get_role()), role);
    }
}
