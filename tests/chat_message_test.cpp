#include "gtest/gtest.h"
#include <chatviz/chat/chat_message.h>

#include <stdexcept>

using namespace chatviz::chat;

TEST(ChatMessageTest, ParsesRequiredAndOptionalFields) {
    ChatMessage message = ChatMessageFromJson(nlohmann::json::parse(
        R"({"role": "tool", "content": "{}", "timestamp": "2024-01-01T00:00:00Z", "view": "graph"})"));
    EXPECT_EQ(message.role, "tool");
    EXPECT_EQ(message.view, std::optional<std::string>("graph"));
    EXPECT_EQ(message.Key(), "2024-01-01T00:00:00Z-tool");
}

TEST(ChatMessageTest, RejectsMissingOrMistypedFields) {
    EXPECT_THROW(ChatMessageFromJson(nlohmann::json::parse(R"({"role": "user", "timestamp": "t"})")),
                 std::runtime_error);
    EXPECT_THROW(ChatMessageFromJson(nlohmann::json::parse(R"({"role": 3, "content": "", "timestamp": "t"})")),
                 std::runtime_error);
    EXPECT_THROW(ChatMessageFromJson(nlohmann::json::parse("[]")), std::runtime_error);
}

TEST(ChatMessageTest, NonStringViewIsIgnored) {
    ChatMessage message = ChatMessageFromJson(nlohmann::json::parse(
        R"({"role": "tool", "content": "", "timestamp": "t", "view": 5})"));
    EXPECT_FALSE(message.view.has_value());
}

TEST(MessageLogTest, IngestSkipsBlankAndMalformedLines) {
    MessageLog log;
    std::size_t accepted = log.IngestStream(
        "{\"role\": \"user\", \"content\": \"hi\", \"timestamp\": \"t1\"}\n"
        "\n"
        "   }\n"
        "{not json\n"
        "{\"role\": \"tool\", \"content\": \"{}\", \"timestamp\": \"t2\", \"view\": \"graph\"}\r\n"
        "{\"role\": \"user\", \"timestamp\": \"t3\"}\n");

    EXPECT_EQ(accepted, 2u);
    EXPECT_EQ(log.SkippedLines(), 2u);
    ASSERT_EQ(log.Messages().size(), 2u);
    EXPECT_EQ(log.Messages()[1].role, "tool");
    EXPECT_EQ(log.Messages()[1].view, std::optional<std::string>("graph"));
}

TEST(MessageLogTest, SameKeyReplacesInPlace) {
    MessageLog log;
    log.IngestStream(
        "{\"role\": \"user\", \"content\": \"first\", \"timestamp\": \"t1\"}\n"
        "{\"role\": \"assistant\", \"content\": \"reply\", \"timestamp\": \"t1\"}\n"
        "{\"role\": \"user\", \"content\": \"second\", \"timestamp\": \"t2\"}\n");
    log.IngestStream("{\"role\": \"user\", \"content\": \"first, edited\", \"timestamp\": \"t1\"}\n");

    ASSERT_EQ(log.Messages().size(), 3u);
    EXPECT_EQ(log.Messages()[0].content, "first, edited");
    EXPECT_EQ(log.Messages()[1].role, "assistant");
    EXPECT_EQ(log.Messages()[2].content, "second");
}

TEST(MessageLogTest, ClearForgetsEverything) {
    MessageLog log;
    log.IngestStream("{broken\n{\"role\": \"user\", \"content\": \"x\", \"timestamp\": \"t\"}\n");
    log.Clear();
    EXPECT_TRUE(log.Messages().empty());
    EXPECT_EQ(log.SkippedLines(), 0u);

    ChatMessage message{"user", "again", "t", std::nullopt};
    log.Upsert(message);
    EXPECT_EQ(log.Messages().size(), 1u);
}
