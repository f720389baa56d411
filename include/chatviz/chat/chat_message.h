#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chatviz {
namespace chat {

struct ChatMessage {
    std::string role;       // "user", "assistant", "tool", ...
    std::string content;
    std::string timestamp;
    std::optional<std::string> view;   // Visualization hint on tool messages

    // De-duplication key: "<timestamp>-<role>"
    std::string Key() const { return timestamp + "-" + role; }
};

// Throws std::runtime_error when a required field is missing or not a string.
ChatMessage ChatMessageFromJson(const nlohmann::json& value);

/*
 * Ordered transcript built from newline-delimited JSON.
 * Re-ingesting a message with a known key replaces it in place.
 */
class MessageLog {
public:
    // Returns the number of lines that were accepted.
    std::size_t IngestStream(const std::string& text);
    void Upsert(const ChatMessage& message);
    void Clear();

    const std::vector<ChatMessage>& Messages() const { return messages_; }
    std::size_t SkippedLines() const { return skipped_lines_; }

private:
    std::vector<ChatMessage> messages_;
    std::unordered_map<std::string, std::size_t> index_by_key_;
    std::size_t skipped_lines_ = 0;
};

} // namespace chat
} // namespace chatviz
