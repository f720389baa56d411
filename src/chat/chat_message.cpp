#include <chatviz/chat/chat_message.h>

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace chatviz {
namespace chat {

namespace {

std::string RequireString(const nlohmann::json& value, const char* key) {
    auto it = value.find(key);
    if (it == value.end() || !it->is_string()) {
        throw std::runtime_error(std::string("message field \"") + key + "\" must be a string");
    }
    return it->get<std::string>();
}

std::string Trim(const std::string& line) {
    const char* whitespace = " \t\r\n";
    auto begin = line.find_first_not_of(whitespace);
    if (begin == std::string::npos) return "";
    auto end = line.find_last_not_of(whitespace);
    return line.substr(begin, end - begin + 1);
}

} // anonymous namespace

ChatMessage ChatMessageFromJson(const nlohmann::json& value) {
    if (!value.is_object()) {
        throw std::runtime_error("message must be a JSON object");
    }
    ChatMessage message;
    message.role = RequireString(value, "role");
    message.timestamp = RequireString(value, "timestamp");
    message.content = RequireString(value, "content");

    auto view_it = value.find("view");
    if (view_it != value.end() && view_it->is_string()) {
        message.view = view_it->get<std::string>();
    }
    return message;
}

std::size_t MessageLog::IngestStream(const std::string& text) {
    std::istringstream stream(text);
    std::string line;
    std::size_t accepted = 0;
    std::size_t line_number = 0;

    while (std::getline(stream, line)) {
        ++line_number;
        std::string trimmed = Trim(line);
        if (trimmed.size() <= 1) continue;

        try {
            Upsert(ChatMessageFromJson(nlohmann::json::parse(trimmed)));
            ++accepted;
        } catch (const std::exception& e) {
            ++skipped_lines_;
            std::cerr << "Warning: skipping transcript line " << line_number << ": " << e.what() << std::endl;
        }
    }
    return accepted;
}

void MessageLog::Upsert(const ChatMessage& message) {
    const std::string key = message.Key();
    auto it = index_by_key_.find(key);
    if (it != index_by_key_.end()) {
        messages_[it->second] = message;
        return;
    }
    index_by_key_.emplace(key, messages_.size());
    messages_.push_back(message);
}

void MessageLog::Clear() {
    messages_.clear();
    index_by_key_.clear();
    skipped_lines_ = 0;
}

} // namespace chat
} // namespace chatviz
