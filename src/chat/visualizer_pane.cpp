#include <chatviz/chat/visualizer_pane.h>
#include <chatviz/graph/payload/graph_payload.h>

#include <iostream>

namespace chatviz {
namespace chat {

VisualizerPane::VisualizerPane(graph::GraphVisualizer& visualizer) : visualizer_(visualizer) {}

std::string VisualizerPane::IdentityKey(const ChatMessage& message) {
    return message.timestamp + "|" + message.role + "|" + message.view.value_or("") + "|" +
           std::to_string(message.content.size());
}

void VisualizerPane::Show(PaneState state, const std::string& error) {
    state_ = state;
    error_message_ = error;
    if (state != PaneState::kGraph) {
        visualizer_.Unmount();
    }
}

void VisualizerPane::Update(const std::vector<ChatMessage>& messages) {
    const ChatMessage* last_tool = nullptr;
    for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
        if (it->role == "tool") {
            last_tool = &*it;
            break;
        }
    }

    if (!last_tool) {
        has_key_ = false;
        last_key_.clear();
        view_name_.clear();
        Show(PaneState::kAwaitingToolOutput);
        return;
    }

    const std::string key = IdentityKey(*last_tool);
    if (has_key_ && key == last_key_) return;
    has_key_ = true;
    last_key_ = key;
    view_name_ = last_tool->view.value_or("");

    nlohmann::json content;
    try {
        content = nlohmann::json::parse(last_tool->content);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "Warning: tool output is not valid JSON: " << e.what() << std::endl;
        Show(PaneState::kInvalidData, "Tool output is not valid JSON");
        return;
    }

    if (view_name_ != "graph") {
        Show(PaneState::kUnsupportedView);
        return;
    }

    try {
        graph::GraphPayload payload = graph::GraphPayloadFromJson(content);
        visualizer_.SetPayload(key, payload);
        Show(PaneState::kGraph);
    } catch (const graph::PayloadError& e) {
        std::cerr << "Warning: rejected graph payload: " << e.what() << std::endl;
        Show(PaneState::kInvalidData, e.what());
    }
}

std::string VisualizerPane::PlaceholderText() const {
    switch (state_) {
        case PaneState::kAwaitingToolOutput:
            return "Awaiting tool output...";
        case PaneState::kInvalidData:
            return error_message_.empty() ? "Invalid tool data" : "Invalid tool data: " + error_message_;
        case PaneState::kUnsupportedView:
            return "No visualizer for view \"" + view_name_ + "\"";
        case PaneState::kGraph:
            break;
    }
    return "";
}

} // namespace chat
} // namespace chatviz
