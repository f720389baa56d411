#ifndef CHATVIZ_VISUALIZER_PANE_H
#define CHATVIZ_VISUALIZER_PANE_H

#include <chatviz/chat/chat_message.h>
#include <chatviz/graph/graph_visualizer.h>

#include <string>
#include <vector>

namespace chatviz {
namespace chat {

enum class PaneState {
    kAwaitingToolOutput,
    kInvalidData,
    kGraph,
    kUnsupportedView
};

/*
 * Picks the last tool message of a transcript and decides what the
 * visualizer shows for it. Payloads are validated here, so the graph
 * visualizer only ever receives well-formed input.
 */
class VisualizerPane {
public:
    explicit VisualizerPane(graph::GraphVisualizer& visualizer);

    // Safe to call every frame; work is only done when the last tool message changes.
    void Update(const std::vector<ChatMessage>& messages);

    PaneState State() const { return state_; }
    const std::string& ErrorMessage() const { return error_message_; }
    const std::string& ViewName() const { return view_name_; }
    std::string PlaceholderText() const;

    // "<timestamp>|<role>|<view>|<content length>"
    static std::string IdentityKey(const ChatMessage& message);

private:
    void Show(PaneState state, const std::string& error = std::string());

    graph::GraphVisualizer& visualizer_;
    PaneState state_ = PaneState::kAwaitingToolOutput;
    std::string last_key_;
    bool has_key_ = false;
    std::string error_message_;
    std::string view_name_;
};

} // namespace chat
} // namespace chatviz

#endif // CHATVIZ_VISUALIZER_PANE_H
