#pragma once

#include <string>

namespace chatviz {

namespace chat {
class MessageLog;
class VisualizerPane;
}
namespace config {
struct VisualizerConfig;
}
namespace db {
class SettingsStore;
}
namespace graph {
class GraphVisualizer;
}

namespace gui {

class GuiInterface;
class GraphRenderer;

// Everything the views read or mutate during one frame. Owned by main().
struct ViewContext {
    chat::MessageLog& messages;
    chat::VisualizerPane& pane;
    graph::GraphVisualizer& visualizer;
    GraphRenderer& renderer;
    config::VisualizerConfig& config;
    db::SettingsStore& settings;
    std::string transcript_path;
    bool reload_requested = false;
};

/*
 * @brief Renders all ImGui views for the application.
 *
 * Settings header, the chat transcript on the left and the visualizer pane
 * on the right. Called once per frame from the main loop.
 */
void drawAllViews(ViewContext& ctx, GuiInterface& gui);

} // namespace gui
} // namespace chatviz
