#ifndef CHATVIZ_GRAPH_RENDERER_H
#define CHATVIZ_GRAPH_RENDERER_H

#include <chatviz/config/visualizer_config.h>
#include <chatviz/graph/graph_visualizer.h>
#include <chatviz/gui/render/theme_utils.h>

#include <imgui.h>

struct ImDrawList;

namespace chatviz {
namespace gui {

/*
 * Draws a GraphVisualizer into the current ImGui content region and turns
 * mouse input over it into pointer events.
 * Left button is one touch, right button is a two-touch pinch, the wheel zooms
 * at the cursor.
 */
class GraphRenderer {
public:
    explicit GraphRenderer(graph::GraphVisualizer& visualizer);

    // wheel_steps: vertical scroll accumulated since the last frame.
    void Render(ThemeType theme, float wheel_steps);

private:
    void HandleInput(const ImVec2& canvas_pos, bool canvas_hovered, float wheel_steps);
    void DrawGraph(ImDrawList* draw_list, const ImVec2& canvas_pos, const graph::FrameGeometry& frame,
                   const GraphPalette& palette) const;
    void DrawHoverLabel(ImDrawList* draw_list, const ImVec2& canvas_pos, const GraphPalette& palette);
    void DrawInfoPanel(const ImVec2& canvas_pos, const ImVec2& canvas_size);
    void DrawInstructions(ImDrawList* draw_list, const ImVec2& canvas_pos, const ImVec2& canvas_size,
                          const GraphPalette& palette) const;

    graph::GraphVisualizer& visualizer_;
    int active_button_ = -1;    // ImGuiMouseButton currently driving a gesture, -1 when none
    bool was_hovered_ = false;
};

} // namespace gui
} // namespace chatviz

#endif // CHATVIZ_GRAPH_RENDERER_H
