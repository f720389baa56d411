#include <chatviz/gui/render/graph_renderer.h>

#include <algorithm>
#include <cmath>

namespace chatviz {
namespace gui {

namespace {
    // Drawn sizes in simulation units; they scale with the viewport.
    constexpr float kNodeRadius = 12.0f;
    constexpr float kNodeRadiusHovered = 16.0f;
    constexpr float kNodeRadiusSelected = 20.0f;
    constexpr float kNodeStrokeWidth = 2.0f;
    constexpr float kEdgeWidth = 4.0f;
    constexpr float kEdgeWidthHovered = 6.0f;
    constexpr float kEdgeWidthSelected = 8.0f;
    constexpr float kEdgeOpacity = 0.8f;
    constexpr float kDimmedNodeOpacity = 0.6f;
    constexpr float kInfoPanelWidth = 280.0f;

    // Right button stands in for a second touch point.
    constexpr int kPrimaryPointer = 0;
    constexpr int kPinchPointer = 1;

    ImVec2 Offset(const ImVec2& p, const ImVec2& origin) {
        return ImVec2(origin.x + p.x, origin.y + p.y);
    }
}

GraphRenderer::GraphRenderer(graph::GraphVisualizer& visualizer) : visualizer_(visualizer) {}

void GraphRenderer::Render(ThemeType theme, float wheel_steps) {
    const GraphPalette& palette = ThemeUtils::GetGraphPalette(theme);
    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    ImVec2 canvas_pos = ImGui::GetCursorScreenPos();
    ImVec2 canvas_size = ImGui::GetContentRegionAvail();
    canvas_size.x = std::max(canvas_size.x, 50.0f);
    canvas_size.y = std::max(canvas_size.y, 50.0f);

    ImVec2 canvas_end(canvas_pos.x + canvas_size.x, canvas_pos.y + canvas_size.y);
    draw_list->AddRectFilled(canvas_pos, canvas_end, palette.background);
    draw_list->AddRect(canvas_pos, canvas_end, palette.border);

    visualizer_.SetViewportSize(canvas_size);

    ImGui::InvisibleButton("graph_canvas", canvas_size,
                           ImGuiButtonFlags_MouseButtonLeft | ImGuiButtonFlags_MouseButtonRight);
    const bool canvas_hovered = ImGui::IsItemHovered();
    const ImVec2 after_canvas = ImGui::GetCursorScreenPos();

    HandleInput(canvas_pos, canvas_hovered, wheel_steps);

    draw_list->PushClipRect(canvas_pos, canvas_end, true);
    if (const graph::FrameGeometry* frame = visualizer_.CurrentFrame()) {
        DrawGraph(draw_list, canvas_pos, *frame, palette);
        DrawHoverLabel(draw_list, canvas_pos, palette);
    }
    DrawInstructions(draw_list, canvas_pos, canvas_size, palette);
    draw_list->PopClipRect();

    DrawInfoPanel(canvas_pos, canvas_size);
    ImGui::SetCursorScreenPos(after_canvas);
    ImGui::Dummy(ImVec2(0.0f, 0.0f));
}

void GraphRenderer::HandleInput(const ImVec2& canvas_pos, bool canvas_hovered, float wheel_steps) {
    ImGuiIO& io = ImGui::GetIO();
    const ImVec2 local(io.MousePos.x - canvas_pos.x, io.MousePos.y - canvas_pos.y);
    const auto now = graph::GestureClock::now();
    const bool moved = io.MouseDelta.x != 0.0f || io.MouseDelta.y != 0.0f;

    auto event_for = [&](int button) {
        graph::PointerEvent event;
        event.pointer_id = button == ImGuiMouseButton_Right ? kPinchPointer : kPrimaryPointer;
        event.position = local;
        event.time = now;
        event.touch_count = button == ImGuiMouseButton_Right ? 2 : 1;
        return event;
    };

    if (active_button_ < 0) {
        if (canvas_hovered && ImGui::IsMouseClicked(ImGuiMouseButton_Left)) {
            active_button_ = ImGuiMouseButton_Left;
        } else if (canvas_hovered && ImGui::IsMouseClicked(ImGuiMouseButton_Right)) {
            active_button_ = ImGuiMouseButton_Right;
        }
        if (active_button_ >= 0) {
            visualizer_.OnPointerDown(event_for(active_button_));
        }
    } else if (ImGui::IsMouseReleased(active_button_)) {
        visualizer_.OnPointerUp(event_for(active_button_));
        active_button_ = -1;
    } else if (moved) {
        visualizer_.OnPointerMove(event_for(active_button_));
    }

    if (active_button_ < 0) {
        if (canvas_hovered && (moved || !was_hovered_)) {
            visualizer_.OnHover(local);
        } else if (!canvas_hovered && was_hovered_) {
            // Leaving the canvas: probe a point no overlay can contain.
            visualizer_.OnHover(ImVec2(-1.0e6f, -1.0e6f));
        }
        if (canvas_hovered && wheel_steps != 0.0f) {
            visualizer_.OnWheel(local, wheel_steps);
        }
    }
    was_hovered_ = canvas_hovered;
}

void GraphRenderer::DrawGraph(ImDrawList* draw_list, const ImVec2& canvas_pos, const graph::FrameGeometry& frame,
                              const GraphPalette& palette) const {
    const graph::SelectionState& selection = visualizer_.Selection();
    const graph::GraphModel* model = visualizer_.Model();
    if (!model) return;
    const float scale = frame.transform.scale;

    for (const auto& edge : frame.edges) {
        ImU32 color = palette.edge;
        float width = kEdgeWidth;
        switch (selection.EdgeEmphasis(edge.edge_id)) {
            case graph::Emphasis::kSelected:
                color = palette.edge_selected;
                width = kEdgeWidthSelected;
                break;
            case graph::Emphasis::kHovered:
                color = palette.edge_hovered;
                width = kEdgeWidthHovered;
                break;
            case graph::Emphasis::kNone:
                break;
        }
        draw_list->AddLine(Offset(edge.from, canvas_pos), Offset(edge.to, canvas_pos),
                           ThemeUtils::WithOpacity(color, kEdgeOpacity), std::max(1.0f, width * scale));
    }

    const bool dim_others = selection.SelectedNode().has_value();
    const auto& nodes = model->Nodes();
    for (std::size_t i = 0; i < frame.node_screen.size() && i < nodes.size(); ++i) {
        graph::Emphasis emphasis = selection.NodeEmphasis(nodes[i].id);
        ImU32 fill = palette.node_fill;
        ImU32 stroke = palette.node_stroke;
        float radius = kNodeRadius;
        if (emphasis == graph::Emphasis::kSelected) {
            fill = palette.node_selected;
            stroke = palette.node_selected_stroke;
            radius = kNodeRadiusSelected;
        } else if (emphasis == graph::Emphasis::kHovered) {
            fill = palette.node_hovered;
            radius = kNodeRadiusHovered;
        }
        if (dim_others && emphasis != graph::Emphasis::kSelected) {
            fill = ThemeUtils::WithOpacity(fill, kDimmedNodeOpacity);
            stroke = ThemeUtils::WithOpacity(stroke, kDimmedNodeOpacity);
        }
        ImVec2 center = Offset(frame.node_screen[i], canvas_pos);
        draw_list->AddCircleFilled(center, radius * scale, fill);
        draw_list->AddCircle(center, radius * scale, stroke, 0, std::max(1.0f, kNodeStrokeWidth * scale));
    }
}

void GraphRenderer::DrawHoverLabel(ImDrawList* draw_list, const ImVec2& canvas_pos, const GraphPalette& palette) {
    std::optional<graph::HoverLabel> label = visualizer_.CurrentHoverLabel();
    if (!label) return;

    ImVec2 text_size = ImGui::CalcTextSize(label->text.c_str());
    ImVec2 anchor = Offset(label->anchor, canvas_pos);
    ImVec2 text_pos(anchor.x - text_size.x * 0.5f, anchor.y - text_size.y * 0.5f);
    const float padding = 4.0f;
    draw_list->AddRectFilled(ImVec2(text_pos.x - padding, text_pos.y - padding),
                             ImVec2(text_pos.x + text_size.x + padding, text_pos.y + text_size.y + padding),
                             palette.label_background, 3.0f);
    draw_list->AddText(text_pos, palette.text, label->text.c_str());
}

void GraphRenderer::DrawInfoPanel(const ImVec2& canvas_pos, const ImVec2& canvas_size) {
    graph::InfoPanelModel panel = visualizer_.InfoPanel();
    if (!panel.visible) return;

    const float width = std::min(kInfoPanelWidth, canvas_size.x - 20.0f);
    const float height = std::min(canvas_size.y * 0.6f, canvas_size.y - 20.0f);
    ImGui::SetCursorScreenPos(ImVec2(canvas_pos.x + canvas_size.x - width - 10.0f, canvas_pos.y + 10.0f));
    if (ImGui::BeginChild("GraphInfoPanel", ImVec2(width, height), true)) {
        if (ImGui::SmallButton("Close")) {
            visualizer_.DismissInfoPanel();
        }
        for (const auto& section : panel.sections) {
            ImGui::Separator();
            ImGui::TextWrapped("%s", section.title.c_str());
            for (const auto& row : section.rows) {
                ImGui::TextWrapped("%s: %s", row.key.c_str(), row.value.c_str());
            }
        }
    }
    ImGui::EndChild();
}

void GraphRenderer::DrawInstructions(ImDrawList* draw_list, const ImVec2& canvas_pos, const ImVec2& canvas_size,
                                     const GraphPalette& palette) const {
    const char* text = "Drag nodes to move | Click to select | Drag background to pan | "
                       "Right-drag or wheel to zoom | Double-click to reset";
    ImVec2 text_size = ImGui::CalcTextSize(text);
    ImVec2 pos(canvas_pos.x + 8.0f, canvas_pos.y + canvas_size.y - text_size.y - 8.0f);
    draw_list->AddText(pos, ThemeUtils::WithOpacity(palette.text, 0.6f), text);
}

} // namespace gui
} // namespace chatviz
