#ifndef CHATVIZ_INFO_PANEL_H
#define CHATVIZ_INFO_PANEL_H

#include <chatviz/graph/graph_types.h>
#include <chatviz/graph/interaction/selection_state.h>
#include <chatviz/graph/render/frame_geometry.h>

#include <imgui.h>
#include <optional>
#include <string>
#include <vector>

namespace chatviz {
namespace graph {

struct InfoRow {
    std::string key;
    std::string value;   // Compact JSON text
};

struct InfoSection {
    std::string title;
    std::vector<InfoRow> rows;
};

struct InfoPanelModel {
    bool visible = false;
    std::vector<InfoSection> sections;
};

struct HoverLabel {
    std::string text;
    ImVec2 anchor;       // Screen space, centered horizontally above the element
};

constexpr float kHoverLabelOffset = 20.0f;

// Keys that describe layout or wiring rather than payload data.
bool IsLayoutAttribute(const std::string& key, OverlayKind kind);

InfoPanelModel BuildInfoPanel(const SelectionState& selection, const GraphModel& model);
std::optional<HoverLabel> BuildHoverLabel(const SelectionState& selection, const GraphModel& model,
                                          const FrameGeometry& frame);

} // namespace graph
} // namespace chatviz

#endif // CHATVIZ_INFO_PANEL_H
