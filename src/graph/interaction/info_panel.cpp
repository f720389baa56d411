#include <chatviz/graph/interaction/info_panel.h>

#include <algorithm>
#include <array>

namespace chatviz {
namespace graph {

namespace {

// Layout internals, hidden for both kinds. Nodes also hide "id", which is their title.
const std::array<const char*, 9> kLayoutKeys = {
    "x", "y", "fx", "fy", "index", "vx", "vy", "source", "target"};

std::vector<InfoRow> RowsFor(const nlohmann::json& attributes, OverlayKind kind) {
    std::vector<InfoRow> rows;
    if (!attributes.is_object()) return rows;
    for (auto it = attributes.begin(); it != attributes.end(); ++it) {
        if (IsLayoutAttribute(it.key(), kind)) continue;
        rows.push_back({it.key(), it.value().dump()});
    }
    return rows;
}

std::string EdgeTitle(const GraphModel& model, const GraphEdge& edge) {
    const auto& nodes = model.Nodes();
    return nodes[edge.source_index].id + " → " + nodes[edge.target_index].id;
}

std::optional<InfoSection> NodeSection(const GraphModel& model, const NodeId& id, const char* prefix) {
    auto index = model.IndexOf(id);
    if (!index) return std::nullopt;
    return InfoSection{std::string(prefix) + id, RowsFor(model.Nodes()[*index].attributes, OverlayKind::kNode)};
}

std::optional<InfoSection> EdgeSection(const GraphModel& model, EdgeId edge_id, const char* prefix) {
    const GraphEdge* edge = model.FindEdge(edge_id);
    if (!edge) return std::nullopt;
    return InfoSection{std::string(prefix) + EdgeTitle(model, *edge), RowsFor(edge->attributes, OverlayKind::kEdge)};
}

} // anonymous namespace

bool IsLayoutAttribute(const std::string& key, OverlayKind kind) {
    if (kind == OverlayKind::kNode && key == "id") return true;
    return std::find(kLayoutKeys.begin(), kLayoutKeys.end(), key) != kLayoutKeys.end();
}

InfoPanelModel BuildInfoPanel(const SelectionState& selection, const GraphModel& model) {
    InfoPanelModel panel;
    panel.visible = selection.HasAny();
    if (!panel.visible) return panel;

    auto add = [&panel](std::optional<InfoSection> section) {
        if (section) panel.sections.push_back(std::move(*section));
    };

    if (selection.SelectedNode()) add(NodeSection(model, *selection.SelectedNode(), "Selected Node: "));
    if (selection.HoveredNode() && selection.HoveredNode() != selection.SelectedNode()) {
        add(NodeSection(model, *selection.HoveredNode(), "Hovered Node: "));
    }
    if (selection.SelectedEdge()) add(EdgeSection(model, *selection.SelectedEdge(), "Selected Edge: "));
    if (selection.HoveredEdge() && selection.HoveredEdge() != selection.SelectedEdge()) {
        add(EdgeSection(model, *selection.HoveredEdge(), "Hovered Edge: "));
    }
    return panel;
}

std::optional<HoverLabel> BuildHoverLabel(const SelectionState& selection, const GraphModel& model,
                                          const FrameGeometry& frame) {
    if (selection.HoveredNode()) {
        auto index = model.IndexOf(*selection.HoveredNode());
        if (index && *index < frame.node_screen.size()) {
            const ImVec2& p = frame.node_screen[*index];
            return HoverLabel{*selection.HoveredNode(), ImVec2(p.x, p.y - kHoverLabelOffset)};
        }
    }
    if (selection.HoveredEdge()) {
        for (const auto& edge : frame.edges) {
            if (edge.edge_id != *selection.HoveredEdge()) continue;
            const GraphEdge* model_edge = model.FindEdge(edge.edge_id);
            if (!model_edge) break;
            ImVec2 mid((edge.from.x + edge.to.x) * 0.5f, (edge.from.y + edge.to.y) * 0.5f - kHoverLabelOffset);
            return HoverLabel{EdgeTitle(model, *model_edge), mid};
        }
    }
    return std::nullopt;
}

} // namespace graph
} // namespace chatviz
