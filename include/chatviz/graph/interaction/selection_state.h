#ifndef CHATVIZ_SELECTION_STATE_H
#define CHATVIZ_SELECTION_STATE_H

#include <chatviz/core/id_types.h>
#include <optional>

namespace chatviz {
namespace graph {

enum class Emphasis {
    kNone,
    kHovered,
    kSelected
};

/*
 * Selection and hover for the visualizer, keyed by node id and edge id.
 * At most one node or one edge is selected at a time. Hover is independent
 * of selection and one of each kind may be set.
 */
class SelectionState {
public:
    // Toggles: selecting the selected node clears it. Always clears the edge selection.
    void SelectNode(const NodeId& id);
    void SelectEdge(EdgeId edge_id);

    void HoverNode(std::optional<NodeId> id);
    void HoverEdge(std::optional<EdgeId> edge_id);
    void ClearHover();

    // Clears all four fields.
    void Dismiss();

    const std::optional<NodeId>& SelectedNode() const { return selected_node_; }
    const std::optional<EdgeId>& SelectedEdge() const { return selected_edge_; }
    const std::optional<NodeId>& HoveredNode() const { return hovered_node_; }
    const std::optional<EdgeId>& HoveredEdge() const { return hovered_edge_; }

    Emphasis NodeEmphasis(const NodeId& id) const;
    Emphasis EdgeEmphasis(EdgeId edge_id) const;

    bool HasAny() const;

private:
    std::optional<NodeId> selected_node_;
    std::optional<EdgeId> selected_edge_;
    std::optional<NodeId> hovered_node_;
    std::optional<EdgeId> hovered_edge_;
};

} // namespace graph
} // namespace chatviz

#endif // CHATVIZ_SELECTION_STATE_H
