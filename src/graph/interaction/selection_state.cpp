#include <chatviz/graph/interaction/selection_state.h>

namespace chatviz {
namespace graph {

void SelectionState::SelectNode(const NodeId& id) {
    if (selected_node_ && *selected_node_ == id) {
        selected_node_.reset();
    } else {
        selected_node_ = id;
    }
    selected_edge_.reset();
}

void SelectionState::SelectEdge(EdgeId edge_id) {
    if (selected_edge_ && *selected_edge_ == edge_id) {
        selected_edge_.reset();
    } else {
        selected_edge_ = edge_id;
    }
    selected_node_.reset();
}

void SelectionState::HoverNode(std::optional<NodeId> id) {
    hovered_node_ = std::move(id);
}

void SelectionState::HoverEdge(std::optional<EdgeId> edge_id) {
    hovered_edge_ = edge_id;
}

void SelectionState::ClearHover() {
    hovered_node_.reset();
    hovered_edge_.reset();
}

void SelectionState::Dismiss() {
    selected_node_.reset();
    selected_edge_.reset();
    ClearHover();
}

Emphasis SelectionState::NodeEmphasis(const NodeId& id) const {
    if (selected_node_ && *selected_node_ == id) return Emphasis::kSelected;
    if (hovered_node_ && *hovered_node_ == id) return Emphasis::kHovered;
    return Emphasis::kNone;
}

Emphasis SelectionState::EdgeEmphasis(EdgeId edge_id) const {
    if (selected_edge_ && *selected_edge_ == edge_id) return Emphasis::kSelected;
    if (hovered_edge_ && *hovered_edge_ == edge_id) return Emphasis::kHovered;
    return Emphasis::kNone;
}

bool SelectionState::HasAny() const {
    return selected_node_ || selected_edge_ || hovered_node_ || hovered_edge_;
}

} // namespace graph
} // namespace chatviz
