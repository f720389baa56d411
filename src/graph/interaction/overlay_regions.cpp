#include <chatviz/graph/interaction/overlay_regions.h>
#include <cmath>

namespace chatviz {
namespace graph {

bool OverlayRegion::Contains(const ImVec2& point) const {
    float dx = point.x - center.x;
    float dy = point.y - center.y;

    if (kind == OverlayKind::kNode) {
        return dx * dx + dy * dy <= half_extents.x * half_extents.x;
    }

    // Rotate the point into the rectangle's local frame
    float c = std::cos(angle);
    float s = std::sin(angle);
    float local_x = dx * c + dy * s;
    float local_y = -dx * s + dy * c;
    return std::fabs(local_x) <= half_extents.x && std::fabs(local_y) <= half_extents.y;
}

void OverlayLayer::Clear() {
    nodes_.clear();
    edges_.clear();
}

void OverlayLayer::AddNode(NodeIndex index, const ImVec2& screen_center) {
    OverlayRegion region;
    region.kind = OverlayKind::kNode;
    region.element = index;
    region.center = screen_center;
    region.half_extents = ImVec2(kNodeHitRadius, kNodeHitRadius);
    nodes_.push_back(region);
}

void OverlayLayer::AddEdge(EdgeId edge_id, const ImVec2& screen_from, const ImVec2& screen_to) {
    float dx = screen_to.x - screen_from.x;
    float dy = screen_to.y - screen_from.y;

    OverlayRegion region;
    region.kind = OverlayKind::kEdge;
    region.element = edge_id;
    region.center = ImVec2((screen_from.x + screen_to.x) * 0.5f, (screen_from.y + screen_to.y) * 0.5f);
    region.half_extents = ImVec2(std::sqrt(dx * dx + dy * dy) * 0.5f, kEdgeHitHalfThickness);
    region.angle = std::atan2(dy, dx);
    edges_.push_back(region);
}

std::optional<HitTarget> OverlayLayer::HitTest(const ImVec2& point) const {
    for (auto it = nodes_.rbegin(); it != nodes_.rend(); ++it) {
        if (it->Contains(point)) return HitTarget{OverlayKind::kNode, it->element};
    }
    for (auto it = edges_.rbegin(); it != edges_.rend(); ++it) {
        if (it->Contains(point)) return HitTarget{OverlayKind::kEdge, it->element};
    }
    return std::nullopt;
}

} // namespace graph
} // namespace chatviz
