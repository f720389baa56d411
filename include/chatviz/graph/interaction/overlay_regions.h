#ifndef CHATVIZ_OVERLAY_REGIONS_H
#define CHATVIZ_OVERLAY_REGIONS_H

#include <chatviz/core/id_types.h>

#include <imgui.h>
#include <cstddef>
#include <optional>
#include <vector>

namespace chatviz {
namespace graph {

enum class OverlayKind {
    kNode,
    kEdge
};

constexpr float kNodeHitRadius = 25.0f;
constexpr float kEdgeHitHalfThickness = 10.0f;

/*
 * Screen-space hit region for one rendered element.
 * Nodes are circles (half_extents.x is the radius); edges are rectangles
 * rotated by angle around center.
 */
struct OverlayRegion {
    OverlayKind kind = OverlayKind::kNode;
    std::size_t element = 0;   // NodeIndex for nodes, EdgeId for edges
    ImVec2 center;
    ImVec2 half_extents;
    float angle = 0.0f;

    bool Contains(const ImVec2& point) const;
};

struct HitTarget {
    OverlayKind kind;
    std::size_t element;
};

class OverlayLayer {
public:
    void Clear();
    void AddNode(NodeIndex index, const ImVec2& screen_center);
    void AddEdge(EdgeId edge_id, const ImVec2& screen_from, const ImVec2& screen_to);

    // Nodes sit above edges; within a kind, later regions sit above earlier ones.
    std::optional<HitTarget> HitTest(const ImVec2& point) const;

    const std::vector<OverlayRegion>& NodeRegions() const { return nodes_; }
    const std::vector<OverlayRegion>& EdgeRegions() const { return edges_; }

private:
    std::vector<OverlayRegion> nodes_;
    std::vector<OverlayRegion> edges_;
};

} // namespace graph
} // namespace chatviz

#endif // CHATVIZ_OVERLAY_REGIONS_H
