#pragma once

#include <chatviz/graph/graph_types.h>
#include <chatviz/graph/interaction/overlay_regions.h>
#include <chatviz/graph/render/viewport_transform.h>

#include <cstdint>
#include <vector>

namespace chatviz {
namespace graph {

struct ScreenEdge {
    EdgeId edge_id;
    NodeIndex source_index;
    NodeIndex target_index;
    ImVec2 from;
    ImVec2 to;
};

/*
 * One frame's screen-space view of the graph. Drawing and hit-testing both
 * read the same instance, so what is under the pointer is what was drawn.
 */
struct FrameGeometry {
    std::uint64_t snapshot_version = 0;
    std::uint64_t transform_revision = 0;
    ViewportTransform transform;

    std::vector<ImVec2> node_screen;     // Index-aligned with GraphModel::Nodes()
    std::vector<ScreenEdge> edges;       // Resolved edges, payload order
    OverlayLayer overlays;

    bool Matches(std::uint64_t version, std::uint64_t revision) const {
        return snapshot_version == version && transform_revision == revision;
    }
};

FrameGeometry BuildFrameGeometry(const GraphModel& model,
                                 const LayoutSnapshot& snapshot,
                                 const ViewportTransform& transform,
                                 std::uint64_t transform_revision);

} // namespace graph
} // namespace chatviz
