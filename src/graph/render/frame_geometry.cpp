#include <chatviz/graph/render/frame_geometry.h>

#include <algorithm>

namespace chatviz {
namespace graph {

FrameGeometry BuildFrameGeometry(const GraphModel& model,
                                 const LayoutSnapshot& snapshot,
                                 const ViewportTransform& transform,
                                 std::uint64_t transform_revision) {
    FrameGeometry frame;
    frame.snapshot_version = snapshot.version;
    frame.transform_revision = transform_revision;
    frame.transform = transform;

    const std::size_t count = std::min(model.NodeCount(), snapshot.positions.size());
    frame.node_screen.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        frame.node_screen.push_back(transform.WorldToScreen(snapshot.positions[i]));
    }

    frame.edges.reserve(model.Edges().size());
    for (const auto& edge : model.Edges()) {
        if (edge.source_index >= count || edge.target_index >= count) continue;
        ScreenEdge screen_edge{edge.edge_id, edge.source_index, edge.target_index,
                               frame.node_screen[edge.source_index], frame.node_screen[edge.target_index]};
        frame.overlays.AddEdge(edge.edge_id, screen_edge.from, screen_edge.to);
        frame.edges.push_back(screen_edge);
    }

    for (std::size_t i = 0; i < count; ++i) {
        frame.overlays.AddNode(i, frame.node_screen[i]);
    }
    return frame;
}

} // namespace graph
} // namespace chatviz
