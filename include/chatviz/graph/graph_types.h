#pragma once

#include <chatviz/core/id_types.h>
#include <chatviz/graph/payload/graph_payload.h>

#include <imgui.h> // For ImVec2
#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chatviz {
namespace graph {

struct GraphNode {
    NodeId id;
    nlohmann::json attributes;      // Immutable payload attributes (never contains "id")
    std::optional<ImVec2> seed;     // Initial position when the payload carried numeric x/y
};

struct GraphEdge {
    EdgeId edge_id;                 // Position in the payload
    NodeIndex source_index;
    NodeIndex target_index;
    nlohmann::json attributes;
};

// An edge whose source or target is absent from the node set. Kept only for reporting.
struct DanglingEdge {
    EdgeId edge_id;
    NodeId source;
    NodeId target;
};

/*
 * Immutable node arena and resolved edge list for one payload.
 * Nodes are addressed by stable NodeIndex; ids map to indices through IndexOf().
 * Built once at ingestion; shared read-only by the simulation, renderer and overlays.
 */
class GraphModel {
public:
    static std::shared_ptr<const GraphModel> Build(const GraphPayload& payload);

    const std::vector<GraphNode>& Nodes() const { return nodes_; }
    const std::vector<GraphEdge>& Edges() const { return edges_; }
    const std::vector<DanglingEdge>& DanglingEdges() const { return dangling_edges_; }

    std::size_t NodeCount() const { return nodes_.size(); }
    std::optional<NodeIndex> IndexOf(const NodeId& id) const;
    const GraphEdge* FindEdge(EdgeId edge_id) const;

    // Number of resolved edges touching each node; used for link strength and bias.
    const std::vector<int>& Degrees() const { return degrees_; }

private:
    GraphModel() = default;

    std::vector<GraphNode> nodes_;
    std::vector<GraphEdge> edges_;
    std::vector<DanglingEdge> dangling_edges_;
    std::unordered_map<NodeId, NodeIndex> index_by_id_;
    std::vector<int> degrees_;
};

/*
 * Positions published by the simulation after one tick.
 * positions/pinned are index-aligned with GraphModel::Nodes().
 */
struct LayoutSnapshot {
    std::uint64_t version = 0;
    float alpha = 0.0f;
    std::vector<ImVec2> positions;
    std::vector<bool> pinned;
};

} // namespace graph
} // namespace chatviz
