#ifndef CHATVIZ_GRAPH_PAYLOAD_H
#define CHATVIZ_GRAPH_PAYLOAD_H

#include <chatviz/core/id_types.h>

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace chatviz {
namespace graph {

// Raised for unparsable or structurally invalid graph data.
class PayloadError : public std::runtime_error {
public:
    explicit PayloadError(const std::string& what) : std::runtime_error(what) {}
};

struct NodeSpec {
    NodeId id;
    nlohmann::json attributes; // object, without "id"
};

struct EdgeSpec {
    NodeId source;
    NodeId target;
    nlohmann::json attributes; // object, without "source"/"target"
};

struct GraphPayload {
    std::vector<NodeSpec> nodes;
    std::vector<EdgeSpec> edges;
};

/*
 * Parses the body of a graph tool result:
 *   { "nodes": [{"id": ..., ...}], "edges": [{"source": ..., "target": ..., ...}] }
 * Ids may be strings or integers. A missing "edges" key means no edges.
 * Throws PayloadError on malformed JSON, wrong shapes, missing ids or duplicate node ids.
 * Edges that reference unknown nodes are NOT rejected here; see GraphModel.
 */
GraphPayload ParseGraphPayload(const std::string& text);
GraphPayload GraphPayloadFromJson(const nlohmann::json& root);

} // namespace graph
} // namespace chatviz

#endif // CHATVIZ_GRAPH_PAYLOAD_H
