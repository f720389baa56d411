#include <chatviz/graph/payload/graph_payload.h>

#include <initializer_list>
#include <unordered_set>

namespace chatviz {
namespace graph {

namespace {

// Accepts the id forms a tool may emit: JSON strings and integers.
NodeId IdFromJson(const nlohmann::json& value, const std::string& context) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return value.dump();
    }
    throw PayloadError(context + " must be a string or an integer");
}

nlohmann::json AttributesWithout(const nlohmann::json& object, std::initializer_list<const char*> keys) {
    nlohmann::json attributes = object;
    for (const char* key : keys) {
        attributes.erase(key);
    }
    return attributes;
}

} // anonymous namespace

GraphPayload ParseGraphPayload(const std::string& text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw PayloadError(std::string("Graph payload is not valid JSON: ") + e.what());
    }
    return GraphPayloadFromJson(root);
}

GraphPayload GraphPayloadFromJson(const nlohmann::json& root) {
    if (!root.is_object()) {
        throw PayloadError("Graph payload must be a JSON object");
    }

    auto nodes_it = root.find("nodes");
    if (nodes_it == root.end() || !nodes_it->is_array()) {
        throw PayloadError("Graph payload requires a \"nodes\" array");
    }

    GraphPayload payload;
    payload.nodes.reserve(nodes_it->size());
    std::unordered_set<NodeId> seen_ids;

    for (std::size_t i = 0; i < nodes_it->size(); ++i) {
        const nlohmann::json& node = (*nodes_it)[i];
        const std::string context = "nodes[" + std::to_string(i) + "]";
        if (!node.is_object()) {
            throw PayloadError(context + " must be an object");
        }
        auto id_it = node.find("id");
        if (id_it == node.end()) {
            throw PayloadError(context + " is missing \"id\"");
        }
        NodeId id = IdFromJson(*id_it, context + ".id");
        if (!seen_ids.insert(id).second) {
            throw PayloadError("Duplicate node id \"" + id + "\"");
        }
        payload.nodes.push_back({std::move(id), AttributesWithout(node, {"id"})});
    }

    auto edges_it = root.find("edges");
    if (edges_it == root.end() || edges_it->is_null()) {
        return payload;
    }
    if (!edges_it->is_array()) {
        throw PayloadError("Graph payload \"edges\" must be an array");
    }

    payload.edges.reserve(edges_it->size());
    for (std::size_t i = 0; i < edges_it->size(); ++i) {
        const nlohmann::json& edge = (*edges_it)[i];
        const std::string context = "edges[" + std::to_string(i) + "]";
        if (!edge.is_object()) {
            throw PayloadError(context + " must be an object");
        }
        auto source_it = edge.find("source");
        auto target_it = edge.find("target");
        if (source_it == edge.end() || target_it == edge.end()) {
            throw PayloadError(context + " requires \"source\" and \"target\"");
        }
        payload.edges.push_back({IdFromJson(*source_it, context + ".source"),
                                 IdFromJson(*target_it, context + ".target"),
                                 AttributesWithout(edge, {"source", "target"})});
    }

    return payload;
}

} // namespace graph
} // namespace chatviz
