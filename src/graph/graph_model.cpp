#include <chatviz/graph/graph_types.h>

#include <cmath>
#include <iostream>
#include <limits>

namespace chatviz {
namespace graph {

namespace {

bool InFloatRange(double value) {
    return std::isfinite(value) && std::fabs(value) <= std::numeric_limits<float>::max();
}

std::optional<ImVec2> SeedFromAttributes(const nlohmann::json& attributes) {
    auto x_it = attributes.find("x");
    auto y_it = attributes.find("y");
    if (x_it == attributes.end() || y_it == attributes.end()) return std::nullopt;
    if (!x_it->is_number() || !y_it->is_number()) return std::nullopt;
    const double x = x_it->get<double>();
    const double y = y_it->get<double>();
    if (!InFloatRange(x) || !InFloatRange(y)) {
        std::cerr << "Warning: ignoring out-of-range seed position (" << x << ", " << y << ")" << std::endl;
        return std::nullopt;
    }
    return ImVec2(static_cast<float>(x), static_cast<float>(y));
}

} // anonymous namespace

std::shared_ptr<const GraphModel> GraphModel::Build(const GraphPayload& payload) {
    std::shared_ptr<GraphModel> model(new GraphModel());

    model->nodes_.reserve(payload.nodes.size());
    for (const auto& spec : payload.nodes) {
        const NodeIndex index = model->nodes_.size();
        // GraphPayload guarantees unique ids; keep the first occurrence if a caller built one by hand.
        if (!model->index_by_id_.emplace(spec.id, index).second) continue;
        model->nodes_.push_back({spec.id, spec.attributes, SeedFromAttributes(spec.attributes)});
    }
    model->degrees_.assign(model->nodes_.size(), 0);

    for (EdgeId edge_id = 0; edge_id < payload.edges.size(); ++edge_id) {
        const EdgeSpec& spec = payload.edges[edge_id];
        auto source = model->IndexOf(spec.source);
        auto target = model->IndexOf(spec.target);
        if (!source || !target) {
            model->dangling_edges_.push_back({edge_id, spec.source, spec.target});
            continue;
        }
        model->edges_.push_back({edge_id, *source, *target, spec.attributes});
        ++model->degrees_[*source];
        ++model->degrees_[*target];
    }

    if (!model->dangling_edges_.empty()) {
        std::cerr << "Warning: dropped " << model->dangling_edges_.size()
                  << " edge(s) referencing unknown nodes:";
        for (const auto& dangling : model->dangling_edges_) {
            std::cerr << " [" << dangling.edge_id << "] " << dangling.source << " -> " << dangling.target;
        }
        std::cerr << std::endl;
    }

    return model;
}

std::optional<NodeIndex> GraphModel::IndexOf(const NodeId& id) const {
    auto it = index_by_id_.find(id);
    if (it == index_by_id_.end()) return std::nullopt;
    return it->second;
}

const GraphEdge* GraphModel::FindEdge(EdgeId edge_id) const {
    for (const auto& edge : edges_) {
        if (edge.edge_id == edge_id) return &edge;
    }
    return nullptr;
}

} // namespace graph
} // namespace chatviz
