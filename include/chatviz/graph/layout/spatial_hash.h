#ifndef CHATVIZ_GRAPH_SPATIAL_HASH_H
#define CHATVIZ_GRAPH_SPATIAL_HASH_H

#include <imgui.h>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace chatviz {
namespace graph {

namespace detail {
// Cell (x, y) as one bucket key.
constexpr uint64_t PackCell(int32_t x, int32_t y) {
    return (static_cast<uint64_t>(static_cast<uint32_t>(x)) << 32) |
           static_cast<uint32_t>(y);
}
} // namespace detail

// Uniform grid over point positions, rebuilt every tick for neighbour queries.
class SpatialHash {
public:
    explicit SpatialHash(float cell_size);

    void Insert(const std::vector<ImVec2>& positions);
    // Indices of every inserted point whose cell lies within radius of position (a superset of the true neighbours).
    std::vector<int> Query(const ImVec2& position, float radius) const;

private:
    float cell_size_;
    std::unordered_map<uint64_t, std::vector<int>> buckets_;
};

} // namespace graph
} // namespace chatviz

#endif // CHATVIZ_GRAPH_SPATIAL_HASH_H
