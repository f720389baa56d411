#include <chatviz/graph/layout/spatial_hash.h>
#include <cmath>
#include <algorithm>

namespace chatviz {
namespace graph {

SpatialHash::SpatialHash(float cell_size) : cell_size_(std::max(1.0f, cell_size)) {}

void SpatialHash::Insert(const std::vector<ImVec2>& positions) {
    buckets_.clear();
    buckets_.reserve(positions.size() * 2);

    for (size_t idx = 0; idx < positions.size(); ++idx) {
        const ImVec2& p = positions[idx];
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) continue;

        int32_t cx = static_cast<int32_t>(std::floor(p.x / cell_size_));
        int32_t cy = static_cast<int32_t>(std::floor(p.y / cell_size_));
        buckets_[detail::PackCell(cx, cy)].push_back(static_cast<int>(idx));
    }
}

std::vector<int> SpatialHash::Query(const ImVec2& position, float radius) const {
    std::vector<int> result;
    if (buckets_.empty()) return result;

    int32_t center_cx = static_cast<int32_t>(std::floor(position.x / cell_size_));
    int32_t center_cy = static_cast<int32_t>(std::floor(position.y / cell_size_));

    int search_radius = static_cast<int>(std::ceil(radius / cell_size_));

    for (int dx = -search_radius; dx <= search_radius; ++dx) {
        for (int dy = -search_radius; dy <= search_radius; ++dy) {
            uint64_t key = detail::PackCell(center_cx + dx, center_cy + dy);
            auto bucket_it = buckets_.find(key);
            if (bucket_it != buckets_.end()) {
                result.insert(result.end(), bucket_it->second.begin(), bucket_it->second.end());
            }
        }
    }
    return result;
}

} // namespace graph
} // namespace chatviz
