#include "priority.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>

namespace chunkcache {

int ChebyshevDistance(const ChunkCoord& a, const ChunkCoord& b) {
    // 64-bit deltas so extreme coordinates cannot overflow.
    long long dx = std::llabs(static_cast<long long>(a.x) - b.x);
    long long dy = std::llabs(static_cast<long long>(a.y) - b.y);
    long long d = std::max(dx, dy);
    return d > INT32_MAX ? INT32_MAX : static_cast<int>(d);
}

int ComputePriority(const ChunkCoord& chunk, const ChunkCoord& reference,
                    int preload_radius, int priority_levels) {
    if (priority_levels <= 1) {
        return 0;
    }
    int distance = ChebyshevDistance(chunk, reference);
    double normalized;
    if (preload_radius <= 0) {
        normalized = distance == 0 ? 0.0 : 1.0;
    } else {
        normalized = std::min(static_cast<double>(distance) / preload_radius, 1.0);
    }
    int priority = static_cast<int>(std::floor(normalized * (priority_levels - 1)));
    return std::clamp(priority, 0, priority_levels - 1);
}

namespace {

int32_t FloorToGrid(double world, int chunk_size) {
    if (std::isnan(world)) {
        throw std::invalid_argument("world coordinate is NaN");
    }
    double cell = std::floor(world / chunk_size);
    if (cell <= static_cast<double>(INT32_MIN)) return INT32_MIN;
    if (cell >= static_cast<double>(INT32_MAX)) return INT32_MAX;
    return static_cast<int32_t>(cell);
}

bool OnGrid(int64_t v) {
    return v >= INT32_MIN && v <= INT32_MAX;
}

}  // namespace

ChunkCoord WorldToChunk(const WorldPos& pos, int chunk_size) {
    return ChunkCoord{FloorToGrid(pos.x, chunk_size), FloorToGrid(pos.y, chunk_size)};
}

std::vector<ChunkCoord> SquareNeighborhood(const ChunkCoord& center, int radius) {
    std::vector<ChunkCoord> out;
    if (radius < 0) {
        return out;
    }
    size_t side = 2 * static_cast<size_t>(radius) + 1;
    out.reserve(side * side);
    out.push_back(center);
    for (int64_t ring = 1; ring <= radius; ++ring) {
        for (int64_t dy = -ring; dy <= ring; ++dy) {
            int64_t y = static_cast<int64_t>(center.y) + dy;
            if (!OnGrid(y)) continue;
            bool edge_row = dy == -ring || dy == ring;
            // Interior rows only contribute their two end cells.
            int64_t step = edge_row ? 1 : 2 * ring;
            for (int64_t dx = -ring; dx <= ring; dx += step) {
                int64_t x = static_cast<int64_t>(center.x) + dx;
                if (!OnGrid(x)) continue;
                out.push_back(ChunkCoord{static_cast<int32_t>(x), static_cast<int32_t>(y)});
            }
        }
    }
    return out;
}

} // namespace chunkcache
