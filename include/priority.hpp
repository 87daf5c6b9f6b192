#pragma once

#include <vector>

#include "chunk_key.hpp"

namespace chunkcache {

// max(|dx|, |dy|): the square-radius metric used for prefetch and priority.
int ChebyshevDistance(const ChunkCoord& a, const ChunkCoord& b);

/**
 * @brief Priority tier of a chunk relative to the reference point.
 *
 * floor(min(distance / preload_radius, 1.0) * (priority_levels - 1)).
 * 0 is the most valuable tier, priority_levels - 1 the most evictable.
 * With preload_radius == 0 every chunk other than the reference chunk lands
 * in the last tier.
 */
int ComputePriority(const ChunkCoord& chunk, const ChunkCoord& reference,
                    int preload_radius, int priority_levels);

// floor(world / chunk_size) per axis; correct for negative positions.
// Results beyond the int32 range saturate. Throws std::invalid_argument for
// a NaN coordinate.
ChunkCoord WorldToChunk(const WorldPos& pos, int chunk_size);

/**
 * @brief All coordinates with max(|dx|, |dy|) <= radius around center.
 *
 * Ordered ring by ring, nearest first, so callers that enqueue the result
 * fetch the centre before the border. Returns (2r+1)^2 coordinates, or none
 * for a negative radius. Cells that would fall outside the int32 grid are
 * left out.
 */
std::vector<ChunkCoord> SquareNeighborhood(const ChunkCoord& center, int radius);

} // namespace chunkcache
