#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <utility>

namespace chunkcache {

// Integer grid coordinate of a chunk.
struct ChunkCoord {
    int32_t x = 0;
    int32_t y = 0;

    bool operator==(const ChunkCoord& other) const { return x == other.x && y == other.y; }
    bool operator!=(const ChunkCoord& other) const { return !(*this == other); }
};

// Continuous world-space position; see WorldToChunk().
struct WorldPos {
    double x = 0.0;
    double y = 0.0;
};

/**
 * @brief Identity of one cached chunk: (owner id, x, y).
 *
 * Immutable after construction. The canonical string form
 * "{owner_id}:{x}:{y}" is built once and used for hashing.
 */
class ChunkKey {
public:
    ChunkKey(std::string owner_id, int32_t x, int32_t y);
    ChunkKey(std::string owner_id, const ChunkCoord& coord)
        : ChunkKey(std::move(owner_id), coord.x, coord.y) {}

    const std::string& OwnerId() const { return owner_id_; }
    int32_t X() const { return x_; }
    int32_t Y() const { return y_; }
    ChunkCoord Coord() const { return ChunkCoord{x_, y_}; }

    const std::string& ToString() const { return encoded_; }

    bool operator==(const ChunkKey& other) const {
        return x_ == other.x_ && y_ == other.y_ && owner_id_ == other.owner_id_;
    }
    bool operator!=(const ChunkKey& other) const { return !(*this == other); }
    bool operator<(const ChunkKey& other) const;

private:
    std::string owner_id_;
    int32_t x_;
    int32_t y_;
    std::string encoded_;
};

struct ChunkKeyHash {
    size_t operator()(const ChunkKey& key) const noexcept {
        return std::hash<std::string>{}(key.ToString());
    }
};

std::ostream& operator<<(std::ostream& os, const ChunkKey& key);

} // namespace chunkcache

namespace std {
template <>
struct hash<chunkcache::ChunkKey> : chunkcache::ChunkKeyHash {};
} // namespace std
