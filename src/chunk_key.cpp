#include "chunk_key.hpp"

#include <tuple>
#include <utility>

namespace chunkcache {

ChunkKey::ChunkKey(std::string owner_id, int32_t x, int32_t y)
    : owner_id_(std::move(owner_id)), x_(x), y_(y) {
    encoded_.reserve(owner_id_.size() + 24);
    encoded_.append(owner_id_);
    encoded_.push_back(':');
    encoded_.append(std::to_string(x_));
    encoded_.push_back(':');
    encoded_.append(std::to_string(y_));
}

bool ChunkKey::operator<(const ChunkKey& other) const {
    return std::tie(owner_id_, x_, y_) < std::tie(other.owner_id_, other.x_, other.y_);
}

std::ostream& operator<<(std::ostream& os, const ChunkKey& key) {
    return os << key.ToString();
}

} // namespace chunkcache
