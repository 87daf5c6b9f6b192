#include <gtest/gtest.h>
#include <sstream>
#include <unordered_set>

#include "../include/chunk_key.hpp"


using chunkcache::ChunkCoord;
using chunkcache::ChunkKey;

TEST(ChunkKeyTest, EncodesOwnerAndCoordinates) {
    ChunkKey key("poi-7", 3, -4);
    EXPECT_EQ(key.ToString(), "poi-7:3:-4");
    EXPECT_EQ(key.OwnerId(), "poi-7");
    EXPECT_EQ(key.X(), 3);
    EXPECT_EQ(key.Y(), -4);
    EXPECT_EQ(key.Coord(), (ChunkCoord{3, -4}));

    std::ostringstream os;
    os << key;
    EXPECT_EQ(os.str(), "poi-7:3:-4");
}

TEST(ChunkKeyTest, EqualityRequiresAllThreeFields) {
    ChunkKey a("poi", 1, 2);
    EXPECT_EQ(a, ChunkKey("poi", 1, 2));
    EXPECT_EQ(a, ChunkKey("poi", ChunkCoord{1, 2}));
    EXPECT_NE(a, ChunkKey("poi", 2, 1));
    EXPECT_NE(a, ChunkKey("poi", 1, 3));
    EXPECT_NE(a, ChunkKey("other", 1, 2));
}

TEST(ChunkKeyTest, HashesConsistentlyWithEquality) {
    std::unordered_set<ChunkKey> keys;
    keys.insert(ChunkKey("poi", 0, 0));
    keys.insert(ChunkKey("poi", 0, 0));
    keys.insert(ChunkKey("poi", 0, 1));
    keys.insert(ChunkKey("poi2", 0, 0));
    EXPECT_EQ(keys.size(), 3u);
    EXPECT_EQ(keys.count(ChunkKey("poi", 0, 1)), 1u);
}

TEST(ChunkKeyTest, OrdersByOwnerThenXThenY) {
    EXPECT_LT(ChunkKey("a", 5, 5), ChunkKey("b", 0, 0));
    EXPECT_LT(ChunkKey("a", 0, 9), ChunkKey("a", 1, 0));
    EXPECT_LT(ChunkKey("a", 1, -1), ChunkKey("a", 1, 0));
    EXPECT_FALSE(ChunkKey("a", 1, 0) < ChunkKey("a", 1, 0));
}
