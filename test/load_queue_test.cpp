#include <gtest/gtest.h>

#include "../include/load_queue.hpp"


using chunkcache::ChunkKey;
using chunkcache::LoadQueue;

TEST(LoadQueueTest, EnqueueDeduplicates) {
    LoadQueue q;
    ChunkKey a("poi", 0, 0);
    EXPECT_TRUE(q.Enqueue(a));
    EXPECT_FALSE(q.Enqueue(a));
    EXPECT_EQ(q.PendingCount(), 1u);
    EXPECT_TRUE(q.IsPending(a));
    EXPECT_FALSE(q.IsInFlight(a));
}

TEST(LoadQueueTest, TakeBatchIsFifoAndMovesKeysInFlight) {
    LoadQueue q;
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(q.Enqueue(ChunkKey("poi", i, 0)));
    }

    auto batch = q.TakeBatch(3);
    ASSERT_EQ(batch.size(), 3u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(batch[i], ChunkKey("poi", i, 0));
        EXPECT_TRUE(q.IsInFlight(batch[i]));
        EXPECT_FALSE(q.IsPending(batch[i]));
    }
    EXPECT_EQ(q.PendingCount(), 2u);
    EXPECT_EQ(q.InFlightCount(), 3u);

    auto rest = q.TakeBatch(10);
    ASSERT_EQ(rest.size(), 2u);
    EXPECT_EQ(rest[0], ChunkKey("poi", 3, 0));
    EXPECT_EQ(rest[1], ChunkKey("poi", 4, 0));
    EXPECT_FALSE(q.HasPending());
    EXPECT_TRUE(q.TakeBatch(4).empty());
}

TEST(LoadQueueTest, InFlightKeyCannotBeRequeuedUntilFinished) {
    LoadQueue q;
    ChunkKey a("poi", 1, 1);
    q.Enqueue(a);
    q.TakeBatch(1);
    EXPECT_FALSE(q.Enqueue(a));
    EXPECT_TRUE(q.Contains(a));

    EXPECT_TRUE(q.Finish(a));
    EXPECT_FALSE(q.Finish(a));
    EXPECT_FALSE(q.Contains(a));
    EXPECT_TRUE(q.Enqueue(a));
}

TEST(LoadQueueTest, ClearPendingOnlyTouchesOneOwner) {
    LoadQueue q;
    q.Enqueue(ChunkKey("a", 0, 0));
    q.Enqueue(ChunkKey("b", 0, 0));
    q.Enqueue(ChunkKey("a", 1, 0));
    q.Enqueue(ChunkKey("b", 1, 0));
    q.Enqueue(ChunkKey("a", 2, 0));
    q.TakeBatch(1);  // a:0:0 now in flight

    EXPECT_EQ(q.ClearPending("a"), 2u);
    EXPECT_EQ(q.PendingCount(), 2u);
    EXPECT_TRUE(q.IsInFlight(ChunkKey("a", 0, 0)));

    auto batch = q.TakeBatch(5);
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch[0], ChunkKey("b", 0, 0));
    EXPECT_EQ(batch[1], ChunkKey("b", 1, 0));
}

TEST(LoadQueueTest, RemovePendingAndClearAll) {
    LoadQueue q;
    q.Enqueue(ChunkKey("a", 0, 0));
    q.Enqueue(ChunkKey("a", 1, 0));
    q.Enqueue(ChunkKey("a", 2, 0));

    EXPECT_TRUE(q.RemovePending(ChunkKey("a", 1, 0)));
    EXPECT_FALSE(q.RemovePending(ChunkKey("a", 1, 0)));

    auto batch = q.TakeBatch(1);
    ASSERT_EQ(batch.size(), 1u);
    EXPECT_EQ(batch[0], ChunkKey("a", 0, 0));

    EXPECT_EQ(q.ClearAllPending(), 1u);
    EXPECT_EQ(q.PendingCount(), 0u);
    EXPECT_EQ(q.InFlightCount(), 1u);
}
