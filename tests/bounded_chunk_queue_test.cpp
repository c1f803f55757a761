//
// Created by garrett on 2/26/25.
//
#include <gtest/gtest.h>
#include "bounded_chunk_queue.hpp"

#include <atomic>
#include <chrono>
#include <thread>

namespace {
ChunkPtr makeChunk(const std::string& text) {
    return std::make_shared<const Chunk>(text.begin(), text.end());
}
}

TEST(BoundedChunkQueueTest, DeliversInOrderAndDrainsAfterClose) {
    BoundedChunkQueue queue(4);
    ASSERT_TRUE(queue.push(makeChunk("a")));
    ASSERT_TRUE(queue.push(makeChunk("b")));
    queue.close();

    auto first = queue.pop();
    auto second = queue.pop();
    ASSERT_TRUE(first && second);
    EXPECT_EQ(std::string((*first)->begin(), (*first)->end()), "a");
    EXPECT_EQ(std::string((*second)->begin(), (*second)->end()), "b");
    EXPECT_FALSE(queue.pop().has_value());
    EXPECT_FALSE(queue.push(makeChunk("c")));
}

TEST(BoundedChunkQueueTest, ProducerBlocksWhenFull) {
    BoundedChunkQueue queue(1);
    ASSERT_TRUE(queue.push(makeChunk("a")));

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        queue.push(makeChunk("b"));
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(pushed);

    queue.pop();
    producer.join();
    EXPECT_TRUE(pushed);
    EXPECT_EQ(queue.size(), 1u);
}

TEST(BoundedChunkQueueTest, AbortWakesBlockedProducerAndDropsChunks) {
    BoundedChunkQueue queue(1);
    ASSERT_TRUE(queue.push(makeChunk("a")));

    std::atomic<bool> result{true};
    std::thread producer([&] { result = queue.push(makeChunk("b")); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.abort();
    producer.join();

    EXPECT_FALSE(result);
    EXPECT_TRUE(queue.aborted());
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(BoundedChunkQueueTest, SameChunkSharedBetweenQueues) {
    BoundedChunkQueue left(2);
    BoundedChunkQueue right(2);
    ChunkPtr chunk = makeChunk("shared");
    left.push(chunk);
    right.push(chunk);

    EXPECT_EQ(left.pop()->get(), right.pop()->get());
}
