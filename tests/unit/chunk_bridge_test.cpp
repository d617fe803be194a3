/**
 * @file chunk_bridge_test.cpp
 * @brief Unit tests for the push-to-pull output bridge
 *
 * @date 2025
 */

#include "noritest/core/chunk_bridge.hpp"
#include "noritest/core/types.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using noritest::core::ChunkBridge;
using noritest::core::OutputChunk;
using noritest::core::OutputOrigin;

TEST(ChunkBridgeTest, DeliversInOrder) {
    ChunkBridge<int> bridge;
    bridge.Push(1);
    bridge.Push(2);
    bridge.Push(3);
    bridge.Close();

    EXPECT_EQ(bridge.Next(), 1);
    EXPECT_EQ(bridge.Next(), 2);
    EXPECT_EQ(bridge.Next(), 3);
    EXPECT_EQ(bridge.Next(), std::nullopt);
    EXPECT_EQ(bridge.Next(), std::nullopt);
}

TEST(ChunkBridgeTest, QueuedItemsSurviveClose) {
    ChunkBridge<std::string> bridge;
    bridge.Push("late");
    bridge.Close();

    EXPECT_TRUE(bridge.IsClosed());
    EXPECT_EQ(bridge.Pending(), 1u);
    EXPECT_EQ(bridge.Next(), std::string("late"));
    EXPECT_EQ(bridge.Pending(), 0u);
    EXPECT_EQ(bridge.Next(), std::nullopt);
}

TEST(ChunkBridgeTest, PushAfterCloseIsDropped) {
    ChunkBridge<int> bridge;
    bridge.Close();
    EXPECT_FALSE(bridge.Push(1));
    EXPECT_EQ(bridge.Pending(), 0u);
}

TEST(ChunkBridgeTest, ConsumerWakesOnPush) {
    ChunkBridge<OutputChunk> bridge;

    std::thread producer([&bridge] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        bridge.Push(OutputChunk{OutputOrigin::STDERR, "woke"});
    });

    auto chunk = bridge.Next();
    producer.join();

    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(chunk->origin, OutputOrigin::STDERR);
    EXPECT_EQ(chunk->data, "woke");
}

TEST(ChunkBridgeTest, ConsumerWakesOnClose) {
    ChunkBridge<int> bridge;

    std::thread producer([&bridge] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        bridge.Close();
    });

    EXPECT_EQ(bridge.Next(), std::nullopt);
    producer.join();
}

TEST(ChunkBridgeTest, ConcurrentProducersLoseNothing) {
    ChunkBridge<int> bridge;
    constexpr int PER_PRODUCER = 1000;

    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&bridge, p] {
            for (int i = 0; i < PER_PRODUCER; ++i) {
                bridge.Push(p * PER_PRODUCER + i);
            }
        });
    }

    std::thread closer([&] {
        for (auto& producer : producers) {
            producer.join();
        }
        bridge.Close();
    });

    std::vector<int> last(4, -1);
    int count = 0;
    while (auto value = bridge.Next()) {
        int producer = *value / PER_PRODUCER;
        // Per-producer order is preserved
        EXPECT_GT(*value, last[producer]);
        last[producer] = *value;
        ++count;
    }
    closer.join();

    EXPECT_EQ(count, 4 * PER_PRODUCER);
}
