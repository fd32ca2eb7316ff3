#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <set>
#include <thread>
#include <vector>

#include "Queue/headers/ThreadSafeQueue.h"
#include "Grid/headers/GridTypes.h"

using namespace std::chrono_literals;

TEST(ThreadSafeQueueTest, FifoOrder) {
    ThreadSafeQueue<int> queue(10, "Fifo");
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(queue.push(int(i)));
    }
    EXPECT_EQ(queue.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        int value = -1;
        ASSERT_TRUE(queue.try_pop(value));
        EXPECT_EQ(value, i);
    }
    EXPECT_TRUE(queue.empty());
}

TEST(ThreadSafeQueueTest, TryPushFailsWhenFull) {
    ThreadSafeQueue<int> queue(2, "Bounded");
    EXPECT_TRUE(queue.try_push(1));
    EXPECT_TRUE(queue.try_push(2));
    EXPECT_TRUE(queue.full());
    EXPECT_FALSE(queue.try_push(3));
    EXPECT_EQ(queue.high_water_mark(), 2u);
}

TEST(ThreadSafeQueueTest, PushBlocksUntilConsumerMakesRoom) {
    ThreadSafeQueue<int> queue(1, "Backpressure");
    ASSERT_TRUE(queue.push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&]() {
        EXPECT_TRUE(queue.push(2));
        pushed = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(pushed.load());

    int value = 0;
    ASSERT_TRUE(queue.pop(value));
    EXPECT_EQ(value, 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_LE(queue.high_water_mark(), 1u);
}

TEST(ThreadSafeQueueTest, ShutdownDrainsThenStops) {
    ThreadSafeQueue<int> queue(4, "Drain");
    ASSERT_TRUE(queue.push(7));
    ASSERT_TRUE(queue.push(8));
    queue.shutdown();
    queue.shutdown(); // idempotent

    EXPECT_FALSE(queue.push(9));
    int value = 0;
    EXPECT_TRUE(queue.pop(value));
    EXPECT_EQ(value, 7);
    EXPECT_TRUE(queue.pop(value));
    EXPECT_EQ(value, 8);
    EXPECT_FALSE(queue.pop(value));
}

TEST(ThreadSafeQueueTest, ShutdownReleasesBlockedProducer) {
    ThreadSafeQueue<int> queue(1, "Release");
    ASSERT_TRUE(queue.push(1));

    std::atomic<int> result{-1};
    std::thread producer([&]() { result = queue.push(2) ? 1 : 0; });
    std::this_thread::sleep_for(20ms);
    queue.shutdown();
    producer.join();
    EXPECT_EQ(result.load(), 0);
}

TEST(ThreadSafeQueueTest, PopForTimesOut) {
    ThreadSafeQueue<int> queue(4, "Timeout");
    int value = 0;
    EXPECT_FALSE(queue.pop_for(value, 10ms));
}

TEST(ThreadSafeQueueTest, ManyProducersSingleConsumer) {
    ThreadSafeQueue<RowBatch> queue(8, "Rows");
    constexpr uint32_t kProducers = 4;
    constexpr uint32_t kRowsEach = 250;

    std::vector<std::thread> producers;
    for (uint32_t p = 0; p < kProducers; ++p) {
        producers.emplace_back([&queue, p]() {
            for (uint32_t i = 0; i < kRowsEach; ++i) {
                RowBatch batch;
                batch.row = p * kRowsEach + i + 1;
                EXPECT_TRUE(queue.push(std::move(batch)));
            }
        });
    }

    std::thread closer([&]() {
        for (auto &t: producers) {
            t.join();
        }
        queue.shutdown();
    });

    std::set<uint32_t> rows;
    RowBatch batch;
    while (queue.pop(batch)) {
        EXPECT_TRUE(rows.insert(batch.row).second);
    }
    closer.join();

    EXPECT_EQ(rows.size(), kProducers * kRowsEach);
    EXPECT_EQ(*rows.begin(), 1u);
    EXPECT_EQ(*rows.rbegin(), kProducers * kRowsEach);
    EXPECT_LE(queue.high_water_mark(), 8u);
}

TEST(ThreadSafeQueueTest, MemoryUsageCountsItems) {
    ThreadSafeQueue<RowBatch> queue(4, "Usage");
    const size_t empty_usage = queue.getMemoryUsage();
    RowBatch batch;
    batch.writes.resize(100);
    ASSERT_TRUE(queue.push(std::move(batch)));
    EXPECT_GT(queue.getMemoryUsage(), empty_usage + 100 * sizeof(CellWrite) - 1);
}

TEST(ThreadSafeQueueTest, ClearWakesWaitUntilEmpty) {
    ThreadSafeQueue<int> queue(4, "Clear");
    ASSERT_TRUE(queue.push(1));
    std::thread waiter([&]() { queue.wait_until_empty(); });
    std::this_thread::sleep_for(10ms);
    queue.clear();
    waiter.join();
    EXPECT_TRUE(queue.empty());
}

TEST(ThreadSafeQueueTest, ClearReportsDroppedItems) {
    ThreadSafeQueue<int> queue(8, "ClearCount");
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(queue.push(int{i}));
    }
    int first = 0;
    ASSERT_TRUE(queue.pop(first));
    EXPECT_EQ(queue.clear(), 4u);
    EXPECT_EQ(queue.clear(), 0u);
    EXPECT_EQ(queue.size(), 0u);
}
