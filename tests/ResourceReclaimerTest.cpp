#include <gtest/gtest.h>
#include <stdexcept>

#include "Grid/headers/ResourceReclaimer.h"
#include "TestSupport.h"

namespace {
    struct CountingCollector {
        int calls{0};

        ResourceReclaimer::CollectFn fn() {
            return [this]() {
                ++calls;
                return static_cast<size_t>(64);
            };
        }
    };
}

TEST(ResourceReclaimerTest, ZeroThresholdIsRejected) {
    testsupport::RecordingSink sink;
    EXPECT_THROW(ResourceReclaimer(sink, 0), std::invalid_argument);
}

TEST(ResourceReclaimerTest, NoReclamationAtOrBelowThreshold) {
    testsupport::RecordingSink sink;
    CountingCollector collector;
    ResourceReclaimer reclaimer(sink, 30, collector.fn());

    EXPECT_FALSE(reclaimer.rowCompleted(1, 10));
    EXPECT_FALSE(reclaimer.rowCompleted(2, 10));
    EXPECT_FALSE(reclaimer.rowCompleted(3, 10)); // exactly 30
    EXPECT_EQ(reclaimer.pendingWrites(), 30u);
    EXPECT_EQ(reclaimer.reclamations(), 0u);
    EXPECT_TRUE(sink.clears.empty());
    EXPECT_EQ(collector.calls, 0);
}

TEST(ResourceReclaimerTest, CrossingThresholdClearsWrittenRowsCollectsAndResets) {
    testsupport::RecordingSink sink;
    CountingCollector collector;
    ResourceReclaimer reclaimer(sink, 30, collector.fn());

    for (uint32_t row = 1; row <= 3; ++row) {
        reclaimer.rowCompleted(row, 10);
    }
    EXPECT_TRUE(reclaimer.rowCompleted(4, 10));

    ASSERT_EQ(sink.clears.size(), 1u);
    EXPECT_EQ(sink.clears[0], std::make_pair(1u, 4u));
    EXPECT_EQ(collector.calls, 1);
    EXPECT_EQ(reclaimer.pendingWrites(), 0u);
    EXPECT_EQ(reclaimer.reclamations(), 1u);
    EXPECT_EQ(reclaimer.bytesReleased(), 64u);
    EXPECT_EQ(reclaimer.lastClearedRow(), 4u);
}

TEST(ResourceReclaimerTest, NeverClearsRowsAheadOfUnfinishedRows) {
    testsupport::RecordingSink sink;
    CountingCollector collector;
    ResourceReclaimer reclaimer(sink, 15, collector.fn());

    // Rows finish out of order; row 2 is still in flight
    reclaimer.rowCompleted(1, 10);
    EXPECT_TRUE(reclaimer.rowCompleted(3, 10));
    ASSERT_EQ(sink.clears.size(), 1u);
    EXPECT_EQ(sink.clears[0], std::make_pair(1u, 1u));
    EXPECT_EQ(reclaimer.completedThrough(), 1u);

    reclaimer.rowCompleted(4, 10);
    // Nothing new is contiguous, so only the collection runs
    EXPECT_TRUE(reclaimer.rowCompleted(5, 10));
    EXPECT_EQ(sink.clears.size(), 1u);
    EXPECT_EQ(collector.calls, 2);

    reclaimer.rowCompleted(2, 10);
    EXPECT_EQ(reclaimer.completedThrough(), 5u);
    EXPECT_TRUE(reclaimer.rowCompleted(6, 10));
    ASSERT_EQ(sink.clears.size(), 2u);
    EXPECT_EQ(sink.clears[1], std::make_pair(2u, 6u));
}

TEST(ResourceReclaimerTest, CounterStaysWithinOneRowOfThreshold) {
    testsupport::RecordingSink sink;
    CountingCollector collector;
    const uint64_t threshold = 1000;
    const uint64_t row_width = 37;
    ResourceReclaimer reclaimer(sink, threshold, collector.fn());

    for (uint32_t row = 1; row <= 500; ++row) {
        reclaimer.rowCompleted(row, row_width);
        EXPECT_LE(reclaimer.pendingWrites(), threshold);
    }
    // 28 rows of 37 writes first exceed 1000
    EXPECT_EQ(reclaimer.reclamations(), 500u / 28u);
}

TEST(ResourceReclaimerTest, DefaultCollectorUsesResourceManager) {
    testsupport::RecordingSink sink;
    ResourceReclaimer reclaimer(sink, 1);
    EXPECT_TRUE(reclaimer.rowCompleted(1, 2));
    EXPECT_EQ(reclaimer.reclamations(), 1u);
    EXPECT_EQ(sink.clears.size(), 1u);
}
