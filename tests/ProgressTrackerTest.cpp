#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

#include "Grid/headers/ProgressTracker.h"
#include "TestSupport.h"

using namespace std::chrono_literals;

namespace {
    int percentageOf(const std::string &line) {
        const auto start = line.find('%') + 1;
        return std::stoi(line.substr(start, line.find(' ', start) - start));
    }
}

TEST(ProgressTrackerTest, LineFormat) {
    EXPECT_EQ(ProgressTracker::formatLine(42, 0ms), "\tConverting: %42 (elapsed: 0m 0s)");
    EXPECT_EQ(ProgressTracker::formatLine(100, 125s), "\tConverting: %100 (elapsed: 2m 5s)");
}

TEST(ProgressTrackerTest, EmitsWhenPercentageAndSecondBothAdvance) {
    testsupport::FakeClock clock;
    std::vector<std::string> lines;
    ProgressTracker tracker(100, clock.source(), [&](const std::string &l) { lines.push_back(l); });

    clock.now = 1500ms;
    EXPECT_TRUE(tracker.report(10));
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "\tConverting: %10 (elapsed: 0m 1s)");
    EXPECT_EQ(tracker.lastReportedPercentage(), 10);
}

TEST(ProgressTrackerTest, SameSecondSuppressesFurtherLines) {
    testsupport::FakeClock clock;
    std::vector<std::string> lines;
    ProgressTracker tracker(100, clock.source(), [&](const std::string &l) { lines.push_back(l); });

    clock.now = 1000ms;
    EXPECT_TRUE(tracker.report(5));
    clock.now = 1900ms;
    EXPECT_FALSE(tracker.report(5));
    EXPECT_FALSE(tracker.report(5));
    EXPECT_EQ(lines.size(), 1u);
    // The percentage gate did not advance while the second gate was closed
    EXPECT_EQ(tracker.lastReportedPercentage(), 5);

    clock.now = 2000ms;
    EXPECT_TRUE(tracker.report(5));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(percentageOf(lines[1]), 20);
}

TEST(ProgressTrackerTest, UnchangedPercentageSuppressesLinesAcrossSeconds) {
    testsupport::FakeClock clock;
    std::vector<std::string> lines;
    ProgressTracker tracker(1000, clock.source(), [&](const std::string &l) { lines.push_back(l); });

    clock.now = 1000ms;
    EXPECT_TRUE(tracker.report(10)); // 1%
    clock.now = 5000ms;
    EXPECT_FALSE(tracker.report(5)); // still 1%
    clock.now = 9000ms;
    EXPECT_FALSE(tracker.report(4)); // still 1%
    EXPECT_EQ(lines.size(), 1u);
    EXPECT_EQ(tracker.processed(), 19u);
}

TEST(ProgressTrackerTest, SequenceIsIncreasingAndEndsAtHundred) {
    testsupport::FakeClock clock;
    std::vector<std::string> lines;
    ProgressTracker tracker(1000, clock.source(), [&](const std::string &l) { lines.push_back(l); });

    for (int row = 0; row < 100; ++row) {
        clock.now += 1000ms;
        tracker.report(10);
    }

    ASSERT_FALSE(lines.empty());
    int previous = 0;
    for (const auto &line: lines) {
        const int pct = percentageOf(line);
        EXPECT_GT(pct, previous);
        EXPECT_LE(pct, 100);
        previous = pct;
    }
    EXPECT_EQ(previous, 100);
    EXPECT_EQ(tracker.processed(), 1000u);
}

TEST(ProgressTrackerTest, ConcurrentReportersCountEveryPixel) {
    testsupport::FakeClock clock;
    std::vector<std::string> lines;
    ProgressTracker tracker(8 * 10000, clock.source(), [&](const std::string &l) { lines.push_back(l); });

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&tracker]() {
            for (int i = 0; i < 10000; ++i) {
                tracker.report(1);
            }
        });
    }
    for (auto &thread: threads) {
        thread.join();
    }

    EXPECT_EQ(tracker.processed(), 80000u);
    // Clock never moved past the first second, so at most one line
    EXPECT_LE(lines.size(), 1u);
}

TEST(ProgressTrackerTest, ZeroTotalIsComplete) {
    testsupport::FakeClock clock;
    std::vector<std::string> lines;
    ProgressTracker tracker(0, clock.source(), [&](const std::string &l) { lines.push_back(l); });

    EXPECT_TRUE(tracker.report(0));
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(percentageOf(lines[0]), 100);
}
