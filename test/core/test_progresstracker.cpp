#include <gtest/gtest.h>
#include <vector>
#include "core/ProgressTracker.hpp"

using namespace hashflow;

// Test: Every strict increase is reported with step 0
TEST(ProgressTrackerTest, ReportsStrictIncreases) {
    ProgressTracker tracker(400, 0.0f);
    auto a = tracker.advance(100);
    ASSERT_TRUE(a.has_value());
    EXPECT_FLOAT_EQ(*a, 25.0f);
    auto b = tracker.advance(300);
    ASSERT_TRUE(b.has_value());
    EXPECT_FLOAT_EQ(*b, 100.0f);
    EXPECT_FLOAT_EQ(tracker.lastEmitted(), 100.0f);
}

// Test: No progress, no event
TEST(ProgressTrackerTest, ZeroBytesNoEvent) {
    ProgressTracker tracker(100, 0.0f);
    EXPECT_FALSE(tracker.advance(0).has_value());
}

// Test: Small gains below the step are held back, 100 always gets through
TEST(ProgressTrackerTest, ThrottlesToStep) {
    ProgressTracker tracker(1000, 1.0f);
    std::vector<float> emitted;
    for (int i = 0; i < 1000; ++i) {
        if (auto p = tracker.advance(1)) emitted.push_back(*p);
    }
    ASSERT_FALSE(emitted.empty());
    EXPECT_LE(emitted.size(), 100u);
    EXPECT_FLOAT_EQ(emitted.back(), 100.0f);
    for (size_t i = 1; i < emitted.size(); ++i) {
        EXPECT_GT(emitted[i], emitted[i - 1]);
    }
}

// Test: Final step below the threshold still reports 100
TEST(ProgressTrackerTest, FinalHundredBypassesStep) {
    ProgressTracker tracker(1000, 10.0f);
    auto first = tracker.advance(995);
    ASSERT_TRUE(first.has_value());
    EXPECT_FLOAT_EQ(*first, 99.5f);
    auto last = tracker.advance(5);
    ASSERT_TRUE(last.has_value());
    EXPECT_FLOAT_EQ(*last, 100.0f);
}

// Test: Percent is clamped at 100 and never regresses
TEST(ProgressTrackerTest, ClampedAndMonotonic) {
    ProgressTracker tracker(10, 0.0f);
    auto p = tracker.advance(15);
    ASSERT_TRUE(p.has_value());
    EXPECT_FLOAT_EQ(*p, 100.0f);
    EXPECT_FALSE(tracker.advance(1).has_value());
    EXPECT_FLOAT_EQ(tracker.currentPercent(), 100.0f);
}

// Test: Empty file never yields InProgress
TEST(ProgressTrackerTest, EmptyTotalNeverReports) {
    ProgressTracker tracker(0);
    EXPECT_TRUE(tracker.isEmpty());
    EXPECT_FALSE(tracker.advance(0).has_value());
    EXPECT_FALSE(tracker.advance(10).has_value());
    EXPECT_FLOAT_EQ(tracker.currentPercent(), 0.0f);
}

// Test: Large totals keep float precision sane
TEST(ProgressTrackerTest, LargeTotals) {
    const uint64_t total = 10ULL * 1024 * 1024 * 1024;  // 10 GiB
    ProgressTracker tracker(total, 1.0f);
    uint64_t chunk = 1024 * 1024;
    float last = 0.0f;
    size_t events = 0;
    for (uint64_t done = 0; done < total; done += chunk) {
        if (auto p = tracker.advance(chunk)) {
            EXPECT_GT(*p, last);
            last = *p;
            ++events;
        }
    }
    EXPECT_FLOAT_EQ(last, 100.0f);
    EXPECT_LE(events, 101u);
    EXPECT_EQ(tracker.bytesProcessed(), total);
}
