#include <gtest/gtest.h>
#include "oracle/sigma_tracker.hpp"

#include <cmath>

using namespace dnmm;

TEST(SigmaTrackerTest, FirstObservationOnlyStoresMid) {
    SigmaTracker tracker(5000.0);
    auto s = tracker.observe(SigmaState{}, 1.0, 1);
    EXPECT_TRUE(s.has_mid);
    EXPECT_FALSE(s.initialized);
    EXPECT_DOUBLE_EQ(SigmaTracker::sigma_bps(s), 0.0);
}

TEST(SigmaTrackerTest, FirstReturnInitializesVariance) {
    SigmaTracker tracker(5000.0);
    auto s = tracker.observe(SigmaState{}, 1.0, 1);
    s = tracker.observe(s, 1.001, 2);

    double r = std::log(1.001) * 10000.0;
    EXPECT_TRUE(s.initialized);
    EXPECT_NEAR(SigmaTracker::sigma_bps(s), std::abs(r), 1e-9);
}

TEST(SigmaTrackerTest, UpdatesAtMostOncePerBlock) {
    SigmaTracker tracker(5000.0);
    auto s = tracker.observe(SigmaState{}, 1.0, 1);
    s = tracker.observe(s, 1.001, 2);
    auto again = tracker.observe(s, 1.5, 2);

    EXPECT_DOUBLE_EQ(again.ewma_variance, s.ewma_variance);
    EXPECT_DOUBLE_EQ(again.last_mid, 1.001);
}

TEST(SigmaTrackerTest, EwmaDecaysOnFlatBlock) {
    SigmaTracker tracker(5000.0);
    auto s = tracker.observe(SigmaState{}, 1.0, 1);
    s = tracker.observe(s, 1.001, 2);
    double first = SigmaTracker::sigma_bps(s);

    // Zero return: variance halves with lambda = 0.5
    s = tracker.observe(s, 1.001, 3);
    EXPECT_NEAR(SigmaTracker::sigma_bps(s), first / std::sqrt(2.0), 1e-9);
}

TEST(SigmaTrackerTest, IgnoresNonPositiveMid) {
    SigmaTracker tracker;
    auto s = tracker.observe(SigmaState{}, 1.0, 1);
    auto same = tracker.observe(s, 0.0, 2);
    EXPECT_EQ(same.last_block, 1u);
    EXPECT_DOUBLE_EQ(same.last_mid, 1.0);
}
