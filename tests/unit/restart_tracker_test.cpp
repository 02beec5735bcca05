/**
 * @file restart_tracker_test.cpp
 * @brief Unit tests for RestartTracker backoff, circuit breaker and budget reset.
 */

#include "rpc/restart_tracker.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

using namespace toolproxy::rpc;

namespace {

RestartPolicyConfig make_enabled_policy(int max_attempts = 3, std::vector<int> backoff_ms = {100, 200, 500},
                                        int success_reset_ms = 1000) {
    RestartPolicyConfig policy;
    policy.enabled = true;
    policy.max_attempts = max_attempts;
    policy.backoff_ms = backoff_ms;
    policy.success_reset_ms = success_reset_ms;
    return policy;
}

RestartPolicyConfig make_disabled_policy() {
    RestartPolicyConfig policy;
    policy.enabled = false;
    return policy;
}

}  // namespace

// ---------------------------------------------------------------------------
// Backoff schedule and circuit breaker
// ---------------------------------------------------------------------------

TEST(RestartTrackerTest, BackoffFollowsSchedule) {
    RestartTracker tracker(make_enabled_policy());

    EXPECT_EQ(tracker.record_failure(), std::optional<int>(100));
    EXPECT_EQ(tracker.record_failure(), std::optional<int>(200));
    EXPECT_EQ(tracker.record_failure(), std::optional<int>(500));
    EXPECT_EQ(tracker.attempt_count(), 3);
    EXPECT_FALSE(tracker.is_circuit_open());
}

TEST(RestartTrackerTest, CircuitOpensAfterMaxAttempts) {
    RestartTracker tracker(make_enabled_policy(2, {0, 0}));

    EXPECT_TRUE(tracker.record_failure().has_value());
    EXPECT_TRUE(tracker.record_failure().has_value());
    EXPECT_FALSE(tracker.record_failure().has_value());
    EXPECT_TRUE(tracker.is_circuit_open());

    auto snap = tracker.snapshot();
    EXPECT_TRUE(snap.circuit_open);
    EXPECT_EQ(snap.total_failures, 3);
    EXPECT_EQ(snap.max_attempts, 2);
}

TEST(RestartTrackerTest, ResetClosesCircuit) {
    RestartTracker tracker(make_enabled_policy(1, {0}));
    tracker.record_failure();
    EXPECT_FALSE(tracker.record_failure().has_value());
    ASSERT_TRUE(tracker.is_circuit_open());

    tracker.reset();
    EXPECT_FALSE(tracker.is_circuit_open());
    EXPECT_EQ(tracker.attempt_count(), 0);
    EXPECT_EQ(tracker.record_failure(), std::optional<int>(0));
}

TEST(RestartTrackerTest, DisabledPolicyNeverOpensCircuit) {
    RestartTracker tracker(make_disabled_policy());
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(tracker.record_failure(), std::optional<int>(0));
    }
    EXPECT_FALSE(tracker.is_circuit_open());
    EXPECT_FALSE(tracker.snapshot().limits_enabled);
    EXPECT_EQ(tracker.snapshot().total_failures, 20);
}

// ---------------------------------------------------------------------------
// Stability window
// ---------------------------------------------------------------------------

TEST(RestartTrackerTest, StableGenerationEarnsFreshBudget) {
    RestartTracker tracker(make_enabled_policy(3, {10, 20, 30}, 50));

    tracker.record_failure();
    tracker.record_failure();
    ASSERT_EQ(tracker.attempt_count(), 2);

    tracker.record_ready();
    std::this_thread::sleep_for(std::chrono::milliseconds(80));

    // Attempts reset before this failure is counted
    EXPECT_EQ(tracker.record_failure(), std::optional<int>(10));
    EXPECT_EQ(tracker.attempt_count(), 1);
}

TEST(RestartTrackerTest, ShortLivedGenerationKeepsCounting) {
    RestartTracker tracker(make_enabled_policy(3, {10, 20, 30}, 10000));

    tracker.record_failure();
    tracker.record_ready();
    EXPECT_EQ(tracker.record_failure(), std::optional<int>(20));
    EXPECT_EQ(tracker.attempt_count(), 2);
}

TEST(RestartTrackerTest, ReadyForReportedOnlyWhileReady) {
    RestartTracker tracker(make_enabled_policy());
    EXPECT_FALSE(tracker.snapshot().ready_for_ms.has_value());

    tracker.record_ready();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    auto snap = tracker.snapshot();
    ASSERT_TRUE(snap.ready_for_ms.has_value());
    EXPECT_GE(*snap.ready_for_ms, 15);

    tracker.record_failure();
    EXPECT_FALSE(tracker.snapshot().ready_for_ms.has_value());
}

TEST(RestartTrackerTest, ConcurrentFailuresCountedOnce) {
    RestartTracker tracker(make_enabled_policy(1000, std::vector<int>(1000, 0)));

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&tracker]() {
            for (int i = 0; i < 100; ++i) {
                tracker.record_failure();
                tracker.snapshot();
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(tracker.attempt_count(), 800);
    EXPECT_EQ(tracker.snapshot().total_failures, 800);
}
