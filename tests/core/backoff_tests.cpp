/**
 * @file backoff_tests.cpp
 * @brief Unit tests for exponential backoff
 */

#include <gtest/gtest.h>
#include "nightfall/core/backoff.h"
#include <limits>

using namespace nightfall;
using namespace nightfall::core;

TEST(BackoffTest, AttemptZeroHasNoDelay) {
    EXPECT_EQ(compute_backoff_delay(0, Duration(1000), Duration(30000)), Duration(0));
}

TEST(BackoffTest, DoublesPerAttempt) {
    EXPECT_EQ(compute_backoff_delay(1, Duration(1000), Duration(30000)), Duration(1000));
    EXPECT_EQ(compute_backoff_delay(2, Duration(1000), Duration(30000)), Duration(2000));
    EXPECT_EQ(compute_backoff_delay(3, Duration(1000), Duration(30000)), Duration(4000));
    EXPECT_EQ(compute_backoff_delay(5, Duration(1000), Duration(30000)), Duration(16000));
}

TEST(BackoffTest, CappedAtMaximum) {
    EXPECT_EQ(compute_backoff_delay(6, Duration(1000), Duration(30000)), Duration(30000));
    EXPECT_EQ(compute_backoff_delay(20, Duration(1000), Duration(30000)), Duration(30000));
}

TEST(BackoffTest, LargeAttemptDoesNotOverflow) {
    EXPECT_GT(compute_backoff_delay(1000, Duration(1000), Duration::max()).count(), 0);
    EXPECT_EQ(compute_backoff_delay(1000, Duration(250), Duration(5000)), Duration(5000));
}

TEST(BackoffTest, HugeBaseSaturatesAtCap) {
    Duration huge(std::numeric_limits<Int64>::max() / 2);
    EXPECT_EQ(compute_backoff_delay(10, huge, Duration(30000)), Duration(30000));
    EXPECT_EQ(compute_backoff_delay(3, huge, Duration::max()), Duration::max());
    EXPECT_EQ(compute_backoff_delay(2, Duration(1), Duration::max()), Duration(2));

    // Largest product that still fits is returned exactly
    Duration top(Int64{1} << 40);
    EXPECT_EQ(compute_backoff_delay(23, top, Duration::max()), Duration(Int64{1} << 62));
    EXPECT_EQ(compute_backoff_delay(24, top, Duration::max()), Duration::max());
}

TEST(BackoffTest, NonPositiveBaseHasNoDelay) {
    EXPECT_EQ(compute_backoff_delay(3, Duration(0), Duration(30000)), Duration(0));
    EXPECT_EQ(compute_backoff_delay(3, Duration(-5), Duration(30000)), Duration(0));
}
