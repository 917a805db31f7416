// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng
//
// test_unlock_attempt_limiter.cc - Unit tests for UnlockAttemptLimiter

#include <gtest/gtest.h>
#include "VaultTestSupport.h"
#include "../src/core/services/UnlockAttemptLimiter.h"
#include <stdexcept>

using namespace Lockr;
using namespace Lockr::Testing;

class UnlockAttemptLimiterTest : public ::testing::Test {
protected:
    static UnlockLimits limits() {
        UnlockLimits l;
        l.max_attempts = 5;
        l.max_attempts_per_address = 3;
        l.window = std::chrono::minutes(15);
        return l;
    }

    ManualClock clock;
    UnlockAttemptLimiter limiter{limits(), clock.provider()};
};

TEST_F(UnlockAttemptLimiterTest, RejectsZeroLimits) {
    UnlockLimits bad = limits();
    bad.max_attempts = 0;
    EXPECT_THROW(UnlockAttemptLimiter{bad}, std::invalid_argument);
}

TEST_F(UnlockAttemptLimiterTest, UnknownUserIsNotBlocked) {
    EXPECT_FALSE(limiter.is_blocked("alice", ""));
    const AttemptStatus status = limiter.status("alice", "10.0.0.1");
    EXPECT_EQ(status.user_failures, 0u);
    EXPECT_FALSE(status.blocked);
}

TEST_F(UnlockAttemptLimiterTest, BlocksAtThreshold) {
    for (int i = 0; i < 4; ++i) {
        limiter.record_failure("alice", "");
        EXPECT_FALSE(limiter.is_blocked("alice", "")) << "after " << (i + 1) << " failures";
    }

    const AttemptStatus status = limiter.record_failure("alice", "");
    EXPECT_EQ(status.user_failures, 5u);
    EXPECT_TRUE(status.blocked);
    ASSERT_TRUE(status.retry_after.has_value());
    EXPECT_TRUE(limiter.is_blocked("alice", ""));
}

TEST_F(UnlockAttemptLimiterTest, WindowAnchoredAtFirstFailure) {
    limiter.record_failure("alice", "");
    clock.advance(std::chrono::minutes(10));
    for (int i = 0; i < 4; ++i) {
        limiter.record_failure("alice", "");
    }
    EXPECT_TRUE(limiter.is_blocked("alice", ""));

    // 15 minutes after the first failure the whole window rolls over
    clock.advance(std::chrono::minutes(5));
    EXPECT_FALSE(limiter.is_blocked("alice", ""));
    EXPECT_EQ(limiter.status("alice", "").user_failures, 0u);
}

TEST_F(UnlockAttemptLimiterTest, StillBlockedJustBeforeWindowEnds) {
    for (int i = 0; i < 5; ++i) {
        limiter.record_failure("alice", "");
    }
    clock.advance(std::chrono::minutes(15) - std::chrono::seconds(1));
    EXPECT_TRUE(limiter.is_blocked("alice", ""));
}

TEST_F(UnlockAttemptLimiterTest, UsersAreIndependent) {
    for (int i = 0; i < 5; ++i) {
        limiter.record_failure("alice", "");
    }
    EXPECT_TRUE(limiter.is_blocked("alice", ""));
    EXPECT_FALSE(limiter.is_blocked("bob", ""));
}

TEST_F(UnlockAttemptLimiterTest, AddressLayerBlocksFirst) {
    for (int i = 0; i < 3; ++i) {
        limiter.record_failure("alice", "10.0.0.1");
    }

    EXPECT_TRUE(limiter.is_blocked("alice", "10.0.0.1"));
    EXPECT_FALSE(limiter.is_blocked("alice", "10.0.0.2"));
    EXPECT_FALSE(limiter.is_blocked("alice", ""));

    // Failures from any address still add up for the user
    limiter.record_failure("alice", "10.0.0.2");
    limiter.record_failure("alice", "10.0.0.3");
    EXPECT_TRUE(limiter.is_blocked("alice", "10.0.0.4"));
}

TEST(UnlockAttemptLimiterDefaultsTest, AddressLayerDisabledByDefault) {
    ManualClock clock;
    UnlockAttemptLimiter limiter{UnlockLimits{}, clock.provider()};
    EXPECT_EQ(limiter.limits().max_attempts_per_address, 0u);

    for (int i = 0; i < 4; ++i) {
        EXPECT_FALSE(limiter.is_blocked("alice", "203.0.113.7")) << "attempt " << (i + 1);
        limiter.record_failure("alice", "203.0.113.7");
    }
    const AttemptStatus status = limiter.status("alice", "203.0.113.7");
    EXPECT_FALSE(status.blocked);
    EXPECT_EQ(status.user_failures, 4u);
    EXPECT_EQ(status.address_failures, 0u);

    limiter.record_failure("alice", "203.0.113.7");
    EXPECT_TRUE(limiter.is_blocked("alice", "203.0.113.7"));
}

TEST_F(UnlockAttemptLimiterTest, ClearResetsUser) {
    for (int i = 0; i < 5; ++i) {
        limiter.record_failure("alice", "10.0.0.1");
    }
    EXPECT_TRUE(limiter.clear("alice"));
    EXPECT_FALSE(limiter.is_blocked("alice", "10.0.0.1"));
    EXPECT_FALSE(limiter.clear("alice"));
}

TEST_F(UnlockAttemptLimiterTest, PurgeExpired) {
    limiter.record_failure("alice", "10.0.0.1");
    clock.advance(std::chrono::minutes(10));
    limiter.record_failure("bob", "");
    clock.advance(std::chrono::minutes(6));

    EXPECT_EQ(limiter.purge_expired(), 1u);
    EXPECT_EQ(limiter.status("bob", "").user_failures, 1u);
}
