// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng
//
// test_maintenance_scheduler.cc - Unit tests for MaintenanceScheduler

#include <gtest/gtest.h>
#include <glibmm/init.h>
#include <glibmm/main.h>
#include "VaultTestSupport.h"
#include "../src/core/controllers/MaintenanceScheduler.h"

using namespace Lockr;
using namespace Lockr::Testing;

class MaintenanceSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Glib::init();
    }

    CoreHarness h;
};

// ============================================================================
// Construction Tests
// ============================================================================

TEST_F(MaintenanceSchedulerTest, NullCoreThrows) {
    EXPECT_THROW(MaintenanceScheduler(nullptr, 60), std::invalid_argument);
}

TEST_F(MaintenanceSchedulerTest, IntervalIsClamped) {
    MaintenanceScheduler fast(h.core.get(), 1);
    EXPECT_EQ(fast.interval_seconds(), MaintenanceScheduler::MIN_INTERVAL);

    MaintenanceScheduler slow(h.core.get(), 100000);
    EXPECT_EQ(slow.interval_seconds(), MaintenanceScheduler::MAX_INTERVAL);
}

// ============================================================================
// Timer Tests
// ============================================================================

TEST_F(MaintenanceSchedulerTest, StartStop) {
    MaintenanceScheduler scheduler(h.core.get(), 60);
    EXPECT_FALSE(scheduler.is_running());

    scheduler.start();
    EXPECT_TRUE(scheduler.is_running());

    // Restarting keeps a single timer
    scheduler.start();
    EXPECT_TRUE(scheduler.is_running());

    scheduler.stop();
    EXPECT_FALSE(scheduler.is_running());
}

TEST_F(MaintenanceSchedulerTest, DestructorStopsTimer) {
    {
        MaintenanceScheduler scheduler(h.core.get(), 60);
        scheduler.start();
        EXPECT_TRUE(scheduler.is_running());
    }
    // A leaked source would call into the destroyed scheduler here
    while (Glib::MainContext::get_default()->iteration(false)) {
    }
}

// ============================================================================
// Sweep Tests
// ============================================================================

TEST_F(MaintenanceSchedulerTest, SweepWithNothingExpired) {
    ASSERT_TRUE(h.unlock(CoreHarness::ALICE, make_encoded_key()).has_value());

    MaintenanceScheduler scheduler(h.core.get(), 60);
    auto report = scheduler.run_now();
    EXPECT_EQ(report.sessions, 0u);
    EXPECT_EQ(report.limiter_users, 0u);
    EXPECT_EQ(report.reset_tokens, 0u);
    EXPECT_EQ(h.core->sessions().session_count(), 1u);
}

TEST_F(MaintenanceSchedulerTest, SweepRemovesExpiredState) {
    ASSERT_TRUE(h.unlock(CoreHarness::ALICE, make_encoded_key()).has_value());
    h.core->limiter().record_failure(CoreHarness::BOB, "192.0.2.7");
    ASSERT_TRUE(h.core->reset().request_reset({"bob@example.org", "192.0.2.7", true}).has_value());

    h.clock.advance(std::chrono::minutes(65));

    MaintenanceScheduler scheduler(h.core.get(), 60);
    std::optional<MaintenanceReport> emitted;
    scheduler.signal_sweep_completed().connect([&](const MaintenanceReport& r) { emitted = r; });

    auto report = scheduler.run_now();
    EXPECT_EQ(report.sessions, 1u);
    EXPECT_EQ(report.limiter_users, 1u);
    EXPECT_EQ(report.reset_tokens, 1u);

    ASSERT_TRUE(emitted.has_value());
    EXPECT_EQ(emitted->sessions, report.sessions);
    EXPECT_EQ(h.core->sessions().session_count(), 0u);
    EXPECT_EQ(h.tokens.size(), 0u);
}
