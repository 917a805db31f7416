// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng
//
// test_session_registry.cc - Unit tests for SessionRegistry

#include <gtest/gtest.h>
#include "VaultTestSupport.h"
#include "../src/core/services/SessionRegistry.h"
#include <stdexcept>

using namespace Lockr;
using namespace Lockr::Testing;

class SessionRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        key_a = CipherEngine::generate_random_bytes(CipherEngine::KEY_LENGTH);
        key_b = CipherEngine::generate_random_bytes(CipherEngine::KEY_LENGTH);
    }

    ManualClock clock;
    SessionRegistry registry{std::chrono::minutes(30), clock.provider()};
    std::vector<uint8_t> key_a;
    std::vector<uint8_t> key_b;
};

TEST_F(SessionRegistryTest, RejectsNonPositiveTimeout) {
    EXPECT_THROW(SessionRegistry{std::chrono::seconds(0)}, std::invalid_argument);
}

TEST_F(SessionRegistryTest, CreateAndGet) {
    const SessionInfo info = registry.create_session("alice", key_a);
    EXPECT_EQ(info.user_id, "alice");
    EXPECT_EQ(info.expires_at - info.created_at, std::chrono::minutes(30));

    auto session = registry.get_session("alice");
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->expires_at, info.expires_at);

    auto key = registry.get_encryption_key("alice");
    ASSERT_TRUE(key.has_value());
    EXPECT_TRUE(std::equal(key->begin(), key->end(), key_a.begin(), key_a.end()));
}

TEST_F(SessionRegistryTest, NoCrossUserLookup) {
    registry.create_session("alice", key_a);

    EXPECT_FALSE(registry.get_session("bob").has_value());
    EXPECT_FALSE(registry.get_encryption_key("bob").has_value());
    EXPECT_FALSE(registry.key_matches("bob", key_a));
}

TEST_F(SessionRegistryTest, NewSessionReplacesOld) {
    registry.create_session("alice", key_a);
    registry.create_session("alice", key_b);

    EXPECT_EQ(registry.session_count(), 1u);
    EXPECT_TRUE(registry.key_matches("alice", key_b));
    EXPECT_FALSE(registry.key_matches("alice", key_a));
}

TEST_F(SessionRegistryTest, ExpiredSessionIsAbsentAndErased) {
    registry.create_session("alice", key_a);
    clock.advance(std::chrono::minutes(29));
    EXPECT_TRUE(registry.get_encryption_key("alice").has_value());

    clock.advance(std::chrono::minutes(1));
    EXPECT_FALSE(registry.get_encryption_key("alice").has_value());
    EXPECT_EQ(registry.session_count(), 0u) << "Lookup of an expired session removes it";
}

TEST_F(SessionRegistryTest, ClearIsIdempotent) {
    registry.create_session("alice", key_a);

    EXPECT_TRUE(registry.clear_session("alice"));
    EXPECT_FALSE(registry.clear_session("alice"));
    EXPECT_FALSE(registry.get_session("alice").has_value());
}

TEST_F(SessionRegistryTest, PurgeExpiredOnlyRemovesExpired) {
    registry.create_session("alice", key_a);
    clock.advance(std::chrono::minutes(20));
    registry.create_session("bob", key_b);
    clock.advance(std::chrono::minutes(15));

    EXPECT_EQ(registry.purge_expired(), 1u);
    EXPECT_FALSE(registry.get_session("alice").has_value());
    EXPECT_TRUE(registry.get_session("bob").has_value());
}

TEST_F(SessionRegistryTest, KeyMatchesRequiresExactKey) {
    registry.create_session("alice", key_a);

    auto truncated = key_a;
    truncated.pop_back();
    EXPECT_TRUE(registry.key_matches("alice", key_a));
    EXPECT_FALSE(registry.key_matches("alice", truncated));
    EXPECT_FALSE(registry.key_matches("alice", key_b));
}
