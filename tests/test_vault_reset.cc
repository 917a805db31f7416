// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file test_vault_reset.cc
 * @brief Lost-key vault reset tests
 */

#include <gtest/gtest.h>
#include "VaultTestSupport.h"
#include "../src/core/crypto/Digest.h"
#include <algorithm>

using namespace Lockr;
using namespace Lockr::Testing;

class VaultResetTest : public ::testing::Test {
protected:
    void SetUp() override {
        key = make_encoded_key();
        h.core->audit().signal_event().connect([this](const AuditEvent& e) { events.push_back(e); });
    }

    VaultResult<void> request(const std::string& email, const std::string& address = "198.51.100.1",
                              bool confirmed = true) {
        return h.core->reset().request_reset({email, address, confirmed});
    }

    VaultResult<ResetResult> complete(const std::string& token, bool confirmed = true,
                                      std::optional<std::string> new_key = std::nullopt) {
        return h.core->reset().complete_reset({token, confirmed, std::move(new_key)});
    }

    CoreHarness h;
    std::string key;
    std::vector<AuditEvent> events;
};

// ============================================================================
// Request
// ============================================================================

TEST_F(VaultResetTest, RequestRequiresConfirmation) {
    auto result = request("alice@example.org", "198.51.100.1", false);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), VaultError::ValidationError);
    EXPECT_TRUE(h.delivery.messages().empty());
}

TEST_F(VaultResetTest, RequestDeliversTokenAndStoresOnlyItsHash) {
    ASSERT_TRUE(request("Alice@Example.org").has_value());

    auto messages = h.delivery.messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].account.id, CoreHarness::ALICE);
    EXPECT_EQ(messages[0].token.size(), 64u);
    EXPECT_EQ(messages[0].expires_at, h.clock.now() + std::chrono::minutes(15));

    EXPECT_FALSE(h.tokens.find(messages[0].token).has_value()) << "Plain token is never a key";
    auto record = h.tokens.find(Digest::sha256_hex(messages[0].token));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->user_id, CoreHarness::ALICE);
    EXPECT_EQ(record->requested_from, "198.51.100.1");
}

TEST_F(VaultResetTest, UnknownEmailLooksLikeSuccess) {
    auto result = request("mallory@example.org");
    EXPECT_TRUE(result.has_value());
    EXPECT_TRUE(h.delivery.messages().empty());
    EXPECT_EQ(h.tokens.size(), 0u);
}

TEST_F(VaultResetTest, PerUserBudgetIsSilent) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(request("alice@example.org", "198.51.100." + std::to_string(i)).has_value());
    }

    // Fourth request answers the same way but issues nothing
    EXPECT_TRUE(request("alice@example.org", "198.51.100.9").has_value());
    EXPECT_EQ(h.delivery.messages().size(), 3u);

    h.clock.advance(std::chrono::hours(1));
    EXPECT_TRUE(request("alice@example.org", "198.51.100.9").has_value());
    EXPECT_EQ(h.delivery.messages().size(), 4u);
}

TEST_F(VaultResetTest, UndeliveredTokenIsWithdrawnAndDoesNotSpendBudget) {
    h.delivery.set_failing(true);
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(request("alice@example.org", "198.51.100." + std::to_string(i)).has_value())
            << "The caller sees the same answer when delivery fails";
    }
    EXPECT_EQ(h.tokens.size(), 0u);
    EXPECT_TRUE(std::none_of(events.begin(), events.end(),
        [](const AuditEvent& e) { return e.type == AuditEventType::ResetRequested; }));

    h.delivery.set_failing(false);
    ASSERT_TRUE(request("alice@example.org", "198.51.100.9").has_value());
    EXPECT_EQ(h.delivery.messages().size(), 1u);
    EXPECT_EQ(h.tokens.size(), 1u);
}

TEST_F(VaultResetTest, PerAddressBudgetIsRateLimitedForAnyEmail) {
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(request("user" + std::to_string(i) + "@example.org", "203.0.113.5").has_value());
    }

    auto result = request("alice@example.org", "203.0.113.5");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), VaultError::RateLimited);
    EXPECT_TRUE(request("alice@example.org", "203.0.113.6").has_value());
}

// ============================================================================
// Completion
// ============================================================================

TEST_F(VaultResetTest, CompletionWipesEntriesAndTokenCannotBeReused) {
    for (int i = 0; i < 4; ++i) {
        seed_entry(h.entries, CoreHarness::ALICE, key, "entry " + std::to_string(i));
    }
    seed_entry(h.entries, CoreHarness::BOB, key, "bob's");
    ASSERT_TRUE(h.unlock(CoreHarness::ALICE, key).has_value());
    ASSERT_TRUE(request("alice@example.org").has_value());
    const std::string token = h.delivery.last_token();

    auto result = complete(token);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->user_id, CoreHarness::ALICE);
    EXPECT_EQ(result->entries_destroyed, 4u);
    EXPECT_TRUE(result->fully_wiped);
    EXPECT_FALSE(result->anchor_created);

    EXPECT_EQ(h.entries.count_for_owner(CoreHarness::ALICE).value(), 0u);
    EXPECT_EQ(h.entries.count_for_owner(CoreHarness::BOB).value(), 1u);
    EXPECT_FALSE(h.core->unlock().is_unlocked(CoreHarness::ALICE));

    auto record = h.tokens.find(Digest::sha256_hex(token));
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->used_at.has_value());
    EXPECT_EQ(record->entries_wiped, std::optional<size_t>(4));

    auto reuse = complete(token);
    ASSERT_FALSE(reuse.has_value());
    EXPECT_EQ(reuse.error(), VaultError::InvalidToken);
}

TEST_F(VaultResetTest, CompletionEmitsCriticalAuditEventWithCount) {
    seed_entry(h.entries, CoreHarness::ALICE, key, "a");
    seed_entry(h.entries, CoreHarness::ALICE, key, "b");
    ASSERT_TRUE(request("alice@example.org").has_value());

    ASSERT_TRUE(complete(h.delivery.last_token()).has_value());
    auto it = std::find_if(events.begin(), events.end(),
        [](const AuditEvent& e) { return e.type == AuditEventType::VaultReset; });
    ASSERT_NE(it, events.end());
    EXPECT_EQ(it->user_id, CoreHarness::ALICE);
    EXPECT_EQ(it->count, 2u);
}

TEST_F(VaultResetTest, CompletionRequiresConfirmation) {
    seed_entry(h.entries, CoreHarness::ALICE, key, "a");
    ASSERT_TRUE(request("alice@example.org").has_value());
    const std::string token = h.delivery.last_token();

    auto result = complete(token, false);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), VaultError::ValidationError);
    EXPECT_EQ(h.entries.count_for_owner(CoreHarness::ALICE).value(), 1u);

    EXPECT_TRUE(complete(token).has_value()) << "Unconfirmed attempt does not spend the token";
}

TEST_F(VaultResetTest, ExpiredTokenIsInvalid) {
    seed_entry(h.entries, CoreHarness::ALICE, key, "a");
    ASSERT_TRUE(request("alice@example.org").has_value());

    h.clock.advance(std::chrono::minutes(15));
    auto result = complete(h.delivery.last_token());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), VaultError::InvalidToken);
    EXPECT_EQ(h.entries.count_for_owner(CoreHarness::ALICE).value(), 1u);
}

TEST_F(VaultResetTest, UnknownOrMalformedTokenIsInvalid) {
    EXPECT_EQ(complete("not-a-token").error(), VaultError::InvalidToken);
    EXPECT_EQ(complete(std::string(64, 'a')).error(), VaultError::InvalidToken);
}

TEST_F(VaultResetTest, DeletedAccountIsNotFound) {
    ASSERT_TRUE(request("alice@example.org").has_value());
    ASSERT_TRUE(h.users.remove_user(CoreHarness::ALICE));

    EXPECT_EQ(complete(h.delivery.last_token()).error(), VaultError::NotFound);
}

TEST_F(VaultResetTest, NewKeySeedsVerificationEntry) {
    seed_entry(h.entries, CoreHarness::ALICE, key, "lost");
    ASSERT_TRUE(request("alice@example.org").has_value());
    const std::string new_key = make_encoded_key();

    auto result = complete(h.delivery.last_token(), true, new_key);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->entries_destroyed, 1u);
    EXPECT_TRUE(result->anchor_created);

    auto entries = h.entries.list_for_owner(CoreHarness::ALICE).value();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].category, EntryCategory::System);

    // The anchor now verifies unlock: only the new key opens the vault
    EXPECT_EQ(h.unlock(CoreHarness::ALICE, key).error(), VaultError::InvalidKey);
    EXPECT_TRUE(h.unlock(CoreHarness::ALICE, new_key).has_value());
}

TEST_F(VaultResetTest, MalformedNewKeyRejectedBeforeTokenIsSpent) {
    ASSERT_TRUE(request("alice@example.org").has_value());
    const std::string token = h.delivery.last_token();

    EXPECT_EQ(complete(token, true, std::string("bogus")).error(), VaultError::ValidationError);
    EXPECT_TRUE(complete(token).has_value());
}

TEST_F(VaultResetTest, PurgeKeepsRecentTokensForBudget) {
    ASSERT_TRUE(request("alice@example.org").has_value());
    h.clock.advance(std::chrono::minutes(20));
    EXPECT_EQ(h.core->reset().purge_expired_tokens(), 0u) << "Expired but inside the request window";

    h.clock.advance(std::chrono::minutes(45));
    EXPECT_EQ(h.core->reset().purge_expired_tokens(), 1u);
    EXPECT_EQ(h.tokens.size(), 0u);
}

TEST_F(VaultResetTest, PurgeReleasesAddressBudget) {
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(request("user" + std::to_string(i) + "@example.org", "203.0.113.5").has_value());
    }
    ASSERT_EQ(request("alice@example.org", "203.0.113.5").error(), VaultError::RateLimited);

    h.clock.advance(std::chrono::hours(1));
    (void)h.core->reset().purge_expired_tokens();
    EXPECT_TRUE(request("alice@example.org", "203.0.113.5").has_value());
}

// ============================================================================
// Partial wipe reporting
// ============================================================================

namespace {

/// Store whose bulk delete fails after removing some entries
class FlakyEntryStore : public InMemoryEntryStore {
public:
    using InMemoryEntryStore::InMemoryEntryStore;

    std::expected<size_t, StoreError> remove_all_for_owner(std::string_view owner_id) override {
        auto entries = list_for_owner(owner_id);
        if (!entries || entries->empty()) {
            return size_t{0};
        }
        // Lose the connection after the first delete
        (void)remove(owner_id, entries->front().id);
        return std::unexpected(StoreError::WRITE_FAILED);
    }
};

}  // namespace

TEST(VaultResetPartialWipeTest, ReportsActualDestroyedCount) {
    ManualClock clock;
    FlakyEntryStore entries(clock.provider());
    InMemoryUserDirectory users;
    InMemoryResetTokenStore tokens;
    RecordingDelivery delivery;
    users.add_user({"user-alice", "alice@example.org"});
    VaultCore core(VaultConfig{}, &entries, &users, &tokens, &delivery, clock.provider());

    const std::string key = make_encoded_key();
    for (int i = 0; i < 3; ++i) {
        seed_entry(entries, "user-alice", key, "entry");
    }

    ASSERT_TRUE(core.reset().request_reset({"alice@example.org", "", true}).has_value());
    auto result = core.reset().complete_reset({delivery.last_token(), true, std::nullopt});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->entries_destroyed, 1u);
    EXPECT_FALSE(result->fully_wiped);
    EXPECT_FALSE(result->anchor_created);

    auto reuse = core.reset().complete_reset({delivery.last_token(), true, std::nullopt});
    EXPECT_EQ(reuse.error(), VaultError::InvalidToken);
}
