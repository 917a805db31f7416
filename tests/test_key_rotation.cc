// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file test_key_rotation.cc
 * @brief Key rotation protocol tests
 */

#include <gtest/gtest.h>
#include "VaultTestSupport.h"

using namespace Lockr;
using namespace Lockr::Testing;

class KeyRotationTest : public ::testing::Test {
protected:
    void SetUp() override {
        k1 = make_encoded_key();
        k2 = make_encoded_key();
    }

    void seed(int count) {
        for (int i = 0; i < count; ++i) {
            ids.push_back(seed_entry(h.entries, CoreHarness::ALICE, k1, "entry " + std::to_string(i)).id);
        }
    }

    void unlock_with(const std::string& key) {
        ASSERT_TRUE(h.unlock(CoreHarness::ALICE, key).has_value());
        h.clock.advance(std::chrono::seconds(1));
    }

    VaultResult<RotationResult> rotate(const std::string& current, const std::string& next) {
        return h.core->rotation().rotate({CoreHarness::ALICE, current, next});
    }

    bool decrypts_with(const std::string& entry_id, const std::string& key) {
        auto entry = h.entries.find(CoreHarness::ALICE, entry_id);
        return entry && CipherEngine::decrypt(entry->sealed, decode_key(key)).has_value();
    }

    CoreHarness h;
    std::string k1;
    std::string k2;
    std::vector<std::string> ids;
};

// ============================================================================
// Preconditions
// ============================================================================

TEST_F(KeyRotationTest, RequiresSession) {
    seed(2);
    auto result = rotate(k1, k2);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), VaultError::SessionRequired);
}

TEST_F(KeyRotationTest, RequiresSessionAfterLock) {
    seed(1);
    unlock_with(k1);
    ASSERT_TRUE(h.core->unlock().lock(CoreHarness::ALICE).has_value());

    EXPECT_EQ(rotate(k1, k2).error(), VaultError::SessionRequired);
}

TEST_F(KeyRotationTest, CurrentKeyMustMatchSession) {
    seed(2);
    unlock_with(k1);

    auto result = rotate(make_encoded_key(), k2);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), VaultError::KeyMismatch);
    EXPECT_TRUE(decrypts_with(ids[0], k1));
}

TEST_F(KeyRotationTest, MalformedNewKeyIsValidationError) {
    seed(1);
    unlock_with(k1);
    EXPECT_EQ(rotate(k1, "short").error(), VaultError::ValidationError);
}

TEST_F(KeyRotationTest, SameKeyIsValidationError) {
    seed(1);
    unlock_with(k1);
    EXPECT_EQ(rotate(k1, k1).error(), VaultError::ValidationError);
}

// ============================================================================
// Rotation
// ============================================================================

TEST_F(KeyRotationTest, ThreeEntriesRotateAndOldKeyStopsWorking) {
    seed(3);
    unlock_with(k1);

    auto result = rotate(k1, k2);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->rotated(), 3u);
    EXPECT_EQ(result->skipped(), 0u);
    EXPECT_EQ(result->outcome(), RotationOutcome::FullyRotated);

    ASSERT_TRUE(h.core->unlock().lock(CoreHarness::ALICE).has_value());
    auto with_old = h.unlock(CoreHarness::ALICE, k1);
    ASSERT_FALSE(with_old.has_value());
    EXPECT_EQ(with_old.error(), VaultError::InvalidKey);

    EXPECT_TRUE(h.unlock(CoreHarness::ALICE, k2).has_value());
}

TEST_F(KeyRotationTest, SessionMovesToNewKey) {
    seed(2);
    unlock_with(k1);
    ASSERT_TRUE(rotate(k1, k2).has_value());

    EXPECT_TRUE(h.core->sessions().key_matches(CoreHarness::ALICE, decode_key(k2)));

    // The session key is used for further data operations without re-unlocking
    auto listed = h.core->entries().list_entries(CoreHarness::ALICE);
    ASSERT_TRUE(listed.has_value());
    EXPECT_EQ(listed->size(), 2u);
}

TEST_F(KeyRotationTest, CorruptedEntryIsSkippedOthersRotated) {
    seed(5);
    unlock_with(k1);

    // Flip a ciphertext byte so one entry no longer authenticates
    auto victim = h.entries.find(CoreHarness::ALICE, ids[2]).value();
    victim.sealed.ciphertext[0] ^= 0xFF;
    ASSERT_TRUE(h.entries.batch_update(CoreHarness::ALICE,
        {{victim.id, victim.sealed, std::nullopt}}).has_value());
    h.clock.advance(std::chrono::seconds(1));

    auto result = rotate(k1, k2);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->rotated(), 4u);
    EXPECT_EQ(result->skipped(), 1u);
    ASSERT_EQ(result->skipped_ids.size(), 1u);
    EXPECT_EQ(result->skipped_ids[0], ids[2]);
    EXPECT_EQ(result->outcome(), RotationOutcome::PartiallyRotated);

    for (size_t i = 0; i < ids.size(); ++i) {
        if (i != 2) {
            EXPECT_TRUE(decrypts_with(ids[i], k2)) << "entry " << i;
        }
    }

    ASSERT_TRUE(h.core->unlock().lock(CoreHarness::ALICE).has_value());
    auto with_old = h.unlock(CoreHarness::ALICE, k1);
    ASSERT_FALSE(with_old.has_value());
    EXPECT_EQ(with_old.error(), VaultError::InvalidKey);
    EXPECT_TRUE(h.unlock(CoreHarness::ALICE, k2).has_value());
}

TEST_F(KeyRotationTest, SkippedEntryStoredLastWithSameTimestampDoesNotBlockUnlock) {
    seed(2);
    ASSERT_TRUE(h.unlock(CoreHarness::ALICE, k1).has_value());

    // Same instant as the rotation below, and last in store order
    const std::string foreign_id = seed_entry(h.entries, CoreHarness::ALICE,
                                              make_encoded_key(), "foreign").id;

    auto result = rotate(k1, k2);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->outcome(), RotationOutcome::PartiallyRotated);
    ASSERT_EQ(result->skipped_ids.size(), 1u);
    EXPECT_EQ(result->skipped_ids[0], foreign_id);

    const auto stored = h.entries.list_for_owner(CoreHarness::ALICE).value();
    ASSERT_EQ(stored.size(), 3u);
    EXPECT_EQ(stored.back().id, foreign_id);
    for (const auto& entry : stored) {
        EXPECT_EQ(entry.updated_at, stored.front().updated_at);
    }

    ASSERT_TRUE(h.core->unlock().lock(CoreHarness::ALICE).has_value());
    auto with_old = h.unlock(CoreHarness::ALICE, k1);
    ASSERT_FALSE(with_old.has_value());
    EXPECT_EQ(with_old.error(), VaultError::InvalidKey);
    EXPECT_TRUE(h.unlock(CoreHarness::ALICE, k2).has_value());
}

TEST_F(KeyRotationTest, EntryAlreadyUnderNewKeyIsSkipped) {
    seed(2);
    unlock_with(k1);
    ids.push_back(seed_entry(h.entries, CoreHarness::ALICE, k2, "rotated earlier").id);

    auto result = rotate(k1, k2);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->rotated(), 2u);
    EXPECT_EQ(result->skipped(), 1u);
    EXPECT_TRUE(decrypts_with(ids[2], k2)) << "Skipped entries are left untouched";
}

TEST_F(KeyRotationTest, EmptyVaultOnlyMovesSession) {
    unlock_with(k1);

    auto result = rotate(k1, k2);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->outcome(), RotationOutcome::NoEntries);
    EXPECT_TRUE(h.core->sessions().key_matches(CoreHarness::ALICE, decode_key(k2)));
}

TEST_F(KeyRotationTest, AllEntriesUndecryptableIsIneffective) {
    std::vector<AuditEvent> events;
    h.core->audit().signal_event().connect([&events](const AuditEvent& e) { events.push_back(e); });
    seed(2);
    unlock_with(k1);

    for (const auto& id : ids) {
        auto entry = h.entries.find(CoreHarness::ALICE, id).value();
        entry.sealed.auth_tag[0] ^= 0x01;
        ASSERT_TRUE(h.entries.batch_update(CoreHarness::ALICE,
            {{entry.id, entry.sealed, std::nullopt}}).has_value());
    }
    const auto before = h.entries.list_for_owner(CoreHarness::ALICE).value();

    auto result = rotate(k1, k2);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), VaultError::RotationIneffective);

    EXPECT_TRUE(h.core->sessions().key_matches(CoreHarness::ALICE, decode_key(k1)))
        << "Old session stays in place";
    const auto after = h.entries.list_for_owner(CoreHarness::ALICE).value();
    ASSERT_EQ(after.size(), before.size());
    for (size_t i = 0; i < after.size(); ++i) {
        EXPECT_EQ(after[i].sealed, before[i].sealed);
        EXPECT_EQ(after[i].updated_at, before[i].updated_at);
    }

    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, AuditEventType::RotationIneffective);
    EXPECT_EQ(events.back().count, 2u);
    EXPECT_NE(events.back().detail.find(ids[0]), std::string::npos);
    EXPECT_NE(events.back().detail.find(ids[1]), std::string::npos);
}

TEST_F(KeyRotationTest, RerunAfterPartialRotationFinishesRemainingEntries) {
    seed(3);
    unlock_with(k1);

    // Simulate an interrupted run: one entry already carries k2
    auto first = h.entries.find(CoreHarness::ALICE, ids[0]).value();
    auto plaintext = CipherEngine::decrypt(first.sealed, decode_key(k1)).value();
    auto resealed = CipherEngine::encrypt(plaintext, decode_key(k2)).value();
    ASSERT_TRUE(h.entries.batch_update(CoreHarness::ALICE, {{first.id, resealed, std::nullopt}}).has_value());

    auto result = rotate(k1, k2);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->rotated(), 2u);
    EXPECT_EQ(result->skipped(), 1u);
    for (const auto& id : ids) {
        EXPECT_TRUE(decrypts_with(id, k2));
    }
}

TEST_F(KeyRotationTest, RotationIsAudited) {
    std::vector<AuditEvent> events;
    h.core->audit().signal_event().connect([&events](const AuditEvent& e) { events.push_back(e); });
    seed(3);
    unlock_with(k1);

    ASSERT_TRUE(rotate(k1, k2).has_value());
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, AuditEventType::KeyRotated);
    EXPECT_EQ(events.back().count, 3u);
    EXPECT_EQ(events.back().secondary_count, 0u);
    EXPECT_TRUE(events.back().detail.empty());
}

TEST_F(KeyRotationTest, PartialRotationAuditNamesSkippedEntries) {
    std::vector<AuditEvent> events;
    h.core->audit().signal_event().connect([&events](const AuditEvent& e) { events.push_back(e); });
    seed(2);
    unlock_with(k1);
    const std::string foreign_id = seed_entry(h.entries, CoreHarness::ALICE,
                                              make_encoded_key(), "foreign").id;

    ASSERT_TRUE(rotate(k1, k2).has_value());
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, AuditEventType::KeyRotated);
    EXPECT_EQ(events.back().detail, foreign_id);
}
