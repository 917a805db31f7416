// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng
//
// VaultTestSupport.h - Shared fixtures for the vault core tests

#ifndef LOCKR_VAULT_TEST_SUPPORT_H
#define LOCKR_VAULT_TEST_SUPPORT_H

#include "../src/core/VaultCore.h"
#include "../src/core/crypto/CipherEngine.h"
#include "../src/core/crypto/KeyCodec.h"
#include "../src/core/repositories/IResetTokenStore.h"
#include "../src/core/repositories/IUserDirectory.h"
#include "../src/core/repositories/InMemoryEntryStore.h"
#include "../src/core/serialization/EntrySerialization.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Lockr::Testing {

/**
 * @brief Clock that only moves when a test advances it
 */
class ManualClock {
public:
    ManualClock() : m_now(Clock::now().time_since_epoch().count()) {}

    TimePoint now() const { return TimePoint(Clock::duration(m_now.load())); }

    void advance(std::chrono::seconds by) {
        m_now += std::chrono::duration_cast<Clock::duration>(by).count();
    }

    void advance_ms(int64_t ms) {
        m_now += std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)).count();
    }

    NowProvider provider() {
        return [this] { return now(); };
    }

private:
    std::atomic<Clock::rep> m_now;
};

/**
 * @brief Delivery stub that remembers every token it was given
 */
class RecordingDelivery : public IResetTokenDelivery {
public:
    struct Message {
        UserAccount account;
        std::string token;
        TimePoint expires_at;
    };

    bool deliver(const UserAccount& account, std::string_view token, TimePoint expires_at) override {
        std::lock_guard lock(m_mutex);
        if (m_fail) {
            return false;
        }
        m_messages.push_back({account, std::string(token), expires_at});
        return true;
    }

    /// Make subsequent deliveries fail, as an unreachable mail relay would
    void set_failing(bool fail) {
        std::lock_guard lock(m_mutex);
        m_fail = fail;
    }

    std::vector<Message> messages() const {
        std::lock_guard lock(m_mutex);
        return m_messages;
    }

    std::string last_token() const {
        std::lock_guard lock(m_mutex);
        return m_messages.empty() ? std::string() : m_messages.back().token;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<Message> m_messages;
    bool m_fail = false;
};

/// Fresh random 32-byte key, base64 encoded
inline std::string make_encoded_key() {
    return KeyCodec::encode(CipherEngine::generate_random_bytes(CipherEngine::KEY_LENGTH));
}

inline SecureVector<uint8_t> decode_key(const std::string& encoded) {
    return KeyCodec::decode(encoded).value();
}

inline lockr::EntryPayload make_payload(const std::string& title, const std::string& password = "hunter2") {
    lockr::EntryPayload payload;
    payload.set_title(title);
    payload.set_username("alice");
    payload.set_password(password);
    payload.set_website("https://example.org");
    return payload;
}

/**
 * @brief Encrypt a payload under an encoded key and store it directly,
 *        bypassing the session (used to seed vaults)
 */
inline VaultEntry seed_entry(IEntryStore& store, const std::string& owner_id,
                             const std::string& encoded_key, const std::string& title,
                             EntryCategory category = EntryCategory::Login) {
    auto plaintext = EntrySerialization::serialize_payload(make_payload(title)).value();
    VaultEntry entry;
    entry.owner_id = owner_id;
    entry.sealed = CipherEngine::encrypt(plaintext, decode_key(encoded_key)).value();
    entry.category = category;
    return store.insert(entry).value();
}

/**
 * @brief Fully wired core over in-memory stores with a manual clock
 */
class CoreHarness {
public:
    static constexpr const char* ALICE = "user-alice";
    static constexpr const char* BOB = "user-bob";

    explicit CoreHarness(VaultConfig config = {})
        : entries(clock.provider()) {
        users.add_user({ALICE, "alice@example.org"});
        users.add_user({BOB, "bob@example.org"});
        core = std::make_unique<VaultCore>(config, &entries, &users, &tokens, &delivery,
                                           clock.provider());
    }

    VaultResult<UnlockResult> unlock(const std::string& user, const std::string& key,
                                     const std::string& address = "") {
        return core->unlock().unlock({user, key, address});
    }

    ManualClock clock;
    InMemoryEntryStore entries;
    InMemoryUserDirectory users;
    InMemoryResetTokenStore tokens;
    RecordingDelivery delivery;
    std::unique_ptr<VaultCore> core;
};

}  // namespace Lockr::Testing

#endif  // LOCKR_VAULT_TEST_SUPPORT_H
