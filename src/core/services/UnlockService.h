// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file UnlockService.h
 * @brief Vault unlock and lock protocol
 */

#pragma once

#include "../VaultError.h"
#include "../VaultTypes.h"
#include "../audit/AuditLog.h"
#include "../repositories/IEntryStore.h"
#include "../repositories/IUserDirectory.h"
#include "KeyedMutex.h"
#include "SessionRegistry.h"
#include "UnlockAttemptLimiter.h"
#include <string>
#include <string_view>
#include <vector>

namespace Lockr {

struct UnlockRequest {
    std::string user_id;          ///< Authenticated by the caller
    std::string encoded_key;      ///< Base64 of the raw 32-byte key
    std::string client_address;   ///< Optional, enables per-address limiting
};

struct UnlockResult {
    TimePoint expires_at{};
    bool verified_against_entry = false;   ///< false when the vault had no entries
};

/**
 * @brief Verifies a submitted key against existing ciphertext and opens a session
 *
 * Unlock, in order:
 * 1. Structural key check (ValidationError)
 * 2. Attempt limiter gate (RateLimited, no decryption attempted)
 * 3. Account lookup (NotFound)
 * 4. Decrypt the most recently written entry; a failed tag check records a
 *    failure and returns InvalidKey. A vault without entries accepts any
 *    well-formed key.
 * 5. Install the session
 *
 * Thread Safety:
 * - Unlock and lock of one user run under that user's gate; different
 *   users never wait on each other
 */
class UnlockService {
public:
    /**
     * @brief Construct service with its collaborators
     * @throws std::invalid_argument if any pointer is null
     */
    UnlockService(IUserDirectory* users,
                  IEntryStore* entries,
                  SessionRegistry* sessions,
                  UnlockAttemptLimiter* limiter,
                  KeyedMutex* gate,
                  AuditLog* audit);

    UnlockService(const UnlockService&) = delete;
    UnlockService& operator=(const UnlockService&) = delete;

    [[nodiscard]] VaultResult<UnlockResult> unlock(const UnlockRequest& request);

    /**
     * @brief Close the user's session (idempotent)
     */
    [[nodiscard]] VaultResult<void> lock(std::string_view user_id);

    [[nodiscard]] bool is_unlocked(std::string_view user_id);

    /**
     * @brief Entries that unlock verifies a key against
     *
     * The most recently updated entries carry the key of the last write. A
     * rotation writes all its entries with one timestamp, so several entries
     * can share it, including one the rotation skipped; a key is accepted
     * when it opens any of them.
     *
     * @return Entries with the newest updated_at, in store order; empty for
     *         an empty list
     */
    [[nodiscard]] static std::vector<const VaultEntry*> verification_entries(
        const std::vector<VaultEntry>& entries);

private:
    IUserDirectory* m_users;
    IEntryStore* m_entries;
    SessionRegistry* m_sessions;
    UnlockAttemptLimiter* m_limiter;
    KeyedMutex* m_gate;
    AuditLog* m_audit;
};

}  // namespace Lockr
