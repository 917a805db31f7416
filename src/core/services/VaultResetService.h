// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file VaultResetService.h
 * @brief Lost-key recovery by destroying the vault contents
 */

#pragma once

#include "../VaultError.h"
#include "../VaultTypes.h"
#include "../audit/AuditLog.h"
#include "../repositories/IEntryStore.h"
#include "../repositories/IResetTokenStore.h"
#include "../repositories/IUserDirectory.h"
#include "KeyedMutex.h"
#include "SessionRegistry.h"
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace Lockr {

struct ResetPolicy {
    std::chrono::seconds token_lifetime{15 * 60};
    size_t max_requests_per_user = 3;
    size_t max_requests_per_address = 5;
    std::chrono::seconds request_window{60 * 60};
};

struct ResetRequest {
    std::string email;
    std::string client_address;
    bool confirmed = false;        ///< User acknowledged that all entries will be destroyed
};

struct ResetCompletion {
    std::string token;
    bool confirmed = false;
    std::optional<std::string> new_encoded_key;   ///< Seeds a verification entry when set
};

struct ResetResult {
    std::string user_id;
    size_t entries_destroyed = 0;
    bool fully_wiped = false;
    bool anchor_created = false;
};

/**
 * @brief Two-phase vault reset through an out-of-band token
 *
 * Phase 1, request_reset(): issues a single-use token (32 random bytes,
 * hex) to the account's e-mail through IResetTokenDelivery. Only the
 * SHA-256 of the token is stored. The response is identical whether the
 * account exists or its request budget is spent; only the per-address
 * budget is visible to the caller.
 *
 * Phase 2, complete_reset(): the token is consumed before anything is
 * deleted, so a second call with the same token always fails with
 * InvalidToken instead of deleting again. All entries are destroyed, the
 * session is cleared and a Critical audit event records the number of
 * entries destroyed. The reported count is what was actually removed.
 *
 * Nothing here needs the old key; the old ciphertext is unrecoverable.
 */
class VaultResetService {
public:
    static constexpr size_t TOKEN_BYTES = 32;
    static constexpr std::string_view ANCHOR_TITLE = "System Validation Entry";

    /**
     * @throws std::invalid_argument if any pointer is null
     */
    VaultResetService(IUserDirectory* users,
                      IEntryStore* entries,
                      IResetTokenStore* tokens,
                      IResetTokenDelivery* delivery,
                      SessionRegistry* sessions,
                      KeyedMutex* gate,
                      AuditLog* audit,
                      ResetPolicy policy = {},
                      NowProvider now = Clock::now);

    VaultResetService(const VaultResetService&) = delete;
    VaultResetService& operator=(const VaultResetService&) = delete;

    /**
     * @brief Issue a reset token
     *
     * Errors:
     * - ValidationError: Not confirmed or no e-mail
     * - RateLimited: Address exceeded its request budget
     */
    [[nodiscard]] VaultResult<void> request_reset(const ResetRequest& request);

    /**
     * @brief Destroy the vault of the token's owner
     *
     * Errors:
     * - ValidationError: Not confirmed, or new key malformed
     * - InvalidToken: Unknown, expired or already used token
     * - NotFound: Account of the token no longer exists
     *
     * A wipe the store could not finish still succeeds with
     * fully_wiped == false and the number actually destroyed; the token is
     * spent either way.
     */
    [[nodiscard]] VaultResult<ResetResult> complete_reset(const ResetCompletion& completion);

    /**
     * @brief Remove expired tokens and stale request counters
     * @return Number of token records removed
     */
    size_t purge_expired_tokens();

private:
    /// Count a request from address; false when its budget is spent
    bool admit_address(const std::string& address, TimePoint now);

    bool create_anchor(const std::string& user_id, const SecureVector<uint8_t>& key);

    IUserDirectory* m_users;
    IEntryStore* m_entries;
    IResetTokenStore* m_tokens;
    IResetTokenDelivery* m_delivery;
    SessionRegistry* m_sessions;
    KeyedMutex* m_gate;
    AuditLog* m_audit;
    ResetPolicy m_policy;
    NowProvider m_now;

    std::mutex m_address_mutex;
    std::map<std::string, std::deque<TimePoint>, std::less<>> m_address_requests;
};

}  // namespace Lockr
