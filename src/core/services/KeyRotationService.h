// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file KeyRotationService.h
 * @brief Re-encryption of a vault under a new key
 */

#pragma once

#include "../VaultError.h"
#include "../VaultTypes.h"
#include "../audit/AuditLog.h"
#include "../repositories/IEntryStore.h"
#include "KeyedMutex.h"
#include "SessionRegistry.h"
#include <string>
#include <vector>

namespace Lockr {

struct RotationRequest {
    std::string user_id;
    std::string current_key;   ///< Base64, must equal the session key
    std::string new_key;       ///< Base64
};

enum class RotationOutcome {
    FullyRotated,       ///< Every entry now under the new key
    PartiallyRotated,   ///< Some entries skipped and still under the old key
    NoEntries,          ///< Empty vault, only the session key changed
    Ineffective         ///< Entries existed but none could be re-encrypted
};

[[nodiscard]] constexpr std::string_view to_string(RotationOutcome outcome) noexcept {
    switch (outcome) {
        case RotationOutcome::FullyRotated:     return "fully rotated";
        case RotationOutcome::PartiallyRotated: return "partially rotated";
        case RotationOutcome::NoEntries:        return "no entries";
        case RotationOutcome::Ineffective:      return "ineffective";
    }
    return "unknown";
}

/**
 * @brief Per-entry result of a rotation
 */
struct RotationResult {
    std::vector<std::string> rotated_ids;
    std::vector<std::string> skipped_ids;   ///< Failed to decrypt under the current key

    [[nodiscard]] size_t rotated() const noexcept { return rotated_ids.size(); }
    [[nodiscard]] size_t skipped() const noexcept { return skipped_ids.size(); }

    [[nodiscard]] RotationOutcome outcome() const noexcept {
        if (rotated_ids.empty()) {
            return skipped_ids.empty() ? RotationOutcome::NoEntries : RotationOutcome::Ineffective;
        }
        return skipped_ids.empty() ? RotationOutcome::FullyRotated : RotationOutcome::PartiallyRotated;
    }
};

/**
 * @brief Master key change for an unlocked vault
 *
 * Preconditions, checked before any entry is read:
 * - A live session (SessionRequired)
 * - Both keys well formed and different (ValidationError)
 * - current_key equal to the session key (KeyMismatch)
 *
 * Every entry is decrypted with the current key and re-encrypted with the
 * new one. Entries that do not decrypt are skipped rather than aborting the
 * rotation. All re-encrypted entries are written in a single batch after the
 * crypto work is done, then the session is replaced by one under the new
 * key. If entries exist but none could be rotated nothing is written, the
 * session stays on the current key and RotationIneffective is returned.
 *
 * A crash before the batch write leaves the vault untouched; running the
 * rotation again re-attempts everything still under the old key.
 */
class KeyRotationService {
public:
    /**
     * @throws std::invalid_argument if any pointer is null
     */
    KeyRotationService(IEntryStore* entries, SessionRegistry* sessions, KeyedMutex* gate,
                       AuditLog* audit);

    KeyRotationService(const KeyRotationService&) = delete;
    KeyRotationService& operator=(const KeyRotationService&) = delete;

    [[nodiscard]] VaultResult<RotationResult> rotate(const RotationRequest& request);

private:
    IEntryStore* m_entries;
    SessionRegistry* m_sessions;
    KeyedMutex* m_gate;
    AuditLog* m_audit;
};

}  // namespace Lockr
