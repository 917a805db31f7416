// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "UnlockService.h"
#include "../crypto/CipherEngine.h"
#include "../crypto/KeyCodec.h"
#include "../../utils/Log.h"
#include <stdexcept>

namespace Lockr {

UnlockService::UnlockService(IUserDirectory* users,
                             IEntryStore* entries,
                             SessionRegistry* sessions,
                             UnlockAttemptLimiter* limiter,
                             KeyedMutex* gate,
                             AuditLog* audit)
    : m_users(users),
      m_entries(entries),
      m_sessions(sessions),
      m_limiter(limiter),
      m_gate(gate),
      m_audit(audit) {
    if (!m_users || !m_entries || !m_sessions || !m_limiter || !m_gate || !m_audit) {
        throw std::invalid_argument("UnlockService: collaborators cannot be null");
    }
}

std::vector<const VaultEntry*> UnlockService::verification_entries(const std::vector<VaultEntry>& entries) {
    std::vector<const VaultEntry*> newest;
    for (const auto& entry : entries) {
        if (!newest.empty() && entry.updated_at < newest.front()->updated_at) {
            continue;
        }
        if (!newest.empty() && entry.updated_at > newest.front()->updated_at) {
            newest.clear();
        }
        newest.push_back(&entry);
    }
    return newest;
}

VaultResult<UnlockResult> UnlockService::unlock(const UnlockRequest& request) {
    if (request.user_id.empty()) {
        return std::unexpected(VaultError::ValidationError);
    }

    auto key = KeyCodec::decode(request.encoded_key);
    if (!key) {
        return std::unexpected(key.error());
    }

    auto guard = m_gate->lock(request.user_id);

    // Hard gate: no decryption while locked out, even for the right key
    if (m_limiter->is_blocked(request.user_id, request.client_address)) {
        m_audit->record({.type = AuditEventType::UnlockRateLimited,
                         .user_id = request.user_id,
                         .client_address = request.client_address});
        return std::unexpected(VaultError::RateLimited);
    }

    if (!m_users->find_by_id(request.user_id)) {
        return std::unexpected(VaultError::NotFound);
    }

    auto entries = m_entries->list_for_owner(request.user_id);
    if (!entries) {
        Log::error("UnlockService: Failed to load entries of user {}: {}",
                   request.user_id, to_string(entries.error()));
        return std::unexpected(to_vault_error(entries.error()));
    }

    UnlockResult result;
    const auto anchors = verification_entries(*entries);
    if (!anchors.empty()) {
        bool opened = false;
        bool key_rejected = false;
        for (const VaultEntry* anchor : anchors) {
            auto plaintext = CipherEngine::decrypt(anchor->sealed, *key);
            if (plaintext) {
                opened = true;
                break;
            }
            if (plaintext.error() == CipherError::AuthenticationFailed) {
                key_rejected = true;
                continue;
            }
            Log::error("UnlockService: Entry {} of user {} is unusable: {}",
                       anchor->id, request.user_id, to_string(plaintext.error()));
            m_audit->record({.type = AuditEventType::DataCorruption,
                             .user_id = request.user_id,
                             .detail = anchor->id});
        }

        if (!opened && !key_rejected) {
            return std::unexpected(VaultError::Fatal);
        }
        if (!opened) {
            const AttemptStatus status = m_limiter->record_failure(request.user_id,
                                                                   request.client_address);
            m_audit->record({.type = AuditEventType::UnlockFailed,
                             .user_id = request.user_id,
                             .client_address = request.client_address,
                             .count = status.user_failures});
            return std::unexpected(VaultError::InvalidKey);
        }
        result.verified_against_entry = true;
    } else {
        Log::info("UnlockService: User {} has no entries, accepting key without verification",
                  request.user_id);
    }

    const SessionInfo session = m_sessions->create_session(request.user_id, *key);
    result.expires_at = session.expires_at;
    Log::info("UnlockService: Vault unlocked for user {}", request.user_id);
    return result;
}

VaultResult<void> UnlockService::lock(std::string_view user_id) {
    if (user_id.empty()) {
        return std::unexpected(VaultError::ValidationError);
    }

    auto guard = m_gate->lock(user_id);
    if (m_sessions->clear_session(user_id)) {
        Log::info("UnlockService: Vault locked for user {}", user_id);
    }
    return {};
}

bool UnlockService::is_unlocked(std::string_view user_id) {
    return m_sessions->get_session(user_id).has_value();
}

}  // namespace Lockr
