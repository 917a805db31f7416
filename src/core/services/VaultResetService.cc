// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "VaultResetService.h"
#include "../crypto/CipherEngine.h"
#include "../crypto/Digest.h"
#include "../crypto/KeyCodec.h"
#include "../serialization/EntrySerialization.h"
#include "../../utils/Log.h"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>

namespace Lockr {

namespace {

bool is_well_formed_token(std::string_view token) {
    return token.size() == VaultResetService::TOKEN_BYTES * 2 &&
           std::all_of(token.begin(), token.end(), [](unsigned char c) {
               return std::isxdigit(c) != 0 && !std::isupper(c);
           });
}

}  // namespace

VaultResetService::VaultResetService(IUserDirectory* users,
                                     IEntryStore* entries,
                                     IResetTokenStore* tokens,
                                     IResetTokenDelivery* delivery,
                                     SessionRegistry* sessions,
                                     KeyedMutex* gate,
                                     AuditLog* audit,
                                     ResetPolicy policy,
                                     NowProvider now)
    : m_users(users),
      m_entries(entries),
      m_tokens(tokens),
      m_delivery(delivery),
      m_sessions(sessions),
      m_gate(gate),
      m_audit(audit),
      m_policy(policy),
      m_now(std::move(now)) {
    if (!m_users || !m_entries || !m_tokens || !m_delivery || !m_sessions || !m_gate || !m_audit) {
        throw std::invalid_argument("VaultResetService: collaborators cannot be null");
    }
    if (!m_now) {
        throw std::invalid_argument("VaultResetService: clock cannot be null");
    }
}

bool VaultResetService::admit_address(const std::string& address, TimePoint now) {
    if (address.empty()) {
        return true;
    }

    std::lock_guard lock(m_address_mutex);
    auto& requests = m_address_requests[address];
    while (!requests.empty() && requests.front() + m_policy.request_window <= now) {
        requests.pop_front();
    }
    if (requests.size() >= m_policy.max_requests_per_address) {
        return false;
    }
    requests.push_back(now);
    return true;
}

VaultResult<void> VaultResetService::request_reset(const ResetRequest& request) {
    if (!request.confirmed || request.email.empty()) {
        return std::unexpected(VaultError::ValidationError);
    }

    const TimePoint now = m_now();
    if (!admit_address(request.client_address, now)) {
        Log::warning("VaultResetService: Reset requests from {} rate limited", request.client_address);
        return std::unexpected(VaultError::RateLimited);
    }

    // Generated for every request so that known and unknown accounts take the same path
    std::string token = Digest::to_hex(CipherEngine::generate_random_bytes(TOKEN_BYTES));
    const std::string token_hash = Digest::sha256_hex(token);

    const auto account = m_users->find_by_email(request.email);
    if (!account) {
        Log::debug("VaultResetService: Reset requested for an unknown account");
        secure_clear_string(token);
        return {};
    }

    if (m_tokens->count_issued_since(account->id, now - m_policy.request_window) >=
        m_policy.max_requests_per_user) {
        Log::warning("VaultResetService: Reset request budget of user {} exhausted", account->id);
        secure_clear_string(token);
        return {};
    }

    ResetTokenRecord record;
    record.token_hash = token_hash;
    record.user_id = account->id;
    record.requested_from = request.client_address;
    record.created_at = now;
    record.expires_at = now + m_policy.token_lifetime;

    if (!m_tokens->insert(record)) {
        Log::error("VaultResetService: Failed to store reset token for user {}", account->id);
        secure_clear_string(token);
        return std::unexpected(VaultError::Fatal);
    }

    const bool delivered = m_delivery->deliver(*account, token, record.expires_at);
    secure_clear_string(token);
    if (!delivered) {
        // Not reachable by the holder, so it must not use up the request budget
        Log::error("VaultResetService: Reset token for user {} not delivered, withdrawn", account->id);
        if (!m_tokens->remove(token_hash)) {
            Log::warning("VaultResetService: Undelivered token of user {} already gone", account->id);
        }
        return {};
    }

    m_audit->record({.type = AuditEventType::ResetRequested,
                     .user_id = account->id,
                     .client_address = request.client_address});
    return {};
}

bool VaultResetService::create_anchor(const std::string& user_id, const SecureVector<uint8_t>& key) {
    lockr::EntryPayload payload;
    payload.set_title(std::string(ANCHOR_TITLE));
    payload.set_notes("Created by vault reset to verify the new encryption key.");

    auto plaintext = EntrySerialization::serialize_payload(payload);
    if (!plaintext) {
        return false;
    }
    auto sealed = CipherEngine::encrypt(*plaintext, key);
    if (!sealed) {
        Log::error("VaultResetService: Failed to encrypt verification entry: {}",
                   to_string(sealed.error()));
        return false;
    }

    VaultEntry anchor;
    anchor.owner_id = user_id;
    anchor.sealed = std::move(*sealed);
    anchor.category = EntryCategory::System;

    auto stored = m_entries->insert(anchor);
    if (!stored) {
        Log::error("VaultResetService: Failed to store verification entry for user {}: {}",
                   user_id, to_string(stored.error()));
        return false;
    }
    return true;
}

VaultResult<ResetResult> VaultResetService::complete_reset(const ResetCompletion& completion) {
    if (!completion.confirmed) {
        return std::unexpected(VaultError::ValidationError);
    }

    std::optional<SecureVector<uint8_t>> new_key;
    if (completion.new_encoded_key) {
        auto decoded = KeyCodec::decode(*completion.new_encoded_key);
        if (!decoded) {
            return std::unexpected(decoded.error());
        }
        new_key = std::move(*decoded);
    }

    if (!is_well_formed_token(completion.token)) {
        return std::unexpected(VaultError::InvalidToken);
    }

    const std::string token_hash = Digest::sha256_hex(completion.token);
    const auto pending = m_tokens->find(token_hash);
    if (!pending || !pending->is_usable(m_now())) {
        return std::unexpected(VaultError::InvalidToken);
    }
    if (!m_users->find_by_id(pending->user_id)) {
        Log::warning("VaultResetService: Account {} of a reset token no longer exists", pending->user_id);
        return std::unexpected(VaultError::NotFound);
    }

    auto guard = m_gate->lock(pending->user_id);

    // Consuming first makes the deletion single-shot even under concurrent completions
    const auto consumed = m_tokens->consume(token_hash, m_now());
    if (!consumed) {
        return std::unexpected(VaultError::InvalidToken);
    }

    ResetResult result;
    result.user_id = consumed->user_id;

    const size_t before = m_entries->count_for_owner(result.user_id).value_or(0);
    auto removed = m_entries->remove_all_for_owner(result.user_id);
    if (removed) {
        result.entries_destroyed = *removed;
        result.fully_wiped = true;
    } else {
        auto remaining = m_entries->count_for_owner(result.user_id);
        if (remaining && *remaining <= before) {
            result.entries_destroyed = before - *remaining;
        }
        result.fully_wiped = remaining.has_value() && *remaining == 0;
        Log::error("VaultResetService: Wipe of user {} incomplete: {}",
                   result.user_id, to_string(removed.error()));
    }

    m_sessions->clear_session(result.user_id);
    m_tokens->record_wipe(token_hash, result.entries_destroyed);

    m_audit->record({.type = AuditEventType::VaultReset,
                     .user_id = result.user_id,
                     .client_address = consumed->requested_from,
                     .count = result.entries_destroyed,
                     .detail = result.fully_wiped ? "complete" : "incomplete"});

    if (new_key && result.fully_wiped) {
        result.anchor_created = create_anchor(result.user_id, *new_key);
    }
    return result;
}

size_t VaultResetService::purge_expired_tokens() {
    const TimePoint now = m_now();
    const TimePoint cutoff = now - m_policy.request_window;

    {
        std::lock_guard lock(m_address_mutex);
        for (auto it = m_address_requests.begin(); it != m_address_requests.end();) {
            auto& requests = it->second;
            while (!requests.empty() && requests.front() <= cutoff) {
                requests.pop_front();
            }
            it = requests.empty() ? m_address_requests.erase(it) : std::next(it);
        }
    }

    const size_t removed = m_tokens->purge(now, cutoff);
    if (removed > 0) {
        Log::debug("VaultResetService: Purged {} reset tokens", removed);
    }
    return removed;
}

}  // namespace Lockr
