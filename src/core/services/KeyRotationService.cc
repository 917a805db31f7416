// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "KeyRotationService.h"
#include "../crypto/CipherEngine.h"
#include "../crypto/KeyCodec.h"
#include "../../utils/Log.h"
#include <stdexcept>

namespace Lockr {

KeyRotationService::KeyRotationService(IEntryStore* entries, SessionRegistry* sessions,
                                       KeyedMutex* gate, AuditLog* audit)
    : m_entries(entries),
      m_sessions(sessions),
      m_gate(gate),
      m_audit(audit) {
    if (!m_entries || !m_sessions || !m_gate || !m_audit) {
        throw std::invalid_argument("KeyRotationService: collaborators cannot be null");
    }
}

namespace {

std::string join_ids(const std::vector<std::string>& ids) {
    std::string joined;
    for (const auto& id : ids) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += id;
    }
    return joined;
}

}  // namespace

VaultResult<RotationResult> KeyRotationService::rotate(const RotationRequest& request) {
    if (request.user_id.empty()) {
        return std::unexpected(VaultError::ValidationError);
    }

    auto guard = m_gate->lock(request.user_id);

    if (!m_sessions->get_session(request.user_id)) {
        return std::unexpected(VaultError::SessionRequired);
    }

    auto current_key = KeyCodec::decode(request.current_key);
    if (!current_key) {
        return std::unexpected(current_key.error());
    }
    auto new_key = KeyCodec::decode(request.new_key);
    if (!new_key) {
        return std::unexpected(new_key.error());
    }
    if (constant_time_equal(*current_key, *new_key)) {
        return std::unexpected(VaultError::ValidationError);
    }

    if (!m_sessions->key_matches(request.user_id, *current_key)) {
        Log::warning("KeyRotationService: Current key of user {} does not match the session",
                     request.user_id);
        return std::unexpected(VaultError::KeyMismatch);
    }

    auto entries = m_entries->list_for_owner(request.user_id);
    if (!entries) {
        Log::error("KeyRotationService: Failed to load entries of user {}: {}",
                   request.user_id, to_string(entries.error()));
        return std::unexpected(to_vault_error(entries.error()));
    }

    RotationResult result;
    std::vector<EntryCiphertextUpdate> updates;
    updates.reserve(entries->size());

    for (const auto& entry : *entries) {
        auto plaintext = CipherEngine::decrypt(entry.sealed, *current_key);
        if (!plaintext) {
            Log::warning("KeyRotationService: Skipping entry {} of user {}: {}",
                         entry.id, request.user_id, to_string(plaintext.error()));
            result.skipped_ids.push_back(entry.id);
            continue;
        }

        auto resealed = CipherEngine::encrypt(*plaintext, *new_key);
        if (!resealed) {
            Log::error("KeyRotationService: Re-encryption failed for user {}: {}",
                       request.user_id, to_string(resealed.error()));
            return std::unexpected(VaultError::Fatal);
        }

        updates.push_back({entry.id, std::move(*resealed), std::nullopt});
        result.rotated_ids.push_back(entry.id);
    }

    const std::string skipped_list = join_ids(result.skipped_ids);

    if (result.outcome() == RotationOutcome::Ineffective) {
        Log::error("KeyRotationService: None of {} entries of user {} could be rotated, keeping current key",
                   result.skipped(), request.user_id);
        m_audit->record({.type = AuditEventType::RotationIneffective,
                         .user_id = request.user_id,
                         .count = result.skipped(),
                         .detail = skipped_list});
        return std::unexpected(VaultError::RotationIneffective);
    }

    if (!updates.empty()) {
        auto applied = m_entries->batch_update(request.user_id, updates);
        if (!applied) {
            Log::error("KeyRotationService: Batch write failed for user {}: {}",
                       request.user_id, to_string(applied.error()));
            return std::unexpected(VaultError::Fatal);
        }
    }

    m_sessions->create_session(request.user_id, *new_key);

    m_audit->record({.type = AuditEventType::KeyRotated,
                     .user_id = request.user_id,
                     .count = result.rotated(),
                     .secondary_count = result.skipped(),
                     .detail = skipped_list});
    return result;
}

}  // namespace Lockr
