// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "EntryService.h"
#include "../crypto/CipherEngine.h"
#include "../serialization/EntrySerialization.h"
#include "../../utils/Log.h"
#include <algorithm>
#include <stdexcept>

namespace Lockr {

EntryService::EntryService(IEntryStore* entries, SessionRegistry* sessions, KeyedMutex* gate,
                           AuditLog* audit)
    : m_entries(entries),
      m_sessions(sessions),
      m_gate(gate),
      m_audit(audit) {
    if (!m_entries || !m_sessions || !m_gate || !m_audit) {
        throw std::invalid_argument("EntryService: collaborators cannot be null");
    }
}

VaultResult<SecureVector<uint8_t>> EntryService::session_key(std::string_view user_id) {
    auto key = m_sessions->get_encryption_key(user_id);
    if (!key) {
        return std::unexpected(VaultError::SessionRequired);
    }
    return std::move(*key);
}

VaultResult<EncryptedBlob> EntryService::seal(const lockr::EntryPayload& payload,
                                              const SecureVector<uint8_t>& key) {
    auto plaintext = EntrySerialization::serialize_payload(payload);
    if (!plaintext) {
        return std::unexpected(plaintext.error());
    }

    auto sealed = CipherEngine::encrypt(*plaintext, key);
    if (!sealed) {
        Log::error("EntryService: Encryption failed: {}", to_string(sealed.error()));
        return std::unexpected(VaultError::Fatal);
    }
    return std::move(*sealed);
}

VaultResult<DecryptedEntry> EntryService::open(const VaultEntry& entry,
                                               const SecureVector<uint8_t>& key) {
    auto plaintext = CipherEngine::decrypt(entry.sealed, key);
    if (!plaintext) {
        Log::error("EntryService: Entry {} of user {} does not decrypt under the session key: {}",
                   entry.id, entry.owner_id, to_string(plaintext.error()));
        m_audit->record({.type = AuditEventType::DataCorruption,
                         .user_id = entry.owner_id,
                         .detail = entry.id});
        return std::unexpected(VaultError::Fatal);
    }

    auto payload = EntrySerialization::deserialize_payload(*plaintext);
    if (!payload) {
        m_audit->record({.type = AuditEventType::DataCorruption,
                         .user_id = entry.owner_id,
                         .detail = entry.id});
        return std::unexpected(payload.error());
    }
    return DecryptedEntry{entry, std::move(*payload)};
}

VaultResult<VaultEntry> EntryService::create_entry(const std::string& user_id,
                                                   const lockr::EntryPayload& payload,
                                                   EntryCategory category,
                                                   bool favorite) {
    if (user_id.empty() || category == EntryCategory::System) {
        return std::unexpected(VaultError::ValidationError);
    }

    auto guard = m_gate->lock(user_id);
    auto key = session_key(user_id);
    if (!key) {
        return std::unexpected(key.error());
    }

    auto sealed = seal(payload, *key);
    if (!sealed) {
        return std::unexpected(sealed.error());
    }

    VaultEntry entry;
    entry.owner_id = user_id;
    entry.sealed = std::move(*sealed);
    entry.category = category;
    entry.favorite = favorite;

    auto stored = m_entries->insert(entry);
    if (!stored) {
        Log::error("EntryService: Failed to store entry for user {}: {}",
                   user_id, to_string(stored.error()));
        return std::unexpected(to_vault_error(stored.error()));
    }
    Log::debug("EntryService: Created entry {} for user {}", stored->id, user_id);
    return *stored;
}

VaultResult<std::vector<DecryptedEntry>> EntryService::list_entries(
    std::string_view user_id,
    std::optional<EntryCategory> category) {
    auto guard = m_gate->lock(user_id);
    auto key = session_key(user_id);
    if (!key) {
        return std::unexpected(key.error());
    }

    auto entries = m_entries->list_for_owner(user_id);
    if (!entries) {
        return std::unexpected(to_vault_error(entries.error()));
    }

    std::vector<DecryptedEntry> result;
    result.reserve(entries->size());
    for (const auto& entry : *entries) {
        if (category && entry.category != *category) {
            continue;
        }
        auto opened = open(entry, *key);
        if (!opened) {
            return std::unexpected(opened.error());
        }
        result.push_back(std::move(*opened));
    }
    return result;
}

VaultResult<EntryPage> EntryService::list_page(std::string_view user_id, const EntryQuery& query) {
    auto guard = m_gate->lock(user_id);
    auto key = session_key(user_id);
    if (!key) {
        return std::unexpected(key.error());
    }

    auto entries = m_entries->list_for_owner(user_id);
    if (!entries) {
        return std::unexpected(to_vault_error(entries.error()));
    }

    std::vector<const VaultEntry*> matching;
    for (const auto& entry : *entries) {
        if (query.category && entry.category != *query.category) {
            continue;
        }
        if (query.favorites_only && !entry.favorite) {
            continue;
        }
        matching.push_back(&entry);
    }
    std::stable_sort(matching.begin(), matching.end(),
        [](const VaultEntry* a, const VaultEntry* b) { return a->created_at > b->created_at; });

    EntryPage page;
    page.limit = std::clamp(query.limit, size_t{1}, EntryQuery::MAX_LIMIT);
    page.page = std::max(query.page, size_t{1});
    page.total = matching.size();
    page.total_pages = (page.total + page.limit - 1) / page.limit;

    if (page.page > page.total_pages) {
        return page;
    }
    const size_t offset = (page.page - 1) * page.limit;
    const size_t end = std::min(offset + page.limit, matching.size());
    page.entries.reserve(end - offset);
    for (size_t i = offset; i < end; ++i) {
        auto opened = open(*matching[i], *key);
        if (!opened) {
            return std::unexpected(opened.error());
        }
        page.entries.push_back(std::move(*opened));
    }
    return page;
}

VaultResult<DecryptedEntry> EntryService::get_entry(std::string_view user_id,
                                                    std::string_view entry_id) {
    auto guard = m_gate->lock(user_id);
    auto key = session_key(user_id);
    if (!key) {
        return std::unexpected(key.error());
    }

    auto entry = m_entries->find(user_id, entry_id);
    if (!entry) {
        return std::unexpected(to_vault_error(entry.error()));
    }
    return open(*entry, *key);
}

VaultResult<VaultEntry> EntryService::update_entry(std::string_view user_id,
                                                   std::string_view entry_id,
                                                   const lockr::EntryPayload& payload,
                                                   std::optional<EntryCategory> category,
                                                   std::optional<bool> favorite) {
    if (category == EntryCategory::System) {
        return std::unexpected(VaultError::ValidationError);
    }

    auto guard = m_gate->lock(user_id);
    auto key = session_key(user_id);
    if (!key) {
        return std::unexpected(key.error());
    }

    auto sealed = seal(payload, *key);
    if (!sealed) {
        return std::unexpected(sealed.error());
    }

    std::vector<EntryCiphertextUpdate> updates;
    updates.push_back({std::string(entry_id), std::move(*sealed), category, favorite});
    if (auto applied = m_entries->batch_update(user_id, updates); !applied) {
        return std::unexpected(to_vault_error(applied.error()));
    }

    auto stored = m_entries->find(user_id, entry_id);
    if (!stored) {
        return std::unexpected(to_vault_error(stored.error()));
    }
    return *stored;
}

VaultResult<void> EntryService::delete_entry(std::string_view user_id, std::string_view entry_id) {
    auto guard = m_gate->lock(user_id);
    if (!m_sessions->get_session(user_id)) {
        return std::unexpected(VaultError::SessionRequired);
    }

    if (auto removed = m_entries->remove(user_id, entry_id); !removed) {
        return std::unexpected(to_vault_error(removed.error()));
    }
    Log::debug("EntryService: Deleted entry {} of user {}", entry_id, user_id);
    return {};
}

}  // namespace Lockr
