// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "InMemoryEntryStore.h"
#include <algorithm>
#include <mutex>
#include <set>

namespace Lockr {

InMemoryEntryStore::InMemoryEntryStore(NowProvider now)
    : m_now(std::move(now)) {
}

std::expected<std::vector<VaultEntry>, StoreError>
InMemoryEntryStore::list_for_owner(std::string_view owner_id) const {
    std::shared_lock lock(m_mutex);
    auto it = m_entries.find(owner_id);
    if (it == m_entries.end()) {
        return std::vector<VaultEntry>{};
    }
    return it->second;
}

std::expected<VaultEntry, StoreError>
InMemoryEntryStore::find(std::string_view owner_id, std::string_view entry_id) const {
    std::shared_lock lock(m_mutex);
    auto it = m_entries.find(owner_id);
    if (it == m_entries.end()) {
        return std::unexpected(StoreError::ENTRY_NOT_FOUND);
    }

    auto entry_it = std::find_if(it->second.begin(), it->second.end(),
        [&](const VaultEntry& e) { return e.id == entry_id; });
    if (entry_it == it->second.end()) {
        return std::unexpected(StoreError::ENTRY_NOT_FOUND);
    }
    return *entry_it;
}

std::expected<VaultEntry, StoreError>
InMemoryEntryStore::insert(const VaultEntry& entry) {
    if (entry.owner_id.empty() || !is_complete_blob(entry.sealed)) {
        return std::unexpected(StoreError::INVALID_ENTRY);
    }

    VaultEntry stored = entry;
    stored.id = generate_entry_id();
    stored.created_at = m_now();
    stored.updated_at = stored.created_at;

    std::unique_lock lock(m_mutex);
    OwnerEntries next;
    if (auto it = m_entries.find(entry.owner_id); it != m_entries.end()) {
        next = it->second;
    }
    next.push_back(stored);

    if (auto persisted = persist_owner(entry.owner_id, next); !persisted) {
        return std::unexpected(persisted.error());
    }
    m_entries[entry.owner_id] = std::move(next);
    return stored;
}

std::expected<size_t, StoreError>
InMemoryEntryStore::batch_update(std::string_view owner_id,
                                 const std::vector<EntryCiphertextUpdate>& updates) {
    if (updates.empty()) {
        return size_t{0};
    }

    std::unique_lock lock(m_mutex);
    auto it = m_entries.find(owner_id);
    if (it == m_entries.end()) {
        return std::unexpected(StoreError::ENTRY_NOT_FOUND);
    }

    // Validate the whole batch before applying anything
    std::set<std::string_view> seen;
    for (const auto& update : updates) {
        if (!is_complete_blob(update.sealed)) {
            return std::unexpected(StoreError::INVALID_ENTRY);
        }
        if (!seen.insert(update.entry_id).second) {
            return std::unexpected(StoreError::INVALID_ENTRY);
        }
        const bool exists = std::any_of(it->second.begin(), it->second.end(),
            [&](const VaultEntry& e) { return e.id == update.entry_id; });
        if (!exists) {
            return std::unexpected(StoreError::ENTRY_NOT_FOUND);
        }
    }

    OwnerEntries next = it->second;
    const TimePoint now = m_now();
    for (const auto& update : updates) {
        auto entry_it = std::find_if(next.begin(), next.end(),
            [&](const VaultEntry& e) { return e.id == update.entry_id; });
        entry_it->sealed = update.sealed;
        if (update.category) {
            entry_it->category = *update.category;
        }
        if (update.favorite) {
            entry_it->favorite = *update.favorite;
        }
        entry_it->updated_at = now;
    }

    if (auto persisted = persist_owner(it->first, next); !persisted) {
        return std::unexpected(persisted.error());
    }
    it->second = std::move(next);
    return updates.size();
}

std::expected<void, StoreError>
InMemoryEntryStore::remove(std::string_view owner_id, std::string_view entry_id) {
    std::unique_lock lock(m_mutex);
    auto it = m_entries.find(owner_id);
    if (it == m_entries.end()) {
        return std::unexpected(StoreError::ENTRY_NOT_FOUND);
    }

    OwnerEntries next = it->second;
    auto removed = std::erase_if(next, [&](const VaultEntry& e) { return e.id == entry_id; });
    if (removed == 0) {
        return std::unexpected(StoreError::ENTRY_NOT_FOUND);
    }

    if (auto persisted = persist_owner(it->first, next); !persisted) {
        return std::unexpected(persisted.error());
    }
    it->second = std::move(next);
    return {};
}

std::expected<size_t, StoreError>
InMemoryEntryStore::remove_all_for_owner(std::string_view owner_id) {
    std::unique_lock lock(m_mutex);
    auto it = m_entries.find(owner_id);
    if (it == m_entries.end()) {
        return size_t{0};
    }

    const size_t count = it->second.size();
    if (auto persisted = persist_owner(it->first, {}); !persisted) {
        return std::unexpected(persisted.error());
    }
    m_entries.erase(it);
    return count;
}

std::expected<size_t, StoreError>
InMemoryEntryStore::count_for_owner(std::string_view owner_id) const {
    std::shared_lock lock(m_mutex);
    auto it = m_entries.find(owner_id);
    return it == m_entries.end() ? size_t{0} : it->second.size();
}

std::expected<void, StoreError>
InMemoryEntryStore::persist_owner(const std::string& /*owner_id*/, const OwnerEntries& /*entries*/) {
    return {};
}

void InMemoryEntryStore::load_owner(const std::string& owner_id, OwnerEntries entries) {
    std::unique_lock lock(m_mutex);
    if (entries.empty()) {
        m_entries.erase(owner_id);
    } else {
        m_entries[owner_id] = std::move(entries);
    }
}

}  // namespace Lockr
