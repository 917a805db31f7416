// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file InMemoryEntryStore.h
 * @brief Process-local entry store
 *
 * Used by tests and by deployments that plug their own persistence in
 * front of the core. Also the base of FileEntryStore, which adds
 * write-through persistence per owner.
 */

#pragma once

#include "IEntryStore.h"
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

namespace Lockr {

/**
 * @brief Thread-safe in-memory implementation of IEntryStore
 *
 * Thread Safety:
 * - Readers share a std::shared_mutex, writers take it exclusively
 * - batch_update validates every update before touching any entry, so a
 *   rejected batch leaves the owner's entries untouched
 */
class InMemoryEntryStore : public IEntryStore {
public:
    explicit InMemoryEntryStore(NowProvider now = Clock::now);
    ~InMemoryEntryStore() override = default;

    InMemoryEntryStore(const InMemoryEntryStore&) = delete;
    InMemoryEntryStore& operator=(const InMemoryEntryStore&) = delete;

    [[nodiscard]] std::expected<std::vector<VaultEntry>, StoreError>
        list_for_owner(std::string_view owner_id) const override;

    [[nodiscard]] std::expected<VaultEntry, StoreError>
        find(std::string_view owner_id, std::string_view entry_id) const override;

    [[nodiscard]] std::expected<VaultEntry, StoreError>
        insert(const VaultEntry& entry) override;

    [[nodiscard]] std::expected<size_t, StoreError>
        batch_update(std::string_view owner_id,
                     const std::vector<EntryCiphertextUpdate>& updates) override;

    [[nodiscard]] std::expected<void, StoreError>
        remove(std::string_view owner_id, std::string_view entry_id) override;

    [[nodiscard]] std::expected<size_t, StoreError>
        remove_all_for_owner(std::string_view owner_id) override;

    [[nodiscard]] std::expected<size_t, StoreError>
        count_for_owner(std::string_view owner_id) const override;

protected:
    using OwnerEntries = std::vector<VaultEntry>;

    /**
     * @brief Persist hook called with the owner's complete new entry list
     *
     * Called under the exclusive lock before the in-memory state changes.
     * Returning an error aborts the mutation.
     */
    [[nodiscard]] virtual std::expected<void, StoreError>
        persist_owner(const std::string& owner_id, const OwnerEntries& entries);

    /**
     * @brief Replace the cached entries of an owner (used when loading)
     */
    void load_owner(const std::string& owner_id, OwnerEntries entries);

private:
    NowProvider m_now;
    mutable std::shared_mutex m_mutex;
    std::map<std::string, OwnerEntries, std::less<>> m_entries;
};

}  // namespace Lockr
