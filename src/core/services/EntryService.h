// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file EntryService.h
 * @brief Encrypted CRUD on vault entries for unlocked users
 */

#pragma once

#include "../VaultError.h"
#include "../VaultTypes.h"
#include "../audit/AuditLog.h"
#include "../repositories/IEntryStore.h"
#include "KeyedMutex.h"
#include "SessionRegistry.h"
#include "vault.pb.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Lockr {

/**
 * @brief Entry metadata together with its decrypted payload
 */
struct DecryptedEntry {
    VaultEntry entry;
    lockr::EntryPayload payload;
};

/**
 * @brief Filter and window for a paginated listing
 *
 * Pages are numbered from 1. A page of 0 is read as 1 and the limit is
 * clamped to [1, MAX_LIMIT].
 */
struct EntryQuery {
    static constexpr size_t DEFAULT_LIMIT = 50;
    static constexpr size_t MAX_LIMIT = 100;

    std::optional<EntryCategory> category;
    bool favorites_only = false;
    size_t page = 1;
    size_t limit = DEFAULT_LIMIT;
};

/**
 * @brief One page of decrypted entries, newest first
 */
struct EntryPage {
    std::vector<DecryptedEntry> entries;
    size_t page = 1;
    size_t limit = EntryQuery::DEFAULT_LIMIT;
    size_t total = 0;        ///< Entries matching the filter across all pages
    size_t total_pages = 0;
};

/**
 * @brief Reads and writes entries with the key held by the session
 *
 * Every call fetches the key from the SessionRegistry and fails with
 * SessionRequired once the vault is locked or the session expired. Reads
 * and writes run under the user's gate: a write cannot interleave with a
 * rotation and leave an entry under the superseded key, and a read never
 * sees a half-rotated vault together with a key that no longer matches.
 *
 * A stored entry that fails to decrypt under the session key is reported as
 * Fatal and recorded as a DataCorruption audit event.
 */
class EntryService {
public:
    /**
     * @throws std::invalid_argument if any pointer is null
     */
    EntryService(IEntryStore* entries, SessionRegistry* sessions, KeyedMutex* gate, AuditLog* audit);

    EntryService(const EntryService&) = delete;
    EntryService& operator=(const EntryService&) = delete;

    /**
     * @brief Encrypt and store a new entry
     * @param category Any category except System, which is reserved
     * @param favorite Stored in the clear next to the ciphertext
     */
    [[nodiscard]] VaultResult<VaultEntry> create_entry(const std::string& user_id,
                                                       const lockr::EntryPayload& payload,
                                                       EntryCategory category,
                                                       bool favorite = false);

    /**
     * @brief Decrypt all entries of a user, optionally only one category
     */
    [[nodiscard]] VaultResult<std::vector<DecryptedEntry>> list_entries(
        std::string_view user_id,
        std::optional<EntryCategory> category = std::nullopt);

    /**
     * @brief Decrypt one page of a user's entries
     *
     * Entries are ordered by creation time, newest first. Filtering happens
     * on clear-text metadata, so only the entries on the requested page are
     * decrypted. A page past the end is empty.
     */
    [[nodiscard]] VaultResult<EntryPage> list_page(std::string_view user_id, const EntryQuery& query);

    [[nodiscard]] VaultResult<DecryptedEntry> get_entry(std::string_view user_id,
                                                        std::string_view entry_id);

    /**
     * @brief Replace an entry's payload (full ciphertext replacement)
     */
    [[nodiscard]] VaultResult<VaultEntry> update_entry(std::string_view user_id,
                                                       std::string_view entry_id,
                                                       const lockr::EntryPayload& payload,
                                                       std::optional<EntryCategory> category = std::nullopt,
                                                       std::optional<bool> favorite = std::nullopt);

    [[nodiscard]] VaultResult<void> delete_entry(std::string_view user_id, std::string_view entry_id);

private:
    [[nodiscard]] VaultResult<SecureVector<uint8_t>> session_key(std::string_view user_id);
    [[nodiscard]] VaultResult<EncryptedBlob> seal(const lockr::EntryPayload& payload,
                                                  const SecureVector<uint8_t>& key);
    [[nodiscard]] VaultResult<DecryptedEntry> open(const VaultEntry& entry,
                                                   const SecureVector<uint8_t>& key);

    IEntryStore* m_entries;
    SessionRegistry* m_sessions;
    KeyedMutex* m_gate;
    AuditLog* m_audit;
};

}  // namespace Lockr
