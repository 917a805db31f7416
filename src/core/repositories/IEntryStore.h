// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file IEntryStore.h
 * @brief Interface for persisted vault entries
 *
 * The entry store only ever sees ciphertext. Every operation is scoped by
 * owner id; there is no query that crosses owner boundaries.
 */

#pragma once

#include "../VaultError.h"
#include "../VaultTypes.h"
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace Lockr {

/**
 * @brief Error types for entry store operations
 */
enum class StoreError {
    ENTRY_NOT_FOUND,        ///< No entry with this id for this owner
    INVALID_ENTRY,          ///< Incomplete ciphertext/iv/tag triple
    READ_FAILED,            ///< Backing storage could not be read
    WRITE_FAILED,           ///< Backing storage could not be written
    UNKNOWN_ERROR           ///< Unspecified error
};

[[nodiscard]] constexpr std::string_view to_string(StoreError error) noexcept {
    switch (error) {
        case StoreError::ENTRY_NOT_FOUND: return "Entry not found";
        case StoreError::INVALID_ENTRY:   return "Invalid entry";
        case StoreError::READ_FAILED:     return "Failed to read entries";
        case StoreError::WRITE_FAILED:    return "Failed to write entries";
        case StoreError::UNKNOWN_ERROR:   return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Map a store error to the error reported by the vault services
 *
 * Only a missing entry is attributable to the caller; everything else is an
 * internal failure.
 */
[[nodiscard]] constexpr VaultError to_vault_error(StoreError error) noexcept {
    return error == StoreError::ENTRY_NOT_FOUND ? VaultError::NotFound : VaultError::Fatal;
}

/**
 * @brief Interface for entry store implementations
 *
 * Design Principles:
 * - Opaque ciphertext: no knowledge of payload structure
 * - Whole-triple writes: ciphertext, iv and tag are replaced together
 * - std::expected for explicit error handling
 * - Implementations must be safe to call from many request threads
 */
class IEntryStore {
public:
    virtual ~IEntryStore() = default;

    /**
     * @brief All entries of one owner, oldest first
     *
     * Errors:
     * - READ_FAILED: Backing storage unreadable
     */
    [[nodiscard]] virtual std::expected<std::vector<VaultEntry>, StoreError>
        list_for_owner(std::string_view owner_id) const = 0;

    /**
     * @brief One entry by id, scoped to its owner
     *
     * Errors:
     * - ENTRY_NOT_FOUND: No such entry for this owner
     * - READ_FAILED: Backing storage unreadable
     */
    [[nodiscard]] virtual std::expected<VaultEntry, StoreError>
        find(std::string_view owner_id, std::string_view entry_id) const = 0;

    /**
     * @brief Insert a new entry
     * @param entry Entry without id; the store assigns id and timestamps
     * @return Stored entry (with id, created_at, updated_at)
     *
     * Errors:
     * - INVALID_ENTRY: Missing owner, iv or tag
     * - WRITE_FAILED: Could not persist
     */
    [[nodiscard]] virtual std::expected<VaultEntry, StoreError>
        insert(const VaultEntry& entry) = 0;

    /**
     * @brief Replace ciphertext of several entries of one owner in one write
     *
     * Either every update is applied or none is. Each update replaces the
     * whole ciphertext/iv/tag triple and bumps updated_at.
     *
     * @return Number of entries updated
     *
     * Errors:
     * - ENTRY_NOT_FOUND: An id does not belong to this owner (nothing applied)
     * - INVALID_ENTRY: An update has a malformed triple (nothing applied)
     * - WRITE_FAILED: Could not persist (nothing applied)
     */
    [[nodiscard]] virtual std::expected<size_t, StoreError>
        batch_update(std::string_view owner_id,
                     const std::vector<EntryCiphertextUpdate>& updates) = 0;

    /**
     * @brief Delete one entry
     *
     * Errors:
     * - ENTRY_NOT_FOUND: No such entry for this owner
     * - WRITE_FAILED: Could not persist
     */
    [[nodiscard]] virtual std::expected<void, StoreError>
        remove(std::string_view owner_id, std::string_view entry_id) = 0;

    /**
     * @brief Delete every entry of one owner
     * @return Number of entries deleted
     *
     * Errors:
     * - WRITE_FAILED: Could not persist (nothing deleted)
     */
    [[nodiscard]] virtual std::expected<size_t, StoreError>
        remove_all_for_owner(std::string_view owner_id) = 0;

    /**
     * @brief Number of entries of one owner
     */
    [[nodiscard]] virtual std::expected<size_t, StoreError>
        count_for_owner(std::string_view owner_id) const = 0;
};

/**
 * @brief Structural completeness of a ciphertext triple
 * @return true if iv and tag have the cipher's sizes
 */
[[nodiscard]] bool is_complete_blob(const EncryptedBlob& blob) noexcept;

/**
 * @brief Generate a new opaque entry id (128 random bits, hex)
 */
[[nodiscard]] std::string generate_entry_id();

}  // namespace Lockr
