// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file FileEntryStore.h
 * @brief Write-through file persistence for vault entries
 */

#pragma once

#include "InMemoryEntryStore.h"
#include <expected>
#include <memory>
#include <string>

namespace Lockr {

/**
 * @brief Entry store keeping one protobuf file per owner
 *
 * Files live in a single directory and are named after the SHA-256 of the
 * owner id, so account identifiers never appear on disk in the clear.
 * Every mutation rewrites the owner's file atomically (VaultIO::write_file)
 * before the cached state changes, which makes a rotation batch either
 * fully visible or not visible at all after a crash.
 *
 * All entries are loaded when the store is opened.
 */
class FileEntryStore final : public InMemoryEntryStore {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    static constexpr std::string_view FILE_EXTENSION = ".entries";

    /// Use open(); the tag keeps construction inside this class
    FileEntryStore(PrivateTag, std::string directory, NowProvider now);

    /**
     * @brief Open (and create if needed) a store directory
     *
     * Errors:
     * - WRITE_FAILED: Directory could not be created
     * - READ_FAILED: An existing owner file is unreadable or corrupt
     */
    [[nodiscard]] static std::expected<std::unique_ptr<FileEntryStore>, StoreError>
        open(const std::string& directory, NowProvider now = Clock::now);

    [[nodiscard]] const std::string& directory() const noexcept { return m_directory; }

    /**
     * @brief Path of the file holding an owner's entries
     */
    [[nodiscard]] std::string path_for_owner(std::string_view owner_id) const;

protected:
    [[nodiscard]] std::expected<void, StoreError>
        persist_owner(const std::string& owner_id, const OwnerEntries& entries) override;

private:
    [[nodiscard]] std::expected<void, StoreError> load_all();

    std::string m_directory;
};

}  // namespace Lockr
