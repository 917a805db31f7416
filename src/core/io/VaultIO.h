// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file VaultIO.h
 * @brief Secure file I/O operations for entry persistence
 *
 * Filesystem primitives shared by FileEntryStore and OutboxTokenDelivery.
 * Everything that touches disk goes through here so that both writers get
 * the same durability and permission guarantees.
 */

#ifndef LOCKR_VAULTIO_H
#define LOCKR_VAULTIO_H

#include <cstdint>
#include <string>
#include <vector>

namespace Lockr {

/**
 * @brief Utility class for secure entry file I/O operations
 *
 * @section features Features
 * - Atomic file writes using temporary files and rename
 * - Secure file permissions (0600 on Unix systems)
 * - File and directory fsync for durability
 * - Symlink-safe reads (O_NOFOLLOW)
 *
 * @section security Security Considerations
 * - Files written with owner-only read/write permissions
 * - Atomic rename ensures no partial writes are visible, so a crash in
 *   the middle of a rotation batch leaves the previous file intact
 * - Files with group/other permission bits are refused on read
 *
 * @note Static functions only; the class cannot be instantiated
 */
class VaultIO {
public:
    /**
     * @brief Read a whole file into memory
     *
     * @param path Absolute path of the file
     * @param data Output buffer for file contents
     * @return true if file read successfully, false on error
     */
    [[nodiscard]] static bool read_file(const std::string& path, std::vector<uint8_t>& data);

    /**
     * @brief Write a file atomically
     *
     * Writes to <path>.tmp, fsyncs it, renames it over path and fsyncs the
     * parent directory.
     *
     * @return true if file written successfully, false on error
     *
     * @post File permissions set to 0600 (owner read/write only)
     * @post Temporary file removed on failure
     */
    [[nodiscard]] static bool write_file(const std::string& path, const std::vector<uint8_t>& data);

    /**
     * @brief Remove a file and sync its directory
     * @return true if the file is gone afterwards (including "never existed")
     */
    [[nodiscard]] static bool remove_file(const std::string& path);

    /**
     * @brief Create a directory (and parents) with 0700 permissions
     * @return true if the directory exists afterwards
     */
    [[nodiscard]] static bool ensure_directory(const std::string& path);

    VaultIO() = delete;
    ~VaultIO() = delete;
    VaultIO(const VaultIO&) = delete;
    VaultIO& operator=(const VaultIO&) = delete;
};

} // namespace Lockr

#endif // LOCKR_VAULTIO_H
