// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file EntrySerialization.h
 * @brief Protobuf serialization for entry payloads and stored entries
 *
 * Two distinct formats live here:
 * - lockr::EntryPayload, the plaintext that is serialized and then
 *   encrypted (it never reaches storage in this form)
 * - lockr::OwnerEntryFile, the at-rest layout used by FileEntryStore,
 *   which only carries ciphertext, iv, tag, category and timestamps
 */

#ifndef LOCKR_ENTRY_SERIALIZATION_H
#define LOCKR_ENTRY_SERIALIZATION_H

#include "../VaultError.h"
#include "../VaultTypes.h"
#include "../../utils/SecureMemory.h"
#include "vault.pb.h"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace Lockr {

/**
 * @class EntrySerialization
 * @brief Static utility class for payload and record conversion
 *
 * All methods are thread-safe; they operate only on their arguments.
 */
class EntrySerialization {
public:
    static constexpr int32_t CURRENT_SCHEMA_VERSION = 1;

    /// Upper bound for a single owner file (DoS guard on parse)
    static constexpr size_t MAX_OWNER_FILE_SIZE = 64 * 1024 * 1024;

    /// Upper bound for one serialized payload
    static constexpr size_t MAX_PAYLOAD_SIZE = 1024 * 1024;

    /**
     * @brief Serialize a plaintext payload for encryption
     * @return Bytes in a zeroizing buffer, or VaultError::Fatal
     */
    [[nodiscard]] static VaultResult<SecureVector<uint8_t>> serialize_payload(
        const lockr::EntryPayload& payload);

    /**
     * @brief Parse decrypted bytes back into a payload
     * @return Payload, or VaultError::Fatal if the bytes are not a payload
     */
    [[nodiscard]] static VaultResult<lockr::EntryPayload> deserialize_payload(
        std::span<const uint8_t> data);

    /**
     * @brief Convert a stored entry to its protobuf record
     */
    [[nodiscard]] static lockr::VaultEntryRecord to_record(const VaultEntry& entry);

    /**
     * @brief Convert a protobuf record to a stored entry
     *
     * Unknown category values map to EntryCategory::Other.
     */
    [[nodiscard]] static VaultEntry from_record(const lockr::VaultEntryRecord& record);

    /**
     * @brief Serialize all entries of one owner for the file store
     */
    [[nodiscard]] static VaultResult<std::vector<uint8_t>> serialize_owner_file(
        const std::string& owner_id,
        const std::vector<VaultEntry>& entries);

    /**
     * @brief Parse an owner file written by serialize_owner_file
     * @return Entries, or VaultError::Fatal on corrupt or foreign data
     */
    [[nodiscard]] static VaultResult<std::vector<VaultEntry>> deserialize_owner_file(
        const std::string& owner_id,
        const std::vector<uint8_t>& data);

    [[nodiscard]] static int64_t to_millis(TimePoint tp) noexcept;
    [[nodiscard]] static TimePoint from_millis(int64_t ms) noexcept;

    EntrySerialization() = delete;
};

} // namespace Lockr

#endif // LOCKR_ENTRY_SERIALIZATION_H
