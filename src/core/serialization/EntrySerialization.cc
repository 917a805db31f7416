// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "EntrySerialization.h"
#include "../../utils/Log.h"

namespace Lockr {

namespace {

std::string to_bytes_string(const std::vector<uint8_t>& v) {
    return std::string(v.begin(), v.end());
}

std::vector<uint8_t> from_bytes_string(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

}  // namespace

int64_t EntrySerialization::to_millis(TimePoint tp) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint EntrySerialization::from_millis(int64_t ms) noexcept {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

VaultResult<SecureVector<uint8_t>>
EntrySerialization::serialize_payload(const lockr::EntryPayload& payload) {
    std::string serialized;
    if (!payload.SerializeToString(&serialized)) {
        Log::error("EntrySerialization: Failed to serialize entry payload");
        return std::unexpected(VaultError::Fatal);
    }

    SecureVector<uint8_t> result(serialized.begin(), serialized.end());
    secure_clear_string(serialized);
    return result;
}

VaultResult<lockr::EntryPayload>
EntrySerialization::deserialize_payload(std::span<const uint8_t> data) {
    if (data.size() > MAX_PAYLOAD_SIZE) {
        Log::error("EntrySerialization: Payload exceeds maximum size ({} bytes)", data.size());
        return std::unexpected(VaultError::Fatal);
    }

    lockr::EntryPayload payload;
    if (!payload.ParseFromArray(data.data(), static_cast<int>(data.size()))) {
        Log::error("EntrySerialization: Failed to parse entry payload");
        return std::unexpected(VaultError::Fatal);
    }
    return payload;
}

lockr::VaultEntryRecord EntrySerialization::to_record(const VaultEntry& entry) {
    lockr::VaultEntryRecord record;
    record.set_id(entry.id);
    record.set_owner_id(entry.owner_id);
    record.set_ciphertext(to_bytes_string(entry.sealed.ciphertext));
    record.set_iv(to_bytes_string(entry.sealed.iv));
    record.set_auth_tag(to_bytes_string(entry.sealed.auth_tag));
    record.set_category(static_cast<uint32_t>(entry.category));
    record.set_created_at_ms(to_millis(entry.created_at));
    record.set_updated_at_ms(to_millis(entry.updated_at));
    record.set_favorite(entry.favorite);
    return record;
}

VaultEntry EntrySerialization::from_record(const lockr::VaultEntryRecord& record) {
    VaultEntry entry;
    entry.id = record.id();
    entry.owner_id = record.owner_id();
    entry.sealed.ciphertext = from_bytes_string(record.ciphertext());
    entry.sealed.iv = from_bytes_string(record.iv());
    entry.sealed.auth_tag = from_bytes_string(record.auth_tag());
    entry.category = record.category() <= static_cast<uint32_t>(EntryCategory::System)
        ? static_cast<EntryCategory>(record.category())
        : EntryCategory::Other;
    entry.created_at = from_millis(record.created_at_ms());
    entry.updated_at = from_millis(record.updated_at_ms());
    entry.favorite = record.favorite();
    return entry;
}

VaultResult<std::vector<uint8_t>>
EntrySerialization::serialize_owner_file(const std::string& owner_id,
                                         const std::vector<VaultEntry>& entries) {
    lockr::OwnerEntryFile file;
    file.set_schema_version(CURRENT_SCHEMA_VERSION);
    file.set_owner_id(owner_id);
    for (const auto& entry : entries) {
        *file.add_entries() = to_record(entry);
    }

    std::string serialized;
    if (!file.SerializeToString(&serialized)) {
        Log::error("EntrySerialization: Failed to serialize entry file for owner {}", owner_id);
        return std::unexpected(VaultError::Fatal);
    }
    return from_bytes_string(serialized);
}

VaultResult<std::vector<VaultEntry>>
EntrySerialization::deserialize_owner_file(const std::string& owner_id,
                                           const std::vector<uint8_t>& data) {
    if (data.size() > MAX_OWNER_FILE_SIZE) {
        Log::error("EntrySerialization: Entry file exceeds maximum size ({} bytes > {} bytes)",
                   data.size(), MAX_OWNER_FILE_SIZE);
        return std::unexpected(VaultError::Fatal);
    }

    lockr::OwnerEntryFile file;
    if (!file.ParseFromArray(data.data(), static_cast<int>(data.size()))) {
        Log::error("EntrySerialization: Failed to parse entry file for owner {}", owner_id);
        return std::unexpected(VaultError::Fatal);
    }

    if (file.schema_version() > CURRENT_SCHEMA_VERSION) {
        Log::error("EntrySerialization: Unsupported entry file schema {}", file.schema_version());
        return std::unexpected(VaultError::Fatal);
    }

    // Records are scoped by owner; a file claiming another owner is rejected
    if (file.owner_id() != owner_id) {
        Log::error("EntrySerialization: Entry file owner mismatch for {}", owner_id);
        return std::unexpected(VaultError::Fatal);
    }

    std::vector<VaultEntry> entries;
    entries.reserve(static_cast<size_t>(file.entries_size()));
    for (const auto& record : file.entries()) {
        if (record.owner_id() != owner_id) {
            Log::error("EntrySerialization: Skipping foreign record {} in file of {}",
                       record.id(), owner_id);
            continue;
        }
        entries.push_back(from_record(record));
    }
    return entries;
}

} // namespace Lockr
