// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "FileEntryStore.h"
#include "../crypto/Digest.h"
#include "../io/VaultIO.h"
#include "../serialization/EntrySerialization.h"
#include "../../utils/Log.h"
#include <filesystem>

namespace Lockr {

FileEntryStore::FileEntryStore(PrivateTag, std::string directory, NowProvider now)
    : InMemoryEntryStore(std::move(now)),
      m_directory(std::move(directory)) {
}

std::expected<std::unique_ptr<FileEntryStore>, StoreError>
FileEntryStore::open(const std::string& directory, NowProvider now) {
    if (!VaultIO::ensure_directory(directory)) {
        return std::unexpected(StoreError::WRITE_FAILED);
    }

    auto store = std::make_unique<FileEntryStore>(PrivateTag{}, directory, std::move(now));
    if (auto loaded = store->load_all(); !loaded) {
        return std::unexpected(loaded.error());
    }
    return store;
}

std::string FileEntryStore::path_for_owner(std::string_view owner_id) const {
    std::filesystem::path path(m_directory);
    path /= Digest::sha256_hex(owner_id) + std::string(FILE_EXTENSION);
    return path.string();
}

std::expected<void, StoreError> FileEntryStore::load_all() {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::directory_iterator it(m_directory, ec);
    if (ec) {
        Log::error("FileEntryStore: Cannot list {}: {}", m_directory, ec.message());
        return std::unexpected(StoreError::READ_FAILED);
    }

    size_t owners = 0;
    size_t entries = 0;
    for (const auto& dir_entry : it) {
        if (!dir_entry.is_regular_file() || dir_entry.path().extension().string() != FILE_EXTENSION) {
            continue;
        }

        const std::string path = dir_entry.path().string();
        std::vector<uint8_t> data;
        if (!VaultIO::read_file(path, data)) {
            return std::unexpected(StoreError::READ_FAILED);
        }

        // The owner id is recovered from the file and cross-checked against its name
        lockr::OwnerEntryFile header;
        if (!header.ParseFromArray(data.data(), static_cast<int>(data.size())) ||
            path_for_owner(header.owner_id()) != path) {
            Log::error("FileEntryStore: {} is not a valid entry file", path);
            return std::unexpected(StoreError::READ_FAILED);
        }

        auto parsed = EntrySerialization::deserialize_owner_file(header.owner_id(), data);
        if (!parsed) {
            Log::error("FileEntryStore: Failed to parse {}", path);
            return std::unexpected(StoreError::READ_FAILED);
        }

        entries += parsed->size();
        ++owners;
        load_owner(header.owner_id(), std::move(*parsed));
    }

    Log::info("FileEntryStore: Loaded {} entries for {} owners from {}", entries, owners, m_directory);
    return {};
}

std::expected<void, StoreError>
FileEntryStore::persist_owner(const std::string& owner_id, const OwnerEntries& entries) {
    const std::string path = path_for_owner(owner_id);

    if (entries.empty()) {
        if (!VaultIO::remove_file(path)) {
            return std::unexpected(StoreError::WRITE_FAILED);
        }
        return {};
    }

    auto data = EntrySerialization::serialize_owner_file(owner_id, entries);
    if (!data) {
        return std::unexpected(StoreError::WRITE_FAILED);
    }
    if (!VaultIO::write_file(path, *data)) {
        return std::unexpected(StoreError::WRITE_FAILED);
    }
    Log::debug("FileEntryStore: Wrote {} entries to {}", entries.size(), path);
    return {};
}

}  // namespace Lockr
