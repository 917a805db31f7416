// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "OutboxTokenDelivery.h"
#include "VaultIO.h"
#include "../crypto/CipherEngine.h"
#include "../crypto/Digest.h"
#include "../serialization/EntrySerialization.h"
#include "../../utils/Log.h"
#include "../../utils/SecureMemory.h"
#include <glibmm/keyfile.h>
#include <filesystem>
#include <stdexcept>

namespace Lockr {

OutboxTokenDelivery::OutboxTokenDelivery(std::string directory)
    : m_directory(std::move(directory)) {
    if (!VaultIO::ensure_directory(m_directory)) {
        throw std::runtime_error("OutboxTokenDelivery: cannot create " + m_directory);
    }
}

bool OutboxTokenDelivery::deliver(const UserAccount& account, std::string_view token,
                                  TimePoint expires_at) {
    auto file = Glib::KeyFile::create();
    file->set_string("reset", "user-id", account.id);
    file->set_string("reset", "email", account.email);
    file->set_string("reset", "token", std::string(token));
    file->set_int64("reset", "expires-at-ms", EntrySerialization::to_millis(expires_at));

    std::string text = file->to_data().raw();
    std::vector<uint8_t> data(text.begin(), text.end());
    secure_clear_string(text);

    // Random suffix keeps two tokens for the same user apart
    const std::string name = Digest::sha256_hex(account.id).substr(0, 16) + "-" +
                             Digest::to_hex(CipherEngine::generate_random_bytes(8)) + ".reset";
    const std::string path = (std::filesystem::path(m_directory) / name).string();

    const bool written = VaultIO::write_file(path, data);
    OPENSSL_cleanse(data.data(), data.size());

    if (!written) {
        Log::error("OutboxTokenDelivery: Failed to queue reset token for user {}", account.id);
        return false;
    }
    Log::info("OutboxTokenDelivery: Queued reset message for user {}", account.id);
    return true;
}

}  // namespace Lockr
