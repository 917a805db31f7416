// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "IEntryStore.h"
#include "../crypto/CipherEngine.h"
#include "../crypto/Digest.h"

namespace Lockr {

bool is_complete_blob(const EncryptedBlob& blob) noexcept {
    return blob.iv.size() == CipherEngine::IV_LENGTH &&
           blob.auth_tag.size() == CipherEngine::TAG_LENGTH;
}

std::string generate_entry_id() {
    return Digest::to_hex(CipherEngine::generate_random_bytes(16));
}

}  // namespace Lockr
