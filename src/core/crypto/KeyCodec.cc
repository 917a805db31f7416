// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "KeyCodec.h"
#include "CipherEngine.h"
#include <glibmm/base64.h>
#include <algorithm>
#include <cctype>

namespace Lockr {

bool KeyCodec::has_valid_alphabet(std::string_view encoded) noexcept {
    if (encoded.empty() || encoded.size() % 4 != 0) {
        return false;
    }

    // Padding may only appear as the last one or two characters
    const auto first_pad = encoded.find('=');
    if (first_pad != std::string_view::npos) {
        if (encoded.size() - first_pad > 2) {
            return false;
        }
        if (encoded.find_first_not_of('=', first_pad) != std::string_view::npos) {
            return false;
        }
    }

    const auto body = encoded.substr(0, first_pad);
    return std::all_of(body.begin(), body.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
    });
}

VaultResult<SecureVector<uint8_t>> KeyCodec::decode(std::string_view encoded) {
    if (encoded.empty() || encoded.size() > MAX_ENCODED_LENGTH) {
        return std::unexpected(VaultError::ValidationError);
    }
    if (!has_valid_alphabet(encoded)) {
        return std::unexpected(VaultError::ValidationError);
    }

    std::string raw = Glib::Base64::decode(std::string(encoded));
    if (raw.size() != CipherEngine::KEY_LENGTH) {
        secure_clear_string(raw);
        return std::unexpected(VaultError::ValidationError);
    }

    SecureVector<uint8_t> key(raw.begin(), raw.end());
    secure_clear_string(raw);
    return key;
}

std::string KeyCodec::encode(std::span<const uint8_t> key) {
    std::string raw(key.begin(), key.end());
    std::string encoded = Glib::Base64::encode(raw);
    secure_clear_string(raw);
    return encoded;
}

}  // namespace Lockr
