// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#ifndef LOCKR_KEY_CODEC_H
#define LOCKR_KEY_CODEC_H

#include "../VaultError.h"
#include "../../utils/SecureMemory.h"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace Lockr {

/**
 * @brief Structural validation of client-supplied vault keys
 *
 * Keys are derived on the client and cross the boundary as standard
 * base64 text. This class only checks that the text is well formed and
 * decodes to exactly CipherEngine::KEY_LENGTH bytes. Whether it is *the*
 * key is decided by the unlock protocol.
 */
class KeyCodec {
public:
    /// Upper bound on accepted input, well above the 44 chars of a 32-byte key
    static constexpr size_t MAX_ENCODED_LENGTH = 128;

    /**
     * @brief Decode and validate an encoded key
     * @param encoded Base64 text (padding required)
     * @return Raw key bytes, or VaultError::ValidationError
     */
    [[nodiscard]] static VaultResult<SecureVector<uint8_t>> decode(std::string_view encoded);

    /**
     * @brief Encode raw key bytes as base64 text
     */
    [[nodiscard]] static std::string encode(std::span<const uint8_t> key);

    /**
     * @brief Cheap format check without decoding
     * @return true if encoded only uses the base64 alphabet and padding
     */
    [[nodiscard]] static bool has_valid_alphabet(std::string_view encoded) noexcept;

    KeyCodec() = delete;
};

}  // namespace Lockr

#endif  // LOCKR_KEY_CODEC_H
