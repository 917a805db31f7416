// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#ifndef LOCKR_CIPHER_ENGINE_H
#define LOCKR_CIPHER_ENGINE_H

#include "../VaultTypes.h"
#include "../../utils/SecureMemory.h"
#include <cstdint>
#include <expected>
#include <span>
#include <string_view>
#include <vector>

namespace Lockr {

/**
 * @brief Failure modes of the cipher engine
 */
enum class CipherError {
    InvalidKeyLength,       ///< Key is not KEY_LENGTH bytes
    MalformedBlob,          ///< IV or tag of the wrong size
    AuthenticationFailed,   ///< Tag mismatch: wrong key or tampered data
    InternalError           ///< OpenSSL failure unrelated to the input
};

[[nodiscard]] constexpr std::string_view to_string(CipherError error) noexcept {
    switch (error) {
        case CipherError::InvalidKeyLength:     return "Invalid key length";
        case CipherError::MalformedBlob:        return "Malformed ciphertext";
        case CipherError::AuthenticationFailed: return "Authentication failed";
        case CipherError::InternalError:        return "Cipher internal error";
    }
    return "Unknown cipher error";
}

/**
 * @brief Authenticated encryption for vault entries (AES-256-GCM)
 *
 * Stateless and thread-safe. All methods are static and no key is retained
 * after a call returns.
 *
 * @section security Security Properties
 * - 256-bit key, 96-bit IV drawn from RAND_bytes() on every encryption
 * - 128-bit detached authentication tag
 * - A failed tag check is definitive. It is the only signal the vault
 *   core ever uses to decide that a submitted key is wrong; no key hash
 *   or other verifier exists anywhere.
 *
 * @code
 * auto sealed = CipherEngine::encrypt(payload, key);
 * if (!sealed) {
 *     // InternalError or InvalidKeyLength
 * }
 * auto opened = CipherEngine::decrypt(*sealed, key);
 * if (!opened && opened.error() == CipherError::AuthenticationFailed) {
 *     // wrong key
 * }
 * @endcode
 */
class CipherEngine {
public:
    static constexpr size_t KEY_LENGTH = 32;   ///< AES-256 key length (256 bits)
    static constexpr size_t IV_LENGTH = 12;    ///< GCM IV length (96 bits, recommended)
    static constexpr size_t TAG_LENGTH = 16;   ///< GCM authentication tag length (128 bits)

    /**
     * @brief Encrypt a payload under key with a fresh random IV
     *
     * @param plaintext Serialized entry payload
     * @param key Raw key (must be KEY_LENGTH bytes)
     * @return ciphertext, iv and auth_tag produced together
     *
     * @throws std::runtime_error if the CSPRNG fails (never returns a
     *         predictable IV)
     */
    [[nodiscard]] static std::expected<EncryptedBlob, CipherError> encrypt(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> key);

    /**
     * @brief Verify and decrypt a blob
     *
     * @param blob ciphertext, iv and auth_tag of one entry
     * @param key Raw key (must be KEY_LENGTH bytes)
     * @return Plaintext in a zeroizing buffer, or AuthenticationFailed when
     *         the key is wrong or the blob was modified
     *
     * @note Plaintext is never returned unless the tag verified
     */
    [[nodiscard]] static std::expected<SecureVector<uint8_t>, CipherError> decrypt(
        const EncryptedBlob& blob,
        std::span<const uint8_t> key);

    /**
     * @brief Generate cryptographically secure random bytes
     * @throws std::runtime_error on CSPRNG failure
     */
    [[nodiscard]] static std::vector<uint8_t> generate_random_bytes(size_t length);

    // CipherEngine is a utility class - no instances needed
    CipherEngine() = delete;
    ~CipherEngine() = delete;
    CipherEngine(const CipherEngine&) = delete;
    CipherEngine& operator=(const CipherEngine&) = delete;
    CipherEngine(CipherEngine&&) = delete;
    CipherEngine& operator=(CipherEngine&&) = delete;
};

}  // namespace Lockr

#endif  // LOCKR_CIPHER_ENGINE_H
