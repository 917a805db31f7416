// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "CipherEngine.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <stdexcept>

namespace Lockr {

std::expected<EncryptedBlob, CipherError> CipherEngine::encrypt(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> key) {

    if (key.size() != KEY_LENGTH) {
        return std::unexpected(CipherError::InvalidKeyLength);
    }

    EncryptedBlob blob;
    blob.iv = generate_random_bytes(IV_LENGTH);

    EVPCipherContextPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::unexpected(CipherError::InternalError);
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), blob.iv.data()) != 1) {
        return std::unexpected(CipherError::InternalError);
    }

    // GCM is a stream mode: output length equals input length
    blob.ciphertext.resize(plaintext.size());
    int len = 0;
    int ciphertext_len = 0;

    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), blob.ciphertext.data(), &len,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            return std::unexpected(CipherError::InternalError);
        }
        ciphertext_len = len;
    }

    if (EVP_EncryptFinal_ex(ctx.get(), blob.ciphertext.data() + ciphertext_len, &len) != 1) {
        return std::unexpected(CipherError::InternalError);
    }
    ciphertext_len += len;
    blob.ciphertext.resize(static_cast<size_t>(ciphertext_len));

    blob.auth_tag.resize(TAG_LENGTH);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(TAG_LENGTH), blob.auth_tag.data()) != 1) {
        return std::unexpected(CipherError::InternalError);
    }

    return blob;
}

std::expected<SecureVector<uint8_t>, CipherError> CipherEngine::decrypt(
    const EncryptedBlob& blob,
    std::span<const uint8_t> key) {

    if (key.size() != KEY_LENGTH) {
        return std::unexpected(CipherError::InvalidKeyLength);
    }
    if (blob.iv.size() != IV_LENGTH || blob.auth_tag.size() != TAG_LENGTH) {
        return std::unexpected(CipherError::MalformedBlob);
    }

    EVPCipherContextPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::unexpected(CipherError::InternalError);
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), blob.iv.data()) != 1) {
        return std::unexpected(CipherError::InternalError);
    }

    SecureVector<uint8_t> plaintext(blob.ciphertext.size());
    int len = 0;
    int plaintext_len = 0;

    if (!blob.ciphertext.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                              blob.ciphertext.data(), static_cast<int>(blob.ciphertext.size())) != 1) {
            return std::unexpected(CipherError::InternalError);
        }
        plaintext_len = len;
    }

    // OpenSSL takes a non-const pointer for SET_TAG; copy into a scratch buffer
    SecureVector<uint8_t> tag(blob.auth_tag.begin(), blob.auth_tag.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(TAG_LENGTH), tag.data()) != 1) {
        return std::unexpected(CipherError::InternalError);
    }

    // Finalize (verifies authentication tag)
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plaintext_len, &len) != 1) {
        return std::unexpected(CipherError::AuthenticationFailed);
    }
    plaintext_len += len;
    plaintext.resize(static_cast<size_t>(plaintext_len));

    return plaintext;
}

std::vector<uint8_t> CipherEngine::generate_random_bytes(size_t length) {
    std::vector<uint8_t> bytes(length);
    if (length == 0) {
        return bytes;
    }
    // RAND_bytes returns 1 on success, 0 or -1 on failure
    if (RAND_bytes(bytes.data(), static_cast<int>(length)) != 1) {
        // PRNG failure is a security event: never hand out predictable bytes
        OPENSSL_cleanse(bytes.data(), bytes.size());
        throw std::runtime_error("CSPRNG failure: RAND_bytes() failed");
    }
    return bytes;
}

}  // namespace Lockr
