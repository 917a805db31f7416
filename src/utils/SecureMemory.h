// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file SecureMemory.h
 * @brief Secure memory handling utilities
 *
 * Provides RAII wrappers and utilities for securely handling sensitive
 * data like vault encryption keys and decrypted entry payloads, ensuring
 * proper cleanup even in exceptional circumstances.
 */

#ifndef LOCKR_SECURE_MEMORY_H
#define LOCKR_SECURE_MEMORY_H

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>
#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace Lockr {

/**
 * @brief Custom deleter for EVP_CIPHER_CTX that securely frees context
 */
struct EVPCipherContextDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const {
        if (ctx) {
            EVP_CIPHER_CTX_free(ctx);
        }
    }
};

/**
 * @brief Custom deleter for EVP_MD_CTX (digest context)
 */
struct EVPDigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

/**
 * @brief Secure allocator for std::vector that zeros memory on deallocation
 *
 * @tparam T Type of elements (typically uint8_t for crypto buffers)
 *
 * @code
 * SecureVector<uint8_t> key(32);
 * // ... use key ...
 * // Automatically zeroized on destruction
 * @endcode
 */
template<typename T>
class SecureAllocator : public std::allocator<T> {
public:
    template<typename U>
    struct rebind {
        using other = SecureAllocator<U>;
    };

    SecureAllocator() noexcept = default;

    template<typename U>
    SecureAllocator(const SecureAllocator<U>&) noexcept {}

    void deallocate(T* p, std::size_t n) {
        if (p) {
            OPENSSL_cleanse(p, n * sizeof(T));
            std::allocator<T>::deallocate(p, n);
        }
    }
};

template<typename T, typename U>
bool operator==(const SecureAllocator<T>&, const SecureAllocator<U>&) noexcept { return true; }

/**
 * @brief Convenience alias for std::vector with secure allocator
 *
 * Use this for keys and decrypted plaintext. Copies are zeroized too, so
 * handing a key out of the session registry by value is safe.
 */
template<typename T>
using SecureVector = std::vector<T, SecureAllocator<T>>;

/**
 * @brief RAII wrapper for EVP_CIPHER_CTX
 */
using EVPCipherContextPtr = std::unique_ptr<EVP_CIPHER_CTX, EVPCipherContextDeleter>;

/**
 * @brief RAII wrapper for EVP_MD_CTX
 */
using EVPDigestContextPtr = std::unique_ptr<EVP_MD_CTX, EVPDigestContextDeleter>;

/**
 * @brief Securely clear a std::string containing sensitive data
 *
 * Uses OPENSSL_cleanse() so the write cannot be optimized away.
 *
 * @param str String to clear (encoded key, reset token)
 */
inline void secure_clear_string(std::string& str) {
    if (!str.empty()) {
        OPENSSL_cleanse(str.data(), str.size());
        str.clear();
    }
}

/**
 * @brief Constant-time equality for key material
 * @return true if both spans have the same length and contents
 */
[[nodiscard]] inline bool constant_time_equal(std::span<const uint8_t> a,
                                              std::span<const uint8_t> b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace Lockr

#endif // LOCKR_SECURE_MEMORY_H
