// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#ifndef LOCKR_DIGEST_H
#define LOCKR_DIGEST_H

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace Lockr {

/**
 * @brief SHA-256 helpers
 *
 * Used for values that must be looked up but never stored in the clear:
 * reset tokens, and owner ids when they become file names.
 */
class Digest {
public:
    /**
     * @brief Lower-case hex SHA-256 of input
     * @throws std::runtime_error if OpenSSL fails to produce a digest
     */
    [[nodiscard]] static std::string sha256_hex(std::string_view input);

    /**
     * @brief Lower-case hex encoding of bytes
     */
    [[nodiscard]] static std::string to_hex(std::span<const uint8_t> bytes);

    Digest() = delete;
};

}  // namespace Lockr

#endif  // LOCKR_DIGEST_H
