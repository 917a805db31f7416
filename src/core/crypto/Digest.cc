// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "Digest.h"
#include "../../utils/SecureMemory.h"
#include <array>
#include <stdexcept>
#include <openssl/evp.h>

namespace Lockr {

std::string Digest::sha256_hex(std::string_view input) {
    EVPDigestContextPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Digest: EVP_MD_CTX_new failed");
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Digest: EVP_DigestInit_ex failed");
    }
    if (EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1) {
        throw std::runtime_error("Digest: EVP_DigestUpdate failed");
    }

    std::array<uint8_t, EVP_MAX_MD_SIZE> hash{};
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash.data(), &hash_len) != 1) {
        throw std::runtime_error("Digest: EVP_DigestFinal_ex failed");
    }

    return to_hex(std::span<const uint8_t>(hash.data(), hash_len));
}

std::string Digest::to_hex(std::span<const uint8_t> bytes) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

}  // namespace Lockr
