// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng
//
// VaultError.h - Error types for vault protocol operations
// C++23 std::expected-based error handling

#ifndef LOCKR_VAULT_ERROR_H
#define LOCKR_VAULT_ERROR_H

#include <expected>
#include <string_view>

namespace Lockr {

// Errors reported across the vault core boundary
enum class VaultError {
    // Caller input
    ValidationError,      // Malformed key, missing confirmation, bad fields
    RateLimited,          // Too many recent failures or requests

    // Key verification
    InvalidKey,           // Authenticated decryption failed during unlock
    SessionRequired,      // Operation needs a live unlock session
    KeyMismatch,          // Current key differs from the session key

    // Lookup
    NotFound,             // Unknown user or entry
    InvalidToken,         // Reset token unknown, expired or used

    // Rotation
    RotationIneffective,  // Entries existed but none could be re-encrypted

    // Internal
    Fatal                 // Storage or cipher failure not caused by input
};

// Convert error enum to human-readable string
inline constexpr std::string_view to_string(VaultError error) noexcept {
    switch (error) {
        case VaultError::ValidationError:
            return "Validation error";
        case VaultError::RateLimited:
            return "Too many attempts, try again later";
        case VaultError::InvalidKey:
            return "Invalid encryption key";
        case VaultError::SessionRequired:
            return "Vault must be unlocked";
        case VaultError::KeyMismatch:
            return "Current encryption key does not match session";
        case VaultError::NotFound:
            return "Not found";
        case VaultError::InvalidToken:
            return "Invalid or expired reset token";
        case VaultError::RotationIneffective:
            return "No entries could be re-encrypted";
        case VaultError::Fatal:
            return "Internal error";
    }
    return "Unknown error";
}

// Helper type aliases
template<typename T = void>
using VaultResult = std::expected<T, VaultError>;

} // namespace Lockr

#endif // LOCKR_VAULT_ERROR_H
