// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file VaultTypes.h
 * @brief Domain types shared by the vault core
 *
 * Plain data carried between the entry store, the session registry and the
 * protocol services. None of these types hold plaintext entry content or
 * key material, so they may be copied and logged (by id) freely.
 */

#ifndef LOCKR_VAULT_TYPES_H
#define LOCKR_VAULT_TYPES_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Lockr {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Source of "now" for expiry decisions
 *
 * Production code uses Clock::now; tests inject a controllable clock.
 */
using NowProvider = std::function<TimePoint()>;

/**
 * @brief Clear-text entry category used for filtering
 *
 * Not sensitive. System marks the verification anchor written by a vault
 * reset.
 */
enum class EntryCategory : uint8_t {
    Other = 0,
    Login = 1,
    Card = 2,
    Note = 3,
    Wifi = 4,
    Email = 5,
    Social = 6,
    Banking = 7,
    Shopping = 8,
    Work = 9,
    Personal = 10,
    System = 11
};

[[nodiscard]] constexpr std::string_view to_string(EntryCategory category) noexcept {
    switch (category) {
        case EntryCategory::Other:    return "other";
        case EntryCategory::Login:    return "login";
        case EntryCategory::Card:     return "card";
        case EntryCategory::Note:     return "note";
        case EntryCategory::Wifi:     return "wifi";
        case EntryCategory::Email:    return "email";
        case EntryCategory::Social:   return "social";
        case EntryCategory::Banking:  return "banking";
        case EntryCategory::Shopping: return "shopping";
        case EntryCategory::Work:     return "work";
        case EntryCategory::Personal: return "personal";
        case EntryCategory::System:   return "system";
    }
    return "other";
}

/**
 * @brief Parse a category name (case-sensitive, lower case)
 * @return Category, or std::nullopt for an unknown name
 */
[[nodiscard]] std::optional<EntryCategory> parse_category(std::string_view name) noexcept;

/**
 * @brief Authenticated-encryption output for one payload
 *
 * The three fields are produced together by one encryption and are only
 * ever replaced together.
 */
struct EncryptedBlob {
    std::vector<uint8_t> ciphertext;  ///< AES-256-GCM ciphertext (no tag)
    std::vector<uint8_t> iv;          ///< 12-byte nonce, fresh per encryption
    std::vector<uint8_t> auth_tag;    ///< 16-byte GCM tag

    bool operator==(const EncryptedBlob&) const = default;
};

/**
 * @brief One stored vault entry
 *
 * Everything the server persists about an entry. The plaintext payload
 * only exists inside EntryService calls, in zeroizing buffers.
 */
struct VaultEntry {
    std::string id;                               ///< Assigned by the store on insert
    std::string owner_id;                         ///< Owning account, immutable
    EncryptedBlob sealed;                         ///< ciphertext + iv + auth_tag
    EntryCategory category = EntryCategory::Other;
    bool favorite = false;                        ///< Clear-text flag, lets lists filter without decrypting
    TimePoint created_at{};
    TimePoint updated_at{};                       ///< Bumped on every ciphertext replacement
};

/**
 * @brief Full ciphertext replacement for one entry (rotation, update)
 */
struct EntryCiphertextUpdate {
    std::string entry_id;
    EncryptedBlob sealed;
    std::optional<EntryCategory> category;        ///< Unchanged when empty
    std::optional<bool> favorite;                 ///< Unchanged when empty
};

/**
 * @brief Public view of an unlock session (never carries the key)
 */
struct SessionInfo {
    std::string user_id;
    TimePoint created_at{};
    TimePoint expires_at{};
};

/**
 * @brief Account as seen from the vault core
 *
 * Identity is established by the authentication layer; the core only
 * needs to know the account exists and where reset mail goes.
 */
struct UserAccount {
    std::string id;
    std::string email;
};

/**
 * @brief Stored vault reset token
 *
 * Only the SHA-256 hash of the token is kept; the plain token is handed to
 * the delivery channel once and then forgotten.
 */
struct ResetTokenRecord {
    std::string token_hash;                ///< Hex SHA-256 of the plain token
    std::string user_id;
    std::string requested_from;            ///< Client address of the request
    TimePoint created_at{};
    TimePoint expires_at{};
    std::optional<TimePoint> used_at;      ///< Set exactly once
    std::optional<size_t> entries_wiped;   ///< Recorded on completion

    [[nodiscard]] bool is_usable(TimePoint now) const noexcept {
        return !used_at.has_value() && now < expires_at;
    }
};

} // namespace Lockr

#endif // LOCKR_VAULT_TYPES_H
