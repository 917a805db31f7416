// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file IUserDirectory.h
 * @brief Read-mostly view of the account database
 *
 * Accounts are owned by the authentication layer. The vault core only needs
 * to confirm that an account exists and find it by e-mail for a reset
 * request.
 */

#pragma once

#include "../VaultTypes.h"
#include <optional>
#include <shared_mutex>
#include <map>
#include <string>
#include <string_view>

namespace Lockr {

class IUserDirectory {
public:
    virtual ~IUserDirectory() = default;

    [[nodiscard]] virtual std::optional<UserAccount> find_by_id(std::string_view user_id) const = 0;

    /**
     * @brief Look up an account by e-mail (case-insensitive)
     */
    [[nodiscard]] virtual std::optional<UserAccount> find_by_email(std::string_view email) const = 0;
};

/**
 * @brief Simple thread-safe directory for tests and standalone deployments
 */
class InMemoryUserDirectory : public IUserDirectory {
public:
    [[nodiscard]] std::optional<UserAccount> find_by_id(std::string_view user_id) const override;
    [[nodiscard]] std::optional<UserAccount> find_by_email(std::string_view email) const override;

    /**
     * @brief Add or replace an account
     * @return false if the id or e-mail is empty, or the e-mail belongs to another id
     */
    bool add_user(const UserAccount& account);

    /**
     * @brief Remove an account
     * @return true if it existed
     */
    bool remove_user(std::string_view user_id);

private:
    mutable std::shared_mutex m_mutex;
    std::map<std::string, UserAccount, std::less<>> m_by_id;
    std::map<std::string, std::string, std::less<>> m_id_by_email;  // normalized e-mail -> id
};

/**
 * @brief Lower-case ASCII and trim surrounding whitespace
 */
[[nodiscard]] std::string normalize_email(std::string_view email);

}  // namespace Lockr
