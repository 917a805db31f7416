// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "IUserDirectory.h"
#include <algorithm>
#include <cctype>
#include <mutex>

namespace Lockr {

std::string normalize_email(std::string_view email) {
    const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    auto first = std::find_if_not(email.begin(), email.end(), is_space);
    auto last = std::find_if_not(email.rbegin(), std::make_reverse_iterator(first), is_space).base();

    std::string result(first, last);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::optional<UserAccount> InMemoryUserDirectory::find_by_id(std::string_view user_id) const {
    std::shared_lock lock(m_mutex);
    auto it = m_by_id.find(user_id);
    if (it == m_by_id.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<UserAccount> InMemoryUserDirectory::find_by_email(std::string_view email) const {
    const std::string key = normalize_email(email);

    std::shared_lock lock(m_mutex);
    auto it = m_id_by_email.find(key);
    if (it == m_id_by_email.end()) {
        return std::nullopt;
    }
    auto user_it = m_by_id.find(it->second);
    if (user_it == m_by_id.end()) {
        return std::nullopt;
    }
    return user_it->second;
}

bool InMemoryUserDirectory::add_user(const UserAccount& account) {
    const std::string email = normalize_email(account.email);
    if (account.id.empty() || email.empty()) {
        return false;
    }

    std::unique_lock lock(m_mutex);
    if (auto it = m_id_by_email.find(email); it != m_id_by_email.end() && it->second != account.id) {
        return false;
    }

    if (auto existing = m_by_id.find(account.id); existing != m_by_id.end()) {
        m_id_by_email.erase(normalize_email(existing->second.email));
    }
    m_by_id[account.id] = account;
    m_id_by_email[email] = account.id;
    return true;
}

bool InMemoryUserDirectory::remove_user(std::string_view user_id) {
    std::unique_lock lock(m_mutex);
    auto it = m_by_id.find(user_id);
    if (it == m_by_id.end()) {
        return false;
    }
    m_id_by_email.erase(normalize_email(it->second.email));
    m_by_id.erase(it);
    return true;
}

}  // namespace Lockr
