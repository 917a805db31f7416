// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "IResetTokenStore.h"
#include <algorithm>

namespace Lockr {

bool InMemoryResetTokenStore::insert(const ResetTokenRecord& record) {
    std::lock_guard lock(m_mutex);
    return m_tokens.emplace(record.token_hash, record).second;
}

std::optional<ResetTokenRecord> InMemoryResetTokenStore::find(std::string_view token_hash) const {
    std::lock_guard lock(m_mutex);
    auto it = m_tokens.find(token_hash);
    if (it == m_tokens.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ResetTokenRecord> InMemoryResetTokenStore::consume(std::string_view token_hash,
                                                                 TimePoint now) {
    std::lock_guard lock(m_mutex);
    auto it = m_tokens.find(token_hash);
    if (it == m_tokens.end() || !it->second.is_usable(now)) {
        return std::nullopt;
    }
    ResetTokenRecord before = it->second;
    it->second.used_at = now;
    return before;
}

void InMemoryResetTokenStore::record_wipe(std::string_view token_hash, size_t entries_wiped) {
    std::lock_guard lock(m_mutex);
    if (auto it = m_tokens.find(token_hash); it != m_tokens.end()) {
        it->second.entries_wiped = entries_wiped;
    }
}

size_t InMemoryResetTokenStore::count_issued_since(std::string_view user_id, TimePoint since) const {
    std::lock_guard lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_tokens.begin(), m_tokens.end(), [&](const auto& item) {
        return item.second.user_id == user_id && item.second.created_at > since;
    }));
}

size_t InMemoryResetTokenStore::purge(TimePoint now, TimePoint retain_since) {
    std::lock_guard lock(m_mutex);
    return std::erase_if(m_tokens, [&](const auto& item) {
        const auto& record = item.second;
        return !record.is_usable(now) && record.created_at < retain_since;
    });
}

bool InMemoryResetTokenStore::remove(std::string_view token_hash) {
    std::lock_guard lock(m_mutex);
    auto it = m_tokens.find(token_hash);
    if (it == m_tokens.end()) {
        return false;
    }
    m_tokens.erase(it);
    return true;
}

size_t InMemoryResetTokenStore::size() const {
    std::lock_guard lock(m_mutex);
    return m_tokens.size();
}

}  // namespace Lockr
