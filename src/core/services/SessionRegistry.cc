// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "SessionRegistry.h"
#include "../../utils/Log.h"
#include <functional>
#include <stdexcept>

namespace Lockr {

SessionRegistry::SessionRegistry(std::chrono::seconds timeout, NowProvider now)
    : m_timeout(timeout),
      m_now(std::move(now)) {
    if (m_timeout <= std::chrono::seconds::zero()) {
        throw std::invalid_argument("SessionRegistry: timeout must be positive");
    }
    if (!m_now) {
        throw std::invalid_argument("SessionRegistry: clock cannot be null");
    }
}

SessionRegistry::Shard& SessionRegistry::shard_for(std::string_view user_id) {
    return m_shards[std::hash<std::string_view>{}(user_id) % SHARD_COUNT];
}

SessionRegistry::UnlockSession*
SessionRegistry::find_live(Shard& shard, std::string_view user_id, TimePoint now) {
    auto it = shard.sessions.find(user_id);
    if (it == shard.sessions.end()) {
        return nullptr;
    }
    if (now >= it->second.expires_at) {
        Log::debug("SessionRegistry: Session of user {} expired", it->first);
        shard.sessions.erase(it);
        return nullptr;
    }
    return &it->second;
}

SessionInfo SessionRegistry::create_session(const std::string& user_id, std::span<const uint8_t> key) {
    const TimePoint now = m_now();

    UnlockSession session;
    session.encryption_key.assign(key.begin(), key.end());
    session.created_at = now;
    session.expires_at = now + m_timeout;

    SessionInfo info{user_id, session.created_at, session.expires_at};

    Shard& shard = shard_for(user_id);
    std::lock_guard lock(shard.mutex);
    shard.sessions.insert_or_assign(user_id, std::move(session));
    return info;
}

std::optional<SessionInfo> SessionRegistry::get_session(std::string_view user_id) {
    const TimePoint now = m_now();
    Shard& shard = shard_for(user_id);
    std::lock_guard lock(shard.mutex);

    const UnlockSession* session = find_live(shard, user_id, now);
    if (!session) {
        return std::nullopt;
    }
    return SessionInfo{std::string(user_id), session->created_at, session->expires_at};
}

std::optional<SecureVector<uint8_t>> SessionRegistry::get_encryption_key(std::string_view user_id) {
    const TimePoint now = m_now();
    Shard& shard = shard_for(user_id);
    std::lock_guard lock(shard.mutex);

    const UnlockSession* session = find_live(shard, user_id, now);
    if (!session) {
        return std::nullopt;
    }
    return session->encryption_key;
}

bool SessionRegistry::key_matches(std::string_view user_id, std::span<const uint8_t> candidate) {
    const TimePoint now = m_now();
    Shard& shard = shard_for(user_id);
    std::lock_guard lock(shard.mutex);

    const UnlockSession* session = find_live(shard, user_id, now);
    return session && constant_time_equal(session->encryption_key, candidate);
}

bool SessionRegistry::clear_session(std::string_view user_id) {
    Shard& shard = shard_for(user_id);
    std::lock_guard lock(shard.mutex);

    auto it = shard.sessions.find(user_id);
    if (it == shard.sessions.end()) {
        return false;
    }
    shard.sessions.erase(it);
    return true;
}

size_t SessionRegistry::purge_expired() {
    const TimePoint now = m_now();
    size_t removed = 0;
    for (auto& shard : m_shards) {
        std::lock_guard lock(shard.mutex);
        removed += std::erase_if(shard.sessions, [now](const auto& item) {
            return now >= item.second.expires_at;
        });
    }
    if (removed > 0) {
        Log::debug("SessionRegistry: Purged {} expired sessions", removed);
    }
    return removed;
}

size_t SessionRegistry::session_count() const {
    size_t count = 0;
    for (const auto& shard : m_shards) {
        std::lock_guard lock(shard.mutex);
        count += shard.sessions.size();
    }
    return count;
}

}  // namespace Lockr
