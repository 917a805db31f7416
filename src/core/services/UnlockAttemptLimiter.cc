// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "UnlockAttemptLimiter.h"
#include "../../utils/Log.h"
#include <functional>
#include <stdexcept>

namespace Lockr {

UnlockAttemptLimiter::UnlockAttemptLimiter(UnlockLimits limits, NowProvider now)
    : m_limits(limits),
      m_now(std::move(now)) {
    if (m_limits.max_attempts == 0) {
        throw std::invalid_argument("UnlockAttemptLimiter: max_attempts must be positive");
    }
    if (m_limits.window <= std::chrono::seconds::zero()) {
        throw std::invalid_argument("UnlockAttemptLimiter: window must be positive");
    }
    if (!m_now) {
        throw std::invalid_argument("UnlockAttemptLimiter: clock cannot be null");
    }
}

UnlockAttemptLimiter::Shard& UnlockAttemptLimiter::shard_for(std::string_view user_id) {
    return m_shards[std::hash<std::string_view>{}(user_id) % SHARD_COUNT];
}

bool UnlockAttemptLimiter::expire(UserCounters& counters, TimePoint now) const {
    const auto elapsed = [&](const Counter& c) { return now >= c.window_start + m_limits.window; };

    if (counters.user && elapsed(*counters.user)) {
        counters.user.reset();
    }
    std::erase_if(counters.by_address, [&](const auto& item) { return elapsed(item.second); });
    return !counters.user && counters.by_address.empty();
}

AttemptStatus UnlockAttemptLimiter::make_status(const UserCounters* counters,
                                                std::string_view client_address) const {
    AttemptStatus status;
    if (!counters) {
        return status;
    }

    if (counters->user) {
        status.user_failures = counters->user->count;
        if (status.user_failures >= m_limits.max_attempts) {
            status.blocked = true;
            status.retry_after = counters->user->window_start + m_limits.window;
        }
    }

    if (address_layer_enabled() && !client_address.empty()) {
        if (auto it = counters->by_address.find(client_address); it != counters->by_address.end()) {
            status.address_failures = it->second.count;
            if (status.address_failures >= m_limits.max_attempts_per_address) {
                const TimePoint end = it->second.window_start + m_limits.window;
                status.blocked = true;
                if (!status.retry_after || *status.retry_after < end) {
                    status.retry_after = end;
                }
            }
        }
    }
    return status;
}

AttemptStatus UnlockAttemptLimiter::status(std::string_view user_id, std::string_view client_address) {
    const TimePoint now = m_now();
    Shard& shard = shard_for(user_id);
    std::lock_guard lock(shard.mutex);

    auto it = shard.users.find(user_id);
    if (it == shard.users.end()) {
        return {};
    }
    if (expire(it->second, now)) {
        shard.users.erase(it);
        return {};
    }
    return make_status(&it->second, client_address);
}

bool UnlockAttemptLimiter::is_blocked(std::string_view user_id, std::string_view client_address) {
    return status(user_id, client_address).blocked;
}

AttemptStatus UnlockAttemptLimiter::record_failure(std::string_view user_id,
                                                   std::string_view client_address) {
    const TimePoint now = m_now();
    Shard& shard = shard_for(user_id);
    std::lock_guard lock(shard.mutex);

    auto it = shard.users.find(user_id);
    if (it == shard.users.end()) {
        it = shard.users.emplace(std::string(user_id), UserCounters{}).first;
    } else {
        expire(it->second, now);
    }

    UserCounters& counters = it->second;
    if (!counters.user) {
        counters.user = Counter{0, now};
    }
    ++counters.user->count;

    if (address_layer_enabled() && !client_address.empty()) {
        auto addr_it = counters.by_address.find(client_address);
        if (addr_it == counters.by_address.end()) {
            addr_it = counters.by_address.emplace(std::string(client_address), Counter{0, now}).first;
        }
        ++addr_it->second.count;
    }

    AttemptStatus result = make_status(&counters, client_address);
    if (result.blocked) {
        Log::warning("UnlockAttemptLimiter: User {} locked out ({} failures in window)",
                     it->first, result.user_failures);
    }
    return result;
}

bool UnlockAttemptLimiter::clear(std::string_view user_id) {
    Shard& shard = shard_for(user_id);
    std::lock_guard lock(shard.mutex);

    auto it = shard.users.find(user_id);
    if (it == shard.users.end()) {
        return false;
    }
    Log::info("UnlockAttemptLimiter: Counters of user {} cleared", it->first);
    shard.users.erase(it);
    return true;
}

size_t UnlockAttemptLimiter::purge_expired() {
    const TimePoint now = m_now();
    size_t removed = 0;
    for (auto& shard : m_shards) {
        std::lock_guard lock(shard.mutex);
        for (auto it = shard.users.begin(); it != shard.users.end();) {
            if (expire(it->second, now)) {
                it = shard.users.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    return removed;
}

}  // namespace Lockr
