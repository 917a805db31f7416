// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file UnlockAttemptLimiter.h
 * @brief Failed-unlock counters per user and per user+address
 */

#pragma once

#include "../VaultTypes.h"
#include <array>
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace Lockr {

/**
 * @brief Limits for UnlockAttemptLimiter
 */
struct UnlockLimits {
    size_t max_attempts = 5;                    ///< Failures per user inside one window
    size_t max_attempts_per_address = 0;        ///< Failures per user+address inside one window, 0 disables
    std::chrono::seconds window{15 * 60};
};

/**
 * @brief Snapshot of the counters relevant to one unlock attempt
 */
struct AttemptStatus {
    size_t user_failures = 0;
    size_t address_failures = 0;
    bool blocked = false;
    std::optional<TimePoint> retry_after;       ///< Window end of the blocking counter
};

/**
 * @brief Fixed-window failure counters guarding unlock
 *
 * A window starts at the first failure of a counter and lasts
 * UnlockLimits::window. While a counter has reached its maximum inside the
 * window every attempt is rejected, even one carrying the correct key.
 * Successful unlocks never touch the counters; they only reset when their
 * window has elapsed or through clear().
 *
 * Counters are two-layered: one per user and, when max_attempts_per_address
 * is non-zero, one per user+address pair so a single address can be given a
 * smaller budget than the user as a whole.
 *
 * Thread Safety:
 * - Sharded by user id, one mutex per shard
 */
class UnlockAttemptLimiter {
public:
    static constexpr size_t SHARD_COUNT = 16;

    /**
     * @throws std::invalid_argument if max_attempts is zero or the window is not positive
     */
    explicit UnlockAttemptLimiter(UnlockLimits limits, NowProvider now = Clock::now);

    UnlockAttemptLimiter(const UnlockAttemptLimiter&) = delete;
    UnlockAttemptLimiter& operator=(const UnlockAttemptLimiter&) = delete;

    /**
     * @brief Whether an attempt must be rejected without trying the key
     * @param client_address May be empty when the address is unknown
     */
    [[nodiscard]] bool is_blocked(std::string_view user_id, std::string_view client_address);

    /**
     * @brief Count one failed unlock
     * @return Counters after the increment
     */
    AttemptStatus record_failure(std::string_view user_id, std::string_view client_address);

    [[nodiscard]] AttemptStatus status(std::string_view user_id, std::string_view client_address);

    /**
     * @brief Administrative reset of every counter of a user
     * @return true if the user had counters
     */
    bool clear(std::string_view user_id);

    /**
     * @brief Drop counters whose window has elapsed
     * @return Number of users whose counters were all removed
     */
    size_t purge_expired();

    [[nodiscard]] const UnlockLimits& limits() const noexcept { return m_limits; }

private:
    struct Counter {
        size_t count = 0;
        TimePoint window_start{};
    };

    struct UserCounters {
        std::optional<Counter> user;
        std::map<std::string, Counter, std::less<>> by_address;
    };

    struct Shard {
        std::mutex mutex;
        std::map<std::string, UserCounters, std::less<>> users;
    };

    Shard& shard_for(std::string_view user_id);

    bool address_layer_enabled() const noexcept { return m_limits.max_attempts_per_address > 0; }

    /// Drop expired counters of one user; true when nothing is left
    bool expire(UserCounters& counters, TimePoint now) const;

    AttemptStatus make_status(const UserCounters* counters, std::string_view client_address) const;

    UnlockLimits m_limits;
    NowProvider m_now;
    std::array<Shard, SHARD_COUNT> m_shards;
};

}  // namespace Lockr
