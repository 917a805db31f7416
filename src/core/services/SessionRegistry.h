// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file SessionRegistry.h
 * @brief In-memory binding of users to their active vault key
 */

#pragma once

#include "../VaultTypes.h"
#include "../../utils/SecureMemory.h"
#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace Lockr {

/**
 * @brief Holds the raw encryption key of every unlocked vault
 *
 * This is the only place a vault key lives after unlock. Keys are kept in
 * zeroizing buffers, are never serialized and are only handed out to calls
 * made on behalf of the owning user id.
 *
 * Responsibilities:
 * - At most one session per user; creating a session replaces the old one
 * - Lazy expiry: an expired session is erased by the lookup that finds it
 * - Optional sweep (purge_expired) to reclaim memory of idle users
 *
 * Thread Safety:
 * - Users are spread over SHARD_COUNT shards, each with its own mutex
 * - No lock is held across calls into other components
 */
class SessionRegistry {
public:
    static constexpr size_t SHARD_COUNT = 16;

    /**
     * @param timeout Lifetime of a session from creation
     * @param now Clock source (tests inject a manual clock)
     * @throws std::invalid_argument if timeout is not positive
     */
    explicit SessionRegistry(std::chrono::seconds timeout, NowProvider now = Clock::now);

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Install a session, replacing any previous one for this user
     *
     * Does not check that the key is correct; that is the caller's job.
     */
    SessionInfo create_session(const std::string& user_id, std::span<const uint8_t> key);

    /**
     * @brief Metadata of the live session, without the key
     */
    [[nodiscard]] std::optional<SessionInfo> get_session(std::string_view user_id);

    /**
     * @brief Copy of the session key, or std::nullopt if locked or expired
     */
    [[nodiscard]] std::optional<SecureVector<uint8_t>> get_encryption_key(std::string_view user_id);

    /**
     * @brief Constant-time check of a candidate against the session key
     * @return false when there is no live session
     */
    [[nodiscard]] bool key_matches(std::string_view user_id, std::span<const uint8_t> candidate);

    /**
     * @brief Remove the session of a user (idempotent)
     * @return true if a session existed
     */
    bool clear_session(std::string_view user_id);

    /**
     * @brief Drop every expired session
     * @return Number of sessions removed
     */
    size_t purge_expired();

    /// Number of stored sessions, including expired ones not yet purged
    [[nodiscard]] size_t session_count() const;

    [[nodiscard]] std::chrono::seconds timeout() const noexcept { return m_timeout; }

private:
    struct UnlockSession {
        SecureVector<uint8_t> encryption_key;
        TimePoint created_at{};
        TimePoint expires_at{};
    };

    struct Shard {
        mutable std::mutex mutex;
        std::map<std::string, UnlockSession, std::less<>> sessions;
    };

    Shard& shard_for(std::string_view user_id);

    /**
     * @brief Live session of a user; erases it when expired
     * @pre Shard mutex is held
     */
    UnlockSession* find_live(Shard& shard, std::string_view user_id, TimePoint now);

    std::chrono::seconds m_timeout;
    NowProvider m_now;
    std::array<Shard, SHARD_COUNT> m_shards;
};

}  // namespace Lockr
