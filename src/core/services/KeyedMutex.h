// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file KeyedMutex.h
 * @brief One mutex per key, created on demand
 */

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace Lockr {

/**
 * @brief Per-user critical sections
 *
 * Used to make unlock, lock, rotation and reset of the same user mutually
 * exclusive while leaving other users unaffected. Mutexes are reference
 * counted and dropped when the last holder or waiter releases them, so the
 * map only ever contains users with an operation in flight.
 *
 * @code
 * auto guard = m_gate.lock(user_id);
 * // ... read state, decide, mutate ...
 * @endcode
 */
class KeyedMutex {
public:
    class Guard {
    public:
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&&) = delete;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard();

    private:
        friend class KeyedMutex;
        struct Slot;

        Guard(KeyedMutex* owner, std::string key, std::shared_ptr<Slot> slot);

        KeyedMutex* m_owner;
        std::string m_key;
        std::shared_ptr<Slot> m_slot;
    };

    KeyedMutex() = default;
    KeyedMutex(const KeyedMutex&) = delete;
    KeyedMutex& operator=(const KeyedMutex&) = delete;

    /**
     * @brief Block until the key's mutex is acquired
     */
    [[nodiscard]] Guard lock(std::string_view key);

    /// Number of keys currently held or waited on
    [[nodiscard]] size_t active_keys() const;

private:
    void release(const std::string& key);

    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<Guard::Slot>, std::less<>> m_slots;
};

}  // namespace Lockr
