// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "KeyedMutex.h"

namespace Lockr {

struct KeyedMutex::Guard::Slot {
    std::mutex mutex;
    size_t users = 0;   // holders + waiters, guarded by KeyedMutex::m_mutex
};

KeyedMutex::Guard::Guard(KeyedMutex* owner, std::string key, std::shared_ptr<Slot> slot)
    : m_owner(owner),
      m_key(std::move(key)),
      m_slot(std::move(slot)) {
}

KeyedMutex::Guard::Guard(Guard&& other) noexcept
    : m_owner(other.m_owner),
      m_key(std::move(other.m_key)),
      m_slot(std::move(other.m_slot)) {
    other.m_owner = nullptr;
}

KeyedMutex::Guard::~Guard() {
    if (m_owner && m_slot) {
        m_slot->mutex.unlock();
        m_owner->release(m_key);
    }
}

KeyedMutex::Guard KeyedMutex::lock(std::string_view key) {
    std::shared_ptr<Guard::Slot> slot;
    {
        std::lock_guard lock(m_mutex);
        auto it = m_slots.find(key);
        if (it == m_slots.end()) {
            it = m_slots.emplace(std::string(key), std::make_shared<Guard::Slot>()).first;
        }
        slot = it->second;
        ++slot->users;
    }

    slot->mutex.lock();
    return Guard(this, std::string(key), std::move(slot));
}

void KeyedMutex::release(const std::string& key) {
    std::lock_guard lock(m_mutex);
    auto it = m_slots.find(key);
    if (it != m_slots.end() && --it->second->users == 0) {
        m_slots.erase(it);
    }
}

size_t KeyedMutex::active_keys() const {
    std::lock_guard lock(m_mutex);
    return m_slots.size();
}

}  // namespace Lockr
