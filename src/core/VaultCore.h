// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file VaultCore.h
 * @brief Composition root of the vault encryption core
 */

#pragma once

#include "audit/AuditLog.h"
#include "config/VaultConfig.h"
#include "repositories/IEntryStore.h"
#include "repositories/IResetTokenStore.h"
#include "repositories/IUserDirectory.h"
#include "services/EntryService.h"
#include "services/KeyRotationService.h"
#include "services/KeyedMutex.h"
#include "services/SessionRegistry.h"
#include "services/UnlockAttemptLimiter.h"
#include "services/UnlockService.h"
#include "services/VaultResetService.h"
#include <memory>

namespace Lockr {

/**
 * @brief Counts removed by one maintenance pass
 */
struct MaintenanceReport {
    size_t sessions = 0;
    size_t limiter_users = 0;
    size_t reset_tokens = 0;
};

/**
 * @brief Owns the shared state of the core and wires the services to it
 *
 * Constructed once at process start and handed to request handlers by
 * reference. Storage and the account directory are owned by the caller and
 * must outlive the core.
 *
 * @code
 * auto store = FileEntryStore::open(config.storage_directory);
 * VaultCore core(config, store->get(), &users, &tokens, &mailer);
 * core.unlock().unlock({user_id, encoded_key, address});
 * @endcode
 */
class VaultCore {
public:
    /**
     * @throws std::invalid_argument if a collaborator is null
     */
    VaultCore(const VaultConfig& config,
              IEntryStore* entries,
              IUserDirectory* users,
              IResetTokenStore* tokens,
              IResetTokenDelivery* delivery,
              NowProvider now = Clock::now);

    VaultCore(const VaultCore&) = delete;
    VaultCore& operator=(const VaultCore&) = delete;

    UnlockService& unlock() noexcept { return *m_unlock; }
    EntryService& entries() noexcept { return *m_entry_service; }
    KeyRotationService& rotation() noexcept { return *m_rotation; }
    VaultResetService& reset() noexcept { return *m_reset; }

    SessionRegistry& sessions() noexcept { return m_sessions; }
    UnlockAttemptLimiter& limiter() noexcept { return m_limiter; }
    AuditLog& audit() noexcept { return m_audit; }
    KeyedMutex& gate() noexcept { return m_gate; }

    /**
     * @brief Drop expired sessions, limiter windows and reset tokens
     *
     * Not needed for correctness (expiry is checked on access); keeps memory
     * bounded for idle users.
     */
    MaintenanceReport run_maintenance();

private:
    SessionRegistry m_sessions;
    UnlockAttemptLimiter m_limiter;
    KeyedMutex m_gate;
    AuditLog m_audit;

    std::unique_ptr<UnlockService> m_unlock;
    std::unique_ptr<EntryService> m_entry_service;
    std::unique_ptr<KeyRotationService> m_rotation;
    std::unique_ptr<VaultResetService> m_reset;
};

}  // namespace Lockr
