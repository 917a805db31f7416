// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "VaultCore.h"
#include "../utils/Log.h"

namespace Lockr {

VaultCore::VaultCore(const VaultConfig& config,
                     IEntryStore* entries,
                     IUserDirectory* users,
                     IResetTokenStore* tokens,
                     IResetTokenDelivery* delivery,
                     NowProvider now)
    : m_sessions(config.session_timeout, now),
      m_limiter(config.unlock, now),
      m_audit(now) {
    m_unlock = std::make_unique<UnlockService>(users, entries, &m_sessions, &m_limiter, &m_gate, &m_audit);
    m_entry_service = std::make_unique<EntryService>(entries, &m_sessions, &m_gate, &m_audit);
    m_rotation = std::make_unique<KeyRotationService>(entries, &m_sessions, &m_gate, &m_audit);
    m_reset = std::make_unique<VaultResetService>(users, entries, tokens, delivery, &m_sessions,
                                                  &m_gate, &m_audit, config.reset, now);
}

MaintenanceReport VaultCore::run_maintenance() {
    MaintenanceReport report;
    report.sessions = m_sessions.purge_expired();
    report.limiter_users = m_limiter.purge_expired();
    report.reset_tokens = m_reset->purge_expired_tokens();

    Log::debug("VaultCore: Maintenance removed {} sessions, {} limiter entries, {} reset tokens",
               report.sessions, report.limiter_users, report.reset_tokens);
    return report;
}

}  // namespace Lockr
