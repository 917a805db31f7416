// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "AuditLog.h"
#include "../../utils/Log.h"

namespace Lockr {

AuditLog::AuditLog(NowProvider now)
    : m_now(std::move(now)) {
}

void AuditLog::record(AuditEvent event) {
    event.at = m_now();
    const std::string_view type = to_string(event.type);

    switch (event.type) {
        case AuditEventType::UnlockFailed:
            Log::warning("AUDIT {} user={} address={} failures={}",
                         type, event.user_id, event.client_address, event.count);
            break;
        case AuditEventType::UnlockRateLimited:
            Log::warning("AUDIT {} user={} address={}", type, event.user_id, event.client_address);
            break;
        case AuditEventType::KeyRotated:
            Log::info("AUDIT {} user={} rotated={} skipped={} [{}]",
                      type, event.user_id, event.count, event.secondary_count, event.detail);
            break;
        case AuditEventType::RotationIneffective:
            Log::error("AUDIT {} user={} skipped={} [{}]", type, event.user_id, event.count, event.detail);
            break;
        case AuditEventType::VaultReset:
            Log::critical("AUDIT {} user={} address={} entries_destroyed={} {}",
                          type, event.user_id, event.client_address, event.count, event.detail);
            break;
        case AuditEventType::ResetRequested:
            Log::info("AUDIT {} user={} address={}", type, event.user_id, event.client_address);
            break;
        case AuditEventType::DataCorruption:
            Log::error("AUDIT {} user={} entry={}", type, event.user_id, event.detail);
            break;
    }

    std::lock_guard lock(m_emit_mutex);
    m_signal_event.emit(event);
}

}  // namespace Lockr
