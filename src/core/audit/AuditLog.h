// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file AuditLog.h
 * @brief Security event sink for the vault core
 */

#ifndef LOCKR_AUDIT_LOG_H
#define LOCKR_AUDIT_LOG_H

#include "../VaultTypes.h"
#include <sigc++/sigc++.h>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>

namespace Lockr {

enum class AuditEventType {
    UnlockFailed,        ///< Wrong key; count = failures in current window
    UnlockRateLimited,   ///< Attempt rejected by the limiter
    KeyRotated,          ///< count = rotated, secondary_count = skipped, detail = skipped ids
    RotationIneffective, ///< No entry rotated; count = skipped, detail = skipped ids
    VaultReset,          ///< count = entries destroyed
    ResetRequested,      ///< A reset token was issued
    DataCorruption       ///< Stored entry failed to decrypt under the session key
};

[[nodiscard]] constexpr std::string_view to_string(AuditEventType type) noexcept {
    switch (type) {
        case AuditEventType::UnlockFailed:      return "unlock-failed";
        case AuditEventType::UnlockRateLimited: return "unlock-rate-limited";
        case AuditEventType::KeyRotated:        return "key-rotated";
        case AuditEventType::RotationIneffective: return "rotation-ineffective";
        case AuditEventType::VaultReset:        return "vault-reset";
        case AuditEventType::ResetRequested:    return "reset-requested";
        case AuditEventType::DataCorruption:    return "data-corruption";
    }
    return "unknown";
}

/**
 * @brief One audit record
 *
 * Carries identifiers and counts only. Never put key material, tokens or
 * decrypted content in any field.
 */
struct AuditEvent {
    AuditEventType type;
    std::string user_id;
    std::string client_address;   ///< Empty when not known
    size_t count = 0;
    size_t secondary_count = 0;
    std::string detail;           ///< Entry id or short reason
    TimePoint at{};
};

/**
 * @brief Writes security events to the log and forwards them to listeners
 *
 * Each event is logged at a severity matching its impact (vault resets at
 * Critical) and then emitted through signal_event(), where an external
 * security-logging collaborator can subscribe.
 *
 * Thread Safety:
 * - record() may be called from any thread; emission is serialized
 * - A handler may call record() again (the emit lock is recursive)
 * - Handlers run while the service that raised the event still holds the
 *   user's gate, so they must not call back into VaultCore services
 * - Connect handlers before request threads start
 */
class AuditLog {
public:
    using EventSignal = sigc::signal<void(const AuditEvent&)>;

    explicit AuditLog(NowProvider now = Clock::now);

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    /**
     * @brief Log and emit an event (fills in the timestamp)
     */
    void record(AuditEvent event);

    /**
     * @brief Signal emitted once per recorded event
     */
    EventSignal& signal_event() { return m_signal_event; }

private:
    NowProvider m_now;
    std::recursive_mutex m_emit_mutex;
    EventSignal m_signal_event;
};

}  // namespace Lockr

#endif  // LOCKR_AUDIT_LOG_H
