// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng
//
// MaintenanceScheduler.h - Periodic cleanup of expired vault core state

#pragma once

#include "../VaultCore.h"
#include <glibmm/main.h>
#include <sigc++/sigc++.h>

namespace Lockr {

/**
 * @brief Runs VaultCore::run_maintenance() on a repeating Glib timeout
 *
 * Responsibilities:
 * - Sweep expired sessions, limiter windows and reset tokens
 * - Signal-based notification after every sweep
 *
 * Expiry is enforced on access everywhere, so a stopped scheduler never
 * affects correctness, only memory use.
 *
 * Thread Safety:
 * - start(), stop() and the sweep run on the thread of the Glib main context
 * - run_now() can be called without a main loop (used by tests)
 */
class MaintenanceScheduler {
public:
    static constexpr int MIN_INTERVAL = 10;
    static constexpr int MAX_INTERVAL = 3600;

    /**
     * @param core Non-owning pointer, must outlive the scheduler
     * @param interval_seconds Clamped to MIN_INTERVAL..MAX_INTERVAL
     * @throws std::invalid_argument if core is null
     */
    MaintenanceScheduler(VaultCore* core, int interval_seconds);
    ~MaintenanceScheduler();

    MaintenanceScheduler(const MaintenanceScheduler&) = delete;
    MaintenanceScheduler& operator=(const MaintenanceScheduler&) = delete;
    MaintenanceScheduler(MaintenanceScheduler&&) = delete;
    MaintenanceScheduler& operator=(MaintenanceScheduler&&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool is_running() const { return m_timeout_connection.connected(); }
    [[nodiscard]] int interval_seconds() const noexcept { return m_interval_seconds; }

    /**
     * @brief Sweep immediately and emit signal_sweep_completed
     */
    MaintenanceReport run_now();

    sigc::signal<void(const MaintenanceReport&)>& signal_sweep_completed() {
        return m_signal_sweep_completed;
    }

private:
    bool on_timeout();

    VaultCore* m_core;
    int m_interval_seconds;
    sigc::connection m_timeout_connection;
    sigc::signal<void(const MaintenanceReport&)> m_signal_sweep_completed;
};

}  // namespace Lockr
