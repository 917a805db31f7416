// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng
//
// MaintenanceScheduler.cc - Implementation of periodic vault core cleanup

#include "MaintenanceScheduler.h"
#include "../../utils/Log.h"
#include <algorithm>
#include <stdexcept>

namespace Lockr {

MaintenanceScheduler::MaintenanceScheduler(VaultCore* core, int interval_seconds)
    : m_core(core),
      m_interval_seconds(std::clamp(interval_seconds, MIN_INTERVAL, MAX_INTERVAL)) {
    if (!m_core) {
        throw std::invalid_argument("MaintenanceScheduler: core cannot be null");
    }
    if (m_interval_seconds != interval_seconds) {
        Log::warning("MaintenanceScheduler: Interval {} seconds clamped to {} (valid range: {}-{})",
                     interval_seconds, m_interval_seconds, MIN_INTERVAL, MAX_INTERVAL);
    }
}

MaintenanceScheduler::~MaintenanceScheduler() {
    stop();
}

void MaintenanceScheduler::start() {
    if (m_timeout_connection.connected()) {
        return;
    }
    m_timeout_connection = Glib::signal_timeout().connect_seconds(
        sigc::mem_fun(*this, &MaintenanceScheduler::on_timeout),
        static_cast<unsigned int>(m_interval_seconds));
    Log::info("MaintenanceScheduler: Sweeping every {} seconds", m_interval_seconds);
}

void MaintenanceScheduler::stop() {
    if (m_timeout_connection.connected()) {
        m_timeout_connection.disconnect();
        Log::debug("MaintenanceScheduler: Stopped");
    }
}

MaintenanceReport MaintenanceScheduler::run_now() {
    const MaintenanceReport report = m_core->run_maintenance();
    m_signal_sweep_completed.emit(report);
    return report;
}

bool MaintenanceScheduler::on_timeout() {
    run_now();
    return true;  // Keep repeating
}

}  // namespace Lockr
