// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#ifndef LOCKR_VAULT_CONFIG_H
#define LOCKR_VAULT_CONFIG_H

#include "../VaultError.h"
#include "../repositories/IUserDirectory.h"
#include "../services/UnlockAttemptLimiter.h"
#include "../services/VaultResetService.h"
#include "../../utils/Log.h"
#include <chrono>
#include <string>

namespace Lockr {

/**
 * @brief Runtime configuration of the vault core
 *
 * Defaults match a conservative production setup. Every numeric value is
 * clamped into a safe range when loaded, so an edited configuration file
 * cannot disable the lockout or make tokens live for days.
 */
struct VaultConfig {
    std::chrono::seconds session_timeout{30 * 60};
    UnlockLimits unlock{};
    ResetPolicy reset{};
    std::string storage_directory;                 ///< Empty: entries are kept in memory
    std::string users_file;                        ///< Key file with a [users] group (id=email)
    std::string reset_outbox_directory;            ///< Where issued reset tokens are handed to the mailer
    std::chrono::seconds sweep_interval{5 * 60};
    Log::Level log_level = Log::Level::Info;
};

/**
 * @brief Loads VaultConfig from an INI-style key file (Glib::KeyFile)
 *
 * @code
 * [session]
 * timeout-seconds=1800
 *
 * [unlock]
 * max-attempts=5
 * window-seconds=900
 * max-attempts-per-address=0
 *
 * [reset]
 * token-lifetime-seconds=900
 * max-requests-per-user=3
 * max-requests-per-address=5
 * request-window-seconds=3600
 * outbox-directory=/var/spool/lockr/reset
 *
 * [storage]
 * directory=/var/lib/lockr/entries
 * users-file=/etc/lockr/users.ini
 *
 * [maintenance]
 * sweep-interval-seconds=300
 *
 * [log]
 * level=info
 * @endcode
 *
 * Missing groups and keys keep their defaults.
 *
 * @note This is a static utility class and cannot be instantiated.
 */
class ConfigLoader final {
public:
    static inline constexpr int MIN_SESSION_TIMEOUT{60};          // 1 minute
    static inline constexpr int MAX_SESSION_TIMEOUT{24 * 3600};   // 1 day

    static inline constexpr int MIN_ATTEMPTS{1};
    static inline constexpr int MAX_ATTEMPTS{100};
    static inline constexpr int MIN_ATTEMPTS_PER_ADDRESS{0};    // 0 disables the address layer

    static inline constexpr int MIN_WINDOW{60};
    static inline constexpr int MAX_WINDOW{24 * 3600};

    static inline constexpr int MIN_TOKEN_LIFETIME{5 * 60};
    static inline constexpr int MAX_TOKEN_LIFETIME{24 * 3600};

    static inline constexpr int MIN_RESET_REQUESTS{1};
    static inline constexpr int MAX_RESET_REQUESTS{100};

    static inline constexpr int MIN_SWEEP_INTERVAL{10};
    static inline constexpr int MAX_SWEEP_INTERVAL{3600};

    /**
     * @brief Load configuration from a file
     * @return Config, or ValidationError if the file cannot be read or parsed
     */
    [[nodiscard]] static VaultResult<VaultConfig> load_from_file(const std::string& path);

    /**
     * @brief Load configuration from key file text
     */
    [[nodiscard]] static VaultResult<VaultConfig> load_from_data(const std::string& data);

    /**
     * @brief Populate a user directory from a key file
     *
     * @code
     * [users]
     * 7f3a9c=alice@example.org
     * @endcode
     *
     * @return Number of accounts added, or ValidationError
     */
    [[nodiscard]] static VaultResult<size_t> load_users(const std::string& path,
                                                        InMemoryUserDirectory& directory);

    ConfigLoader() = delete;
    ~ConfigLoader() = delete;
    ConfigLoader(const ConfigLoader&) = delete;
    ConfigLoader& operator=(const ConfigLoader&) = delete;
};

}  // namespace Lockr

#endif  // LOCKR_VAULT_CONFIG_H
