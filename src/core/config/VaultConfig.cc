// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "VaultConfig.h"
#include <glibmm/keyfile.h>
#include <algorithm>

namespace Lockr {

namespace {

/**
 * @brief Read an integer key clamped to [min_value, max_value]
 * @throws Glib::KeyFileError if the value is not an integer
 */
int read_clamped(const Glib::RefPtr<Glib::KeyFile>& file,
                 const char* group, const char* key,
                 int fallback, int min_value, int max_value) {
    if (!file->has_group(group) || !file->has_key(group, key)) {
        return fallback;
    }

    const int value = file->get_integer(group, key);
    const int clamped = std::clamp(value, min_value, max_value);
    if (clamped != value) {
        Log::warning("Config: [{}] {}={} out of range, using {}", group, key, value, clamped);
    }
    return clamped;
}

std::chrono::seconds read_seconds(const Glib::RefPtr<Glib::KeyFile>& file,
                                  const char* group, const char* key,
                                  std::chrono::seconds fallback, int min_value, int max_value) {
    return std::chrono::seconds(read_clamped(file, group, key, static_cast<int>(fallback.count()),
                                             min_value, max_value));
}

size_t read_count(const Glib::RefPtr<Glib::KeyFile>& file,
                  const char* group, const char* key,
                  size_t fallback, int min_value, int max_value) {
    return static_cast<size_t>(read_clamped(file, group, key, static_cast<int>(fallback),
                                            min_value, max_value));
}

VaultResult<VaultConfig> parse(const Glib::RefPtr<Glib::KeyFile>& file) {
    using L = ConfigLoader;
    VaultConfig config;

    try {
        config.session_timeout = read_seconds(file, "session", "timeout-seconds",
            config.session_timeout, L::MIN_SESSION_TIMEOUT, L::MAX_SESSION_TIMEOUT);

        config.unlock.max_attempts = read_count(file, "unlock", "max-attempts",
            config.unlock.max_attempts, L::MIN_ATTEMPTS, L::MAX_ATTEMPTS);
        config.unlock.window = read_seconds(file, "unlock", "window-seconds",
            config.unlock.window, L::MIN_WINDOW, L::MAX_WINDOW);
        config.unlock.max_attempts_per_address = read_count(file, "unlock", "max-attempts-per-address",
            config.unlock.max_attempts_per_address, L::MIN_ATTEMPTS_PER_ADDRESS, L::MAX_ATTEMPTS);

        config.reset.token_lifetime = read_seconds(file, "reset", "token-lifetime-seconds",
            config.reset.token_lifetime, L::MIN_TOKEN_LIFETIME, L::MAX_TOKEN_LIFETIME);
        config.reset.max_requests_per_user = read_count(file, "reset", "max-requests-per-user",
            config.reset.max_requests_per_user, L::MIN_RESET_REQUESTS, L::MAX_RESET_REQUESTS);
        config.reset.max_requests_per_address = read_count(file, "reset", "max-requests-per-address",
            config.reset.max_requests_per_address, L::MIN_RESET_REQUESTS, L::MAX_RESET_REQUESTS);
        config.reset.request_window = read_seconds(file, "reset", "request-window-seconds",
            config.reset.request_window, L::MIN_WINDOW, L::MAX_WINDOW);

        config.sweep_interval = read_seconds(file, "maintenance", "sweep-interval-seconds",
            config.sweep_interval, L::MIN_SWEEP_INTERVAL, L::MAX_SWEEP_INTERVAL);

        if (file->has_group("storage") && file->has_key("storage", "directory")) {
            config.storage_directory = file->get_string("storage", "directory").raw();
        }

        if (file->has_group("storage") && file->has_key("storage", "users-file")) {
            config.users_file = file->get_string("storage", "users-file").raw();
        }

        if (file->has_group("reset") && file->has_key("reset", "outbox-directory")) {
            config.reset_outbox_directory = file->get_string("reset", "outbox-directory").raw();
        }

        if (file->has_group("log") && file->has_key("log", "level")) {
            const std::string name = file->get_string("log", "level").raw();
            if (auto level = Log::parse_level(name)) {
                config.log_level = *level;
            } else {
                Log::warning("Config: Unknown log level '{}', using info", name);
            }
        }
    } catch (const Glib::KeyFileError& e) {
        Log::error("Config: Invalid value: {}", e.what());
        return std::unexpected(VaultError::ValidationError);
    }

    return config;
}

}  // namespace

VaultResult<VaultConfig> ConfigLoader::load_from_file(const std::string& path) {
    auto file = Glib::KeyFile::create();
    try {
        file->load_from_file(path);
    } catch (const Glib::Error& e) {
        Log::error("Config: Failed to load {}: {}", path, e.what());
        return std::unexpected(VaultError::ValidationError);
    }
    return parse(file);
}

VaultResult<VaultConfig> ConfigLoader::load_from_data(const std::string& data) {
    auto file = Glib::KeyFile::create();
    try {
        file->load_from_data(data);
    } catch (const Glib::Error& e) {
        Log::error("Config: Failed to parse configuration: {}", e.what());
        return std::unexpected(VaultError::ValidationError);
    }
    return parse(file);
}

VaultResult<size_t> ConfigLoader::load_users(const std::string& path,
                                             InMemoryUserDirectory& directory) {
    auto file = Glib::KeyFile::create();
    try {
        file->load_from_file(path);
        if (!file->has_group("users")) {
            return size_t{0};
        }

        size_t added = 0;
        for (const auto& id : file->get_keys("users")) {
            const std::string email = file->get_string("users", id).raw();
            if (!directory.add_user({id.raw(), email})) {
                Log::warning("Config: Skipping account {} in {}", id.raw(), path);
                continue;
            }
            ++added;
        }
        return added;
    } catch (const Glib::Error& e) {
        Log::error("Config: Failed to load users from {}: {}", path, e.what());
        return std::unexpected(VaultError::ValidationError);
    }
}

}  // namespace Lockr
