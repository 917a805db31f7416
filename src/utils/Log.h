// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file Log.h
 * @brief Simple logging framework with compile-time formatting
 *
 * Provides a lightweight, type-safe logging system using C++23 std::format
 * and std::source_location for automatic file/line tracking. Supports multiple
 * log levels with runtime filtering.
 *
 * @section features Features
 * - Compile-time format string validation
 * - Automatic timestamp generation (millisecond precision)
 * - Source location tracking (file:line)
 * - Runtime log level filtering (configurable via [log] level)
 * - Dedicated Critical level for destructive security events
 *
 * @section usage Usage Example
 * @code
 * Lockr::Log::set_level(Lockr::Log::Level::Debug);
 *
 * Lockr::Log::info("Vault unlocked for user {}", user_id);
 * Lockr::Log::warning("Unlock failed for user {} ({} recent failures)", user_id, count);
 * Lockr::Log::critical("Vault reset: {} entries destroyed", destroyed);
 * @endcode
 *
 * @warning Never pass key material, reset tokens or decrypted payloads as
 *          format arguments. Log user ids, entry ids and counts only.
 *
 * @section thread_safety Thread Safety
 * Each record is formatted into a single string and written with one
 * stream insertion, so concurrent request threads do not interleave lines.
 */

#ifndef LOCKR_LOG_H
#define LOCKR_LOG_H

#include <atomic>
#include <chrono>
#include <ctime>
#include <format>
#include <iostream>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace Lockr::Log {

/**
 * @brief Log severity levels
 */
enum class Level {
    Debug,     ///< Detailed debugging information (verbose)
    Info,      ///< General informational messages
    Warning,   ///< Warning conditions (failed unlocks, skipped entries)
    Error,     ///< Error conditions (operation failures)
    Critical   ///< Irreversible security events (vault wipe)
};

/**
 * @brief Current minimum log level (can be changed at runtime)
 *
 * Atomic because request threads read it while the daemon may reload
 * configuration.
 */
inline std::atomic<Level> current_level{Level::Info};

/**
 * @brief Internal implementation details
 * @private
 */
namespace detail {
    inline constexpr std::string_view level_to_string(Level level) noexcept {
        switch (level) {
            case Level::Debug:    return "DEBUG";
            case Level::Info:     return "INFO ";
            case Level::Warning:  return "WARN ";
            case Level::Error:    return "ERROR";
            case Level::Critical: return "CRIT ";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Generate timestamp with millisecond precision
     * @return Formatted timestamp string (YYYY-MM-DD HH:MM:SS.mmm)
     */
    inline std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&time_t, &tm);

        return std::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}",
            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
            tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()));
    }

    inline void write(Level level, std::string_view message, const std::source_location& loc) {
        // Format: [TIMESTAMP] LEVEL: message (file:line)
        std::cerr << std::format("[{}] {}: {} ({}:{})\n",
            get_timestamp(), level_to_string(level), message,
            loc.file_name(), loc.line());
    }
}

/**
 * @brief Format string wrapper that captures the caller's source location
 *
 * The implicit constructor runs at the call site, so the file:line in
 * every record points at the code that logged, not at this header.
 */
template<typename... Args>
struct FormatWithLocation {
    std::format_string<Args...> fmt;
    std::source_location loc;

    template<typename String>
    consteval FormatWithLocation(const String& s,
                                 std::source_location l = std::source_location::current())
        : fmt(s), loc(l) {}
};

template<typename... Args>
using format_t = FormatWithLocation<std::type_identity_t<Args>...>;

/**
 * @brief Main logging function
 * @param level Log level for this message
 * @param fmt Format string (validated at compile-time)
 * @param args Format arguments
 *
 * @note Use convenience functions (debug, info, warning, error, critical)
 */
template<typename... Args>
void log(Level level, format_t<Args...> fmt, Args&&... args) {
    if (level < current_level.load(std::memory_order_relaxed)) {
        return;
    }
    detail::write(level, std::format(fmt.fmt, std::forward<Args>(args)...), fmt.loc);
}

template<typename... Args>
void debug(format_t<Args...> fmt, Args&&... args) {
    log<Args...>(Level::Debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void info(format_t<Args...> fmt, Args&&... args) {
    log<Args...>(Level::Info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void warning(format_t<Args...> fmt, Args&&... args) {
    log<Args...>(Level::Warning, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void error(format_t<Args...> fmt, Args&&... args) {
    log<Args...>(Level::Error, fmt, std::forward<Args>(args)...);
}

/**
 * @brief Log critical message (Level::Critical)
 *
 * Reserved for irreversible operations such as a vault wipe. Never
 * filtered out unless the level is explicitly raised above Critical.
 */
template<typename... Args>
void critical(format_t<Args...> fmt, Args&&... args) {
    log<Args...>(Level::Critical, fmt, std::forward<Args>(args)...);
}

/**
 * @brief Set minimum log level at runtime
 */
inline void set_level(Level level) {
    current_level.store(level, std::memory_order_relaxed);
}

/**
 * @brief Parse a level name from configuration ("debug", "info", "warning",
 *        "error", "critical")
 * @return Parsed level, or std::nullopt for an unknown name
 */
inline std::optional<Level> parse_level(std::string_view name) noexcept {
    if (name == "debug")    return Level::Debug;
    if (name == "info")     return Level::Info;
    if (name == "warning")  return Level::Warning;
    if (name == "error")    return Level::Error;
    if (name == "critical") return Level::Critical;
    return std::nullopt;
}

} // namespace Lockr::Log

#endif // LOCKR_LOG_H
