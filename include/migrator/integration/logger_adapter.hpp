/**
 * @file logger_adapter.hpp
 * @brief Adapter for application and audit logging using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with migration operations. It supports standard logging and an audit
 * trail of destructive actions (authorizations, rejected confirmations,
 * migration outcomes and connection profile changes).
 */

#pragma once

#include <migrator/compat/format.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace migrator::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Parse a log level name ("trace" .. "fatal", "off")
 * @param str Level name, case-sensitive
 * @return Parsed level, or info if unknown
 */
[[nodiscard]] auto log_level_from_string(std::string_view str) noexcept -> log_level;

/**
 * @enum profile_change
 * @brief Connection profile mutations recorded in the audit trail
 */
enum class profile_change { added, updated, removed };

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Enable separate audit trail file for destructive operations
    bool enable_audit_log{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{50};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{5};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Adapter for application and audit logging using logger_system
 *
 * Audit entries are appended as one JSON object per line to
 * `<log_directory>/audit.json`. Connection URIs passed to the audit
 * helpers are redacted before they are written.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/mongo_migrator";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Loaded {} connection profiles", count);
 * logger_adapter::log_migration_authorized(job_id, "orders (staging)",
 *                                          "orders (production)", "orders_prod");
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Initialize the logger with configuration
     *
     * Sets up console and file writers and the audit trail. Calling it
     * again while initialized is a no-op.
     *
     * @param config Configuration options
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release writers
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(migrator::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, migrator::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(migrator::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, migrator::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(migrator::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, migrator::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(migrator::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, migrator::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(migrator::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, migrator::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(migrator::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, migrator::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     * @param level Log severity level
     * @param message The message to log
     */
    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Audit Logging
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record that a migration passed the confirmation guard
     *
     * @param job_id Identifier of the created job
     * @param source_name Display name of the source profile
     * @param target_name Display name of the target profile
     * @param target_database Logical database name that will be overwritten
     */
    static void log_migration_authorized(const std::string& job_id,
                                         const std::string& source_name,
                                         const std::string& target_name,
                                         const std::string& target_database);

    /**
     * @brief Record a start request refused by the confirmation guard
     *
     * @param target_profile_id Target profile the request named
     * @param reason Rejection reason code
     */
    static void log_migration_rejected(const std::string& target_profile_id,
                                       const std::string& reason);

    /**
     * @brief Record the terminal outcome of a migration job
     *
     * @param job_id Job identifier
     * @param final_state Terminal state name
     * @param reason Reason code (empty on success)
     */
    static void log_migration_finished(const std::string& job_id,
                                       const std::string& final_state,
                                       const std::string& reason);

    /**
     * @brief Record a connection profile mutation
     *
     * @param change Kind of mutation
     * @param profile_name Display name of the profile
     * @param uri Connection URI (redacted before writing)
     */
    static void log_profile_change(profile_change change,
                                   const std::string& profile_name,
                                   const std::string& uri = "");

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

private:
    static void write_audit_log(const std::string& event_type,
                                const std::string& outcome,
                                const std::map<std::string, std::string>& fields);

    [[nodiscard]] static auto profile_change_to_string(profile_change change) -> std::string;

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace migrator::integration
