/**
 * @file logger_adapter.hpp
 * @brief Adapter for engine and audit logging using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with the access engine. It supports standard logging, an audit trail of
 * category and role mutations, and logging of access decisions.
 */

#pragma once

#include <lms/compat/format.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace lms::integration {

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
 * @enum category_operation
 * @brief Category Store mutations recorded in the audit trail
 */
enum class category_operation { create, update, remove };

/**
 * @enum role_operation
 * @brief Role Assignment Store mutations recorded in the audit trail
 */
enum class role_operation { assign, update, revoke };

/**
 * @enum security_event_type
 * @brief Types of security events for audit logging
 */
enum class security_event_type {
    access_granted,
    access_denied,
    configuration_change,
    invalid_request,
    integrity_violation
};

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

    /// Enable separate audit trail file
    bool enable_audit_log{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{100};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{10};

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
 * @brief Adapter for engine logging using logger_system
 *
 * Provides a unified interface for logging in the access engine:
 * - Standard application logging (trace through fatal)
 * - Audit trail of category and role mutations
 * - Access decision and security event logging
 *
 * Logging calls made before initialize() are dropped.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/lms";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Category store opened at {}", path);
 * logger_adapter::log_role_change(role_operation::assign, 7, 3,
 *                                 "category-admin", 1);
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
     * Sets up console and file writers, configures log levels, and
     * prepares the audit trail file if enabled.
     *
     * @param config Configuration options
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Shutdown the logger
     *
     * Flushes all pending messages and releases resources.
     */
    static void shutdown();

    /**
     * @brief Check if the logger is initialized
     */
    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(lms::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, lms::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(lms::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, lms::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(lms::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, lms::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(lms::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, lms::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(lms::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, lms::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(lms::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, lms::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     * @param level Log severity level
     * @param message The message to log
     */
    static void log(log_level level, const std::string& message);

    /**
     * @brief Check if a log level is enabled
     * @param level The level to check
     * @return true if messages at this level will be logged
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    /**
     * @brief Flush all pending log messages
     */
    static void flush();

    // ─────────────────────────────────────────────────────
    // Audit Logging
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record a committed category mutation
     *
     * @param op The mutation performed
     * @param category_id Affected category
     * @param name Category name after the mutation (empty on remove)
     * @param parent_id Parent after the mutation, if any
     */
    static void log_category_change(category_operation op,
                                    std::int64_t category_id,
                                    const std::string& name,
                                    std::optional<std::int64_t> parent_id);

    /**
     * @brief Record a committed role assignment mutation
     *
     * @param op The mutation performed
     * @param user_id User holding the role
     * @param category_id Category the role is scoped to
     * @param role Role name after the mutation (previous role on revoke)
     * @param actor_id User that performed the change. The audit record
     *        has no actor_id field when it is not known.
     */
    static void log_role_change(role_operation op,
                                std::int64_t user_id,
                                std::int64_t category_id,
                                const std::string& role,
                                std::optional<std::int64_t> actor_id);

    /**
     * @brief Record a course access decision
     *
     * Granted decisions are logged at debug level, denials at info level.
     * Only denials are written to the audit trail.
     */
    static void log_access_decision(std::int64_t user_id,
                                    std::int64_t course_id,
                                    bool granted,
                                    const std::string& source,
                                    const std::string& role);

    /**
     * @brief Log a security event
     *
     * @param type Type of security event
     * @param description Human-readable description
     * @param user_id User involved (if known)
     */
    static void log_security_event(security_event_type type,
                                   const std::string& description,
                                   const std::string& user_id = "");

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

    [[nodiscard]] static auto category_operation_to_string(category_operation op)
        -> std::string;
    [[nodiscard]] static auto role_operation_to_string(role_operation op)
        -> std::string;
    [[nodiscard]] static auto security_event_to_string(security_event_type type)
        -> std::string;

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace lms::integration
