/**
 * @file ilogger.hpp
 * @brief Logger interface for dependency injection
 *
 * This file provides the ILogger interface and its two implementations.
 * category_repository, role_assignment_repository, course_access_resolver
 * and category_aggregator take a shared ILogger at construction;
 * access_engine hands the same instance to all of them.
 *
 * - NullLogger: the default when nothing is injected
 * - LoggerService: forwards to the process-wide logger_adapter
 *
 * Audit records are not written through this interface. The stores call
 * logger_adapter's audit functions directly so the trail is kept even when
 * a NullLogger is injected.
 */

#pragma once

#include <lms/compat/format.hpp>
#include <lms/integration/logger_adapter.hpp>

#include <memory>
#include <string_view>

namespace lms::di {

// =============================================================================
// Logger Interface
// =============================================================================

/**
 * @brief Abstract logger interface for dependency injection
 *
 * Components log rejected mutations at warn, data integrity problems
 * found while walking the hierarchy at warn or error, and per-decision
 * detail at debug.
 *
 * Thread Safety:
 * - All methods must be thread-safe in concrete implementations. One
 *   instance is shared by every component of an engine.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    // =========================================================================
    // Log Level Methods
    // =========================================================================

    virtual void trace(std::string_view message) = 0;

    /**
     * @brief Log a debug-level message
     * @param message The message to log
     */
    virtual void debug(std::string_view message) = 0;

    virtual void info(std::string_view message) = 0;

    /**
     * @brief Log a warning-level message
     *
     * Used for operations that were refused, such as a delete blocked by
     * subcategories.
     *
     * @param message The message to log
     */
    virtual void warn(std::string_view message) = 0;

    virtual void error(std::string_view message) = 0;
    virtual void fatal(std::string_view message) = 0;

    /**
     * @brief Check if a log level is enabled
     * @param level The level to check
     * @return true if messages at this level will be logged
     */
    [[nodiscard]] virtual bool is_enabled(integration::log_level level) const noexcept = 0;

    // =========================================================================
    // Formatted Logging (Convenience Templates)
    // =========================================================================

    /**
     * @brief Format and log a debug message
     *
     * Formatting is skipped when the level is disabled, so the access
     * resolver can describe every decision without paying for it.
     */
    template <typename... Args>
    void debug_fmt(lms::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::debug)) {
            debug(lms::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void info_fmt(lms::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::info)) {
            info(lms::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void warn_fmt(lms::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::warn)) {
            warn(lms::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void error_fmt(lms::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::error)) {
            error(lms::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

protected:
    ILogger() = default;
    ILogger(const ILogger&) = default;
    ILogger& operator=(const ILogger&) = default;
    ILogger(ILogger&&) = default;
    ILogger& operator=(ILogger&&) = default;
};

// =============================================================================
// Null Logger Implementation
// =============================================================================

/**
 * @brief No-op logger used when a component is built without one
 *
 * is_enabled() is always false, so the *_fmt helpers never format.
 */
class NullLogger final : public ILogger {
public:
    NullLogger() = default;
    ~NullLogger() override = default;

    void trace(std::string_view /*message*/) override {}
    void debug(std::string_view /*message*/) override {}
    void info(std::string_view /*message*/) override {}
    void warn(std::string_view /*message*/) override {}
    void error(std::string_view /*message*/) override {}
    void fatal(std::string_view /*message*/) override {}

    [[nodiscard]] bool is_enabled(integration::log_level /*level*/) const noexcept override {
        return false;
    }
};

// =============================================================================
// Logger Service Implementation
// =============================================================================

/**
 * @brief ILogger backed by logger_adapter
 *
 * Messages go to the writers configured by logger_adapter::initialize().
 * Before initialization, and after shutdown, every level reports as
 * disabled and messages are dropped.
 *
 * Thread Safety:
 * - All methods are thread-safe (delegates to thread-safe logger_adapter)
 */
class LoggerService final : public ILogger {
public:
    LoggerService() = default;
    ~LoggerService() override = default;

    void trace(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::trace, std::string{message});
    }

    void debug(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::debug, std::string{message});
    }

    void info(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::info, std::string{message});
    }

    void warn(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::warn, std::string{message});
    }

    void error(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::error, std::string{message});
    }

    void fatal(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::fatal, std::string{message});
    }

    [[nodiscard]] bool is_enabled(integration::log_level level) const noexcept override {
        return integration::logger_adapter::is_initialized() &&
               integration::logger_adapter::is_level_enabled(level);
    }
};

/**
 * @brief Get the shared NullLogger instance
 *
 * Components fall back to this when constructed with a null logger.
 */
[[nodiscard]] inline std::shared_ptr<ILogger> null_logger() {
    static auto instance = std::make_shared<NullLogger>();
    return instance;
}

}  // namespace lms::di
