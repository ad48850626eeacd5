/**
 * @file logger_adapter.cpp
 * @brief Implementation of the engine logging and audit adapter
 */

#include <lms/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace lms::integration {

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    impl() = default;
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);

        if (initialized_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        if (config.enable_file || config.enable_audit_log) {
            std::filesystem::create_directories(config.log_directory);
        }

        logger_ = std::make_unique<kcenon::logger::logger>(
            config.async_mode, config.buffer_size);
        logger_->set_min_level(convert_log_level(config.min_level));

        if (config.enable_console) {
            logger_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }

        if (config.enable_file) {
            auto log_path = config.log_directory / "lms_access.log";
            auto writer = std::make_unique<kcenon::logger::rotating_file_writer>(
                log_path.string(),
                config.max_file_size_mb * 1024 * 1024,
                config.max_files);
            logger_->add_writer(std::move(writer));
        }

        logger_->start();

        if (config.enable_audit_log) {
            audit_log_path_ = config.log_directory / "audit.json";
        }

        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);

        if (!initialized_) {
            return;
        }

        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }

        audit_log_path_.clear();
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool {
        return initialized_.load();
    }

    void log(log_level level, const std::string& message) {
        if (!initialized_ || !logger_) {
            return;
        }

        if (!is_level_enabled(level)) {
            return;
        }

        logger_->log(convert_log_level(level), message);
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void flush() {
        if (logger_) {
            logger_->flush();
        }
    }

    void set_min_level(log_level level) {
        min_level_.store(level);
        if (logger_) {
            logger_->set_min_level(convert_log_level(level));
        }
    }

    [[nodiscard]] auto get_min_level() const noexcept -> log_level {
        return min_level_.load();
    }

    [[nodiscard]] auto get_config() const -> const logger_config& { return config_; }

    void write_audit_log(const std::string& event_type,
                         const std::string& outcome,
                         const std::map<std::string, std::string>& fields) {
        if (!initialized_ || !config_.enable_audit_log || audit_log_path_.empty()) {
            return;
        }

        std::lock_guard lock(audit_mutex_);

        std::ofstream file(audit_log_path_, std::ios::app);
        if (!file) {
            return;
        }

        std::ostringstream json;
        json << "{";
        json << "\"timestamp\":\"" << format_iso8601() << "\",";
        json << "\"event_type\":\"" << escape_json(event_type) << "\",";
        json << "\"outcome\":\"" << escape_json(outcome) << "\"";

        for (const auto& [key, value] : fields) {
            json << ",\"" << escape_json(key) << "\":\"" << escape_json(value) << "\"";
        }

        json << "}\n";

        file << json.str();
        file.flush();
    }

private:
    [[nodiscard]] static auto convert_log_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace:
                return kcenon::logger::log_level::trace;
            case log_level::debug:
                return kcenon::logger::log_level::debug;
            case log_level::info:
                return kcenon::logger::log_level::info;
            case log_level::warn:
                return kcenon::logger::log_level::warn;
            case log_level::error:
                return kcenon::logger::log_level::error;
            case log_level::fatal:
                return kcenon::logger::log_level::fatal;
            case log_level::off:
            default:
                return kcenon::logger::log_level::off;
        }
    }

    [[nodiscard]] static auto format_iso8601() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;

        std::tm tm_val{};
#ifdef _WIN32
        localtime_s(&tm_val, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_val);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        oss << std::put_time(&tm_val, "%z");
        return oss.str();
    }

    [[nodiscard]] static auto escape_json(const std::string& str) -> std::string {
        std::ostringstream oss;
        for (char c : str) {
            switch (c) {
                case '"':
                    oss << "\\\"";
                    break;
                case '\\':
                    oss << "\\\\";
                    break;
                case '\n':
                    oss << "\\n";
                    break;
                case '\r':
                    oss << "\\r";
                    break;
                case '\t':
                    oss << "\\t";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 32) {
                        oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                            << static_cast<int>(c);
                    } else {
                        oss << c;
                    }
                    break;
            }
        }
        return oss.str();
    }

    mutable std::mutex mutex_;
    mutable std::mutex audit_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> logger_;
    std::filesystem::path audit_log_path_;
};

// =============================================================================
// Static Member Initialization
// =============================================================================

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Initialization
// =============================================================================

void logger_adapter::initialize(const logger_config& config) {
    pimpl_->initialize(config);
}

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool {
    return pimpl_->is_initialized();
}

// =============================================================================
// Standard Logging
// =============================================================================

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

// =============================================================================
// Audit Logging
// =============================================================================

void logger_adapter::log_category_change(category_operation op,
                                         std::int64_t category_id,
                                         const std::string& name,
                                         std::optional<std::int64_t> parent_id) {
    auto op_str = category_operation_to_string(op);
    auto parent_str = parent_id ? std::to_string(*parent_id) : std::string{"none"};

    info("Category {}: id={} name='{}' parent={}", op_str, category_id, name,
         parent_str);

    write_audit_log("CATEGORY", "success",
                    {{"operation", op_str},
                     {"category_id", std::to_string(category_id)},
                     {"name", name},
                     {"parent_id", parent_str}});
}

void logger_adapter::log_role_change(role_operation op,
                                     std::int64_t user_id,
                                     std::int64_t category_id,
                                     const std::string& role,
                                     std::optional<std::int64_t> actor_id) {
    auto op_str = role_operation_to_string(op);
    auto actor_str = actor_id ? std::to_string(*actor_id) : std::string("unknown");

    info("Category role {}: user={} category={} role={} by={}", op_str,
         user_id, category_id, role, actor_str);

    std::map<std::string, std::string> fields{
        {"operation", op_str},
        {"user_id", std::to_string(user_id)},
        {"category_id", std::to_string(category_id)},
        {"role", role}};
    if (actor_id) {
        fields.emplace("actor_id", actor_str);
    }
    write_audit_log("CATEGORY_ROLE", "success", fields);
}

void logger_adapter::log_access_decision(std::int64_t user_id,
                                         std::int64_t course_id,
                                         bool granted,
                                         const std::string& source,
                                         const std::string& role) {
    if (granted) {
        debug("Course access granted: user={} course={} source={} role={}",
              user_id, course_id, source, role);
        return;
    }

    info("Course access denied: user={} course={}", user_id, course_id);

    write_audit_log("COURSE_ACCESS", "denied",
                    {{"user_id", std::to_string(user_id)},
                     {"course_id", std::to_string(course_id)}});
}

void logger_adapter::log_security_event(security_event_type type,
                                        const std::string& description,
                                        const std::string& user_id) {
    auto type_str = security_event_to_string(type);

    switch (type) {
        case security_event_type::access_granted:
        case security_event_type::configuration_change:
            info("Security event: {} - {}", type_str, description);
            break;
        case security_event_type::access_denied:
        case security_event_type::invalid_request:
            warn("Security event: {} - {}", type_str, description);
            break;
        case security_event_type::integrity_violation:
            error("Security event: {} - {}", type_str, description);
            break;
    }

    std::map<std::string, std::string> fields = {
        {"security_event", type_str}, {"description", description}};

    if (!user_id.empty()) {
        fields["user_id"] = user_id;
    }

    write_audit_log("SECURITY", type_str, fields);
}

// =============================================================================
// Configuration
// =============================================================================

void logger_adapter::set_min_level(log_level level) {
    pimpl_->set_min_level(level);
}

auto logger_adapter::get_min_level() noexcept -> log_level {
    return pimpl_->get_min_level();
}

auto logger_adapter::get_config() -> const logger_config& {
    return pimpl_->get_config();
}

// =============================================================================
// Private Helpers
// =============================================================================

void logger_adapter::write_audit_log(
    const std::string& event_type,
    const std::string& outcome,
    const std::map<std::string, std::string>& fields) {
    pimpl_->write_audit_log(event_type, outcome, fields);
}

auto logger_adapter::category_operation_to_string(category_operation op)
    -> std::string {
    switch (op) {
        case category_operation::create:
            return "create";
        case category_operation::update:
            return "update";
        case category_operation::remove:
            return "delete";
    }
    return "unknown";
}

auto logger_adapter::role_operation_to_string(role_operation op) -> std::string {
    switch (op) {
        case role_operation::assign:
            return "assign";
        case role_operation::update:
            return "update";
        case role_operation::revoke:
            return "revoke";
    }
    return "unknown";
}

auto logger_adapter::security_event_to_string(security_event_type type)
    -> std::string {
    switch (type) {
        case security_event_type::access_granted:
            return "AccessGranted";
        case security_event_type::access_denied:
            return "AccessDenied";
        case security_event_type::configuration_change:
            return "ConfigurationChange";
        case security_event_type::invalid_request:
            return "InvalidRequest";
        case security_event_type::integrity_violation:
            return "IntegrityViolation";
    }
    return "Unknown";
}

}  // namespace lms::integration
