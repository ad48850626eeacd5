/**
 * @file access_engine.cpp
 * @brief Implementation of the engine facade
 */

#include <lms/services/access_engine.hpp>

#include <lms/integration/logger_adapter.hpp>
#include <lms/security/course_access_resolver.hpp>
#include <lms/security/effective_role_resolver.hpp>
#include <lms/services/category_aggregator.hpp>
#include <lms/storage/category_repository.hpp>
#include <lms/storage/role_assignment_repository.hpp>
#include <lms/storage/sqlite_course_directory.hpp>

namespace lms::services {

auto access_engine::open(std::string_view path,
                         const access_engine_config& config,
                         std::shared_ptr<di::ILogger> logger)
    -> Result<std::unique_ptr<access_engine>> {
    if (!logger) {
        logger = di::null_logger();
    }

    auto db = storage::access_database::open(path, config.database);
    if (db.is_err()) {
        logger->error_fmt("Failed to open access database '{}': {}", path,
                          db.error().message);
        return Result<std::unique_ptr<access_engine>>(db.error());
    }

    logger->info_fmt("Access database '{}' at schema version {}", path,
                     db.value()->schema_version());

    if (config.categories.max_depth) {
        integration::logger_adapter::log_security_event(
            integration::security_event_type::configuration_change,
            lms::compat::format("Category max depth set to {}",
                                *config.categories.max_depth));
    }

    return std::unique_ptr<access_engine>(
        new access_engine(db.value(), config, std::move(logger)));
}

access_engine::access_engine(std::shared_ptr<storage::access_database> db,
                             const access_engine_config& config,
                             std::shared_ptr<di::ILogger> logger)
    : config_(config), db_(std::move(db)) {
    directory_ = std::make_shared<storage::sqlite_course_directory>(db_);

    categories_ = std::make_shared<storage::category_repository>(
        db_, directory_, config_.categories, logger);

    roles_ = std::make_shared<storage::role_assignment_repository>(
        db_, directory_, logger);

    role_resolver_ = std::make_shared<security::effective_role_resolver>(
        categories_, roles_, logger);

    access_ = std::make_shared<security::course_access_resolver>(
        directory_, directory_, directory_, categories_, roles_, role_resolver_,
        logger);

    aggregator_ = std::make_shared<category_aggregator>(categories_, directory_,
                                                        logger);
}

access_engine::~access_engine() = default;

}  // namespace lms::services
