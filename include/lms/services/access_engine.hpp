/**
 * @file access_engine.hpp
 * @brief Wires the stores, resolvers and aggregator over one database
 *
 * This file provides the access_engine class, the entry point used by the
 * surrounding application. It opens the database, applies migrations and
 * creates every component sharing the same connection and logger.
 */

#pragma once

#include <lms/core/result.hpp>
#include <lms/di/ilogger.hpp>
#include <lms/storage/access_database.hpp>
#include <lms/storage/category_record.hpp>

#include <memory>
#include <string_view>

namespace lms::storage {
class category_repository;
class role_assignment_repository;
class sqlite_course_directory;
}  // namespace lms::storage

namespace lms::security {
class effective_role_resolver;
class course_access_resolver;
}  // namespace lms::security

namespace lms::services {

class category_aggregator;

/**
 * @brief Configuration of a whole engine instance
 */
struct access_engine_config {
    storage::database_config database;
    storage::category_store_config categories;
};

/**
 * @brief Engine facade owning every component
 *
 * Thread Safety: components share one connection and serialize on its
 * mutex; the engine itself holds no mutable state after open().
 *
 * @example
 * @code
 * access_engine_config config;
 * config.categories.max_depth = 5;
 *
 * auto engine = access_engine::open("lms.db", config,
 *                                   std::make_shared<di::LoggerService>());
 * if (engine.is_err()) { ... }
 *
 * auto& e = *engine.value();
 * auto science = e.categories().create("Science");
 * auto decision = e.access().check_access(user_id, course_id);
 * @endcode
 */
class access_engine {
public:
    /**
     * @brief Open the database at path and wire the components
     *
     * @param path Database file path, or ":memory:"
     * @param config Engine configuration
     * @param logger Logger injected into every component; null selects
     *               the shared NullLogger
     */
    [[nodiscard]] static auto open(std::string_view path,
                                   const access_engine_config& config = {},
                                   std::shared_ptr<di::ILogger> logger = nullptr)
        -> Result<std::unique_ptr<access_engine>>;

    ~access_engine();

    access_engine(const access_engine&) = delete;
    auto operator=(const access_engine&) -> access_engine& = delete;
    access_engine(access_engine&&) = delete;
    auto operator=(access_engine&&) -> access_engine& = delete;

    // =========================================================================
    // Component Accessors
    // =========================================================================

    [[nodiscard]] auto database() -> storage::access_database& { return *db_; }

    [[nodiscard]] auto categories() -> storage::category_repository& {
        return *categories_;
    }

    [[nodiscard]] auto roles() -> storage::role_assignment_repository& {
        return *roles_;
    }

    /**
     * @brief SQLite-backed user, course and enrollment lookups
     */
    [[nodiscard]] auto directory() -> storage::sqlite_course_directory& {
        return *directory_;
    }

    [[nodiscard]] auto aggregator() -> category_aggregator& { return *aggregator_; }

    [[nodiscard]] auto role_resolver() -> security::effective_role_resolver& {
        return *role_resolver_;
    }

    [[nodiscard]] auto access() -> security::course_access_resolver& {
        return *access_;
    }

    [[nodiscard]] auto config() const noexcept -> const access_engine_config& {
        return config_;
    }

private:
    access_engine(std::shared_ptr<storage::access_database> db,
                  const access_engine_config& config,
                  std::shared_ptr<di::ILogger> logger);

    access_engine_config config_;
    std::shared_ptr<storage::access_database> db_;
    std::shared_ptr<storage::sqlite_course_directory> directory_;
    std::shared_ptr<storage::category_repository> categories_;
    std::shared_ptr<storage::role_assignment_repository> roles_;
    std::shared_ptr<security::effective_role_resolver> role_resolver_;
    std::shared_ptr<security::course_access_resolver> access_;
    std::shared_ptr<category_aggregator> aggregator_;
};

}  // namespace lms::services
