/**
 * @file migration_runner.hpp
 * @brief Versioned schema setup for the access database
 *
 * This file provides the migration_runner class, which brings a SQLite
 * database up to the schema the category and role stores expect.
 *
 * Schema versions:
 * - v1: categories, category_role_assignments and the collaborator tables
 *   (users, courses, enrollments) with their indexes and constraints
 * - v2: triggers rejecting self-parented categories and maintaining
 *   categories.updated_at
 */

#pragma once

#include "migration_record.hpp"

#include <kcenon/common/patterns/result.h>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

// Forward declaration of SQLite handle
struct sqlite3;

namespace lms::storage {

/// Result type alias for void operations
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Function type for a single schema step
 *
 * A step executes the DDL for exactly one version. The runner wraps it in
 * a transaction and records the version once it succeeds.
 *
 * @param db The SQLite database handle
 * @return VoidResult Success or error information
 */
using migration_function = std::function<VoidResult(sqlite3* db)>;

/**
 * @brief Applies the access schema in version order
 *
 * The applied versions are kept in a schema_version table, one row per
 * version with its description and the time it was applied. Opening an
 * existing database only runs the steps it has not seen yet.
 *
 * Thread Safety: This class is NOT thread-safe. access_database calls it
 * once while opening, before the connection is shared.
 *
 * @example
 * @code
 * migration_runner runner;
 * if (runner.needs_migration(db)) {
 *     auto result = runner.run_migrations(db);
 *     if (result.is_err()) {
 *         return result;
 *     }
 * }
 * @endcode
 */
class migration_runner {
public:
    migration_runner();
    ~migration_runner() = default;

    migration_runner(const migration_runner&) = delete;
    auto operator=(const migration_runner&) -> migration_runner& = delete;
    migration_runner(migration_runner&&) = delete;
    auto operator=(migration_runner&&) -> migration_runner& = delete;

    // ========================================================================
    // Migration Operations
    // ========================================================================

    /**
     * @brief Apply every step above the current version
     *
     * Each step runs in its own transaction. A failing step is rolled back,
     * so the database stays at the last version that succeeded.
     *
     * @param db The SQLite database handle
     * @return VoidResult Success, or database_migration_error naming the
     *         version that failed
     */
    [[nodiscard]] auto run_migrations(sqlite3* db) -> VoidResult;

    /**
     * @brief Apply steps up to and including target_version
     *
     * A target at or below the current version does nothing. A target
     * above get_latest_version() is an error and applies nothing.
     *
     * @param db The SQLite database handle
     * @param target_version Highest version to apply
     * @return VoidResult Success or error information
     */
    [[nodiscard]] auto run_migrations_to(sqlite3* db, int target_version)
        -> VoidResult;

    // ========================================================================
    // Version Information
    // ========================================================================

    /**
     * @brief Highest applied version, 0 for a fresh database
     */
    [[nodiscard]] auto get_current_version(sqlite3* db) const -> int;

    [[nodiscard]] auto get_latest_version() const noexcept -> int;

    /**
     * @brief Check whether any step is still pending
     */
    [[nodiscard]] auto needs_migration(sqlite3* db) const -> bool;

    /**
     * @brief Applied versions in ascending order
     *
     * @param db The SQLite database handle
     * @return One record per applied version, empty for a fresh database
     */
    [[nodiscard]] auto get_history(sqlite3* db) const
        -> std::vector<migration_record>;

private:
    [[nodiscard]] auto ensure_schema_version_table(sqlite3* db) -> VoidResult;

    /**
     * @brief Run one registered step inside its own transaction
     */
    [[nodiscard]] auto apply_migration(sqlite3* db, int version) -> VoidResult;

    [[nodiscard]] auto record_migration(sqlite3* db, int version,
                                        std::string_view description)
        -> VoidResult;
    [[nodiscard]] auto execute_sql(sqlite3* db, std::string_view sql)
        -> VoidResult;

    // Schema steps
    [[nodiscard]] auto migrate_v1(sqlite3* db) -> VoidResult;
    [[nodiscard]] auto migrate_v2(sqlite3* db) -> VoidResult;

    /// Latest schema version (increment when adding a step)
    static constexpr int LATEST_VERSION = 2;

    /// Registered steps, keyed by the version they produce
    std::vector<std::pair<int, migration_function>> migrations_;
};

}  // namespace lms::storage
