/**
 * @file migration_runner.cpp
 * @brief Implementation of database schema migration runner
 */

#include <lms/storage/migration_runner.hpp>

#include <lms/compat/format.hpp>
#include <lms/core/result.hpp>

#include <sqlite3.h>

namespace lms::storage {

using kcenon::common::ok;
using kcenon::common::make_error;

// ============================================================================
// Construction
// ============================================================================

migration_runner::migration_runner() {
    migrations_.push_back({1, [this](sqlite3* db) { return migrate_v1(db); }});
    migrations_.push_back({2, [this](sqlite3* db) { return migrate_v2(db); }});
}

// ============================================================================
// Migration Operations
// ============================================================================

auto migration_runner::run_migrations(sqlite3* db) -> VoidResult {
    return run_migrations_to(db, LATEST_VERSION);
}

auto migration_runner::run_migrations_to(sqlite3* db, int target_version)
    -> VoidResult {
    if (target_version > LATEST_VERSION) {
        return make_error<std::monostate>(
            error_codes::database_migration_error,
            lms::compat::format("Target version {} exceeds latest version {}",
                                target_version, LATEST_VERSION),
            "storage");
    }

    auto ensure_result = ensure_schema_version_table(db);
    if (ensure_result.is_err()) {
        return ensure_result;
    }

    auto current_version = get_current_version(db);

    while (current_version < target_version) {
        auto next_version = current_version + 1;

        auto begin_result = execute_sql(db, "BEGIN TRANSACTION;");
        if (begin_result.is_err()) {
            return begin_result;
        }

        auto migration_result = apply_migration(db, next_version);
        if (migration_result.is_err()) {
            (void)execute_sql(db, "ROLLBACK;");
            return migration_result;
        }

        auto commit_result = execute_sql(db, "COMMIT;");
        if (commit_result.is_err()) {
            (void)execute_sql(db, "ROLLBACK;");
            return commit_result;
        }

        current_version = next_version;
    }

    return ok();
}

// ============================================================================
// Version Information
// ============================================================================

auto migration_runner::get_current_version(sqlite3* db) const -> int {
    const char* check_sql =
        "SELECT name FROM sqlite_master WHERE type='table' AND name='schema_version';";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, check_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return 0;
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW) {
        return 0;
    }

    const char* version_sql = "SELECT MAX(version) FROM schema_version;";
    rc = sqlite3_prepare_v2(db, version_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return 0;
    }

    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        // sqlite3_column_int returns 0 for NULL
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);

    return version;
}

auto migration_runner::get_latest_version() const noexcept -> int {
    return LATEST_VERSION;
}

auto migration_runner::needs_migration(sqlite3* db) const -> bool {
    return get_current_version(db) < LATEST_VERSION;
}

auto migration_runner::get_history(sqlite3* db) const
    -> std::vector<migration_record> {
    std::vector<migration_record> history;

    const char* sql =
        "SELECT version, description, applied_at FROM schema_version ORDER BY version;";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return history;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        migration_record record;
        record.version = sqlite3_column_int(stmt, 0);

        const auto* desc = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        record.description = desc ? desc : "";

        const auto* applied = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        record.applied_at = applied ? applied : "";

        history.push_back(std::move(record));
    }

    sqlite3_finalize(stmt);
    return history;
}

// ============================================================================
// Internal Implementation
// ============================================================================

auto migration_runner::ensure_schema_version_table(sqlite3* db) -> VoidResult {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version     INTEGER PRIMARY KEY,
            description TEXT NOT NULL,
            applied_at  TEXT NOT NULL DEFAULT (datetime('now'))
        );
    )";

    return execute_sql(db, sql);
}

auto migration_runner::apply_migration(sqlite3* db, int version) -> VoidResult {
    for (const auto& [ver, func] : migrations_) {
        if (ver == version) {
            return func(db);
        }
    }

    return make_error<std::monostate>(
        error_codes::database_migration_error,
        lms::compat::format("Migration for version {} not found", version),
        "storage");
}

auto migration_runner::record_migration(sqlite3* db, int version,
                                        std::string_view description)
    -> VoidResult {
    const char* sql =
        "INSERT INTO schema_version (version, description) VALUES (?, ?);";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return make_error<std::monostate>(
            error_codes::database_migration_error,
            lms::compat::format("Failed to prepare statement: {}",
                                sqlite3_errmsg(db)),
            "storage");
    }

    sqlite3_bind_int(stmt, 1, version);
    sqlite3_bind_text(stmt, 2, description.data(),
                      static_cast<int>(description.size()), SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return make_error<std::monostate>(
            error_codes::database_migration_error,
            lms::compat::format("Failed to record migration: {}",
                                sqlite3_errmsg(db)),
            "storage");
    }

    return ok();
}

auto migration_runner::execute_sql(sqlite3* db, std::string_view sql)
    -> VoidResult {
    char* errmsg = nullptr;
    auto rc = sqlite3_exec(db, std::string(sql).c_str(), nullptr, nullptr, &errmsg);

    if (rc != SQLITE_OK) {
        auto error_str = errmsg ? std::string(errmsg) : "Unknown error";
        sqlite3_free(errmsg);

        return make_error<std::monostate>(
            error_codes::database_migration_error,
            lms::compat::format("SQL execution failed: {}", error_str),
            "storage");
    }

    return ok();
}

// ============================================================================
// Migration Implementations
// ============================================================================

auto migration_runner::migrate_v1(sqlite3* db) -> VoidResult {
    // V1: Initial schema
    const char* sql = R"(
        -- =====================================================================
        -- CATEGORIES TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS categories (
            id          INTEGER PRIMARY KEY AUTOINCREMENT,
            name        TEXT NOT NULL CHECK (length(name) > 0),
            parent_id   INTEGER REFERENCES categories(id) ON DELETE RESTRICT,
            created_at  TEXT NOT NULL DEFAULT (datetime('now')),
            updated_at  TEXT NOT NULL DEFAULT (datetime('now'))
        );

        CREATE INDEX IF NOT EXISTS idx_categories_parent ON categories(parent_id);
        CREATE INDEX IF NOT EXISTS idx_categories_name ON categories(name);

        -- =====================================================================
        -- CATEGORY ROLE ASSIGNMENTS TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS category_role_assignments (
            id          INTEGER PRIMARY KEY AUTOINCREMENT,
            user_id     INTEGER NOT NULL,
            category_id INTEGER NOT NULL
                        REFERENCES categories(id) ON DELETE CASCADE,
            role        TEXT NOT NULL CHECK (role IN (
                            'category-admin',
                            'category-coordinator',
                            'category-reviewer')),
            assigned_by INTEGER NOT NULL DEFAULT 0,
            assigned_at TEXT NOT NULL,
            notes       TEXT,
            UNIQUE (user_id, category_id)
        );

        CREATE INDEX IF NOT EXISTS idx_role_assignments_user
            ON category_role_assignments(user_id);
        CREATE INDEX IF NOT EXISTS idx_role_assignments_category
            ON category_role_assignments(category_id);

        -- =====================================================================
        -- COLLABORATOR TABLES (users, courses, enrollments)
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS users (
            id          INTEGER PRIMARY KEY,
            global_role TEXT NOT NULL DEFAULT 'user'
        );

        CREATE TABLE IF NOT EXISTS courses (
            id          INTEGER PRIMARY KEY,
            category_id INTEGER REFERENCES categories(id) ON DELETE RESTRICT
        );

        CREATE INDEX IF NOT EXISTS idx_courses_category ON courses(category_id);

        CREATE TABLE IF NOT EXISTS enrollments (
            id          INTEGER PRIMARY KEY AUTOINCREMENT,
            user_id     INTEGER NOT NULL,
            course_id   INTEGER NOT NULL REFERENCES courses(id) ON DELETE CASCADE,
            role        TEXT NOT NULL
                CHECK (role IN ('student', 'ta', 'teacher', 'manager')),
            status      TEXT NOT NULL DEFAULT 'active'
                CHECK (status IN ('active', 'inactive', 'completed', 'dropped')),
            UNIQUE (user_id, course_id)
        );

        CREATE INDEX IF NOT EXISTS idx_enrollments_user ON enrollments(user_id);
    )";

    auto result = execute_sql(db, sql);
    if (result.is_err()) {
        return result;
    }

    return record_migration(db, 1, "Initial schema");
}

auto migration_runner::migrate_v2(sqlite3* db) -> VoidResult {
    // V2: Integrity triggers guarding the parent link at the storage level
    const char* sql = R"(
        CREATE TRIGGER IF NOT EXISTS trg_categories_no_self_parent_insert
        BEFORE INSERT ON categories
        WHEN NEW.parent_id IS NOT NULL AND NEW.parent_id = NEW.id
        BEGIN
            SELECT RAISE(ABORT, 'category cannot be its own parent');
        END;

        CREATE TRIGGER IF NOT EXISTS trg_categories_no_self_parent_update
        BEFORE UPDATE OF parent_id ON categories
        WHEN NEW.parent_id IS NOT NULL AND NEW.parent_id = NEW.id
        BEGIN
            SELECT RAISE(ABORT, 'category cannot be its own parent');
        END;

        CREATE TRIGGER IF NOT EXISTS trg_categories_touch_updated_at
        AFTER UPDATE OF name, parent_id ON categories
        BEGIN
            UPDATE categories SET updated_at = datetime('now') WHERE id = NEW.id;
        END;
    )";

    auto result = execute_sql(db, sql);
    if (result.is_err()) {
        return result;
    }

    return record_migration(db, 2, "Category integrity triggers");
}

}  // namespace lms::storage
