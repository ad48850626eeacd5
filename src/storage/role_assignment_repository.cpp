/**
 * @file role_assignment_repository.cpp
 * @brief Implementation of the role assignment store
 */

#include <lms/storage/role_assignment_repository.hpp>

#include "sqlite_statement.hpp"

#include <lms/compat/format.hpp>
#include <lms/integration/logger_adapter.hpp>

#include <sqlite3.h>

#include <chrono>

namespace lms::storage {

using detail::get_int64_column;
using detail::get_optional_text_column;
using detail::get_text_column;
using detail::statement;
using integration::logger_adapter;
using integration::role_operation;
using security::category_role;

namespace {

constexpr const char* kModule = "role_store";

constexpr const char* kColumns =
    "id, user_id, category_id, role, assigned_by, assigned_at, notes";

[[nodiscard]] auto parse_row(sqlite3_stmt* stmt) -> role_assignment_record {
    role_assignment_record record;
    record.id = get_int64_column(stmt, 0);
    record.user_id = get_int64_column(stmt, 1);
    record.category_id = get_int64_column(stmt, 2);
    // The CHECK constraint on the role column admits only known names
    record.role = security::parse_category_role(get_text_column(stmt, 3))
                      .value_or(category_role::reviewer);
    record.assigned_by = get_int64_column(stmt, 4);
    record.assigned_at = detail::from_timestamp_string(get_text_column(stmt, 5));
    record.notes = get_optional_text_column(stmt, 6);
    return record;
}

template <typename T>
[[nodiscard]] auto query_error(sqlite3* db, std::string_view what) -> Result<T> {
    return lms_error<T>(
        error_codes::database_query_error,
        lms::compat::format("Failed to {}: {}", what, sqlite3_errmsg(db)),
        kModule);
}

}  // namespace

role_assignment_repository::role_assignment_repository(
    std::shared_ptr<access_database> db,
    std::shared_ptr<security::user_directory_interface> users,
    std::shared_ptr<di::ILogger> logger)
    : db_(std::move(db)),
      users_(std::move(users)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

// =============================================================================
// Mutations
// =============================================================================

auto role_assignment_repository::assign(const role_grant& grant)
    -> Result<role_assignment_record> {
    auto result = db_->in_transaction<role_assignment_record>(
        [&]() -> Result<role_assignment_record> {
            auto valid = validate_references(grant.user_id, grant.category_id);
            if (valid.is_err()) {
                return Result<role_assignment_record>(valid.error());
            }

            auto sql = lms::compat::format(
                "INSERT INTO category_role_assignments "
                "(user_id, category_id, role, assigned_by, assigned_at, notes) "
                "VALUES (?, ?, ?, ?, ?, ?) "
                "ON CONFLICT(user_id, category_id) DO UPDATE SET "
                "role = excluded.role, "
                "assigned_by = excluded.assigned_by, "
                "assigned_at = excluded.assigned_at, "
                "notes = excluded.notes "
                "RETURNING {};",
                kColumns);

            statement stmt(db_->handle(), sql);
            if (!stmt.prepared()) {
                return query_error<role_assignment_record>(db_->handle(),
                                                           "prepare upsert");
            }

            auto assigned_at =
                detail::to_timestamp_string(std::chrono::system_clock::now());
            stmt.bind(1, grant.user_id);
            stmt.bind(2, grant.category_id);
            stmt.bind(3, security::to_string(grant.role));
            stmt.bind(4, grant.assigned_by);
            stmt.bind(5, std::string_view{assigned_at});
            stmt.bind(6, grant.notes);

            if (stmt.step() != SQLITE_ROW) {
                return query_error<role_assignment_record>(db_->handle(),
                                                           "assign role");
            }
            return parse_row(stmt.get());
        });

    if (result.is_err()) {
        logger_->warn_fmt("Role assign user={} category={} failed: {}",
                          grant.user_id, grant.category_id,
                          result.error().message);
        return result;
    }

    logger_adapter::log_role_change(role_operation::assign, grant.user_id,
                                    grant.category_id,
                                    std::string(security::to_string(grant.role)),
                                    grant.assigned_by);
    return result;
}

auto role_assignment_repository::revoke(std::int64_t user_id,
                                        std::int64_t category_id,
                                        std::optional<std::int64_t> actor_id)
    -> VoidResult {
    std::optional<category_role> previous;

    auto result = db_->in_transaction<std::monostate>([&]() -> VoidResult {
        auto existing = find(user_id, category_id);
        if (existing.is_err()) {
            return VoidResult(existing.error());
        }
        if (!existing.value()) {
            return lms_void_error(
                error_codes::not_found,
                lms::compat::format("No role assignment for user {} on category {}",
                                    user_id, category_id),
                kModule);
        }
        previous = existing.value()->role;

        statement stmt(db_->handle(),
                       "DELETE FROM category_role_assignments "
                       "WHERE user_id = ? AND category_id = ?;");
        if (!stmt.prepared()) {
            return query_error<std::monostate>(db_->handle(), "prepare revoke");
        }
        stmt.bind(1, user_id);
        stmt.bind(2, category_id);

        if (stmt.step() != SQLITE_DONE) {
            return query_error<std::monostate>(db_->handle(), "revoke role");
        }
        return ok();
    });

    if (result.is_err()) {
        return result;
    }

    logger_adapter::log_role_change(role_operation::revoke, user_id, category_id,
                                    std::string(security::to_string(*previous)),
                                    actor_id);
    return result;
}

auto role_assignment_repository::update(std::int64_t assignment_id,
                                        category_role role,
                                        std::optional<std::int64_t> actor_id)
    -> Result<role_assignment_record> {
    auto result = db_->in_transaction<role_assignment_record>(
        [&]() -> Result<role_assignment_record> {
            auto sql = lms::compat::format(
                "UPDATE category_role_assignments SET role = ? WHERE id = ? "
                "RETURNING {};",
                kColumns);

            statement stmt(db_->handle(), sql);
            if (!stmt.prepared()) {
                return query_error<role_assignment_record>(db_->handle(),
                                                           "prepare role update");
            }
            stmt.bind(1, security::to_string(role));
            stmt.bind(2, assignment_id);

            auto rc = stmt.step();
            if (rc == SQLITE_DONE) {
                return lms_error<role_assignment_record>(
                    error_codes::not_found,
                    lms::compat::format("Role assignment {} not found",
                                        assignment_id),
                    kModule);
            }
            if (rc != SQLITE_ROW) {
                return query_error<role_assignment_record>(db_->handle(),
                                                           "update role");
            }
            auto record = parse_row(stmt.get());
            // Drain so the UPDATE completes before the statement is finalized
            (void)stmt.step();
            return record;
        });

    if (result.is_err()) {
        return result;
    }

    const auto& updated = result.value();
    logger_adapter::log_role_change(role_operation::update, updated.user_id,
                                    updated.category_id,
                                    std::string(security::to_string(updated.role)),
                                    actor_id);
    return result;
}

// =============================================================================
// Queries
// =============================================================================

auto role_assignment_repository::find(std::int64_t user_id,
                                      std::int64_t category_id)
    -> Result<std::optional<role_assignment_record>> {
    std::lock_guard lock(db_->mutex());

    auto sql = lms::compat::format(
        "SELECT {} FROM category_role_assignments "
        "WHERE user_id = ? AND category_id = ?;",
        kColumns);

    statement stmt(db_->handle(), sql);
    if (!stmt.prepared()) {
        return query_error<std::optional<role_assignment_record>>(
            db_->handle(), "prepare role lookup");
    }
    stmt.bind(1, user_id);
    stmt.bind(2, category_id);

    auto rc = stmt.step();
    if (rc == SQLITE_ROW) {
        return std::optional<role_assignment_record>(parse_row(stmt.get()));
    }
    if (rc == SQLITE_DONE) {
        return std::optional<role_assignment_record>{};
    }
    return query_error<std::optional<role_assignment_record>>(db_->handle(),
                                                              "look up role");
}

auto role_assignment_repository::find_by_id(std::int64_t assignment_id)
    -> Result<role_assignment_record> {
    auto rows = query_list("id = ?", assignment_id);
    if (rows.is_err()) {
        return Result<role_assignment_record>(rows.error());
    }
    if (rows.value().empty()) {
        return lms_error<role_assignment_record>(
            error_codes::not_found,
            lms::compat::format("Role assignment {} not found", assignment_id),
            kModule);
    }
    return rows.value().front();
}

auto role_assignment_repository::list_for_user(std::int64_t user_id)
    -> Result<std::vector<role_assignment_record>> {
    return query_list("user_id = ?", user_id);
}

auto role_assignment_repository::list_for_category(std::int64_t category_id)
    -> Result<std::vector<role_assignment_record>> {
    return query_list("category_id = ?", category_id);
}

auto role_assignment_repository::check_role(
    std::int64_t user_id, std::int64_t category_id,
    std::optional<category_role> required)
    -> Result<std::optional<category_role>> {
    auto assignment = find(user_id, category_id);
    if (assignment.is_err()) {
        return Result<std::optional<category_role>>(assignment.error());
    }
    if (!assignment.value()) {
        return std::optional<category_role>{};
    }

    auto role = assignment.value()->role;
    if (required && *required != role) {
        return std::optional<category_role>{};
    }
    return std::optional<category_role>(role);
}

// =============================================================================
// Private Helpers
// =============================================================================

auto role_assignment_repository::query_list(std::string_view where,
                                            std::int64_t param)
    -> Result<std::vector<role_assignment_record>> {
    std::lock_guard lock(db_->mutex());

    auto sql = lms::compat::format(
        "SELECT {} FROM category_role_assignments WHERE {};", kColumns, where);

    statement stmt(db_->handle(), sql);
    if (!stmt.prepared()) {
        return query_error<std::vector<role_assignment_record>>(
            db_->handle(), "prepare role listing");
    }
    stmt.bind(1, param);

    std::vector<role_assignment_record> records;
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        records.push_back(parse_row(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        return query_error<std::vector<role_assignment_record>>(db_->handle(),
                                                                "list roles");
    }
    return records;
}

auto role_assignment_repository::validate_references(std::int64_t user_id,
                                                     std::int64_t category_id)
    -> VoidResult {
    if (users_) {
        auto user = users_->find_user(user_id);
        if (user.is_err()) {
            return VoidResult(user.error());
        }
        if (!user.value()) {
            return lms_void_error(
                error_codes::not_found,
                lms::compat::format("User {} not found", user_id), kModule);
        }
    }

    statement stmt(db_->handle(), "SELECT 1 FROM categories WHERE id = ?;");
    if (!stmt.prepared()) {
        return query_error<std::monostate>(db_->handle(),
                                           "prepare category lookup");
    }
    stmt.bind(1, category_id);

    auto rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return lms_void_error(
            error_codes::not_found,
            lms::compat::format("Category {} not found", category_id), kModule);
    }
    if (rc != SQLITE_ROW) {
        return query_error<std::monostate>(db_->handle(), "look up category");
    }
    return ok();
}

}  // namespace lms::storage
