/**
 * @file sqlite_course_directory.cpp
 * @brief Implementation of the SQLite collaborator lookups
 */

#include <lms/storage/sqlite_course_directory.hpp>

#include "sqlite_statement.hpp"

#include <lms/compat/format.hpp>

#include <sqlite3.h>

namespace lms::storage {

using detail::get_int64_column;
using detail::get_optional_int64_column;
using detail::get_text_column;
using detail::statement;
using security::course_ref;
using security::enrollment;
using security::user_account;

namespace {

constexpr const char* kModule = "storage";

template <typename T>
[[nodiscard]] auto query_error(sqlite3* db, std::string_view what) -> Result<T> {
    return lms_error<T>(
        error_codes::database_query_error,
        lms::compat::format("Failed to {}: {}", what, sqlite3_errmsg(db)),
        kModule);
}

[[nodiscard]] auto parse_enrollment(sqlite3_stmt* stmt) -> enrollment {
    enrollment record;
    record.id = get_int64_column(stmt, 0);
    record.user_id = get_int64_column(stmt, 1);
    record.course_id = get_int64_column(stmt, 2);
    // Unrecognized roles and states never grant access
    auto role = security::parse_course_role(get_text_column(stmt, 3));
    record.role = role.value_or(security::course_role::student);
    record.status = security::parse_enrollment_status(get_text_column(stmt, 4))
                        .value_or(security::enrollment_status::inactive);
    if (!role) {
        record.status = security::enrollment_status::inactive;
    }
    return record;
}

}  // namespace

sqlite_course_directory::sqlite_course_directory(std::shared_ptr<access_database> db)
    : db_(std::move(db)) {}

// =============================================================================
// Courses
// =============================================================================

auto sqlite_course_directory::find_course(std::int64_t course_id)
    -> Result<std::optional<course_ref>> {
    auto rows = query_courses("SELECT id, category_id FROM courses WHERE id = ?;",
                              course_id);
    if (rows.is_err()) {
        return Result<std::optional<course_ref>>(rows.error());
    }
    if (rows.value().empty()) {
        return std::optional<course_ref>{};
    }
    return std::optional<course_ref>(rows.value().front());
}

auto sqlite_course_directory::count_courses_by_category(std::int64_t category_id)
    -> Result<std::size_t> {
    std::lock_guard lock(db_->mutex());

    statement stmt(db_->handle(),
                   "SELECT COUNT(*) FROM courses WHERE category_id = ?;");
    if (!stmt.prepared()) {
        return query_error<std::size_t>(db_->handle(), "prepare course count");
    }
    stmt.bind(1, category_id);

    if (stmt.step() != SQLITE_ROW) {
        return query_error<std::size_t>(db_->handle(), "count courses");
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

auto sqlite_course_directory::list_courses_by_category(std::int64_t category_id)
    -> Result<std::vector<course_ref>> {
    return query_courses(
        "SELECT id, category_id FROM courses WHERE category_id = ? ORDER BY id;",
        category_id);
}

auto sqlite_course_directory::list_all_courses() -> Result<std::vector<course_ref>> {
    return query_courses("SELECT id, category_id FROM courses ORDER BY id;",
                         std::nullopt);
}

auto sqlite_course_directory::upsert_course(const course_ref& course) -> VoidResult {
    std::lock_guard lock(db_->mutex());

    statement stmt(db_->handle(),
                   "INSERT INTO courses (id, category_id) VALUES (?, ?) "
                   "ON CONFLICT(id) DO UPDATE SET category_id = excluded.category_id;");
    if (!stmt.prepared()) {
        return query_error<std::monostate>(db_->handle(), "prepare course upsert");
    }
    stmt.bind(1, course.id);
    stmt.bind(2, course.category_id);

    if (stmt.step() != SQLITE_DONE) {
        return query_error<std::monostate>(db_->handle(), "store course");
    }
    return ok();
}

// =============================================================================
// Enrollments
// =============================================================================

auto sqlite_course_directory::find_enrollment(std::int64_t user_id,
                                              std::int64_t course_id)
    -> Result<std::optional<enrollment>> {
    std::lock_guard lock(db_->mutex());

    statement stmt(db_->handle(),
                   "SELECT id, user_id, course_id, role, status FROM enrollments "
                   "WHERE user_id = ? AND course_id = ?;");
    if (!stmt.prepared()) {
        return query_error<std::optional<enrollment>>(db_->handle(),
                                                      "prepare enrollment lookup");
    }
    stmt.bind(1, user_id);
    stmt.bind(2, course_id);

    auto rc = stmt.step();
    if (rc == SQLITE_ROW) {
        return std::optional<enrollment>(parse_enrollment(stmt.get()));
    }
    if (rc == SQLITE_DONE) {
        return std::optional<enrollment>{};
    }
    return query_error<std::optional<enrollment>>(db_->handle(),
                                                  "look up enrollment");
}

auto sqlite_course_directory::list_enrollments_for_user(std::int64_t user_id)
    -> Result<std::vector<enrollment>> {
    std::lock_guard lock(db_->mutex());

    statement stmt(db_->handle(),
                   "SELECT id, user_id, course_id, role, status FROM enrollments "
                   "WHERE user_id = ? ORDER BY course_id;");
    if (!stmt.prepared()) {
        return query_error<std::vector<enrollment>>(db_->handle(),
                                                    "prepare enrollment listing");
    }
    stmt.bind(1, user_id);

    std::vector<enrollment> records;
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        records.push_back(parse_enrollment(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        return query_error<std::vector<enrollment>>(db_->handle(),
                                                    "list enrollments");
    }
    return records;
}

auto sqlite_course_directory::upsert_enrollment(const enrollment& record)
    -> Result<enrollment> {
    std::lock_guard lock(db_->mutex());

    statement stmt(db_->handle(),
                   "INSERT INTO enrollments (user_id, course_id, role, status) "
                   "VALUES (?, ?, ?, ?) "
                   "ON CONFLICT(user_id, course_id) DO UPDATE SET "
                   "role = excluded.role, status = excluded.status "
                   "RETURNING id, user_id, course_id, role, status;");
    if (!stmt.prepared()) {
        return query_error<enrollment>(db_->handle(), "prepare enrollment upsert");
    }
    stmt.bind(1, record.user_id);
    stmt.bind(2, record.course_id);
    stmt.bind(3, security::to_string(record.role));
    stmt.bind(4, security::to_string(record.status));

    if (stmt.step() != SQLITE_ROW) {
        return query_error<enrollment>(db_->handle(), "store enrollment");
    }
    auto stored = parse_enrollment(stmt.get());
    (void)stmt.step();
    return stored;
}

// =============================================================================
// Users
// =============================================================================

auto sqlite_course_directory::find_user(std::int64_t user_id)
    -> Result<std::optional<user_account>> {
    std::lock_guard lock(db_->mutex());

    statement stmt(db_->handle(), "SELECT id, global_role FROM users WHERE id = ?;");
    if (!stmt.prepared()) {
        return query_error<std::optional<user_account>>(db_->handle(),
                                                        "prepare user lookup");
    }
    stmt.bind(1, user_id);

    auto rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return std::optional<user_account>{};
    }
    if (rc != SQLITE_ROW) {
        return query_error<std::optional<user_account>>(db_->handle(),
                                                        "look up user");
    }

    user_account user;
    user.id = get_int64_column(stmt.get(), 0);
    user.role = security::parse_global_role(get_text_column(stmt.get(), 1))
                    .value_or(security::global_role::user);
    return std::optional<user_account>(user);
}

auto sqlite_course_directory::upsert_user(const user_account& user) -> VoidResult {
    std::lock_guard lock(db_->mutex());

    statement stmt(db_->handle(),
                   "INSERT INTO users (id, global_role) VALUES (?, ?) "
                   "ON CONFLICT(id) DO UPDATE SET global_role = excluded.global_role;");
    if (!stmt.prepared()) {
        return query_error<std::monostate>(db_->handle(), "prepare user upsert");
    }
    stmt.bind(1, user.id);
    stmt.bind(2, security::to_string(user.role));

    if (stmt.step() != SQLITE_DONE) {
        return query_error<std::monostate>(db_->handle(), "store user");
    }
    return ok();
}

// =============================================================================
// Private Helpers
// =============================================================================

auto sqlite_course_directory::query_courses(std::string_view sql,
                                            std::optional<std::int64_t> param)
    -> Result<std::vector<course_ref>> {
    std::lock_guard lock(db_->mutex());

    statement stmt(db_->handle(), sql);
    if (!stmt.prepared()) {
        return query_error<std::vector<course_ref>>(db_->handle(),
                                                    "prepare course query");
    }
    if (param) {
        stmt.bind(1, *param);
    }

    std::vector<course_ref> courses;
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        course_ref course;
        course.id = get_int64_column(stmt.get(), 0);
        course.category_id = get_optional_int64_column(stmt.get(), 1);
        courses.push_back(course);
    }
    if (rc != SQLITE_DONE) {
        return query_error<std::vector<course_ref>>(db_->handle(), "read courses");
    }
    return courses;
}

}  // namespace lms::storage
