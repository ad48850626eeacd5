/**
 * @file sqlite_course_directory.hpp
 * @brief SQLite implementation of the user, course and enrollment lookups
 *
 * The surrounding application owns these records; this class reads them
 * from the same database as the category tables so that the course-count
 * precondition of a category delete runs inside the delete's transaction.
 * The seeding methods exist for embedding applications and tests.
 */

#pragma once

#include "access_database.hpp"

#include <lms/core/result.hpp>
#include <lms/security/course_catalog_interface.hpp>
#include <lms/security/enrollment_lookup_interface.hpp>
#include <lms/security/user_directory_interface.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace lms::storage {

/**
 * @brief Course, enrollment and user lookups over the shared connection
 *
 * Thread Safety: operations serialize on the database connection mutex.
 */
class sqlite_course_directory final : public security::course_catalog_interface,
                                      public security::enrollment_lookup_interface,
                                      public security::user_directory_interface {
public:
    template <typename T> using Result = lms::Result<T>;

    explicit sqlite_course_directory(std::shared_ptr<access_database> db);
    ~sqlite_course_directory() override = default;

    // ========================================================================
    // course_catalog_interface
    // ========================================================================

    [[nodiscard]] auto find_course(std::int64_t course_id)
        -> Result<std::optional<security::course_ref>> override;

    [[nodiscard]] auto count_courses_by_category(std::int64_t category_id)
        -> Result<std::size_t> override;

    [[nodiscard]] auto list_courses_by_category(std::int64_t category_id)
        -> Result<std::vector<security::course_ref>> override;

    [[nodiscard]] auto list_all_courses()
        -> Result<std::vector<security::course_ref>> override;

    // ========================================================================
    // enrollment_lookup_interface
    // ========================================================================

    [[nodiscard]] auto find_enrollment(std::int64_t user_id, std::int64_t course_id)
        -> Result<std::optional<security::enrollment>> override;

    [[nodiscard]] auto list_enrollments_for_user(std::int64_t user_id)
        -> Result<std::vector<security::enrollment>> override;

    // ========================================================================
    // user_directory_interface
    // ========================================================================

    [[nodiscard]] auto find_user(std::int64_t user_id)
        -> Result<std::optional<security::user_account>> override;

    // ========================================================================
    // Seeding
    // ========================================================================

    /**
     * @brief Insert or replace a user
     */
    [[nodiscard]] auto upsert_user(const security::user_account& user) -> VoidResult;

    /**
     * @brief Insert or replace a course
     *
     * @return error if category_id names a category that does not exist
     */
    [[nodiscard]] auto upsert_course(const security::course_ref& course) -> VoidResult;

    /**
     * @brief Insert or replace the enrollment of a user in a course
     *
     * @return The enrollment with its assigned id
     */
    [[nodiscard]] auto upsert_enrollment(const security::enrollment& record)
        -> Result<security::enrollment>;

private:
    [[nodiscard]] auto query_courses(std::string_view sql,
                                     std::optional<std::int64_t> param)
        -> Result<std::vector<security::course_ref>>;

    std::shared_ptr<access_database> db_;
};

}  // namespace lms::storage
