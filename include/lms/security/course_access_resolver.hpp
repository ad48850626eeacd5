/**
 * @file course_access_resolver.hpp
 * @brief Course access decisions merging admin, enrollment and category grants
 *
 * This file provides the course_access_resolver class which decides whether
 * a user may open a course, and lists every course a user can reach.
 */

#pragma once

#include "category_role.hpp"
#include "course_catalog_interface.hpp"
#include "effective_role_resolver.hpp"
#include "enrollment_lookup_interface.hpp"
#include "user_directory_interface.hpp"

#include <lms/core/result.hpp>
#include <lms/di/ilogger.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lms::storage {
class category_repository;
class role_assignment_repository;
}  // namespace lms::storage

namespace lms::security {

/**
 * @brief Where an access decision came from
 */
enum class access_source {
    none,          ///< No access
    global_admin,  ///< System-wide administrator override
    enrollment,    ///< Active direct enrollment in the course
    category       ///< Role inherited from the course's category chain
};

constexpr std::string_view to_string(access_source source) {
    switch (source) {
        case access_source::global_admin: return "global-admin";
        case access_source::enrollment: return "enrollment";
        case access_source::category: return "category";
        case access_source::none: return "none";
    }
    return "none";
}

/// Course role reported for the global-admin override
inline constexpr std::string_view global_admin_course_role = "manager";

/**
 * @brief Result of a course access check
 *
 * "No access" is a regular result, never an error.
 */
struct course_access_result {
    bool has_access{false};
    access_source source{access_source::none};

    /// Enrollment role or category role name; unset when denied
    std::optional<std::string> role;

    static course_access_result granted(access_source source, std::string_view role) {
        return {true, source, std::string{role}};
    }
    static course_access_result denied() { return {}; }

    explicit operator bool() const { return has_access; }
};

/**
 * @brief One course reachable by a user
 */
struct course_access_info {
    std::int64_t course_id{0};
    access_source source{access_source::none};
    std::string role;
    std::optional<std::int64_t> category_id;
};

/**
 * @brief Callback for audit logging of access decisions
 */
using access_audit_callback =
    std::function<void(std::int64_t user_id, std::int64_t course_id,
                       const course_access_result& result)>;

/**
 * @brief Stateless course access resolver
 *
 * check_access() evaluates, in order:
 * 1. global admin: unconditional access
 * 2. active enrollment in the course
 * 3. effective category role on the course's category
 *
 * The first matching source decides. An enrollment is reported even when
 * the user also holds a category role covering the course.
 *
 * @example
 * @code
 * auto decision = access.check_access(user_id, course_id);
 * if (decision.is_ok() && decision.value()) {
 *     // decision.value().source, decision.value().role
 * }
 * @endcode
 */
class course_access_resolver {
public:
    course_access_resolver(std::shared_ptr<user_directory_interface> users,
                           std::shared_ptr<enrollment_lookup_interface> enrollments,
                           std::shared_ptr<course_catalog_interface> courses,
                           std::shared_ptr<storage::category_repository> categories,
                           std::shared_ptr<storage::role_assignment_repository> roles,
                           std::shared_ptr<effective_role_resolver> resolver,
                           std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Decide whether a user may access a course
     *
     * Unknown users are treated as non-admin; unknown or uncategorized
     * courses without an enrollment resolve to no access.
     *
     * @return The decision, or an error only when a lookup fails
     */
    [[nodiscard]] auto check_access(std::int64_t user_id, std::int64_t course_id)
        -> Result<course_access_result>;

    /**
     * @brief Effective category role on a course, ignoring enrollment and
     *        the admin override
     */
    [[nodiscard]] auto check_access_via_category(std::int64_t user_id,
                                                 std::int64_t course_id)
        -> Result<std::optional<category_role>>;

    /**
     * @brief Every course the user can reach, ordered by course id
     *
     * Global admins get the whole catalog. Otherwise active enrollments are
     * merged with the courses of every category below a granted category;
     * on conflict the enrollment entry is kept, and among category grants
     * the highest-priority role is reported.
     */
    [[nodiscard]] auto get_user_accessible_courses(std::int64_t user_id)
        -> Result<std::vector<course_access_info>>;

    void set_audit_callback(access_audit_callback callback);

private:
    [[nodiscard]] auto is_global_admin(std::int64_t user_id) -> Result<bool>;

    void record(std::int64_t user_id, std::int64_t course_id,
                const course_access_result& result);

    std::shared_ptr<user_directory_interface> users_;
    std::shared_ptr<enrollment_lookup_interface> enrollments_;
    std::shared_ptr<course_catalog_interface> courses_;
    std::shared_ptr<storage::category_repository> categories_;
    std::shared_ptr<storage::role_assignment_repository> roles_;
    std::shared_ptr<effective_role_resolver> resolver_;
    std::shared_ptr<di::ILogger> logger_;

    access_audit_callback audit_callback_;
    mutable std::mutex callback_mutex_;
};

}  // namespace lms::security
