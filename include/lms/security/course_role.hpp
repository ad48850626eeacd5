/**
 * @file course_role.hpp
 * @brief Enrollment roles and the merged course role hierarchy
 */

#pragma once

#include "category_role.hpp"

#include <optional>
#include <string_view>

namespace lms::security {

/**
 * @brief Course-specific role carried by an enrollment
 */
enum class course_role {
    student,
    ta,
    teacher,
    manager
};

/**
 * @brief Convert course_role to string
 */
constexpr std::string_view to_string(course_role role) {
    switch (role) {
        case course_role::student: return "student";
        case course_role::ta: return "ta";
        case course_role::teacher: return "teacher";
        case course_role::manager: return "manager";
    }
    return "unknown";
}

/**
 * @brief Parse course_role from string
 */
inline std::optional<course_role> parse_course_role(std::string_view str) {
    if (str == "student") return course_role::student;
    if (str == "ta") return course_role::ta;
    if (str == "teacher") return course_role::teacher;
    if (str == "manager") return course_role::manager;
    return std::nullopt;
}

/**
 * @brief Rank of a course or category role name on the merged ladder
 *
 * category-admin = manager (6) > category-coordinator = teacher (5) >
 * category-reviewer (4) > ta (3) > student (1). Unknown names rank 0.
 */
constexpr int access_rank(std::string_view role_name) {
    if (role_name == "category-admin" || role_name == "manager") return 6;
    if (role_name == "category-coordinator" || role_name == "teacher") return 5;
    if (role_name == "category-reviewer") return 4;
    if (role_name == "ta") return 3;
    if (role_name == "student") return 1;
    return 0;
}

/**
 * @brief Check if a role is at least as strong as the required one
 */
constexpr bool has_minimum_role(std::string_view user_role,
                                std::string_view required_role) {
    return access_rank(user_role) >= access_rank(required_role);
}

} // namespace lms::security
