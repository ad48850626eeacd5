/**
 * @file user_account.hpp
 * @brief Already-authenticated user as seen by the access engine
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace lms::security {

/**
 * @brief Account-level role of a user
 */
enum class global_role {
    user,        ///< Regular account, access decided per course
    instructor,  ///< Content author, no implicit course access
    admin        ///< System-wide administrator, bypasses every check
};

constexpr std::string_view to_string(global_role role) {
    switch (role) {
        case global_role::user: return "user";
        case global_role::instructor: return "instructor";
        case global_role::admin: return "admin";
    }
    return "unknown";
}

inline std::optional<global_role> parse_global_role(std::string_view str) {
    if (str == "user" || str == "student") return global_role::user;
    if (str == "instructor") return global_role::instructor;
    if (str == "admin") return global_role::admin;
    return std::nullopt;
}

/**
 * @brief User record returned by the user lookup collaborator
 */
struct user_account {
    std::int64_t id{0};
    global_role role{global_role::user};

    [[nodiscard]] bool is_global_admin() const noexcept {
        return role == global_role::admin;
    }
};

} // namespace lms::security
