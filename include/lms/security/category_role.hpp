/**
 * @file category_role.hpp
 * @brief Ranked roles grantable on a category
 */

#pragma once

#include <optional>
#include <string_view>

namespace lms::security {

/**
 * @brief Roles that can be granted on a category node
 *
 * A role applies to the category it is assigned on and to every
 * descendant category.
 */
enum class category_role {
    reviewer,     ///< Read access to courses under the category
    coordinator,  ///< Manages courses under the category
    admin         ///< Full control over the category subtree
};

/**
 * @brief Fixed priority used when merging grants along an ancestor chain
 *
 * admin(3) > coordinator(2) > reviewer(1)
 */
constexpr int priority(category_role role) {
    switch (role) {
        case category_role::admin: return 3;
        case category_role::coordinator: return 2;
        case category_role::reviewer: return 1;
    }
    return 0;
}

/**
 * @brief Convert category_role to its persisted name
 */
constexpr std::string_view to_string(category_role role) {
    switch (role) {
        case category_role::admin: return "category-admin";
        case category_role::coordinator: return "category-coordinator";
        case category_role::reviewer: return "category-reviewer";
    }
    return "unknown";
}

/**
 * @brief Parse category_role from its persisted name
 */
inline std::optional<category_role> parse_category_role(std::string_view str) {
    if (str == "category-admin") return category_role::admin;
    if (str == "category-coordinator") return category_role::coordinator;
    if (str == "category-reviewer") return category_role::reviewer;
    return std::nullopt;
}

} // namespace lms::security
