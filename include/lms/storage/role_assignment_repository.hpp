/**
 * @file role_assignment_repository.hpp
 * @brief Repository for category role assignments
 *
 * This file provides the role_assignment_repository class which owns the
 * (user, category) -> role facts. A second grant for the same pair
 * overwrites the first in place.
 */

#pragma once

#include "access_database.hpp"
#include "role_assignment_record.hpp"

#include <lms/core/result.hpp>
#include <lms/di/ilogger.hpp>
#include <lms/security/category_role.hpp>
#include <lms/security/user_directory_interface.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace lms::storage {

/**
 * @brief Role assignment store
 *
 * Users and categories are referenced by id only. The store checks that
 * both exist when a role is granted but holds no ownership over either.
 *
 * Thread Safety: operations serialize on the database connection mutex.
 */
class role_assignment_repository {
public:
    /**
     * @param db Shared database connection
     * @param users User lookup used to validate grants; may be null, in
     *              which case user ids are not validated
     * @param logger Logger for diagnostics
     */
    role_assignment_repository(std::shared_ptr<access_database> db,
                               std::shared_ptr<security::user_directory_interface> users,
                               std::shared_ptr<di::ILogger> logger = nullptr);

    ~role_assignment_repository() = default;

    role_assignment_repository(const role_assignment_repository&) = delete;
    auto operator=(const role_assignment_repository&)
        -> role_assignment_repository& = delete;
    role_assignment_repository(role_assignment_repository&&) noexcept = default;
    auto operator=(role_assignment_repository&&) noexcept
        -> role_assignment_repository& = default;

    // ========================================================================
    // Mutations
    // ========================================================================

    /**
     * @brief Grant a role, replacing any existing grant for the pair
     *
     * Insert and overwrite are a single statement keyed on
     * (user_id, category_id); role, assigned_by, assigned_at and notes
     * are replaced on conflict.
     *
     * @return The stored record, or NotFound for an unknown user/category
     */
    [[nodiscard]] auto assign(const role_grant& grant)
        -> Result<role_assignment_record>;

    /**
     * @brief Remove the grant of a user on a category
     *
     * @param actor_id User performing the revoke, recorded in the audit
     *        trail when given
     * @return NotFound if the pair has no grant
     */
    [[nodiscard]] auto revoke(std::int64_t user_id, std::int64_t category_id,
                              std::optional<std::int64_t> actor_id = std::nullopt)
        -> VoidResult;

    /**
     * @brief Change the role of an existing assignment
     *
     * assigned_by keeps the original grantor; actor_id only goes to the
     * audit trail.
     *
     * @return The updated record, or NotFound
     */
    [[nodiscard]] auto update(std::int64_t assignment_id,
                              security::category_role role,
                              std::optional<std::int64_t> actor_id = std::nullopt)
        -> Result<role_assignment_record>;

    // ========================================================================
    // Queries
    // ========================================================================

    /**
     * @brief Direct grant of a user on exactly this category
     */
    [[nodiscard]] auto find(std::int64_t user_id, std::int64_t category_id)
        -> Result<std::optional<role_assignment_record>>;

    [[nodiscard]] auto find_by_id(std::int64_t assignment_id)
        -> Result<role_assignment_record>;

    [[nodiscard]] auto list_for_user(std::int64_t user_id)
        -> Result<std::vector<role_assignment_record>>;

    [[nodiscard]] auto list_for_category(std::int64_t category_id)
        -> Result<std::vector<role_assignment_record>>;

    /**
     * @brief Directly assigned role, optionally required to match
     *
     * @param required When set, only a grant of exactly this role counts
     * @return The role, or std::nullopt if none (or a different one) is held
     */
    [[nodiscard]] auto check_role(std::int64_t user_id,
                                  std::int64_t category_id,
                                  std::optional<security::category_role> required =
                                      std::nullopt)
        -> Result<std::optional<security::category_role>>;

private:
    [[nodiscard]] auto query_list(std::string_view where, std::int64_t param)
        -> Result<std::vector<role_assignment_record>>;

    [[nodiscard]] auto validate_references(std::int64_t user_id,
                                           std::int64_t category_id)
        -> VoidResult;

    std::shared_ptr<access_database> db_;
    std::shared_ptr<security::user_directory_interface> users_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace lms::storage
