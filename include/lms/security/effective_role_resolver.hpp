/**
 * @file effective_role_resolver.hpp
 * @brief Inherited category role resolution
 */

#pragma once

#include "category_role.hpp"

#include <lms/core/result.hpp>
#include <lms/di/ilogger.hpp>

#include <cstdint>
#include <memory>
#include <optional>

namespace lms::storage {
class category_repository;
class role_assignment_repository;
}  // namespace lms::storage

namespace lms::security {

/**
 * @brief The winning grant of a resolution
 */
struct effective_role {
    category_role role{category_role::reviewer};

    /// Category on which the winning grant is assigned
    std::int64_t granted_on{0};
};

/**
 * @brief Resolves the effective role of a user on a category
 *
 * Walks from the category itself up to its root, consulting the direct
 * grant on every level, and keeps the highest-priority role seen. The walk
 * always reaches the root: a reviewer grant on the node never shadows an
 * admin grant further up. Every call re-reads the stores; nothing is
 * cached between calls.
 */
class effective_role_resolver {
public:
    effective_role_resolver(std::shared_ptr<storage::category_repository> categories,
                            std::shared_ptr<storage::role_assignment_repository> roles,
                            std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Highest-priority role on the category or any ancestor
     * @return The role, std::nullopt if none is held, or NotFound for an
     *         unknown category
     */
    [[nodiscard]] auto resolve(std::int64_t user_id, std::int64_t category_id)
        -> Result<std::optional<category_role>>;

    /**
     * @brief Same as resolve(), also naming the category holding the grant
     *
     * On equal priority the grant closest to the category wins.
     */
    [[nodiscard]] auto resolve_detailed(std::int64_t user_id,
                                        std::int64_t category_id)
        -> Result<std::optional<effective_role>>;

private:
    std::shared_ptr<storage::category_repository> categories_;
    std::shared_ptr<storage::role_assignment_repository> roles_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace lms::security
