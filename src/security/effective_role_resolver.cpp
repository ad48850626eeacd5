/**
 * @file effective_role_resolver.cpp
 * @brief Implementation of inherited category role resolution
 */

#include <lms/security/effective_role_resolver.hpp>

#include <lms/storage/category_repository.hpp>
#include <lms/storage/role_assignment_repository.hpp>

namespace lms::security {

effective_role_resolver::effective_role_resolver(
    std::shared_ptr<storage::category_repository> categories,
    std::shared_ptr<storage::role_assignment_repository> roles,
    std::shared_ptr<di::ILogger> logger)
    : categories_(std::move(categories)),
      roles_(std::move(roles)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

auto effective_role_resolver::resolve(std::int64_t user_id,
                                      std::int64_t category_id)
    -> Result<std::optional<category_role>> {
    auto detailed = resolve_detailed(user_id, category_id);
    if (detailed.is_err()) {
        return Result<std::optional<category_role>>(detailed.error());
    }
    if (!detailed.value()) {
        return std::optional<category_role>{};
    }
    return std::optional<category_role>(detailed.value()->role);
}

auto effective_role_resolver::resolve_detailed(std::int64_t user_id,
                                               std::int64_t category_id)
    -> Result<std::optional<effective_role>> {
    auto chain = categories_->get_ancestors(category_id);
    if (chain.is_err()) {
        return Result<std::optional<effective_role>>(chain.error());
    }

    std::optional<effective_role> best;

    // Self first, then upwards; strict comparison keeps the nearest grant
    // among equal roles.
    const auto& ancestors = chain.value();
    for (auto it = ancestors.rbegin(); it != ancestors.rend(); ++it) {
        auto assignment = roles_->find(user_id, it->id);
        if (assignment.is_err()) {
            return Result<std::optional<effective_role>>(assignment.error());
        }
        if (!assignment.value()) {
            continue;
        }

        auto role = assignment.value()->role;
        if (!best || priority(role) > priority(best->role)) {
            best = effective_role{role, it->id};
        }
    }

    if (best) {
        logger_->debug_fmt("Effective role of user {} on category {}: {} (via {})",
                           user_id, category_id, to_string(best->role),
                           best->granted_on);
    }
    return best;
}

}  // namespace lms::security
