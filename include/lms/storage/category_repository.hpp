/**
 * @file category_repository.hpp
 * @brief Category store enforcing the tree invariants
 *
 * This file provides the category_repository class which owns category
 * identity and parent links. Every mutation re-validates that the parent
 * graph stays acyclic and within the configured maximum depth, and runs
 * inside a single transaction.
 */

#pragma once

#include "access_database.hpp"
#include "category_record.hpp"

#include <lms/core/result.hpp>
#include <lms/di/ilogger.hpp>
#include <lms/security/course_catalog_interface.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace lms::storage {

/**
 * @brief Category store
 *
 * Invariants held after every committed mutation:
 * - no category is (transitively) its own ancestor
 * - when max_depth is configured, no category has more than max_depth
 *   ancestors
 * - a category with subcategories or courses is never deleted
 *
 * Thread Safety: operations serialize on the database connection mutex.
 *
 * @example
 * @code
 * category_repository categories(db, catalog, {.max_depth = 4});
 * auto science = categories.create("Science");
 * auto physics = categories.create("Physics", science.value().id);
 * auto chain = categories.get_ancestors(physics.value().id); // Science, Physics
 * @endcode
 */
class category_repository {
public:
    category_repository(std::shared_ptr<access_database> db,
                        std::shared_ptr<security::course_catalog_interface> courses,
                        category_store_config config = {},
                        std::shared_ptr<di::ILogger> logger = nullptr);

    ~category_repository() = default;

    category_repository(const category_repository&) = delete;
    auto operator=(const category_repository&) -> category_repository& = delete;
    category_repository(category_repository&&) noexcept = default;
    auto operator=(category_repository&&) noexcept -> category_repository& = default;

    // ========================================================================
    // Mutations
    // ========================================================================

    /**
     * @brief Create a category
     *
     * @param name Non-empty display name
     * @param parent_id Parent category, std::nullopt for a root
     * @return The stored record, or InvalidArgument / NotFound /
     *         DepthLimitExceeded
     */
    [[nodiscard]] auto create(std::string_view name,
                              std::optional<std::int64_t> parent_id = std::nullopt)
        -> Result<category_record>;

    /**
     * @brief Rename and/or reparent a category
     *
     * Name-only updates never re-check depth or cycles. A reparent is
     * rejected with CircularReference when the new parent is the category
     * itself or one of its descendants, and with DepthLimitExceeded when
     * the moved subtree would exceed the configured maximum depth.
     */
    [[nodiscard]] auto update(std::int64_t category_id,
                              const category_update& changes)
        -> Result<category_record>;

    /**
     * @brief Delete a childless, course-free category
     *
     * The precondition checks and the delete share one transaction.
     * Role assignments still referencing the category are removed with it.
     *
     * @return NotFound, HasSubcategories, HasCourses, or success
     */
    [[nodiscard]] auto remove(std::int64_t category_id) -> VoidResult;

    // ========================================================================
    // Queries
    // ========================================================================

    /**
     * @brief Find a category by id
     * @return The record, or NotFound
     */
    [[nodiscard]] auto find_by_id(std::int64_t category_id)
        -> Result<category_record>;

    [[nodiscard]] auto exists(std::int64_t category_id) -> Result<bool>;

    /**
     * @brief Root categories ordered by name
     * @param limit Maximum rows; defaults to config().default_list_limit
     */
    [[nodiscard]] auto find_roots(std::optional<std::size_t> limit = std::nullopt)
        -> Result<std::vector<category_record>>;

    /**
     * @brief Direct subcategories of a category ordered by name
     * @param limit Maximum rows; defaults to config().default_list_limit
     */
    [[nodiscard]] auto find_children(std::int64_t parent_id,
                                     std::optional<std::size_t> limit = std::nullopt)
        -> Result<std::vector<category_record>>;

    /**
     * @brief Every category ordered by name
     */
    [[nodiscard]] auto find_all() -> Result<std::vector<category_record>>;

    /**
     * @brief Number of direct subcategories
     */
    [[nodiscard]] auto count_children(std::int64_t parent_id)
        -> Result<std::size_t>;

    /**
     * @brief Ancestor chain ordered root to self, inclusive
     *
     * The walk is iterative and guarded by a visited set; inconsistent
     * parent links fail with CircularReference instead of looping.
     */
    [[nodiscard]] auto get_ancestors(std::int64_t category_id)
        -> Result<std::vector<category_record>>;

    /**
     * @brief Number of ancestors strictly above the category (root = 0)
     */
    [[nodiscard]] auto get_depth(std::int64_t category_id) -> Result<std::size_t>;

    /**
     * @brief Check whether candidate_id lies in the subtree of ancestor_id
     *
     * A category counts as part of its own subtree.
     */
    [[nodiscard]] auto is_descendant(std::int64_t ancestor_id,
                                     std::int64_t candidate_id) -> Result<bool>;

    /**
     * @brief The full forest with children ordered by name
     */
    [[nodiscard]] auto get_tree() -> Result<std::vector<category_node>>;

    [[nodiscard]] auto config() const noexcept -> const category_store_config& {
        return config_;
    }

private:
    [[nodiscard]] auto load(std::int64_t category_id)
        -> Result<std::optional<category_record>>;

    [[nodiscard]] auto query_list(std::string_view sql,
                                  std::optional<std::int64_t> param,
                                  std::optional<std::size_t> limit)
        -> Result<std::vector<category_record>>;

    [[nodiscard]] auto subtree_height(std::int64_t category_id)
        -> Result<std::size_t>;

    [[nodiscard]] auto check_depth(std::int64_t parent_id,
                                   std::size_t subtree_height) -> VoidResult;

    [[nodiscard]] auto check_reparent(std::int64_t category_id,
                                      std::int64_t new_parent_id) -> VoidResult;

    std::shared_ptr<access_database> db_;
    std::shared_ptr<security::course_catalog_interface> courses_;
    category_store_config config_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace lms::storage
