/**
 * @file category_repository.cpp
 * @brief Implementation of the category store
 */

#include <lms/storage/category_repository.hpp>

#include "sqlite_statement.hpp"

#include <lms/compat/format.hpp>
#include <lms/integration/logger_adapter.hpp>

#include <sqlite3.h>

#include <algorithm>
#include <deque>
#include <map>
#include <unordered_set>

namespace lms::storage {

using detail::get_int64_column;
using detail::get_optional_int64_column;
using detail::get_text_column;
using detail::statement;
using integration::category_operation;
using integration::logger_adapter;

namespace {

constexpr const char* kModule = "category_store";

constexpr const char* kSelectColumns =
    "SELECT id, name, parent_id, created_at, updated_at FROM categories";

[[nodiscard]] auto parse_row(sqlite3_stmt* stmt) -> category_record {
    category_record record;
    record.id = get_int64_column(stmt, 0);
    record.name = get_text_column(stmt, 1);
    record.parent_id = get_optional_int64_column(stmt, 2);
    record.created_at = detail::from_timestamp_string(get_text_column(stmt, 3));
    record.updated_at = detail::from_timestamp_string(get_text_column(stmt, 4));
    return record;
}

template <typename T>
[[nodiscard]] auto prepare_error(sqlite3* db) -> Result<T> {
    return lms_error<T>(
        error_codes::database_query_error,
        lms::compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db)),
        kModule);
}

template <typename T>
[[nodiscard]] auto not_found(std::int64_t category_id) -> Result<T> {
    return lms_error<T>(error_codes::not_found,
                        lms::compat::format("Category {} not found", category_id),
                        kModule);
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

category_repository::category_repository(
    std::shared_ptr<access_database> db,
    std::shared_ptr<security::course_catalog_interface> courses,
    category_store_config config,
    std::shared_ptr<di::ILogger> logger)
    : db_(std::move(db)),
      courses_(std::move(courses)),
      config_(config),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

// =============================================================================
// Mutations
// =============================================================================

auto category_repository::create(std::string_view name,
                                 std::optional<std::int64_t> parent_id)
    -> Result<category_record> {
    if (name.empty()) {
        return lms_error<category_record>(error_codes::invalid_argument,
                                          "Category name is required", kModule);
    }

    auto result = db_->in_transaction<category_record>(
        [&]() -> Result<category_record> {
            if (parent_id) {
                auto parent = load(*parent_id);
                if (parent.is_err()) {
                    return Result<category_record>(parent.error());
                }
                if (!parent.value()) {
                    return lms_error<category_record>(
                        error_codes::not_found,
                        lms::compat::format("Parent category {} not found",
                                            *parent_id),
                        kModule);
                }

                auto depth_ok = check_depth(*parent_id, 0);
                if (depth_ok.is_err()) {
                    return Result<category_record>(depth_ok.error());
                }
            }

            statement stmt(db_->handle(),
                           "INSERT INTO categories (name, parent_id) VALUES (?, ?) "
                           "RETURNING id, name, parent_id, created_at, updated_at;");
            if (!stmt.prepared()) {
                return prepare_error<category_record>(db_->handle());
            }
            stmt.bind(1, name);
            stmt.bind(2, parent_id);

            if (stmt.step() != SQLITE_ROW) {
                return lms_error<category_record>(
                    error_codes::database_query_error,
                    lms::compat::format("Failed to insert category: {}",
                                        sqlite3_errmsg(db_->handle())),
                    kModule);
            }
            return parse_row(stmt.get());
        });

    if (result.is_err()) {
        logger_->warn_fmt("Category create '{}' failed: {}", name,
                          result.error().message);
        return result;
    }

    const auto& created = result.value();
    logger_adapter::log_category_change(category_operation::create, created.id,
                                        created.name, created.parent_id);
    return result;
}

auto category_repository::update(std::int64_t category_id,
                                 const category_update& changes)
    -> Result<category_record> {
    if (changes.name && changes.name->empty()) {
        return lms_error<category_record>(error_codes::invalid_argument,
                                          "Category name cannot be empty",
                                          kModule);
    }
    if (changes.parent_id && changes.move_to_root) {
        return lms_error<category_record>(
            error_codes::invalid_argument,
            "parent_id and move_to_root are mutually exclusive", kModule);
    }

    auto result = db_->in_transaction<category_record>(
        [&]() -> Result<category_record> {
            auto current = load(category_id);
            if (current.is_err()) {
                return Result<category_record>(current.error());
            }
            if (!current.value()) {
                return not_found<category_record>(category_id);
            }

            category_record record = *current.value();

            if (changes.parent_id) {
                auto check = check_reparent(category_id, *changes.parent_id);
                if (check.is_err()) {
                    return Result<category_record>(check.error());
                }
                record.parent_id = changes.parent_id;
            } else if (changes.move_to_root) {
                record.parent_id = std::nullopt;
            }

            if (changes.name) {
                record.name = *changes.name;
            }

            if (!changes.name && !changes.changes_parent()) {
                return record;
            }

            statement stmt(db_->handle(),
                           "UPDATE categories SET name = ?, parent_id = ? "
                           "WHERE id = ?;");
            if (!stmt.prepared()) {
                return prepare_error<category_record>(db_->handle());
            }
            stmt.bind(1, std::string_view{record.name});
            stmt.bind(2, record.parent_id);
            stmt.bind(3, category_id);

            if (stmt.step() != SQLITE_DONE) {
                return lms_error<category_record>(
                    error_codes::database_query_error,
                    lms::compat::format("Failed to update category {}: {}",
                                        category_id,
                                        sqlite3_errmsg(db_->handle())),
                    kModule);
            }

            auto reloaded = load(category_id);
            if (reloaded.is_err()) {
                return Result<category_record>(reloaded.error());
            }
            if (!reloaded.value()) {
                return not_found<category_record>(category_id);
            }
            return *reloaded.value();
        });

    if (result.is_err()) {
        logger_->warn_fmt("Category update {} failed: {}", category_id,
                          result.error().message);
        return result;
    }

    if (changes.name || changes.changes_parent()) {
        const auto& updated = result.value();
        logger_adapter::log_category_change(category_operation::update,
                                            updated.id, updated.name,
                                            updated.parent_id);
    }
    return result;
}

auto category_repository::remove(std::int64_t category_id) -> VoidResult {
    auto result = db_->in_transaction<std::monostate>(
        [&]() -> VoidResult {
            auto current = load(category_id);
            if (current.is_err()) {
                return VoidResult(current.error());
            }
            if (!current.value()) {
                return not_found<std::monostate>(category_id);
            }

            auto children = count_children(category_id);
            if (children.is_err()) {
                return VoidResult(children.error());
            }
            if (children.value() > 0) {
                return lms_void_error(
                    error_codes::has_subcategories,
                    "Cannot delete category with subcategories. "
                    "Delete subcategories first.",
                    kModule);
            }

            if (courses_) {
                auto course_count = courses_->count_courses_by_category(category_id);
                if (course_count.is_err()) {
                    return VoidResult(course_count.error());
                }
                if (course_count.value() > 0) {
                    return lms_void_error(
                        error_codes::has_courses,
                        "Cannot delete category with courses. "
                        "Remove or reassign courses first.",
                        kModule);
                }
            }

            statement cleanup(db_->handle(),
                              "DELETE FROM category_role_assignments "
                              "WHERE category_id = ?;");
            if (!cleanup.prepared()) {
                return prepare_error<std::monostate>(db_->handle());
            }
            cleanup.bind(1, category_id);
            if (cleanup.step() != SQLITE_DONE) {
                return lms_void_error(
                    error_codes::database_query_error,
                    lms::compat::format("Failed to remove role assignments: {}",
                                        sqlite3_errmsg(db_->handle())),
                    kModule);
            }
            auto dangling = sqlite3_changes(db_->handle());
            if (dangling > 0) {
                logger_->info_fmt(
                    "Removed {} role assignment(s) of deleted category {}",
                    dangling, category_id);
            }

            statement stmt(db_->handle(), "DELETE FROM categories WHERE id = ?;");
            if (!stmt.prepared()) {
                return prepare_error<std::monostate>(db_->handle());
            }
            stmt.bind(1, category_id);
            if (stmt.step() != SQLITE_DONE) {
                return lms_void_error(
                    error_codes::database_query_error,
                    lms::compat::format("Failed to delete category {}: {}",
                                        category_id,
                                        sqlite3_errmsg(db_->handle())),
                    kModule);
            }

            return ok();
        });

    if (result.is_err()) {
        logger_->warn_fmt("Category delete {} failed: {}", category_id,
                          result.error().message);
        return result;
    }

    logger_adapter::log_category_change(category_operation::remove, category_id,
                                        "", std::nullopt);
    return result;
}

// =============================================================================
// Queries
// =============================================================================

auto category_repository::find_by_id(std::int64_t category_id)
    -> Result<category_record> {
    auto result = load(category_id);
    if (result.is_err()) {
        return Result<category_record>(result.error());
    }
    if (!result.value()) {
        return not_found<category_record>(category_id);
    }
    return *result.value();
}

auto category_repository::exists(std::int64_t category_id) -> Result<bool> {
    auto result = load(category_id);
    if (result.is_err()) {
        return Result<bool>(result.error());
    }
    return Result<bool>(result.value().has_value());
}

auto category_repository::find_roots(std::optional<std::size_t> limit)
    -> Result<std::vector<category_record>> {
    return query_list(
        std::string(kSelectColumns) +
            " WHERE parent_id IS NULL ORDER BY name, id LIMIT ?;",
        std::nullopt, limit.value_or(config_.default_list_limit));
}

auto category_repository::find_children(std::int64_t parent_id,
                                        std::optional<std::size_t> limit)
    -> Result<std::vector<category_record>> {
    return query_list(
        std::string(kSelectColumns) +
            " WHERE parent_id = ? ORDER BY name, id LIMIT ?;",
        parent_id, limit.value_or(config_.default_list_limit));
}

auto category_repository::find_all() -> Result<std::vector<category_record>> {
    return query_list(std::string(kSelectColumns) + " ORDER BY name, id;",
                      std::nullopt, std::nullopt);
}

auto category_repository::count_children(std::int64_t parent_id)
    -> Result<std::size_t> {
    std::lock_guard lock(db_->mutex());

    statement stmt(db_->handle(),
                   "SELECT COUNT(*) FROM categories WHERE parent_id = ?;");
    if (!stmt.prepared()) {
        return prepare_error<std::size_t>(db_->handle());
    }
    stmt.bind(1, parent_id);

    if (stmt.step() != SQLITE_ROW) {
        return lms_error<std::size_t>(
            error_codes::database_query_error,
            lms::compat::format("Failed to count subcategories: {}",
                                sqlite3_errmsg(db_->handle())),
            kModule);
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

auto category_repository::get_ancestors(std::int64_t category_id)
    -> Result<std::vector<category_record>> {
    std::lock_guard lock(db_->mutex());

    std::vector<category_record> chain;
    std::unordered_set<std::int64_t> visited;
    std::optional<std::int64_t> current = category_id;

    while (current) {
        if (!visited.insert(*current).second) {
            logger_adapter::log_security_event(
                integration::security_event_type::integrity_violation,
                lms::compat::format("Parent cycle detected at category {}",
                                    *current));
            return lms_error<std::vector<category_record>>(
                error_codes::circular_reference,
                lms::compat::format("Parent cycle detected at category {}",
                                    *current),
                kModule);
        }

        auto record = load(*current);
        if (record.is_err()) {
            return Result<std::vector<category_record>>(record.error());
        }
        if (!record.value()) {
            if (chain.empty()) {
                return not_found<std::vector<category_record>>(category_id);
            }
            // Dangling parent link: the chain ends at the last existing node
            logger_->warn_fmt("Category {} references missing parent {}",
                              chain.back().id, *current);
            break;
        }

        current = record.value()->parent_id;
        chain.push_back(std::move(*record.value()));
    }

    std::reverse(chain.begin(), chain.end());
    return chain;
}

auto category_repository::get_depth(std::int64_t category_id)
    -> Result<std::size_t> {
    auto chain = get_ancestors(category_id);
    if (chain.is_err()) {
        return Result<std::size_t>(chain.error());
    }
    return chain.value().size() - 1;
}

auto category_repository::is_descendant(std::int64_t ancestor_id,
                                        std::int64_t candidate_id)
    -> Result<bool> {
    auto chain = get_ancestors(candidate_id);
    if (chain.is_err()) {
        return Result<bool>(chain.error());
    }
    return Result<bool>(std::any_of(chain.value().begin(), chain.value().end(),
                                    [ancestor_id](const category_record& record) {
                                        return record.id == ancestor_id;
                                    }));
}

auto category_repository::get_tree() -> Result<std::vector<category_node>> {
    auto all = find_all();
    if (all.is_err()) {
        return Result<std::vector<category_node>>(all.error());
    }

    std::map<std::int64_t, std::vector<std::size_t>> children_of;
    std::unordered_set<std::int64_t> known;
    for (const auto& record : all.value()) {
        known.insert(record.id);
    }

    std::vector<std::size_t> roots;
    const auto& records = all.value();
    for (std::size_t i = 0; i < records.size(); ++i) {
        const auto& parent = records[i].parent_id;
        if (parent && known.contains(*parent)) {
            children_of[*parent].push_back(i);
        } else {
            roots.push_back(i);
        }
    }

    // Breadth-first order guarantees children are listed after parents, so
    // walking it backwards completes every child before its parent.
    std::vector<std::size_t> order;
    std::unordered_set<std::int64_t> visited;
    std::deque<std::size_t> pending(roots.begin(), roots.end());
    while (!pending.empty()) {
        auto index = pending.front();
        pending.pop_front();
        if (!visited.insert(records[index].id).second) {
            continue;
        }
        order.push_back(index);
        auto it = children_of.find(records[index].id);
        if (it != children_of.end()) {
            pending.insert(pending.end(), it->second.begin(), it->second.end());
        }
    }

    if (order.size() != records.size()) {
        logger_->warn_fmt("{} categories are unreachable from any root",
                          records.size() - order.size());
    }

    std::map<std::int64_t, category_node> built;
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        category_node node;
        node.category = records[*it];
        auto kids = children_of.find(node.category.id);
        if (kids != children_of.end()) {
            for (auto child_index : kids->second) {
                auto child = built.find(records[child_index].id);
                if (child != built.end()) {
                    node.children.push_back(std::move(child->second));
                    built.erase(child);
                }
            }
        }
        built.emplace(node.category.id, std::move(node));
    }

    std::vector<category_node> forest;
    forest.reserve(roots.size());
    for (auto index : roots) {
        auto it = built.find(records[index].id);
        if (it != built.end()) {
            forest.push_back(std::move(it->second));
        }
    }
    return forest;
}

// =============================================================================
// Private Helpers
// =============================================================================

auto category_repository::load(std::int64_t category_id)
    -> Result<std::optional<category_record>> {
    std::lock_guard lock(db_->mutex());

    statement stmt(db_->handle(), std::string(kSelectColumns) + " WHERE id = ?;");
    if (!stmt.prepared()) {
        return prepare_error<std::optional<category_record>>(db_->handle());
    }
    stmt.bind(1, category_id);

    auto rc = stmt.step();
    if (rc == SQLITE_ROW) {
        return std::optional<category_record>(parse_row(stmt.get()));
    }
    if (rc == SQLITE_DONE) {
        return std::optional<category_record>{};
    }
    return lms_error<std::optional<category_record>>(
        error_codes::database_query_error,
        lms::compat::format("Failed to load category {}: {}", category_id,
                            sqlite3_errmsg(db_->handle())),
        kModule);
}

auto category_repository::query_list(std::string_view sql,
                                     std::optional<std::int64_t> param,
                                     std::optional<std::size_t> limit)
    -> Result<std::vector<category_record>> {
    std::lock_guard lock(db_->mutex());

    statement stmt(db_->handle(), sql);
    if (!stmt.prepared()) {
        return prepare_error<std::vector<category_record>>(db_->handle());
    }

    int idx = 1;
    if (param) {
        stmt.bind(idx++, *param);
    }
    if (limit) {
        stmt.bind(idx++, static_cast<std::int64_t>(*limit));
    }

    std::vector<category_record> records;
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        records.push_back(parse_row(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        return lms_error<std::vector<category_record>>(
            error_codes::database_query_error,
            lms::compat::format("Failed to list categories: {}",
                                sqlite3_errmsg(db_->handle())),
            kModule);
    }
    return records;
}

auto category_repository::subtree_height(std::int64_t category_id)
    -> Result<std::size_t> {
    std::size_t height = 0;
    std::unordered_set<std::int64_t> visited{category_id};
    std::vector<std::int64_t> level{category_id};

    while (true) {
        std::vector<std::int64_t> next;
        for (auto id : level) {
            auto children = query_list(
                "SELECT id, name, parent_id, created_at, updated_at "
                "FROM categories WHERE parent_id = ?;",
                id, std::nullopt);
            if (children.is_err()) {
                return Result<std::size_t>(children.error());
            }
            for (const auto& child : children.value()) {
                if (visited.insert(child.id).second) {
                    next.push_back(child.id);
                }
            }
        }
        if (next.empty()) {
            return height;
        }
        ++height;
        level = std::move(next);
    }
}

auto category_repository::check_depth(std::int64_t parent_id,
                                      std::size_t subtree_height) -> VoidResult {
    if (!config_.max_depth) {
        return ok();
    }

    auto parent_depth = get_depth(parent_id);
    if (parent_depth.is_err()) {
        return VoidResult(parent_depth.error());
    }

    auto new_depth = parent_depth.value() + 1;
    if (new_depth + subtree_height > *config_.max_depth) {
        return lms_void_error(
            error_codes::depth_limit_exceeded,
            lms::compat::format(
                "Category depth limit exceeded. Maximum allowed depth is {}",
                *config_.max_depth),
            kModule);
    }
    return ok();
}

auto category_repository::check_reparent(std::int64_t category_id,
                                         std::int64_t new_parent_id)
    -> VoidResult {
    if (new_parent_id == category_id) {
        return lms_void_error(error_codes::circular_reference,
                              "A category cannot be its own parent", kModule);
    }

    auto parent = load(new_parent_id);
    if (parent.is_err()) {
        return VoidResult(parent.error());
    }
    if (!parent.value()) {
        return lms_void_error(
            error_codes::not_found,
            lms::compat::format("Parent category {} not found", new_parent_id),
            kModule);
    }

    auto descendant = is_descendant(category_id, new_parent_id);
    if (descendant.is_err()) {
        return VoidResult(descendant.error());
    }
    if (descendant.value()) {
        return lms_void_error(
            error_codes::circular_reference,
            "Cannot set parent to a descendant category (circular reference)",
            kModule);
    }

    if (!config_.max_depth) {
        return ok();
    }

    auto height = subtree_height(category_id);
    if (height.is_err()) {
        return VoidResult(height.error());
    }
    return check_depth(new_parent_id, height.value());
}

}  // namespace lms::storage
