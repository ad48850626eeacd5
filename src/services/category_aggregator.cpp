/**
 * @file category_aggregator.cpp
 * @brief Implementation of category statistics
 */

#include <lms/services/category_aggregator.hpp>

#include <lms/storage/category_repository.hpp>

#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace lms::services {

category_aggregator::category_aggregator(
    std::shared_ptr<storage::category_repository> categories,
    std::shared_ptr<security::course_catalog_interface> courses,
    std::shared_ptr<di::ILogger> logger)
    : categories_(std::move(categories)),
      courses_(std::move(courses)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

auto category_aggregator::direct_courses_count(std::int64_t category_id)
    -> Result<std::size_t> {
    auto category = categories_->find_by_id(category_id);
    if (category.is_err()) {
        return Result<std::size_t>(category.error());
    }
    return courses_->count_courses_by_category(category_id);
}

auto category_aggregator::direct_subcategories_count(std::int64_t category_id)
    -> Result<std::size_t> {
    auto category = categories_->find_by_id(category_id);
    if (category.is_err()) {
        return Result<std::size_t>(category.error());
    }
    return categories_->count_children(category_id);
}

auto category_aggregator::total_nested_courses_count(std::int64_t category_id)
    -> Result<std::size_t> {
    auto category = categories_->find_by_id(category_id);
    if (category.is_err()) {
        return Result<std::size_t>(category.error());
    }

    auto all = categories_->find_all();
    if (all.is_err()) {
        return Result<std::size_t>(all.error());
    }

    std::unordered_map<std::int64_t, std::vector<std::int64_t>> children_of;
    for (const auto& record : all.value()) {
        if (record.parent_id) {
            children_of[*record.parent_id].push_back(record.id);
        }
    }

    std::size_t total = 0;
    std::unordered_set<std::int64_t> visited;
    std::deque<std::int64_t> pending{category_id};
    while (!pending.empty()) {
        auto id = pending.front();
        pending.pop_front();
        if (!visited.insert(id).second) {
            continue;
        }

        auto direct = courses_->count_courses_by_category(id);
        if (direct.is_err()) {
            return direct;
        }
        total += direct.value();

        auto kids = children_of.find(id);
        if (kids != children_of.end()) {
            pending.insert(pending.end(), kids->second.begin(), kids->second.end());
        }
    }
    return total;
}

auto category_aggregator::stats(std::int64_t category_id) -> Result<category_stats> {
    category_stats result;

    auto direct = direct_courses_count(category_id);
    if (direct.is_err()) {
        return Result<category_stats>(direct.error());
    }
    result.direct_courses_count = direct.value();

    auto subcategories = categories_->count_children(category_id);
    if (subcategories.is_err()) {
        return Result<category_stats>(subcategories.error());
    }
    result.direct_subcategories_count = subcategories.value();

    auto nested = total_nested_courses_count(category_id);
    if (nested.is_err()) {
        return Result<category_stats>(nested.error());
    }
    result.total_nested_courses_count = nested.value();

    return result;
}

auto category_aggregator::build_tree() -> Result<std::vector<category_tree_node>> {
    using result_type = Result<std::vector<category_tree_node>>;

    auto all = categories_->find_all();
    if (all.is_err()) {
        return result_type(all.error());
    }
    auto courses = courses_->list_all_courses();
    if (courses.is_err()) {
        return result_type(courses.error());
    }

    const auto& records = all.value();

    std::unordered_map<std::int64_t, std::size_t> direct_courses;
    for (const auto& course : courses.value()) {
        if (course.category_id) {
            ++direct_courses[*course.category_id];
        }
    }

    std::unordered_map<std::int64_t, std::size_t> index_of;
    for (std::size_t i = 0; i < records.size(); ++i) {
        index_of.emplace(records[i].id, i);
    }

    // Records arrive ordered by name, so child lists keep that order.
    // A parent link to a missing category makes the node a root.
    std::vector<std::vector<std::size_t>> children(records.size());
    std::vector<std::size_t> roots;
    for (std::size_t i = 0; i < records.size(); ++i) {
        const auto& parent = records[i].parent_id;
        auto it = parent ? index_of.find(*parent) : index_of.end();
        if (it != index_of.end()) {
            children[it->second].push_back(i);
        } else {
            roots.push_back(i);
        }
    }

    // Breadth-first order: every parent precedes its children
    std::vector<std::size_t> order;
    order.reserve(records.size());
    std::vector<bool> visited(records.size(), false);
    std::deque<std::size_t> pending(roots.begin(), roots.end());
    while (!pending.empty()) {
        auto index = pending.front();
        pending.pop_front();
        if (visited[index]) {
            continue;
        }
        visited[index] = true;
        order.push_back(index);
        pending.insert(pending.end(), children[index].begin(), children[index].end());
    }

    if (order.size() != records.size()) {
        logger_->warn_fmt("{} categories sit on a parent cycle and are left out",
                          records.size() - order.size());
    }

    // Reverse breadth-first order resolves children before parents
    std::vector<std::optional<category_tree_node>> built(records.size());
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        const auto& record = records[*it];

        category_tree_node node;
        node.id = record.id;
        node.name = record.name;
        node.parent_id = record.parent_id;
        node.direct_subcategories_count = children[*it].size();

        auto direct = direct_courses.find(record.id);
        node.direct_courses_count = direct != direct_courses.end() ? direct->second : 0;
        node.total_nested_courses_count = node.direct_courses_count;

        for (auto child_index : children[*it]) {
            if (!built[child_index]) {
                continue;
            }
            node.total_nested_courses_count +=
                built[child_index]->total_nested_courses_count;
            node.subcategories.push_back(std::move(*built[child_index]));
            built[child_index].reset();
        }

        built[*it] = std::move(node);
    }

    std::vector<category_tree_node> forest;
    forest.reserve(roots.size());
    for (auto index : roots) {
        if (built[index]) {
            forest.push_back(std::move(*built[index]));
        }
    }
    return forest;
}

}  // namespace lms::services
