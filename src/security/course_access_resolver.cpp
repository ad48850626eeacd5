/**
 * @file course_access_resolver.cpp
 * @brief Implementation of course access decisions
 */

#include <lms/security/course_access_resolver.hpp>

#include <lms/integration/logger_adapter.hpp>
#include <lms/storage/category_repository.hpp>
#include <lms/storage/role_assignment_repository.hpp>

#include <deque>
#include <map>
#include <unordered_map>
#include <unordered_set>

namespace lms::security {

using integration::logger_adapter;

course_access_resolver::course_access_resolver(
    std::shared_ptr<user_directory_interface> users,
    std::shared_ptr<enrollment_lookup_interface> enrollments,
    std::shared_ptr<course_catalog_interface> courses,
    std::shared_ptr<storage::category_repository> categories,
    std::shared_ptr<storage::role_assignment_repository> roles,
    std::shared_ptr<effective_role_resolver> resolver,
    std::shared_ptr<di::ILogger> logger)
    : users_(std::move(users)),
      enrollments_(std::move(enrollments)),
      courses_(std::move(courses)),
      categories_(std::move(categories)),
      roles_(std::move(roles)),
      resolver_(std::move(resolver)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

// =============================================================================
// Access Checks
// =============================================================================

auto course_access_resolver::check_access(std::int64_t user_id,
                                          std::int64_t course_id)
    -> Result<course_access_result> {
    auto admin = is_global_admin(user_id);
    if (admin.is_err()) {
        return Result<course_access_result>(admin.error());
    }
    if (admin.value()) {
        auto result = course_access_result::granted(access_source::global_admin,
                                                    global_admin_course_role);
        record(user_id, course_id, result);
        return result;
    }

    auto enrolled = enrollments_->find_enrollment(user_id, course_id);
    if (enrolled.is_err()) {
        return Result<course_access_result>(enrolled.error());
    }
    if (enrolled.value()) {
        if (enrolled.value()->grants_access()) {
            auto result = course_access_result::granted(
                access_source::enrollment, to_string(enrolled.value()->role));
            record(user_id, course_id, result);
            return result;
        }
        logger_->debug_fmt("Enrollment of user {} in course {} is {}", user_id,
                           course_id, to_string(enrolled.value()->status));
    }

    auto via_category = check_access_via_category(user_id, course_id);
    if (via_category.is_err()) {
        return Result<course_access_result>(via_category.error());
    }
    if (via_category.value()) {
        auto result = course_access_result::granted(
            access_source::category, to_string(*via_category.value()));
        record(user_id, course_id, result);
        return result;
    }

    auto result = course_access_result::denied();
    record(user_id, course_id, result);
    return result;
}

auto course_access_resolver::check_access_via_category(std::int64_t user_id,
                                                       std::int64_t course_id)
    -> Result<std::optional<category_role>> {
    auto course = courses_->find_course(course_id);
    if (course.is_err()) {
        return Result<std::optional<category_role>>(course.error());
    }
    if (!course.value() || !course.value()->category_id) {
        return std::optional<category_role>{};
    }

    auto category_id = *course.value()->category_id;
    auto role = resolver_->resolve(user_id, category_id);
    if (role.is_err() && role.error().code == error_codes::not_found) {
        logger_->warn_fmt("Course {} references missing category {}",
                          course_id, category_id);
        return std::optional<category_role>{};
    }
    return role;
}

auto course_access_resolver::get_user_accessible_courses(std::int64_t user_id)
    -> Result<std::vector<course_access_info>> {
    using result_type = Result<std::vector<course_access_info>>;

    auto admin = is_global_admin(user_id);
    if (admin.is_err()) {
        return result_type(admin.error());
    }

    std::vector<course_access_info> accessible;

    if (admin.value()) {
        auto all = courses_->list_all_courses();
        if (all.is_err()) {
            return result_type(all.error());
        }
        accessible.reserve(all.value().size());
        for (const auto& course : all.value()) {
            accessible.push_back({course.id, access_source::global_admin,
                                  std::string{global_admin_course_role},
                                  course.category_id});
        }
        return accessible;
    }

    std::map<std::int64_t, course_access_info> by_course;

    // Category-sourced entries
    auto grants = roles_->list_for_user(user_id);
    if (grants.is_err()) {
        return result_type(grants.error());
    }

    if (!grants.value().empty()) {
        auto all_categories = categories_->find_all();
        if (all_categories.is_err()) {
            return result_type(all_categories.error());
        }

        std::unordered_map<std::int64_t, std::vector<std::int64_t>> children_of;
        for (const auto& category : all_categories.value()) {
            if (category.parent_id) {
                children_of[*category.parent_id].push_back(category.id);
            }
        }

        // Best role per reachable category, expanded downwards from every grant
        std::map<std::int64_t, category_role> covered;
        for (const auto& grant : grants.value()) {
            std::unordered_set<std::int64_t> visited;
            std::deque<std::int64_t> pending{grant.category_id};
            while (!pending.empty()) {
                auto id = pending.front();
                pending.pop_front();
                if (!visited.insert(id).second) {
                    continue;
                }

                auto [it, inserted] = covered.emplace(id, grant.role);
                if (!inserted && priority(grant.role) > priority(it->second)) {
                    it->second = grant.role;
                }

                auto kids = children_of.find(id);
                if (kids != children_of.end()) {
                    pending.insert(pending.end(), kids->second.begin(),
                                   kids->second.end());
                }
            }
        }

        for (const auto& [category_id, role] : covered) {
            auto courses = courses_->list_courses_by_category(category_id);
            if (courses.is_err()) {
                return result_type(courses.error());
            }
            for (const auto& course : courses.value()) {
                by_course[course.id] = {course.id, access_source::category,
                                        std::string{to_string(role)},
                                        course.category_id};
            }
        }
    }

    // Enrollment-sourced entries replace category-sourced ones
    auto enrolled = enrollments_->list_enrollments_for_user(user_id);
    if (enrolled.is_err()) {
        return result_type(enrolled.error());
    }
    for (const auto& entry : enrolled.value()) {
        if (!entry.grants_access()) {
            continue;
        }

        std::optional<std::int64_t> category_id;
        auto existing = by_course.find(entry.course_id);
        if (existing != by_course.end()) {
            category_id = existing->second.category_id;
        } else {
            auto course = courses_->find_course(entry.course_id);
            if (course.is_err()) {
                return result_type(course.error());
            }
            if (!course.value()) {
                logger_->warn_fmt("Enrollment {} references missing course {}",
                                  entry.id, entry.course_id);
                continue;
            }
            category_id = course.value()->category_id;
        }

        by_course[entry.course_id] = {entry.course_id, access_source::enrollment,
                                      std::string{to_string(entry.role)},
                                      category_id};
    }

    accessible.reserve(by_course.size());
    for (auto& [course_id, info] : by_course) {
        accessible.push_back(std::move(info));
    }

    logger_->debug_fmt("User {} can access {} course(s)", user_id,
                       accessible.size());
    return accessible;
}

void course_access_resolver::set_audit_callback(access_audit_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    audit_callback_ = std::move(callback);
}

// =============================================================================
// Private Helpers
// =============================================================================

auto course_access_resolver::is_global_admin(std::int64_t user_id) -> Result<bool> {
    auto user = users_->find_user(user_id);
    if (user.is_err()) {
        return Result<bool>(user.error());
    }
    if (!user.value()) {
        logger_->debug_fmt("Unknown user {} treated as non-admin", user_id);
        return Result<bool>(false);
    }
    return Result<bool>(user.value()->is_global_admin());
}

void course_access_resolver::record(std::int64_t user_id, std::int64_t course_id,
                                    const course_access_result& result) {
    logger_adapter::log_access_decision(user_id, course_id, result.has_access,
                                        std::string{to_string(result.source)},
                                        result.role.value_or(""));

    access_audit_callback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = audit_callback_;
    }
    if (callback) {
        callback(user_id, course_id, result);
    }
}

}  // namespace lms::security
