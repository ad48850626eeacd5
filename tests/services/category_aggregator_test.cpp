/**
 * @file category_aggregator_test.cpp
 * @brief Unit tests for derived category counts and the annotated tree
 */

#include <catch2/catch_test_macros.hpp>

#include "mocks/mock_collaborators.hpp"

#include <lms/services/category_aggregator.hpp>
#include <lms/storage/access_database.hpp>
#include <lms/storage/category_repository.hpp>

#include <functional>
#include <memory>

using namespace lms;
using namespace lms::services;
using namespace lms::storage;
using lms::test::MockCollaborators;

namespace {

/**
 * Arts (1 course)
 * Science (2)
 *   Biology (0)
 *   Physics (3)
 *     Quantum (1)
 * plus one uncategorized course.
 */
struct aggregator_fixture {
    aggregator_fixture() {
        auto opened = access_database::open(":memory:");
        REQUIRE(opened.is_ok());
        db = opened.value();

        catalog = std::make_shared<MockCollaborators>();
        categories = std::make_shared<category_repository>(db, catalog);
        aggregator = std::make_shared<category_aggregator>(categories, catalog);

        science = categories->create("Science").value().id;
        physics = categories->create("Physics", science).value().id;
        quantum = categories->create("Quantum", physics).value().id;
        biology = categories->create("Biology", science).value().id;
        arts = categories->create("Arts").value().id;

        std::int64_t next_course = 100;
        auto file = [&](std::int64_t category, int count) {
            for (int i = 0; i < count; ++i) {
                catalog->add_course(next_course++, category);
            }
        };
        file(science, 2);
        file(physics, 3);
        file(quantum, 1);
        file(arts, 1);
        catalog->add_course(next_course++, std::nullopt);
    }

    std::shared_ptr<access_database> db;
    std::shared_ptr<MockCollaborators> catalog;
    std::shared_ptr<category_repository> categories;
    std::shared_ptr<category_aggregator> aggregator;

    std::int64_t science = 0;
    std::int64_t physics = 0;
    std::int64_t quantum = 0;
    std::int64_t biology = 0;
    std::int64_t arts = 0;
};

}  // namespace

TEST_CASE("category_aggregator direct counts", "[aggregator][count]") {
    aggregator_fixture f;

    CHECK(f.aggregator->direct_courses_count(f.science).value() == 2);
    CHECK(f.aggregator->direct_courses_count(f.biology).value() == 0);
    CHECK(f.aggregator->direct_subcategories_count(f.science).value() == 2);
    CHECK(f.aggregator->direct_subcategories_count(f.quantum).value() == 0);
}

TEST_CASE("category_aggregator nested counts", "[aggregator][count]") {
    aggregator_fixture f;

    SECTION("totals include every descendant") {
        CHECK(f.aggregator->total_nested_courses_count(f.science).value() == 6);
        CHECK(f.aggregator->total_nested_courses_count(f.physics).value() == 4);
        CHECK(f.aggregator->total_nested_courses_count(f.quantum).value() == 1);
        CHECK(f.aggregator->total_nested_courses_count(f.biology).value() == 0);
    }

    SECTION("total equals direct plus children's totals") {
        for (auto id : {f.science, f.physics, f.quantum, f.biology, f.arts}) {
            auto total = f.aggregator->total_nested_courses_count(id);
            auto direct = f.aggregator->direct_courses_count(id);
            auto children = f.categories->find_children(id);
            REQUIRE(total.is_ok());
            REQUIRE(direct.is_ok());
            REQUIRE(children.is_ok());

            std::size_t sum = direct.value();
            for (const auto& child : children.value()) {
                sum += f.aggregator->total_nested_courses_count(child.id).value();
            }
            CHECK(total.value() == sum);
        }
    }

    SECTION("moving a subtree moves its courses") {
        REQUIRE(f.categories->update(f.physics, category_update{.parent_id = f.arts})
                    .is_ok());

        CHECK(f.aggregator->total_nested_courses_count(f.science).value() == 2);
        CHECK(f.aggregator->total_nested_courses_count(f.arts).value() == 5);
    }

    SECTION("stats combines the three counts") {
        auto stats = f.aggregator->stats(f.physics);
        REQUIRE(stats.is_ok());
        CHECK(stats.value().direct_courses_count == 3);
        CHECK(stats.value().direct_subcategories_count == 1);
        CHECK(stats.value().total_nested_courses_count == 4);
    }
}

TEST_CASE("category_aggregator unknown category", "[aggregator][error]") {
    aggregator_fixture f;

    CHECK(f.aggregator->direct_courses_count(999).error().code == error_codes::not_found);
    CHECK(f.aggregator->direct_subcategories_count(999).error().code ==
          error_codes::not_found);
    CHECK(f.aggregator->total_nested_courses_count(999).error().code ==
          error_codes::not_found);
    CHECK(f.aggregator->stats(999).is_err());
}

TEST_CASE("category_aggregator build_tree", "[aggregator][tree]") {
    aggregator_fixture f;

    auto tree = f.aggregator->build_tree();
    REQUIRE(tree.is_ok());

    const auto& roots = tree.value();
    REQUIRE(roots.size() == 2);
    CHECK(roots[0].name == "Arts");
    CHECK(roots[0].total_nested_courses_count == 1);

    const auto& science = roots[1];
    CHECK(science.name == "Science");
    CHECK_FALSE(science.parent_id.has_value());
    CHECK(science.direct_courses_count == 2);
    CHECK(science.direct_subcategories_count == 2);
    CHECK(science.total_nested_courses_count == 6);

    REQUIRE(science.subcategories.size() == 2);
    CHECK(science.subcategories[0].name == "Biology");
    const auto& physics = science.subcategories[1];
    CHECK(physics.name == "Physics");
    CHECK(physics.parent_id == f.science);
    CHECK(physics.total_nested_courses_count == 4);
    REQUIRE(physics.subcategories.size() == 1);
    CHECK(physics.subcategories[0].total_nested_courses_count == 1);

    SECTION("every node agrees with the per-category queries") {
        std::function<void(const category_tree_node&)> verify =
            [&](const category_tree_node& node) {
                CHECK(node.total_nested_courses_count ==
                      f.aggregator->total_nested_courses_count(node.id).value());
                CHECK(node.direct_subcategories_count == node.subcategories.size());
                for (const auto& child : node.subcategories) {
                    verify(child);
                }
            };
        for (const auto& root : roots) {
            verify(root);
        }
    }
}

TEST_CASE("category_aggregator empty forest", "[aggregator][tree]") {
    auto opened = access_database::open(":memory:");
    REQUIRE(opened.is_ok());
    auto catalog = std::make_shared<MockCollaborators>();
    auto categories = std::make_shared<category_repository>(opened.value(), catalog);
    category_aggregator aggregator(categories, catalog);

    auto tree = aggregator.build_tree();
    REQUIRE(tree.is_ok());
    CHECK(tree.value().empty());
}

TEST_CASE("category_aggregator catalog failure", "[aggregator][error]") {
    aggregator_fixture f;
    f.catalog->fail_lookups = true;

    auto total = f.aggregator->total_nested_courses_count(f.science);
    REQUIRE(total.is_err());
    CHECK(total.error().code == error_codes::database_query_error);
    CHECK(f.aggregator->build_tree().is_err());
}
