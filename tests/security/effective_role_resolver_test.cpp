/**
 * @file effective_role_resolver_test.cpp
 * @brief Unit tests for inherited category role resolution
 */

#include <catch2/catch_test_macros.hpp>

#include <lms/security/effective_role_resolver.hpp>
#include <lms/storage/access_database.hpp>
#include <lms/storage/category_repository.hpp>
#include <lms/storage/role_assignment_repository.hpp>
#include <lms/storage/sqlite_course_directory.hpp>

#include <memory>

using namespace lms;
using namespace lms::security;
using namespace lms::storage;

namespace {

constexpr std::int64_t kUser = 7;
constexpr std::int64_t kOtherUser = 8;
constexpr std::int64_t kGrantor = 1;

/// Science -> Physics -> Quantum, plus an unrelated Arts root
struct hierarchy_fixture {
    hierarchy_fixture() {
        auto opened = access_database::open(":memory:");
        REQUIRE(opened.is_ok());
        db = opened.value();
        directory = std::make_shared<sqlite_course_directory>(db);
        categories = std::make_shared<category_repository>(db, directory);
        roles = std::make_shared<role_assignment_repository>(db, directory);
        resolver = std::make_shared<effective_role_resolver>(categories, roles);

        for (auto id : {kGrantor, kUser, kOtherUser}) {
            REQUIRE(directory->upsert_user({id, global_role::user}).is_ok());
        }

        science = categories->create("Science").value().id;
        physics = categories->create("Physics", science).value().id;
        quantum = categories->create("Quantum", physics).value().id;
        arts = categories->create("Arts").value().id;
    }

    void grant(std::int64_t user, std::int64_t category, category_role role) {
        REQUIRE(roles->assign({user, category, role, kGrantor, {}}).is_ok());
    }

    auto resolve(std::int64_t user, std::int64_t category) -> std::optional<category_role> {
        auto result = resolver->resolve(user, category);
        REQUIRE(result.is_ok());
        return result.value();
    }

    std::shared_ptr<access_database> db;
    std::shared_ptr<sqlite_course_directory> directory;
    std::shared_ptr<category_repository> categories;
    std::shared_ptr<role_assignment_repository> roles;
    std::shared_ptr<effective_role_resolver> resolver;

    std::int64_t science = 0;
    std::int64_t physics = 0;
    std::int64_t quantum = 0;
    std::int64_t arts = 0;
};

}  // namespace

TEST_CASE("effective_role_resolver without grants", "[resolver][role]") {
    hierarchy_fixture f;

    CHECK_FALSE(f.resolve(kUser, f.quantum).has_value());
    CHECK_FALSE(f.resolve(kUser, f.science).has_value());
}

TEST_CASE("effective_role_resolver inheritance", "[resolver][role]") {
    hierarchy_fixture f;

    SECTION("grant on the root reaches descendants") {
        f.grant(kUser, f.science, category_role::admin);

        CHECK(f.resolve(kUser, f.science) == category_role::admin);
        CHECK(f.resolve(kUser, f.physics) == category_role::admin);
        CHECK(f.resolve(kUser, f.quantum) == category_role::admin);
    }

    SECTION("grant does not flow upwards or sideways") {
        f.grant(kUser, f.physics, category_role::coordinator);

        CHECK_FALSE(f.resolve(kUser, f.science).has_value());
        CHECK_FALSE(f.resolve(kUser, f.arts).has_value());
        CHECK(f.resolve(kUser, f.quantum) == category_role::coordinator);
    }

    SECTION("grants of other users are ignored") {
        f.grant(kOtherUser, f.science, category_role::admin);

        CHECK_FALSE(f.resolve(kUser, f.physics).has_value());
    }
}

TEST_CASE("effective_role_resolver priority", "[resolver][role]") {
    hierarchy_fixture f;

    SECTION("ancestor admin beats a nearer reviewer") {
        f.grant(kUser, f.physics, category_role::reviewer);
        f.grant(kUser, f.science, category_role::admin);

        CHECK(f.resolve(kUser, f.physics) == category_role::admin);
    }

    SECTION("adding a lower role closer to the node keeps the result") {
        f.grant(kUser, f.science, category_role::coordinator);
        REQUIRE(f.resolve(kUser, f.quantum) == category_role::coordinator);

        f.grant(kUser, f.quantum, category_role::reviewer);
        CHECK(f.resolve(kUser, f.quantum) == category_role::coordinator);
    }

    SECTION("higher role on the node itself wins") {
        f.grant(kUser, f.science, category_role::reviewer);
        f.grant(kUser, f.quantum, category_role::admin);

        CHECK(f.resolve(kUser, f.quantum) == category_role::admin);
        CHECK(f.resolve(kUser, f.physics) == category_role::reviewer);
    }

    SECTION("revoking the winning grant falls back to the next one") {
        f.grant(kUser, f.science, category_role::admin);
        f.grant(kUser, f.physics, category_role::reviewer);

        REQUIRE(f.roles->revoke(kUser, f.science).is_ok());
        CHECK(f.resolve(kUser, f.quantum) == category_role::reviewer);
    }

    SECTION("reparenting changes the inherited role") {
        f.grant(kUser, f.arts, category_role::coordinator);
        REQUIRE(f.categories->update(f.quantum, category_update{.parent_id = f.arts})
                    .is_ok());

        CHECK(f.resolve(kUser, f.quantum) == category_role::coordinator);
    }
}

TEST_CASE("effective_role_resolver resolve_detailed", "[resolver][role]") {
    hierarchy_fixture f;

    SECTION("names the category holding the winning grant") {
        f.grant(kUser, f.science, category_role::admin);
        f.grant(kUser, f.physics, category_role::reviewer);

        auto detailed = f.resolver->resolve_detailed(kUser, f.quantum);
        REQUIRE(detailed.is_ok());
        REQUIRE(detailed.value().has_value());
        CHECK(detailed.value()->role == category_role::admin);
        CHECK(detailed.value()->granted_on == f.science);
    }

    SECTION("equal roles report the nearest grant") {
        f.grant(kUser, f.science, category_role::coordinator);
        f.grant(kUser, f.physics, category_role::coordinator);

        auto detailed = f.resolver->resolve_detailed(kUser, f.quantum);
        REQUIRE(detailed.is_ok());
        REQUIRE(detailed.value().has_value());
        CHECK(detailed.value()->granted_on == f.physics);
    }
}

TEST_CASE("effective_role_resolver unknown category", "[resolver][role]") {
    hierarchy_fixture f;

    auto result = f.resolver->resolve(kUser, 999);
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::not_found);
}
