/**
 * @file connection_registry_test.cpp
 * @brief Unit tests for the connection profile registry
 */

#include <migrator/client/connection_registry.hpp>
#include <migrator/storage/profile_repository.hpp>

#include "../mocks/migration_fakes.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>

using namespace migrator;
using namespace migrator::client;

namespace {

connection_profile make_profile(const std::string& name, const std::string& database,
                                environment env) {
    connection_profile profile;
    profile.name = name;
    profile.uri = "mongodb://localhost:27017";
    profile.database = database;
    profile.env = env;
    return profile;
}

}  // namespace

TEST_CASE("environment conversion", "[connection_profile]") {
    CHECK(std::string_view(to_string(environment::production)) == "production");
    CHECK(std::string_view(to_string(environment::staging)) == "staging");
    CHECK(std::string_view(to_string(environment::development)) == "development");

    CHECK(environment_from_string("staging") == environment::staging);
    CHECK(environment_from_string("Development") == environment::development);
    CHECK(environment_from_string("unknown") == environment::production);  // Default
}

TEST_CASE("make_profile_id", "[connection_registry]") {
    CHECK(connection_registry::make_profile_id("Orders (staging)") == "orders-staging");
    CHECK(connection_registry::make_profile_id("  Billing  DB ") == "billing-db");
    CHECK(connection_registry::make_profile_id("prod_1") == "prod-1");
    CHECK(connection_registry::make_profile_id("---").empty());
}

TEST_CASE("connection_registry in memory", "[connection_registry]") {
    auto logger = std::make_shared<migrator::testing::recording_logger>();
    connection_registry registry(nullptr, logger);

    SECTION("add assigns an id and returns the stored profile") {
        auto added = registry.add_profile(
            make_profile("Orders (staging)", "orders", environment::staging));
        REQUIRE(added.is_ok());
        CHECK(added.value().profile_id == "orders-staging");
        CHECK(registry.profile_count() == 1);
        CHECK(logger->contains("Added connection profile: orders-staging"));

        auto fetched = registry.get_profile("orders-staging");
        REQUIRE(fetched.is_ok());
        CHECK(fetched.value().database == "orders");
    }

    SECTION("explicit id is kept") {
        auto profile = make_profile("Orders", "orders", environment::production);
        profile.profile_id = "src";
        auto added = registry.add_profile(profile);
        REQUIRE(added.is_ok());
        CHECK(added.value().profile_id == "src");
    }

    SECTION("duplicate names are rejected") {
        REQUIRE(registry.add_profile(
            make_profile("Orders", "orders", environment::staging)).is_ok());

        auto other = make_profile("Orders", "orders_prod", environment::production);
        other.profile_id = "other-id";
        auto dup = registry.add_profile(other);
        REQUIRE(dup.is_err());
        CHECK(dup.error().code == error_codes::profile_already_exists);
        CHECK(dup.error().message == "Connection name already exists");
        CHECK(registry.profile_count() == 1);
    }

    SECTION("invalid profiles are rejected") {
        auto missing_db = make_profile("Orders", "", environment::staging);
        auto result = registry.add_profile(missing_db);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_argument);

        auto missing_uri = make_profile("Orders", "orders", environment::staging);
        missing_uri.uri.clear();
        CHECK(registry.add_profile(missing_uri).is_err());
        CHECK(registry.profile_count() == 0);
    }

    SECTION("unknown profile lookup") {
        auto result = registry.get_profile("nope");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::profile_not_found);
    }

    SECTION("update and remove") {
        REQUIRE(registry.add_profile(
            make_profile("Orders", "orders", environment::staging)).is_ok());

        auto changed = registry.get_profile("orders").value();
        changed.database = "orders_v2";
        REQUIRE(registry.update_profile(changed).is_ok());
        CHECK(registry.get_profile("orders").value().database == "orders_v2");

        REQUIRE(registry.remove_profile("orders").is_ok());
        CHECK(registry.profile_count() == 0);

        auto again = registry.remove_profile("orders");
        REQUIRE(again.is_err());
        CHECK(again.error().code == error_codes::profile_not_found);
    }

    SECTION("listing is sorted and grouped by environment") {
        REQUIRE(registry.add_profile(
            make_profile("Zeta", "z", environment::staging)).is_ok());
        REQUIRE(registry.add_profile(
            make_profile("Alpha", "a", environment::staging)).is_ok());
        REQUIRE(registry.add_profile(
            make_profile("Main", "m", environment::production)).is_ok());
        REQUIRE(registry.add_profile(
            make_profile("Local", "l", environment::development)).is_ok());

        auto all = registry.list_profiles();
        REQUIRE(all.size() == 4);
        CHECK(all[0].name == "Main");
        CHECK(all[1].name == "Alpha");
        CHECK(all[2].name == "Zeta");
        CHECK(all[3].name == "Local");

        auto grouped = registry.list_grouped();
        CHECK(grouped.size() == 3);
        CHECK(grouped[environment::production].size() == 1);
        CHECK(grouped[environment::staging].size() == 2);
        CHECK(grouped[environment::development].size() == 1);
    }
}

TEST_CASE("connection_registry pinning", "[connection_registry]") {
    connection_registry registry;
    REQUIRE(registry.add_profile(
        make_profile("Orders", "orders", environment::production)).is_ok());

    SECTION("pinned profile cannot be removed or updated") {
        REQUIRE(registry.pin("orders").is_ok());
        CHECK(registry.is_pinned("orders"));

        auto removed = registry.remove_profile("orders");
        REQUIRE(removed.is_err());
        CHECK(removed.error().code == error_codes::profile_in_use);

        auto changed = registry.get_profile("orders").value();
        changed.database = "other";
        auto updated = registry.update_profile(changed);
        REQUIRE(updated.is_err());
        CHECK(updated.error().code == error_codes::profile_in_use);

        registry.unpin("orders");
        CHECK_FALSE(registry.is_pinned("orders"));
        CHECK(registry.remove_profile("orders").is_ok());
    }

    SECTION("pins are counted") {
        REQUIRE(registry.pin("orders").is_ok());
        REQUIRE(registry.pin("orders").is_ok());
        registry.unpin("orders");
        CHECK(registry.is_pinned("orders"));
        registry.unpin("orders");
        CHECK_FALSE(registry.is_pinned("orders"));
    }

    SECTION("pinning an unknown profile fails") {
        auto result = registry.pin("missing");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::profile_not_found);
    }

    SECTION("unpin of an unpinned profile is harmless") {
        registry.unpin("orders");
        CHECK_FALSE(registry.is_pinned("orders"));
    }
}

TEST_CASE("connection_registry with a repository", "[connection_registry][storage]") {
    migrator::testing::temp_directory dir;
    auto path = (dir.path() / "connections.db").string();

    {
        auto repo = std::make_shared<storage::profile_repository>(path);
        REQUIRE(repo->is_valid());
        connection_registry registry(repo);

        auto added = registry.add_profile(
            make_profile("Orders (prod)", "orders_prod", environment::production));
        REQUIRE(added.is_ok());
        CHECK(added.value().pk > 0);
        CHECK(repo->exists("orders-prod"));
    }

    auto repo = std::make_shared<storage::profile_repository>(path);
    connection_registry reloaded(repo);
    CHECK(reloaded.profile_count() == 1);

    auto profile = reloaded.get_profile("orders-prod");
    REQUIRE(profile.is_ok());
    CHECK(profile.value().database == "orders_prod");

    REQUIRE(reloaded.remove_profile("orders-prod").is_ok());
    CHECK_FALSE(repo->exists("orders-prod"));
}
