/**
 * @file confirmation_guard_test.cpp
 * @brief Unit tests for the destructive-action confirmation guard
 */

#include <migrator/client/connection_registry.hpp>
#include <migrator/migration/confirmation_guard.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <memory>
#include <string>

using namespace migrator;
using namespace migrator::migration;

namespace {

std::shared_ptr<client::connection_registry> make_registry() {
    auto registry = std::make_shared<client::connection_registry>();

    client::connection_profile staging;
    staging.profile_id = "src";
    staging.name = "Orders (staging)";
    staging.uri = "mongodb://staging:27017";
    staging.database = "orders";
    staging.env = client::environment::staging;
    (void)registry->add_profile(staging);

    client::connection_profile production;
    production.profile_id = "tgt";
    production.name = "Orders (production)";
    production.uri = "mongodb://prod:27017";
    production.database = "orders_prod";
    production.env = client::environment::production;
    (void)registry->add_profile(production);

    return registry;
}

start_request make_request(bool ack, std::string typed) {
    start_request request;
    request.source_profile_id = "src";
    request.target_profile_id = "tgt";
    request.risk_acknowledged = ack;
    request.typed_name = std::move(typed);
    return request;
}

}  // namespace

TEST_CASE("confirmation_guard approves the exact gesture", "[confirmation_guard]") {
    confirmation_guard guard(make_registry(), [] { return false; });

    auto result = guard.authorize(make_request(true, "orders_prod"));
    REQUIRE(result.is_ok());
    CHECK(result.value().profile_id == "tgt");
    CHECK(result.value().database == "orders_prod");
}

TEST_CASE("confirmation_guard rejects mismatches", "[confirmation_guard]") {
    confirmation_guard guard(make_registry(), [] { return false; });

    SECTION("different case") {
        auto result = guard.authorize(make_request(true, "orders_Prod"));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::confirmation_mismatch);
    }

    SECTION("trailing whitespace") {
        auto result = guard.authorize(make_request(true, "orders_prod "));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::confirmation_mismatch);
    }

    SECTION("display name instead of database name") {
        auto result = guard.authorize(make_request(true, "Orders (production)"));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::confirmation_mismatch);
    }

    SECTION("empty typed name") {
        auto result = guard.authorize(make_request(true, ""));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::confirmation_mismatch);
    }

    SECTION("risk not acknowledged") {
        auto result = guard.authorize(make_request(false, "orders_prod"));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::confirmation_mismatch);
    }
}

TEST_CASE("confirmation_guard checks the active job", "[confirmation_guard]") {
    std::atomic<bool> active{true};
    confirmation_guard guard(make_registry(), [&active] { return active.load(); });

    auto busy = guard.authorize(make_request(true, "orders_prod"));
    REQUIRE(busy.is_err());
    CHECK(busy.error().code == error_codes::job_in_progress);

    // A wrong gesture is reported as a mismatch even while busy.
    auto wrong = guard.authorize(make_request(true, "orders"));
    REQUIRE(wrong.is_err());
    CHECK(wrong.error().code == error_codes::confirmation_mismatch);

    active = false;
    CHECK(guard.authorize(make_request(true, "orders_prod")).is_ok());
}

TEST_CASE("confirmation_guard unknown target", "[confirmation_guard]") {
    confirmation_guard guard(make_registry(), [] { return false; });

    auto request = make_request(true, "orders_prod");
    request.target_profile_id = "missing";
    auto result = guard.authorize(request);
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::profile_not_found);
}

TEST_CASE("rejection_reason names", "[confirmation_guard]") {
    CHECK(std::string(rejection_reason(error_codes::confirmation_mismatch)) ==
          "confirmation_mismatch");
    CHECK(std::string(rejection_reason(error_codes::job_in_progress)) == "job_in_progress");
    CHECK(std::string(rejection_reason(error_codes::profile_not_found)) ==
          "profile_not_found");
    CHECK(std::string(rejection_reason(error_codes::export_failed)) == "error");
}
