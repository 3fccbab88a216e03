/**
 * @file events_test.cpp
 * @brief Unit tests for migration event types and event bus integration
 */

#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

#include "migrator/client/connection_registry.hpp"
#include "migrator/core/events.hpp"
#include "migrator/migration/migration_orchestrator.hpp"
#include "migrator/migration/process_runner.hpp"
#include "../mocks/migration_fakes.hpp"
#include <kcenon/common/patterns/event_bus.h>

using namespace migrator::events;

// ============================================================================
// Event Type Construction Tests
// ============================================================================

TEST_CASE("migration_started_event construction", "[events][migration]") {
    migration_started_event event{
        "3f2b1c4e-0000-4000-8000-000000000001",
        "Orders (staging)",
        "Orders (production)",
        "orders_prod"
    };

    CHECK(event.job_id == "3f2b1c4e-0000-4000-8000-000000000001");
    CHECK(event.source_name == "Orders (staging)");
    CHECK(event.target_name == "Orders (production)");
    CHECK(event.target_database == "orders_prod");
    CHECK(event.timestamp.time_since_epoch().count() > 0);
}

TEST_CASE("migration_rejected_event construction", "[events][migration]") {
    migration_rejected_event event{"tgt", "confirmation_mismatch"};

    CHECK(event.target_profile_id == "tgt");
    CHECK(event.reason == "confirmation_mismatch");
}

TEST_CASE("migration_finished_event construction", "[events][migration]") {
    migration_finished_event event{
        "job-1",
        "failed",
        "import_failed",
        std::chrono::milliseconds{5000}
    };

    CHECK(event.final_state == "failed");
    CHECK(event.reason == "import_failed");
    CHECK(event.duration.count() == 5000);
}

// ============================================================================
// Event Bus Integration Tests
// ============================================================================

TEST_CASE("Event bus publish and subscribe", "[events][integration]") {
    auto& bus = kcenon::common::get_event_bus();

    std::atomic<int> event_count{0};
    std::string received_job_id;

    auto sub_id = bus.subscribe<migration_finished_event>(
        [&](const migration_finished_event& evt) {
            event_count++;
            received_job_id = evt.job_id;
        }
    );

    bus.publish(migration_finished_event{
        "job-42", "completed", "", std::chrono::milliseconds{1200}
    });

    // Give time for async processing if any
    std::this_thread::sleep_for(std::chrono::milliseconds{10});

    CHECK(event_count == 1);
    CHECK(received_job_id == "job-42");

    bus.unsubscribe(sub_id);
}

TEST_CASE("Orchestrator publishes rejection events", "[events][integration]") {
    auto& bus = kcenon::common::get_event_bus();

    std::mutex mutex;
    std::vector<std::string> reasons;
    auto sub_id = bus.subscribe<migration_rejected_event>(
        [&](const migration_rejected_event& evt) {
            std::lock_guard<std::mutex> lock(mutex);
            reasons.push_back(evt.reason);
        }
    );

    auto registry = std::make_shared<migrator::client::connection_registry>();
    migrator::client::connection_profile target;
    target.profile_id = "tgt";
    target.name = "Orders (production)";
    target.uri = "mongodb://prod:27017";
    target.database = "orders_prod";
    REQUIRE(registry->add_profile(target).is_ok());

    migrator::migration::migration_orchestrator orchestrator(
        migrator::migration::orchestrator_config{}, registry,
        std::make_shared<migrator::migration::posix_process_runner>(),
        std::make_shared<migrator::testing::fake_probe>());

    migrator::migration::start_request request;
    request.source_profile_id = "tgt";
    request.target_profile_id = "tgt";
    request.risk_acknowledged = true;
    request.typed_name = "ORDERS_PROD";
    REQUIRE(orchestrator.start_migration(request).is_err());

    request.target_profile_id = "missing";
    REQUIRE(orchestrator.start_migration(request).is_err());

    std::this_thread::sleep_for(std::chrono::milliseconds{10});

    {
        std::lock_guard<std::mutex> lock(mutex);
        REQUIRE(reasons.size() == 2);
        CHECK(reasons[0] == "confirmation_mismatch");
        CHECK(reasons[1] == "profile_not_found");
    }

    bus.unsubscribe(sub_id);
}
