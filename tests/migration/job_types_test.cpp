/**
 * @file job_types_test.cpp
 * @brief Unit tests for migration job types
 */

#include <migrator/migration/job_types.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string_view>

using namespace migrator::migration;

TEST_CASE("job_state conversion", "[job_types]") {
    SECTION("to_string conversion") {
        CHECK(std::string_view(to_string(job_state::pending)) == "pending");
        CHECK(std::string_view(to_string(job_state::confirmed)) == "confirmed");
        CHECK(std::string_view(to_string(job_state::exporting)) == "exporting");
        CHECK(std::string_view(to_string(job_state::export_complete)) == "export_complete");
        CHECK(std::string_view(to_string(job_state::importing)) == "importing");
        CHECK(std::string_view(to_string(job_state::completed)) == "completed");
        CHECK(std::string_view(to_string(job_state::failed)) == "failed");
        CHECK(std::string_view(to_string(job_state::cancelled)) == "cancelled");
    }

    SECTION("from_string conversion") {
        CHECK(job_state_from_string("exporting") == job_state::exporting);
        CHECK(job_state_from_string("export_complete") == job_state::export_complete);
        CHECK(job_state_from_string("cancelled") == job_state::cancelled);
        CHECK_FALSE(job_state_from_string("running").has_value());
    }

    SECTION("is_terminal_state") {
        CHECK_FALSE(is_terminal_state(job_state::pending));
        CHECK_FALSE(is_terminal_state(job_state::confirmed));
        CHECK_FALSE(is_terminal_state(job_state::exporting));
        CHECK_FALSE(is_terminal_state(job_state::export_complete));
        CHECK_FALSE(is_terminal_state(job_state::importing));
        CHECK(is_terminal_state(job_state::completed));
        CHECK(is_terminal_state(job_state::failed));
        CHECK(is_terminal_state(job_state::cancelled));
    }
}

TEST_CASE("log_source and stats tags", "[job_types]") {
    CHECK(std::string_view(to_string(log_source::export_)) == "export");
    CHECK(std::string_view(to_string(log_source::import_)) == "import");
    CHECK(std::string_view(to_string(log_source::system)) == "system");
    CHECK(std::string_view(to_string(stats_side::source)) == "source");
    CHECK(std::string_view(to_string(stats_side::target)) == "target");
    CHECK(std::string_view(to_string(stats_phase::before)) == "before");
    CHECK(std::string_view(to_string(stats_phase::after)) == "after");
}

TEST_CASE("migration_job helpers", "[job_types]") {
    migration_job job;

    SECTION("fresh job") {
        CHECK_FALSE(job.is_finished());
        CHECK(job.can_cancel());
        CHECK(job.duration() == std::chrono::milliseconds{0});
    }

    SECTION("terminal job") {
        auto start = std::chrono::system_clock::now();
        job.state = job_state::completed;
        job.started_at = start;
        job.finished_at = start + std::chrono::milliseconds{1500};

        CHECK(job.is_finished());
        CHECK_FALSE(job.can_cancel());
        CHECK(job.duration() == std::chrono::milliseconds{1500});
    }
}

TEST_CASE("orchestrator_config defaults", "[job_types]") {
    orchestrator_config config;

    CHECK(config.tools.dump_path == "mongodump");
    CHECK(config.tools.restore_path == "mongorestore");
    CHECK(config.tools.drop_target);
    CHECK(config.cancel_grace_period == std::chrono::milliseconds{5000});
    CHECK(config.stats_timeout == std::chrono::milliseconds{15000});
    CHECK(config.log_tail_lines == 20);
    CHECK(config.subscriber_queue_capacity == 1024);
}
