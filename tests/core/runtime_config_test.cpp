/**
 * @file runtime_config_test.cpp
 * @brief Unit tests for JSON and environment configuration loading
 */

#include <migrator/core/runtime_config.hpp>

#include "../mocks/migration_fakes.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <fstream>

using namespace migrator;

TEST_CASE("runtime_config defaults", "[config]") {
    runtime_config config;

    CHECK(config.database_path == "connections.db");
    CHECK(config.orchestrator.tools.dump_path == "mongodump");
    CHECK(config.orchestrator.tools.restore_path == "mongorestore");
    CHECK(config.orchestrator.tools.shell_path == "mongosh");
    CHECK(config.orchestrator.tools.drop_target);
    CHECK(config.orchestrator.cancel_grace_period == std::chrono::milliseconds{5000});
    CHECK(config.orchestrator.stats_timeout == std::chrono::milliseconds{15000});
    CHECK(config.orchestrator.phase_timeout == std::chrono::milliseconds{0});
    CHECK(config.logging.min_level == integration::log_level::info);
}

TEST_CASE("apply_config_json reads every section", "[config]") {
    runtime_config config;

    auto result = apply_config_json(R"({
        "database": {"path": "/var/lib/migrator/profiles.db"},
        "logging": {"directory": "/var/log/migrator", "level": "debug",
                    "console": false, "maxFiles": 3},
        "tools": {"mongodump": "/opt/mongo/bin/mongodump",
                  "mongorestore": "/opt/mongo/bin/mongorestore",
                  "dumpDirectory": "/tmp/migrator-dump",
                  "dropTarget": false,
                  "environment": {"TZ": "UTC"}},
        "orchestrator": {"cancelGracePeriodMs": 250, "statsTimeoutMs": 2000,
                         "logTailLines": 5, "cleanupDumpDirectory": false,
                         "maxRetainedJobs": 10, "retainedEventStreams": 2}
    })", config);

    REQUIRE(result.is_ok());
    CHECK(config.database_path == "/var/lib/migrator/profiles.db");
    CHECK(config.logging.log_directory == "/var/log/migrator");
    CHECK(config.logging.min_level == integration::log_level::debug);
    CHECK_FALSE(config.logging.enable_console);
    CHECK(config.logging.max_files == 3);

    const auto& tools = config.orchestrator.tools;
    CHECK(tools.dump_path == "/opt/mongo/bin/mongodump");
    CHECK(tools.restore_path == "/opt/mongo/bin/mongorestore");
    CHECK(tools.shell_path == "mongosh");
    CHECK(tools.dump_directory == "/tmp/migrator-dump");
    CHECK_FALSE(tools.drop_target);
    REQUIRE(tools.environment.count("TZ") == 1);
    CHECK(tools.environment.at("TZ") == "UTC");

    CHECK(config.orchestrator.cancel_grace_period == std::chrono::milliseconds{250});
    CHECK(config.orchestrator.stats_timeout == std::chrono::milliseconds{2000});
    CHECK(config.orchestrator.log_tail_lines == 5);
    CHECK_FALSE(config.orchestrator.cleanup_dump_directory);
    CHECK(config.orchestrator.max_retained_jobs == 10);
    CHECK(config.orchestrator.retained_event_streams == 2);
}

TEST_CASE("apply_config_json rejects bad input", "[config]") {
    runtime_config config;

    SECTION("malformed JSON") {
        auto result = apply_config_json("{ \"tools\": ", config);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::config_parse_error);
    }

    SECTION("root is not an object") {
        auto result = apply_config_json("[1, 2, 3]", config);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::config_parse_error);
    }

    SECTION("wrong value type") {
        auto result = apply_config_json(R"({"tools": {"dropTarget": "yes"}})", config);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::config_parse_error);
    }
}

TEST_CASE("load_config_file", "[config]") {
    migrator::testing::temp_directory dir;
    runtime_config config;

    SECTION("missing file") {
        auto result = load_config_file(dir.path() / "absent.json", config);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::config_file_not_found);
    }

    SECTION("file on disk") {
        auto path = dir.path() / "migrator.json";
        {
            std::ofstream out(path);
            out << R"({"tools": {"mongosh": "/usr/local/bin/mongosh"}})";
        }
        auto result = load_config_file(path, config);
        REQUIRE(result.is_ok());
        CHECK(config.orchestrator.tools.shell_path == "/usr/local/bin/mongosh");
    }
}

TEST_CASE("apply_environment overrides", "[config]") {
    runtime_config config;

    ::setenv("MIGRATOR_TEST_DB_PATH", "/data/profiles.db", 1);
    ::setenv("MIGRATOR_TEST_DUMP_DIR", "/scratch/dump", 1);
    ::setenv("MIGRATOR_TEST_LOG_LEVEL", "error", 1);

    apply_environment(config, "MIGRATOR_TEST_");

    CHECK(config.database_path == "/data/profiles.db");
    CHECK(config.orchestrator.tools.dump_directory == "/scratch/dump");
    CHECK(config.logging.min_level == integration::log_level::error);
    CHECK(config.orchestrator.tools.dump_path == "mongodump");

    ::unsetenv("MIGRATOR_TEST_DB_PATH");
    ::unsetenv("MIGRATOR_TEST_DUMP_DIR");
    ::unsetenv("MIGRATOR_TEST_LOG_LEVEL");
}
