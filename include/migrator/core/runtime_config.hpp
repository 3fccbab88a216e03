/**
 * @file runtime_config.hpp
 * @brief Process-wide configuration loaded from JSON files and the environment
 */

#pragma once

#include "migrator/core/result.hpp"
#include "migrator/integration/logger_adapter.hpp"
#include "migrator/migration/job_types.hpp"

#include <filesystem>
#include <string>

namespace migrator {

/**
 * @brief Everything needed to assemble the orchestrator and its collaborators
 */
struct runtime_config {
    /// SQLite file holding the connection profiles
    std::filesystem::path database_path{"connections.db"};

    integration::logger_config logging;

    migration::orchestrator_config orchestrator;
};

/**
 * @brief Apply a JSON document to a configuration
 *
 * Keys that are absent leave the current value untouched. Recognized layout:
 * @code
 * {
 *   "database": { "path": "connections.db" },
 *   "logging": { "directory": "logs", "level": "info", "console": true,
 *                "file": true, "audit": true, "maxFileSizeMb": 50, "maxFiles": 5 },
 *   "tools": { "mongodump": "mongodump", "mongorestore": "mongorestore",
 *              "mongosh": "mongosh", "dumpDirectory": "dump", "dropTarget": true,
 *              "environment": { "NAME": "value" } },
 *   "orchestrator": { "cancelGracePeriodMs": 5000, "statsTimeoutMs": 15000,
 *                     "phaseTimeoutMs": 0, "logTailLines": 20,
 *                     "subscriberQueueCapacity": 1024, "cleanupDumpDirectory": true }
 * }
 * @endcode
 *
 * @param text JSON text
 * @param config Configuration to update
 * @return VoidResult or config_parse_error
 */
[[nodiscard]] auto apply_config_json(const std::string& text, runtime_config& config)
    -> VoidResult;

/**
 * @brief Apply a JSON configuration file
 *
 * @return VoidResult, config_file_not_found or config_parse_error
 */
[[nodiscard]] auto load_config_file(const std::filesystem::path& path, runtime_config& config)
    -> VoidResult;

/**
 * @brief Apply environment variable overrides
 *
 * Recognized variables (with the default prefix): MIGRATOR_DB_PATH,
 * MIGRATOR_LOG_DIR, MIGRATOR_LOG_LEVEL, MIGRATOR_DUMP_DIR,
 * MIGRATOR_MONGODUMP, MIGRATOR_MONGORESTORE, MIGRATOR_MONGOSH.
 *
 * @param config Configuration to update
 * @param prefix Variable name prefix
 */
void apply_environment(runtime_config& config, const std::string& prefix = "MIGRATOR_");

}  // namespace migrator
