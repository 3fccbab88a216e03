/**
 * @file connection_probe.hpp
 * @brief Reachability and dbStats queries against MongoDB deployments
 *
 * This file provides the database_probe interface used by the stats
 * reconciler and the preflight check, and an implementation that drives
 * the MongoDB shell through a process_runner.
 */

#pragma once

#include "migrator/client/connection_profile.hpp"
#include "migrator/core/result.hpp"
#include "migrator/di/ilogger.hpp"
#include "migrator/migration/process_runner.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace migrator::migration {

/**
 * @brief Raw counters returned by the dbStats command
 */
struct database_stats {
    uint64_t collections{0};
    uint64_t objects{0};
    uint64_t data_size{0};
    uint64_t storage_size{0};
};

// =============================================================================
// Probe Interface
// =============================================================================

/**
 * @brief Queries a deployment for reachability and database statistics
 */
class database_probe {
public:
    virtual ~database_probe() = default;

    /**
     * @brief Check that the deployment answers
     *
     * @param uri Connection string
     * @return The server version, or connectivity_error / connectivity_timeout
     */
    [[nodiscard]] virtual auto ping(const std::string& uri) -> Result<std::string> = 0;

    /**
     * @brief Run dbStats on one database
     *
     * @param uri Connection string
     * @param database Logical database name
     * @param cancel Token that abandons the query when set
     * @return The counters, or connectivity_error / connectivity_timeout /
     *         stats_parse_error
     */
    [[nodiscard]] virtual auto db_stats(const std::string& uri, const std::string& database,
                                        const cancellation_token& cancel)
        -> Result<database_stats> = 0;

protected:
    database_probe() = default;
};

// =============================================================================
// mongosh Implementation
// =============================================================================

/**
 * @brief database_probe running `mongosh --quiet --eval` per query
 *
 * The script prints one relaxed Extended JSON document which is parsed
 * with nlohmann::json. Lines that are not JSON (shell warnings) are ignored.
 */
class mongosh_probe final : public database_probe {
public:
    /**
     * @brief Construct a probe
     *
     * @param runner Runner used to start the shell
     * @param shell_path mongosh executable
     * @param timeout Upper bound per query
     * @param environment Extra environment for the shell
     * @param logger Logger instance (optional, defaults to NullLogger)
     */
    mongosh_probe(std::shared_ptr<process_runner> runner,
                  std::string shell_path = "mongosh",
                  std::chrono::milliseconds timeout = std::chrono::milliseconds{15000},
                  std::map<std::string, std::string> environment = {},
                  std::shared_ptr<di::ILogger> logger = nullptr);

    [[nodiscard]] auto ping(const std::string& uri) -> Result<std::string> override;

    [[nodiscard]] auto db_stats(const std::string& uri, const std::string& database,
                                const cancellation_token& cancel)
        -> Result<database_stats> override;

    /**
     * @brief Parse the shell output of a dbStats script
     *
     * @param lines Output lines of the shell
     * @return The counters, or stats_parse_error
     */
    [[nodiscard]] static auto parse_db_stats(const std::vector<std::string>& lines)
        -> Result<database_stats>;

    /**
     * @brief Parse the shell output of a ping script
     *
     * @return The server version, or stats_parse_error
     */
    [[nodiscard]] static auto parse_ping(const std::vector<std::string>& lines)
        -> Result<std::string>;

private:
    [[nodiscard]] auto evaluate(const std::string& uri, const std::string& script,
                                const cancellation_token& cancel)
        -> Result<std::vector<std::string>>;

    std::shared_ptr<process_runner> runner_;
    std::string shell_path_;
    std::chrono::milliseconds timeout_;
    std::map<std::string, std::string> environment_;
    std::shared_ptr<di::ILogger> logger_;
};

// =============================================================================
// Preflight
// =============================================================================

/**
 * @brief Outcome of one preflight check
 */
struct preflight_check {
    bool passed{false};
    std::string message;
};

/**
 * @brief Verify that source and target are reachable
 *
 * The source is checked first; when it fails the target is not contacted.
 *
 * @return One entry per check performed, in order
 */
[[nodiscard]] auto run_preflight(database_probe& probe,
                                 const client::connection_profile& source,
                                 const client::connection_profile& target)
    -> std::vector<preflight_check>;

/**
 * @brief True when every check passed
 */
[[nodiscard]] auto preflight_passed(const std::vector<preflight_check>& checks) -> bool;

}  // namespace migrator::migration
