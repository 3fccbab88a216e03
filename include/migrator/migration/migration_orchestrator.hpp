/**
 * @file migration_orchestrator.hpp
 * @brief Supervised two-phase (export, import) migration pipeline
 *
 * This file provides the migration_orchestrator class: the only component
 * allowed to create migration jobs. It gates every start request through
 * the confirmation guard, holds the single active-job slot, runs the export
 * and import tools through a process_runner on the shared thread pool and
 * streams everything that happens to the telemetry channel.
 */

#pragma once

#include "migrator/client/connection_profile.hpp"
#include "migrator/core/result.hpp"
#include "migrator/di/ilogger.hpp"
#include "migrator/migration/job_types.hpp"
#include "migrator/migration/telemetry_channel.hpp"

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations
namespace migrator::client {
class connection_registry;
}

namespace migrator::migration {

class database_probe;
class process_runner;

/**
 * @brief Runs migration jobs one at a time
 *
 * Job lifecycle:
 * @code
 * pending -> confirmed -> exporting -> export_complete -> importing -> completed
 *    \___________\____________\_______________\_______________\-> failed | cancelled
 * @endcode
 *
 * Provides:
 * - start_migration / cancel_migration / get_job_status / list_jobs
 * - Live event streams through subscribe_to_job
 * - Completion notification through wait_for_completion and a callback
 *
 * Finished jobs are retained up to orchestrator_config::max_retained_jobs;
 * older ones are forgotten when the next job starts.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - The active-job slot is taken with a compare-and-swap, so concurrent
 *   start requests can never create two active jobs
 *
 * @example
 * @code
 * auto orchestrator = std::make_shared<migration_orchestrator>(
 *     config, registry, runner, probe, logger);
 *
 * start_request request;
 * request.source_profile_id = "orders-staging";
 * request.target_profile_id = "orders-prod";
 * request.risk_acknowledged = true;
 * request.typed_name = "orders_prod";
 *
 * auto job_id = orchestrator->start_migration(request);
 * if (job_id.is_ok()) {
 *     auto sub = orchestrator->subscribe_to_job(job_id.value());
 *     while (auto event = sub.value().next()) { ... }
 * }
 * @endcode
 */
class migration_orchestrator {
public:
    /**
     * @brief Construct an orchestrator
     *
     * @param config Tool locations, timeouts and channel sizing
     * @param registry Source of connection profiles
     * @param runner Runner for the export and import tools
     * @param probe Probe used for before/after statistics
     * @param logger Logger instance (optional, defaults to NullLogger)
     */
    migration_orchestrator(orchestrator_config config,
                           std::shared_ptr<client::connection_registry> registry,
                           std::shared_ptr<process_runner> runner,
                           std::shared_ptr<database_probe> probe,
                           std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Cancels the active job, if any, and waits for it to finish
     */
    ~migration_orchestrator();

    migration_orchestrator(const migration_orchestrator&) = delete;
    auto operator=(const migration_orchestrator&) -> migration_orchestrator& = delete;
    migration_orchestrator(migration_orchestrator&&) = delete;
    auto operator=(migration_orchestrator&&) -> migration_orchestrator& = delete;

    // =========================================================================
    // Job Control
    // =========================================================================

    /**
     * @brief Check a start request without starting anything
     *
     * @return The target profile on approval, or confirmation_mismatch /
     *         job_in_progress / profile_not_found
     */
    [[nodiscard]] auto authorize(const start_request& request) const
        -> Result<client::connection_profile>;

    /**
     * @brief Authorize a request and start its job
     *
     * On success the job is already in the confirmed state and its pipeline
     * has been handed to the thread pool. On failure no job exists.
     *
     * @param request The operator's request
     * @return The new job's identifier, or the rejection
     */
    [[nodiscard]] auto start_migration(const start_request& request) -> Result<std::string>;

    /**
     * @brief Request cancellation of a job
     *
     * Returns once the request is recorded; the job becomes cancelled after
     * the running tool has exited. Use wait_for_completion() to wait for it.
     *
     * @param job_id Job to cancel
     * @return VoidResult, job_not_found or job_not_active
     */
    [[nodiscard]] auto cancel_migration(std::string_view job_id) -> VoidResult;

    /**
     * @brief Attach to a job's event stream
     *
     * For a finished job whose event stream was already released, the
     * replay is rebuilt from the job record: statistics, log lines and the
     * terminal state change.
     *
     * @param job_id Job to observe
     * @param replay_history Deliver the events recorded so far first
     * @return The subscription, or job_not_found
     */
    [[nodiscard]] auto subscribe_to_job(std::string_view job_id, bool replay_history = false)
        -> Result<subscription>;

    /**
     * @brief Snapshot of a job
     *
     * @return A copy of the job, or job_not_found
     */
    [[nodiscard]] auto get_job_status(std::string_view job_id) const -> Result<migration_job>;

    /**
     * @brief Snapshots of every retained job, oldest first
     */
    [[nodiscard]] auto list_jobs() const -> std::vector<migration_job>;

    /**
     * @brief Identifier of the job holding the active slot
     */
    [[nodiscard]] auto active_job_id() const -> std::optional<std::string>;

    [[nodiscard]] auto has_active_job() const noexcept -> bool;

    // =========================================================================
    // Completion
    // =========================================================================

    /**
     * @brief Future that becomes ready with the job's final snapshot
     *
     * For an unknown job_id the future holds std::out_of_range.
     */
    [[nodiscard]] auto wait_for_completion(std::string_view job_id)
        -> std::future<migration_job>;

    /**
     * @brief Callback invoked on the pipeline thread after a job finishes
     */
    void set_completion_callback(job_completion_callback callback);

    [[nodiscard]] auto config() const noexcept -> const orchestrator_config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace migrator::migration
