/**
 * @file job_types.hpp
 * @brief Job types and structures for supervised database migrations
 *
 * This file provides the data structures shared by the orchestrator and its
 * observers: job states, log lines, statistics snapshots, the job record
 * itself and the orchestrator configuration.
 */

#pragma once

#include "migrator/client/connection_profile.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace migrator::migration {

// =============================================================================
// Job State
// =============================================================================

/**
 * @brief Lifecycle state of a migration job
 *
 * Forward order is pending, confirmed, exporting, export_complete,
 * importing, completed. failed and cancelled are reachable from any
 * non-terminal state.
 */
enum class job_state {
    pending,          ///< Job object created, not yet confirmed
    confirmed,        ///< Confirmation guard approved the request
    exporting,        ///< Export tool is running against the source
    export_complete,  ///< Export tool exited with status 0
    importing,        ///< Import tool is running against the target
    completed,        ///< Import tool exited with status 0
    failed,           ///< A phase failed
    cancelled         ///< Operator cancelled the job
};

/**
 * @brief Convert job_state to string representation
 * @param state The state to convert
 * @return String representation of the state
 */
[[nodiscard]] constexpr const char* to_string(job_state state) noexcept {
    switch (state) {
        case job_state::pending: return "pending";
        case job_state::confirmed: return "confirmed";
        case job_state::exporting: return "exporting";
        case job_state::export_complete: return "export_complete";
        case job_state::importing: return "importing";
        case job_state::completed: return "completed";
        case job_state::failed: return "failed";
        case job_state::cancelled: return "cancelled";
        default: return "unknown";
    }
}

/**
 * @brief Parse job_state from string
 * @param str The string to parse
 * @return Parsed state, or std::nullopt if unknown
 */
[[nodiscard]] inline std::optional<job_state> job_state_from_string(std::string_view str) noexcept {
    if (str == "pending") return job_state::pending;
    if (str == "confirmed") return job_state::confirmed;
    if (str == "exporting") return job_state::exporting;
    if (str == "export_complete") return job_state::export_complete;
    if (str == "importing") return job_state::importing;
    if (str == "completed") return job_state::completed;
    if (str == "failed") return job_state::failed;
    if (str == "cancelled") return job_state::cancelled;
    return std::nullopt;
}

/**
 * @brief Check if a job state is terminal
 * @param state The state to check
 * @return true for completed, failed and cancelled
 */
[[nodiscard]] constexpr bool is_terminal_state(job_state state) noexcept {
    return state == job_state::completed ||
           state == job_state::failed ||
           state == job_state::cancelled;
}

// =============================================================================
// Log Lines
// =============================================================================

/**
 * @brief Producer of a log line
 */
enum class log_source {
    export_,  ///< Output of the export tool
    import_,  ///< Output of the import tool
    system    ///< Orchestrator messages
};

[[nodiscard]] constexpr const char* to_string(log_source source) noexcept {
    switch (source) {
        case log_source::export_: return "export";
        case log_source::import_: return "import";
        case log_source::system: return "system";
        default: return "unknown";
    }
}

/**
 * @brief One line of job output
 *
 * Sequence numbers start at 1 and increase by one per job.
 */
struct log_line {
    uint64_t sequence{0};
    log_source source{log_source::system};
    std::chrono::system_clock::time_point timestamp;
    std::string text;  ///< Credential-redacted line content
};

// =============================================================================
// Statistics
// =============================================================================

enum class stats_side { source, target };

enum class stats_phase { before, after };

[[nodiscard]] constexpr const char* to_string(stats_side side) noexcept {
    return side == stats_side::source ? "source" : "target";
}

[[nodiscard]] constexpr const char* to_string(stats_phase phase) noexcept {
    return phase == stats_phase::before ? "before" : "after";
}

/**
 * @brief Point-in-time collection and document counts of one database
 *
 * A snapshot whose query failed is kept with available == false and the
 * failure text in error; its counters are zero.
 */
struct stats_snapshot {
    stats_side side{stats_side::source};
    stats_phase phase{stats_phase::before};
    std::chrono::system_clock::time_point timestamp;

    bool available{false};
    std::string error;

    uint64_t collections{0};
    uint64_t objects{0};
    uint64_t data_size{0};     ///< Uncompressed data size in bytes
    uint64_t storage_size{0};  ///< Allocated storage in bytes
};

// =============================================================================
// Migration Job
// =============================================================================

/**
 * @brief Terminal error detail of a failed or cancelled job
 */
struct job_error {
    std::string reason;                 ///< Reason code, e.g. "import_failed"
    std::string message;                ///< Human-readable description
    std::optional<int> exit_code;       ///< Tool exit code when a tool ran
    std::vector<std::string> log_tail;  ///< Last lines of output before the failure
};

/**
 * @brief Snapshot of one migration job
 *
 * The orchestrator owns the live record; every accessor hands out copies.
 */
struct migration_job {
    std::string job_id;  ///< UUID v4

    client::connection_profile source;  ///< Copy taken at creation time
    client::connection_profile target;  ///< Copy taken at creation time

    job_state state{job_state::pending};
    std::vector<job_state> history;  ///< Every state entered, in order

    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> started_at;   ///< Set once past pending
    std::optional<std::chrono::system_clock::time_point> finished_at;  ///< Set iff terminal

    std::optional<stats_snapshot> pre_stats;
    std::optional<stats_snapshot> post_stats;

    std::vector<log_line> logs;
    std::optional<job_error> error;

    [[nodiscard]] bool is_finished() const noexcept {
        return is_terminal_state(state);
    }

    [[nodiscard]] bool can_cancel() const noexcept {
        return !is_terminal_state(state);
    }

    /**
     * @brief Job duration from start to finish (or now while running)
     */
    [[nodiscard]] std::chrono::milliseconds duration() const noexcept {
        if (!started_at.has_value()) {
            return std::chrono::milliseconds{0};
        }
        auto end_time = finished_at.value_or(std::chrono::system_clock::now());
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - started_at.value());
    }
};

// =============================================================================
// Requests
// =============================================================================

/**
 * @brief Operator request to start a migration
 */
struct start_request {
    std::string source_profile_id;
    std::string target_profile_id;
    bool risk_acknowledged{false};
    std::string typed_name;  ///< Must equal the target database name exactly
};

// =============================================================================
// Callbacks
// =============================================================================

/**
 * @brief Callback for job completion
 *
 * @param job_id The ID of the job
 * @param job Final job snapshot
 */
using job_completion_callback = std::function<void(
    const std::string& job_id,
    const migration_job& job)>;

// =============================================================================
// Configuration
// =============================================================================

/**
 * @brief Locations and options of the external tool pair
 */
struct tool_config {
    std::string dump_path{"mongodump"};        ///< Export tool
    std::string restore_path{"mongorestore"};  ///< Import tool
    std::string shell_path{"mongosh"};         ///< Shell used for stats and ping

    /// Directory the export tool writes into and the import tool reads from
    std::filesystem::path dump_directory{"dump"};

    /// Pass --drop to the import tool
    bool drop_target{true};

    /// Extra environment variables for every tool invocation
    std::map<std::string, std::string> environment;
};

/**
 * @brief Configuration for the migration orchestrator
 */
struct orchestrator_config {
    tool_config tools;

    /// Time between SIGTERM and SIGKILL when cancelling a tool
    std::chrono::milliseconds cancel_grace_period{5000};

    /// Upper bound for a single stats query
    std::chrono::milliseconds stats_timeout{15000};

    /// Upper bound for one export or import run (0 = unlimited)
    std::chrono::milliseconds phase_timeout{0};

    /// Number of output lines attached to a terminal error
    std::size_t log_tail_lines{20};

    /// Per-subscriber queue capacity of the telemetry channel
    std::size_t subscriber_queue_capacity{1024};

    /// Remove the dump directory once the job has finished
    bool cleanup_dump_directory{true};

    /// Finished jobs kept for queries; older ones are forgotten
    std::size_t max_retained_jobs{100};

    /// Finished jobs whose full event history stays available for replay
    std::size_t retained_event_streams{16};
};

}  // namespace migrator::migration
