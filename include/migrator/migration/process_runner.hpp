/**
 * @file process_runner.hpp
 * @brief Supervised execution of one external tool invocation
 *
 * This file provides the process_runner interface shared by the export and
 * import phases and by the connection probe, together with its POSIX
 * implementation.
 */

#pragma once

#include "migrator/core/result.hpp"
#include "migrator/di/ilogger.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace migrator::migration {

// =============================================================================
// Process Role
// =============================================================================

/**
 * @brief What an invocation is for; tags every line it produces
 */
enum class process_role {
    export_,  ///< Export tool reading the source
    import_,  ///< Import tool writing the target
    probe     ///< Short shell query (ping, dbStats)
};

[[nodiscard]] constexpr const char* to_string(process_role role) noexcept {
    switch (role) {
        case process_role::export_: return "export";
        case process_role::import_: return "import";
        case process_role::probe: return "probe";
        default: return "unknown";
    }
}

// =============================================================================
// Cancellation
// =============================================================================

/**
 * @brief Shared cancellation flag
 *
 * Copies observe the same flag, so the orchestrator can keep one copy and
 * hand another to the runner loop.
 */
class cancellation_token {
public:
    cancellation_token() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { state_->store(true, std::memory_order_release); }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return state_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

// =============================================================================
// Process Spec / Result
// =============================================================================

/**
 * @brief Command line and execution options of one invocation
 */
struct process_spec {
    std::string executable;          ///< Looked up in PATH when it has no slash
    std::vector<std::string> args;   ///< Arguments, excluding argv[0]
    process_role role{process_role::probe};

    /// Variables set (or overridden) in the child environment
    std::map<std::string, std::string> environment;

    /// Hard limit; expiry is handled like a cancellation (0 = unlimited)
    std::chrono::milliseconds timeout{0};

    /**
     * @brief The command line as a single string, for logging
     *
     * The result may contain credentials; redact before emitting it.
     */
    [[nodiscard]] std::string command_line() const {
        std::string line = executable;
        for (const auto& arg : args) {
            line += ' ';
            line += arg;
        }
        return line;
    }
};

/**
 * @brief Terminal result of one invocation
 */
struct process_result {
    /// Exit status, or the negated signal number if a signal ended the process
    int exit_code{-1};

    /// The process ended because of a signal (cancellation, timeout or external)
    bool signaled_termination{false};

    /// The hard timeout expired
    bool timed_out{false};

    /// SIGTERM was not enough and SIGKILL was sent
    bool force_killed{false};

    std::chrono::milliseconds duration{0};

    [[nodiscard]] bool succeeded() const noexcept {
        return exit_code == 0 && !signaled_termination;
    }
};

/**
 * @brief Receives each output line as soon as it is complete
 *
 * Called on the runner's thread. Lines exclude the trailing newline.
 */
using line_callback = std::function<void(process_role role, std::string_view line)>;

// =============================================================================
// Process Runner Interface
// =============================================================================

/**
 * @brief Abstract runner for external tools
 *
 * Implementations spawn exactly one process per run() call, merge its
 * standard output and standard error into one ordered line stream and
 * block until the process has ended.
 */
class process_runner {
public:
    virtual ~process_runner() = default;

    /**
     * @brief Run one process to completion
     *
     * @param spec Command line and options
     * @param on_line Receives each output line (may be empty)
     * @param cancel Token observed while the process runs
     * @return The process result, or process_spawn_failed / process_pipe_failed /
     *         process_wait_failed when the process could not be supervised
     */
    [[nodiscard]] virtual auto run(const process_spec& spec,
                                   const line_callback& on_line,
                                   const cancellation_token& cancel)
        -> Result<process_result> = 0;

protected:
    process_runner() = default;
    process_runner(const process_runner&) = default;
    process_runner& operator=(const process_runner&) = default;
};

// =============================================================================
// POSIX Implementation
// =============================================================================

/**
 * @brief fork/exec based runner with process-group signalling
 *
 * The child is placed in its own process group. Cancellation (or timeout)
 * sends SIGTERM to the whole group; if the child has not exited after the
 * grace period, SIGKILL follows.
 *
 * Thread Safety:
 * - run() may be called concurrently from different threads
 */
class posix_process_runner final : public process_runner {
public:
    /**
     * @brief Construct a runner
     *
     * @param grace_period Time between SIGTERM and SIGKILL
     * @param logger Logger instance (optional, defaults to NullLogger)
     */
    explicit posix_process_runner(
        std::chrono::milliseconds grace_period = std::chrono::milliseconds{5000},
        std::shared_ptr<di::ILogger> logger = nullptr);

    [[nodiscard]] auto run(const process_spec& spec,
                           const line_callback& on_line,
                           const cancellation_token& cancel)
        -> Result<process_result> override;

    [[nodiscard]] auto grace_period() const noexcept -> std::chrono::milliseconds {
        return grace_period_;
    }

private:
    std::chrono::milliseconds grace_period_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace migrator::migration
