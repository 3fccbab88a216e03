/**
 * @file events.hpp
 * @brief Migration event definitions for event-based communication
 *
 * These events are published on the common_system Event Bus so that
 * process-wide observers (CLI status line, audit hooks, tests) can follow
 * migrations without holding a telemetry subscription.
 *
 * @see common_system/include/kcenon/common/patterns/event_bus.h
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace migrator::events {

// ============================================================================
// Migration Lifecycle Events
// ============================================================================

/**
 * @brief Event published when a start request passes the confirmation guard
 */
struct migration_started_event {
    std::string job_id;
    std::string source_name;
    std::string target_name;
    std::string target_database;
    std::chrono::steady_clock::time_point timestamp;

    migration_started_event(std::string id,
                            std::string source,
                            std::string target,
                            std::string database)
        : job_id(std::move(id)),
          source_name(std::move(source)),
          target_name(std::move(target)),
          target_database(std::move(database)),
          timestamp(std::chrono::steady_clock::now()) {}
};

/**
 * @brief Event published when a start request is refused
 *
 * No job exists for a rejected request.
 */
struct migration_rejected_event {
    std::string target_profile_id;
    std::string reason;  ///< confirmation_mismatch, job_in_progress, profile_not_found
    std::chrono::steady_clock::time_point timestamp;

    migration_rejected_event(std::string target, std::string why)
        : target_profile_id(std::move(target)),
          reason(std::move(why)),
          timestamp(std::chrono::steady_clock::now()) {}
};

/**
 * @brief Event published when a job reaches a terminal state
 */
struct migration_finished_event {
    std::string job_id;
    std::string final_state;  ///< completed, failed or cancelled
    std::string reason;       ///< Empty on success
    std::chrono::milliseconds duration;
    std::chrono::steady_clock::time_point timestamp;

    migration_finished_event(std::string id,
                             std::string state,
                             std::string why,
                             std::chrono::milliseconds dur)
        : job_id(std::move(id)),
          final_state(std::move(state)),
          reason(std::move(why)),
          duration(dur),
          timestamp(std::chrono::steady_clock::now()) {}
};

}  // namespace migrator::events
