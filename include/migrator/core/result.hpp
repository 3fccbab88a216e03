/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the migrator
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for the migration orchestrator, integrating with common_system's
 * Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace migrator {

/**
 * @brief Result type alias for migrator operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief Migrator-specific error codes
 *
 * Error code range: -900 to -999
 * Provides access to both common error codes and migrator-specific codes.
 */
namespace error_codes {
    // Import common error codes
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int migrator_base = -900;

    // Confirmation and concurrency errors (-900 to -909)
    constexpr int confirmation_mismatch = migrator_base - 0;
    constexpr int job_in_progress = migrator_base - 1;
    constexpr int job_not_found = migrator_base - 2;
    constexpr int job_not_active = migrator_base - 3;
    constexpr int orchestrator_stopped = migrator_base - 4;

    // Connection registry errors (-910 to -929)
    constexpr int profile_not_found = migrator_base - 10;
    constexpr int profile_already_exists = migrator_base - 11;
    constexpr int profile_invalid = migrator_base - 12;
    constexpr int profile_in_use = migrator_base - 13;

    // Database errors (-930 to -939)
    constexpr int database_open_error = migrator_base - 30;
    constexpr int database_query_error = migrator_base - 31;
    constexpr int database_schema_error = migrator_base - 32;

    // Process errors (-940 to -959)
    constexpr int process_spawn_failed = migrator_base - 40;
    constexpr int process_pipe_failed = migrator_base - 41;
    constexpr int process_wait_failed = migrator_base - 42;
    constexpr int export_failed = migrator_base - 43;
    constexpr int import_failed = migrator_base - 44;

    // Connectivity errors (-960 to -969)
    constexpr int connectivity_error = migrator_base - 60;
    constexpr int connectivity_timeout = migrator_base - 61;
    constexpr int stats_parse_error = migrator_base - 62;

    // Configuration errors (-970 to -979)
    constexpr int config_file_not_found = migrator_base - 70;
    constexpr int config_parse_error = migrator_base - 71;
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;
using kcenon::common::is_ok;
using kcenon::common::is_error;
using kcenon::common::get_value;
using kcenon::common::get_error;

/**
 * @brief Create a migrator error result with module context
 * @tparam T The result value type
 * @param code Error code from migrator::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> migrator_error(int code, const std::string& message,
                                const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "migrator");
    }
    return kcenon::common::make_error<T>(code, message, "migrator", details);
}

/**
 * @brief Create a migrator void error result
 * @param code Error code from migrator::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult migrator_void_error(int code, const std::string& message,
                                      const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "migrator"});
    }
    return VoidResult(error_info{code, message, "migrator", details});
}

} // namespace migrator

/**
 * @brief Return early if expression is an error
 */
#define MIGRATOR_RETURN_IF_ERROR(expr) COMMON_RETURN_IF_ERROR(expr)

/**
 * @brief Assign value or return error
 */
#define MIGRATOR_ASSIGN_OR_RETURN(decl, expr) COMMON_ASSIGN_OR_RETURN(decl, expr)
