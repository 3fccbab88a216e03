/**
 * @file confirmation_guard.hpp
 * @brief Two-factor safety check gating destructive migrations
 */

#pragma once

#include "migrator/client/connection_profile.hpp"
#include "migrator/core/result.hpp"
#include "migrator/migration/job_types.hpp"

#include <functional>
#include <memory>
#include <string>

namespace migrator::client {
class connection_registry;
}

namespace migrator::migration {

/**
 * @brief Map a guard or orchestrator error code to its reason code
 *
 * @param code Error code from migrator::error_codes
 * @return "confirmation_mismatch", "job_in_progress", "profile_not_found",
 *         or "error" for anything else
 */
[[nodiscard]] auto rejection_reason(int code) noexcept -> const char*;

/**
 * @brief Validates the operator's confirmation gesture
 *
 * A request is approved when all of these hold:
 * - risk_acknowledged is true
 * - typed_name equals the target profile's database name byte-for-byte
 * - no job is currently active
 *
 * The first two failures yield confirmation_mismatch, the last one
 * job_in_progress. An unknown target profile yields profile_not_found.
 * authorize() has no side effects; it can be retried freely.
 */
class confirmation_guard {
public:
    /// Returns true while a job occupies the active slot
    using active_probe = std::function<bool()>;

    confirmation_guard(std::shared_ptr<const client::connection_registry> registry,
                       active_probe job_active);

    /**
     * @brief Check a start request
     *
     * @param request The operator's request
     * @return The target profile on approval, or the rejection as an error
     */
    [[nodiscard]] auto authorize(const start_request& request) const
        -> Result<client::connection_profile>;

private:
    std::shared_ptr<const client::connection_registry> registry_;
    active_probe job_active_;
};

}  // namespace migrator::migration
