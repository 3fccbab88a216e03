/**
 * @file confirmation_guard.cpp
 * @brief Implementation of the confirmation guard
 */

#include "migrator/migration/confirmation_guard.hpp"
#include "migrator/client/connection_registry.hpp"

namespace migrator::migration {

auto rejection_reason(int code) noexcept -> const char* {
    switch (code) {
        case error_codes::confirmation_mismatch: return "confirmation_mismatch";
        case error_codes::job_in_progress: return "job_in_progress";
        case error_codes::profile_not_found: return "profile_not_found";
        default: return "error";
    }
}

confirmation_guard::confirmation_guard(
    std::shared_ptr<const client::connection_registry> registry,
    active_probe job_active)
    : registry_(std::move(registry)), job_active_(std::move(job_active)) {}

auto confirmation_guard::authorize(const start_request& request) const
    -> Result<client::connection_profile> {
    auto target = registry_->get_profile(request.target_profile_id);
    if (target.is_err()) {
        return target;
    }

    if (!request.risk_acknowledged) {
        return migrator_error<client::connection_profile>(
            error_codes::confirmation_mismatch,
            "Risk acknowledgement is required before overwriting the target");
    }

    // Exact comparison: no trimming, no case folding.
    if (request.typed_name != target.value().database) {
        return migrator_error<client::connection_profile>(
            error_codes::confirmation_mismatch,
            "Typed name does not match the target database name");
    }

    if (job_active_ && job_active_()) {
        return migrator_error<client::connection_profile>(
            error_codes::job_in_progress,
            "Another migration is in progress");
    }

    return target;
}

}  // namespace migrator::migration
