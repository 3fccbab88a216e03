/**
 * @file stats_reconciler.hpp
 * @brief Before/after collection and document counts of a migration
 */

#pragma once

#include "migrator/client/connection_profile.hpp"
#include "migrator/core/result.hpp"
#include "migrator/di/ilogger.hpp"
#include "migrator/migration/job_types.hpp"
#include "migrator/migration/process_runner.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace migrator::migration {

class database_probe;

/**
 * @brief Advisory comparison of a pre-transfer and a post-transfer snapshot
 *
 * Differences never fail a job; replication lag, capped collections or
 * TTL expiry can make the counts diverge legitimately.
 */
struct reconciliation {
    bool comparable{false};  ///< Both snapshots were available
    int64_t collections_delta{0};  ///< after - before
    int64_t objects_delta{0};      ///< after - before
    bool counts_match{false};
    std::string summary;
};

/**
 * @brief Takes statistics snapshots through a database_probe
 *
 * Thread Safety:
 * - Safe to call concurrently if the probe is
 */
class stats_reconciler {
public:
    explicit stats_reconciler(std::shared_ptr<database_probe> probe,
                              std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Query the profile's database
     *
     * @param cancel Token that abandons the query when set
     * @return The snapshot, or a connectivity error from the probe
     */
    [[nodiscard]] auto snapshot(const client::connection_profile& profile,
                                stats_side side, stats_phase phase,
                                const cancellation_token& cancel = cancellation_token{}) const
        -> Result<stats_snapshot>;

    /**
     * @brief Query the profile's database, recording failure in the snapshot
     *
     * @return An available snapshot, or one with available == false and
     *         the failure text in error
     */
    [[nodiscard]] auto snapshot_or_unavailable(
        const client::connection_profile& profile, stats_side side, stats_phase phase,
        const cancellation_token& cancel = cancellation_token{}) const -> stats_snapshot;

    /**
     * @brief Compare two snapshots
     */
    [[nodiscard]] static auto compare(const stats_snapshot& before,
                                      const stats_snapshot& after) -> reconciliation;

private:
    std::shared_ptr<database_probe> probe_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace migrator::migration
