/**
 * @file stats_reconciler.cpp
 * @brief Implementation of the stats reconciler
 */

#include "migrator/migration/stats_reconciler.hpp"
#include "migrator/migration/connection_probe.hpp"
#include "migrator/core/redaction.hpp"

namespace migrator::migration {

stats_reconciler::stats_reconciler(std::shared_ptr<database_probe> probe,
                                   std::shared_ptr<di::ILogger> logger)
    : probe_(std::move(probe)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

auto stats_reconciler::snapshot(const client::connection_profile& profile,
                                stats_side side, stats_phase phase,
                                const cancellation_token& cancel) const
    -> Result<stats_snapshot> {
    auto stats = probe_->db_stats(profile.uri, profile.database, cancel);
    if (stats.is_err()) {
        return migrator_error<stats_snapshot>(stats.error().code,
                                              redact_credentials(stats.error().message));
    }

    stats_snapshot snap;
    snap.side = side;
    snap.phase = phase;
    snap.timestamp = std::chrono::system_clock::now();
    snap.available = true;
    snap.collections = stats.value().collections;
    snap.objects = stats.value().objects;
    snap.data_size = stats.value().data_size;
    snap.storage_size = stats.value().storage_size;

    logger_->debug_fmt("Stats {} {} ({}): {} collections, {} objects",
                       to_string(side), to_string(phase), profile.label(),
                       snap.collections, snap.objects);
    return ok(snap);
}

auto stats_reconciler::snapshot_or_unavailable(const client::connection_profile& profile,
                                               stats_side side, stats_phase phase,
                                               const cancellation_token& cancel) const
    -> stats_snapshot {
    auto result = snapshot(profile, side, phase, cancel);
    if (result.is_ok()) {
        return result.value();
    }

    logger_->warn_fmt("Stats unavailable for {} ({} {}): {}", profile.label(),
                      to_string(side), to_string(phase), result.error().message);

    stats_snapshot snap;
    snap.side = side;
    snap.phase = phase;
    snap.timestamp = std::chrono::system_clock::now();
    snap.available = false;
    snap.error = result.error().message;
    return snap;
}

auto stats_reconciler::compare(const stats_snapshot& before, const stats_snapshot& after)
    -> reconciliation {
    reconciliation r;
    if (!before.available || !after.available) {
        r.summary = !before.available ? "Source statistics unavailable"
                                      : "Target statistics unavailable";
        return r;
    }

    r.comparable = true;
    r.collections_delta = static_cast<int64_t>(after.collections) -
                          static_cast<int64_t>(before.collections);
    r.objects_delta = static_cast<int64_t>(after.objects) -
                      static_cast<int64_t>(before.objects);
    r.counts_match = r.collections_delta == 0 && r.objects_delta == 0;

    if (r.counts_match) {
        r.summary = migrator::compat::format("Counts match: {} collections, {} objects",
                                             after.collections, after.objects);
    } else {
        r.summary = migrator::compat::format(
            "Counts differ: collections {} -> {}, objects {} -> {}",
            before.collections, after.collections, before.objects, after.objects);
    }
    return r;
}

}  // namespace migrator::migration
