/**
 * @file migrator_app.cpp
 * @brief mongo_migrator CLI application implementation
 */

#include "migrator_app.hpp"

#include "migrator/core/redaction.hpp"
#include "migrator/integration/logger_adapter.hpp"
#include "migrator/integration/thread_adapter.hpp"
#include "migrator/migration/stats_reconciler.hpp"
#include "migrator/storage/profile_repository.hpp"

#include <iomanip>
#include <iostream>
#include <string>

namespace migrator::app {

namespace {

constexpr int exit_ok = 0;
constexpr int exit_error = 1;
constexpr int exit_migration_failed = 2;
constexpr int exit_rejected = 3;
constexpr int exit_cancelled = 130;

void print_snapshot(const migration::stats_snapshot& snap) {
    std::cout << "  " << migration::to_string(snap.side) << " ("
              << migration::to_string(snap.phase) << "): ";
    if (!snap.available) {
        std::cout << "unavailable - " << snap.error << "\n";
        return;
    }
    std::cout << snap.collections << " collections, " << snap.objects << " objects, "
              << snap.data_size << " bytes data, " << snap.storage_size
              << " bytes storage\n";
}

void print_event(const migration::telemetry_event& event) {
    if (const auto* line = std::get_if<migration::log_line>(&event.payload)) {
        std::cout << "[" << std::setw(6) << migration::to_string(line->source) << "] "
                  << line->text << "\n";
    } else if (const auto* snap = std::get_if<migration::stats_snapshot>(&event.payload)) {
        print_snapshot(*snap);
    } else if (const auto* change = std::get_if<migration::state_change>(&event.payload)) {
        std::cout << "== " << migration::to_string(change->to);
        if (!change->reason.empty()) {
            std::cout << " (" << change->reason << ")";
        }
        std::cout << "\n";
    }
}

}  // namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

migrator_app::migrator_app(const migrator_app_config& config)
    : config_(config), logger_(std::make_shared<di::LoggerService>()) {}

migrator_app::~migrator_app() {
    // Pipelines run on the shared pool, so the orchestrator goes first.
    orchestrator_.reset();
    integration::thread_adapter::shutdown(true);
    integration::logger_adapter::shutdown();
}

// =============================================================================
// Lifecycle
// =============================================================================

bool migrator_app::initialize() {
    integration::logger_adapter::initialize(config_.runtime.logging);

    auto repo = std::make_shared<storage::profile_repository>(
        config_.runtime.database_path.string());
    if (!repo->is_valid()) {
        std::cerr << "Failed to open profile database "
                  << config_.runtime.database_path << ": " << repo->open_error() << "\n";
        return false;
    }

    const auto& orch = config_.runtime.orchestrator;
    registry_ = std::make_shared<client::connection_registry>(repo, logger_);
    runner_ = std::make_shared<migration::posix_process_runner>(orch.cancel_grace_period,
                                                                logger_);
    probe_ = std::make_shared<migration::mongosh_probe>(
        runner_, orch.tools.shell_path, orch.stats_timeout, orch.tools.environment, logger_);
    orchestrator_ = std::make_unique<migration::migration_orchestrator>(
        orch, registry_, runner_, probe_, logger_);

    return true;
}

int migrator_app::run() {
    switch (config_.options.command) {
        case cli_command::profiles_list: return list_profiles();
        case cli_command::profiles_add: return add_profile();
        case cli_command::profiles_remove: return remove_profile();
        case cli_command::preflight: return preflight();
        case cli_command::stats: return show_stats();
        case cli_command::migrate: return migrate();
    }
    return exit_error;
}

void migrator_app::request_cancel() noexcept {
    cancel_requested_.store(true);
}

// =============================================================================
// Profile Commands
// =============================================================================

int migrator_app::list_profiles() {
    auto grouped = registry_->list_grouped();
    if (grouped.empty()) {
        std::cout << "No connection profiles. Add one with 'profiles add'.\n";
        return exit_ok;
    }

    for (const auto& [env, profiles] : grouped) {
        std::cout << client::to_string(env) << ":\n";
        for (const auto& profile : profiles) {
            std::cout << "  " << std::left << std::setw(24) << profile.profile_id
                      << std::setw(28) << profile.name << std::setw(20) << profile.database
                      << redact_credentials(profile.uri) << "\n";
        }
    }
    return exit_ok;
}

int migrator_app::add_profile() {
    const auto& opts = config_.options;

    client::connection_profile profile;
    profile.profile_id = opts.profile_id;
    profile.name = opts.name;
    profile.uri = opts.uri;
    profile.database = opts.database;
    profile.env = client::environment_from_string(opts.environment);

    auto added = registry_->add_profile(profile);
    if (added.is_err()) {
        std::cerr << "Error: " << added.error().message << "\n";
        return exit_error;
    }
    std::cout << "Added profile " << added.value().profile_id << "\n";
    return exit_ok;
}

int migrator_app::remove_profile() {
    auto removed = registry_->remove_profile(config_.options.profile_id);
    if (removed.is_err()) {
        std::cerr << "Error: " << removed.error().message << "\n";
        return exit_error;
    }
    std::cout << "Removed profile " << config_.options.profile_id << "\n";
    return exit_ok;
}

// =============================================================================
// Diagnostics
// =============================================================================

int migrator_app::preflight() {
    auto source = registry_->get_profile(config_.options.source_id);
    if (source.is_err()) {
        std::cerr << "Error: " << source.error().message << "\n";
        return exit_error;
    }
    auto target = registry_->get_profile(config_.options.target_id);
    if (target.is_err()) {
        std::cerr << "Error: " << target.error().message << "\n";
        return exit_error;
    }

    auto checks = migration::run_preflight(*probe_, source.value(), target.value());
    for (const auto& check : checks) {
        std::cout << (check.passed ? "[pass] " : "[FAIL] ") << check.message << "\n";
    }
    return migration::preflight_passed(checks) ? exit_ok : exit_error;
}

int migrator_app::show_stats() {
    auto profile = registry_->get_profile(config_.options.profile_id);
    if (profile.is_err()) {
        std::cerr << "Error: " << profile.error().message << "\n";
        return exit_error;
    }

    migration::stats_reconciler reconciler(probe_, logger_);
    auto snap = reconciler.snapshot(profile.value(), migration::stats_side::source,
                                    migration::stats_phase::before);
    if (snap.is_err()) {
        std::cerr << "Error: " << snap.error().message << "\n";
        return exit_error;
    }

    const auto& s = snap.value();
    std::cout << profile.value().label() << "\n"
              << "  collections:  " << s.collections << "\n"
              << "  objects:      " << s.objects << "\n"
              << "  data size:    " << s.data_size << "\n"
              << "  storage size: " << s.storage_size << "\n";
    return exit_ok;
}

// =============================================================================
// Migration
// =============================================================================

bool migrator_app::confirm_interactively(const client::connection_profile& target,
                                         migration::start_request& request) const {
    std::cout << "\nWARNING: this will overwrite database '" << target.database << "' on "
              << target.name << " (" << client::to_string(target.env) << ").\n";

    if (!request.risk_acknowledged) {
        std::cout << "Type 'yes' to acknowledge the risk: " << std::flush;
        std::string answer;
        if (!std::getline(std::cin, answer)) {
            return false;
        }
        request.risk_acknowledged = answer == "yes";
    }

    if (!config_.options.typed_name) {
        std::cout << "Type the target database name to confirm: " << std::flush;
        std::string typed;
        if (!std::getline(std::cin, typed)) {
            return false;
        }
        request.typed_name = typed;
    }
    return true;
}

int migrator_app::migrate() {
    const auto& opts = config_.options;

    auto source = registry_->get_profile(opts.source_id);
    if (source.is_err()) {
        std::cerr << "Error: " << source.error().message << "\n";
        return exit_error;
    }
    auto target = registry_->get_profile(opts.target_id);
    if (target.is_err()) {
        std::cerr << "Error: " << target.error().message << "\n";
        return exit_error;
    }

    if (!opts.skip_preflight) {
        auto checks = migration::run_preflight(*probe_, source.value(), target.value());
        for (const auto& check : checks) {
            std::cout << (check.passed ? "[pass] " : "[FAIL] ") << check.message << "\n";
        }
        if (!migration::preflight_passed(checks)) {
            std::cerr << "Preflight failed; use --skip-preflight to override\n";
            return exit_error;
        }
    }

    migration::start_request request;
    request.source_profile_id = opts.source_id;
    request.target_profile_id = opts.target_id;
    request.risk_acknowledged = opts.acknowledge;
    request.typed_name = opts.typed_name.value_or("");

    if ((!opts.acknowledge || !opts.typed_name) &&
        !confirm_interactively(target.value(), request)) {
        std::cerr << "Aborted\n";
        return exit_rejected;
    }

    auto started = orchestrator_->start_migration(request);
    if (started.is_err()) {
        std::cerr << "Rejected (" << migration::rejection_reason(started.error().code)
                  << "): " << started.error().message << "\n";
        return exit_rejected;
    }
    const auto job_id = started.value();
    std::cout << "Started job " << job_id << "\n";

    auto sub = orchestrator_->subscribe_to_job(job_id, true);
    if (sub.is_err()) {
        std::cerr << "Error: " << sub.error().message << "\n";
        return exit_error;
    }
    auto stream = std::move(sub.value());

    bool cancel_sent = false;
    while (!stream.finished()) {
        if (cancel_requested_.load() && !cancel_sent) {
            cancel_sent = true;
            std::cout << "\nCancelling migration...\n";
            auto cancelled = orchestrator_->cancel_migration(job_id);
            if (cancelled.is_err()) {
                std::cerr << "Error: " << cancelled.error().message << "\n";
            }
        }
        if (auto event = stream.next_for(std::chrono::milliseconds{200})) {
            print_event(*event);
        }
    }
    if (stream.dropped_count() > 0) {
        std::cout << "(" << stream.dropped_count() << " events were not displayed)\n";
    }

    auto job = orchestrator_->wait_for_completion(job_id).get();

    std::cout << "\nJob " << job.job_id << " " << migration::to_string(job.state) << " after "
              << job.duration().count() << " ms\n";
    if (job.pre_stats) {
        print_snapshot(*job.pre_stats);
    }
    if (job.post_stats) {
        print_snapshot(*job.post_stats);
    }
    if (job.pre_stats && job.post_stats) {
        std::cout << migration::stats_reconciler::compare(*job.pre_stats, *job.post_stats).summary
                  << "\n";
    }

    switch (job.state) {
        case migration::job_state::completed:
            return exit_ok;
        case migration::job_state::cancelled:
            return exit_cancelled;
        default:
            if (job.error) {
                std::cerr << "Failure: " << job.error->reason << " - " << job.error->message
                          << "\n";
                for (const auto& line : job.error->log_tail) {
                    std::cerr << "  | " << line << "\n";
                }
            }
            return exit_migration_failed;
    }
}

}  // namespace migrator::app
