/**
 * @file migration_orchestrator.cpp
 * @brief Implementation of the migration orchestrator
 */

#include "migrator/migration/migration_orchestrator.hpp"
#include "migrator/client/connection_registry.hpp"
#include "migrator/core/events.hpp"
#include "migrator/core/redaction.hpp"
#include "migrator/integration/logger_adapter.hpp"
#include "migrator/integration/thread_adapter.hpp"
#include "migrator/migration/confirmation_guard.hpp"
#include "migrator/migration/connection_probe.hpp"
#include "migrator/migration/process_runner.hpp"
#include "migrator/migration/stats_reconciler.hpp"

#include <kcenon/common/patterns/event_bus.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <iomanip>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <unordered_map>
#include <unordered_set>

namespace migrator::migration {

namespace {

/**
 * @brief Generate a UUID v4 job identifier
 */
std::string generate_uuid() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    uint64_t ab = dis(gen);
    uint64_t cd = dis(gen);

    // Set version (4) and variant (8, 9, A, or B)
    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8) << (ab >> 32);
    oss << '-';
    oss << std::setw(4) << ((ab >> 16) & 0xFFFF);
    oss << '-';
    oss << std::setw(4) << (ab & 0xFFFF);
    oss << '-';
    oss << std::setw(4) << (cd >> 48);
    oss << '-';
    oss << std::setw(12) << (cd & 0xFFFFFFFFFFFFULL);

    return oss.str();
}

constexpr std::size_t event_history_capacity = 10000;

log_source to_log_source(process_role role) noexcept {
    switch (role) {
        case process_role::export_: return log_source::export_;
        case process_role::import_: return log_source::import_;
        default: return log_source::system;
    }
}

}  // namespace

// =============================================================================
// Job Context
// =============================================================================

/**
 * @brief Runtime state of a job that is not part of its snapshot
 */
struct job_context {
    std::string job_id;
    client::connection_profile source;
    client::connection_profile target;
    cancellation_token cancel;
    std::future<void> pipeline;
    std::atomic<bool> finished{false};
};

// =============================================================================
// Implementation Structure
// =============================================================================

struct migration_orchestrator::impl {
    // Configuration
    orchestrator_config config;

    // Dependencies
    std::shared_ptr<client::connection_registry> registry;
    std::shared_ptr<process_runner> runner;
    std::shared_ptr<di::ILogger> logger;

    stats_reconciler reconciler;
    telemetry_channel channel;
    std::unique_ptr<confirmation_guard> guard;

    // The single active-job slot
    std::atomic<job_context*> active_slot{nullptr};

    // Jobs (snapshots are copied out under the lock)
    std::unordered_map<std::string, migration_job> jobs;
    std::unordered_map<std::string, std::shared_ptr<job_context>> contexts;
    std::vector<std::string> job_order;
    std::unordered_map<std::string, std::vector<std::shared_ptr<std::promise<migration_job>>>>
        waiters;
    std::unordered_set<std::string> notified;
    mutable std::mutex jobs_mutex;

    // Callbacks
    job_completion_callback completion_callback;
    mutable std::shared_mutex callbacks_mutex;

    impl(orchestrator_config cfg,
         std::shared_ptr<client::connection_registry> reg,
         std::shared_ptr<process_runner> run,
         std::shared_ptr<database_probe> probe,
         std::shared_ptr<di::ILogger> log)
        : config(std::move(cfg)),
          registry(std::move(reg)),
          runner(std::move(run)),
          logger(log ? std::move(log) : di::null_logger()),
          reconciler(std::move(probe), logger),
          channel(config.subscriber_queue_capacity, event_history_capacity,
                  config.retained_event_streams) {
        guard = std::make_unique<confirmation_guard>(
            registry, [this]() { return active_slot.load() != nullptr; });
    }

    // =========================================================================
    // Job Record Updates
    // =========================================================================

    void append_log(const std::string& job_id, log_source source, std::string_view text) {
        std::lock_guard<std::mutex> lock(jobs_mutex);

        auto it = jobs.find(job_id);
        if (it == jobs.end()) {
            return;
        }
        auto& job = it->second;

        log_line line;
        line.sequence = job.logs.size() + 1;
        line.source = source;
        line.timestamp = std::chrono::system_clock::now();
        line.text = redact_credentials(text);
        job.logs.push_back(line);

        if (source == log_source::system) {
            logger->info_fmt("[{}] {}", job_id, line.text);
        } else {
            logger->debug_fmt("[{}] {}: {}", job_id, to_string(source), line.text);
        }

        channel.publish(telemetry_event{job_id, std::move(line)});
    }

    bool transition(const std::string& job_id, job_state to, const std::string& reason = "") {
        std::lock_guard<std::mutex> lock(jobs_mutex);

        auto it = jobs.find(job_id);
        if (it == jobs.end() || is_terminal_state(it->second.state)) {
            return false;
        }
        auto& job = it->second;
        auto now = std::chrono::system_clock::now();

        state_change change;
        change.from = job.state;
        change.to = to;
        change.timestamp = now;
        change.reason = reason;

        job.state = to;
        job.history.push_back(to);
        if (to != job_state::pending && !job.started_at) {
            job.started_at = now;
        }
        if (is_terminal_state(to)) {
            job.finished_at = now;
        }

        logger->info_fmt("Job {} state: {} -> {}", job_id, to_string(change.from),
                         to_string(to));
        channel.publish(telemetry_event{job_id, change});
        return true;
    }

    void record_stats(const std::string& job_id, const stats_snapshot& snap) {
        std::lock_guard<std::mutex> lock(jobs_mutex);

        auto it = jobs.find(job_id);
        if (it == jobs.end()) {
            return;
        }
        if (snap.phase == stats_phase::before) {
            it->second.pre_stats = snap;
        } else {
            it->second.post_stats = snap;
        }
        channel.publish(telemetry_event{job_id, snap});
    }

    void record_error(const std::string& job_id, const std::string& reason,
                      const std::string& message, std::optional<int> exit_code) {
        {
            std::lock_guard<std::mutex> lock(jobs_mutex);

            auto it = jobs.find(job_id);
            if (it == jobs.end()) {
                return;
            }
            auto& job = it->second;

            job_error error;
            error.reason = reason;
            error.message = redact_credentials(message);
            error.exit_code = exit_code;
            auto count = std::min(config.log_tail_lines, job.logs.size());
            for (auto line = job.logs.end() - static_cast<std::ptrdiff_t>(count);
                 line != job.logs.end(); ++line) {
                error.log_tail.push_back(line->text);
            }
            job.error = std::move(error);
        }

        if (reason == "cancelled") {
            append_log(job_id, log_source::system, "Migration cancelled: " + message);
        } else {
            append_log(job_id, log_source::system, "ERROR: Migration Failed - " + message);
        }
    }

    [[nodiscard]] std::optional<migration_job> snapshot(const std::string& job_id) const {
        std::lock_guard<std::mutex> lock(jobs_mutex);
        auto it = jobs.find(job_id);
        if (it == jobs.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // =========================================================================
    // Dump Directory
    // =========================================================================

    void clear_dump_directory(const std::string& job_id) {
        std::error_code ec;
        if (!std::filesystem::exists(config.tools.dump_directory, ec)) {
            return;
        }
        std::filesystem::remove_all(config.tools.dump_directory, ec);
        if (ec) {
            append_log(job_id, log_source::system,
                       "Warning: could not remove " +
                           config.tools.dump_directory.string() + ": " + ec.message());
        }
    }

    void cleanup_dump_directory(const std::string& job_id) {
        if (!config.cleanup_dump_directory) {
            return;
        }
        std::error_code ec;
        if (!std::filesystem::exists(config.tools.dump_directory, ec)) {
            return;
        }
        std::filesystem::remove_all(config.tools.dump_directory, ec);
        if (ec) {
            logger->warn_fmt("Failed to clean up {}: {}",
                             config.tools.dump_directory.string(), ec.message());
            return;
        }
        append_log(job_id, log_source::system, "Cleaned up temporary resources.");
    }

    // =========================================================================
    // Tool Invocations
    // =========================================================================

    [[nodiscard]] process_spec make_export_spec(const client::connection_profile& source) const {
        process_spec spec;
        spec.executable = config.tools.dump_path;
        spec.args = {"--uri", source.uri,
                     "--db", source.database,
                     "--out", config.tools.dump_directory.string()};
        spec.role = process_role::export_;
        spec.environment = config.tools.environment;
        spec.timeout = config.phase_timeout;
        return spec;
    }

    [[nodiscard]] process_spec make_import_spec(const client::connection_profile& source,
                                                const client::connection_profile& target) const {
        process_spec spec;
        spec.executable = config.tools.restore_path;
        spec.args = {"--uri", target.uri, "--db", target.database};
        if (config.tools.drop_target) {
            spec.args.emplace_back("--drop");
        }
        spec.args.push_back((config.tools.dump_directory / source.database).string());
        spec.role = process_role::import_;
        spec.environment = config.tools.environment;
        spec.timeout = config.phase_timeout;
        return spec;
    }

    [[nodiscard]] Result<process_result> run_phase(job_context& ctx,
                                                   const process_spec& spec) {
        append_log(ctx.job_id, log_source::system, "Running: " + spec.command_line());

        const auto& job_id = ctx.job_id;
        return runner->run(
            spec,
            [this, &job_id](process_role role, std::string_view line) {
                append_log(job_id, to_log_source(role), line);
            },
            ctx.cancel);
    }

    // =========================================================================
    // Pipeline
    // =========================================================================

    /**
     * @brief Outcome of one tool phase
     * @return true when the pipeline may continue
     */
    bool check_phase(job_context& ctx, const Result<process_result>& result,
                     const char* failure_reason, const char* tool_label) {
        if (result.is_err()) {
            if (ctx.cancel.is_cancelled()) {
                record_error(ctx.job_id, "cancelled", "Cancelled by operator", std::nullopt);
                finish(ctx, job_state::cancelled, "cancelled");
                return false;
            }
            record_error(ctx.job_id, failure_reason,
                         std::string(tool_label) + " could not be run: " +
                             result.error().message,
                         std::nullopt);
            finish(ctx, job_state::failed, failure_reason);
            return false;
        }

        const auto& outcome = result.value();
        if (ctx.cancel.is_cancelled()) {
            record_error(ctx.job_id, "cancelled", "Cancelled by operator", outcome.exit_code);
            finish(ctx, job_state::cancelled, "cancelled");
            return false;
        }
        if (!outcome.succeeded()) {
            std::string message = outcome.timed_out
                ? std::string(tool_label) + " timed out"
                : std::string(tool_label) + " failed with exit code " +
                      std::to_string(outcome.exit_code);
            record_error(ctx.job_id, failure_reason, message, outcome.exit_code);
            finish(ctx, job_state::failed, failure_reason);
            return false;
        }
        return true;
    }

    bool stop_if_cancelled(job_context& ctx) {
        if (!ctx.cancel.is_cancelled()) {
            return false;
        }
        record_error(ctx.job_id, "cancelled", "Cancelled by operator", std::nullopt);
        finish(ctx, job_state::cancelled, "cancelled");
        return true;
    }

    void run_pipeline(job_context& ctx) {
        const auto& job_id = ctx.job_id;

        if (stop_if_cancelled(ctx)) {
            return;
        }

        auto pre = reconciler.snapshot_or_unavailable(ctx.source, stats_side::source,
                                                      stats_phase::before, ctx.cancel);
        if (stop_if_cancelled(ctx)) {
            return;
        }
        record_stats(job_id, pre);
        if (!pre.available) {
            append_log(job_id, log_source::system,
                       "Source statistics unavailable: " + pre.error);
        }

        // Export
        clear_dump_directory(job_id);
        transition(job_id, job_state::exporting);
        append_log(job_id, log_source::system, "PHASE:DUMPING|Starting dump from source...");

        auto exported = run_phase(ctx, make_export_spec(ctx.source));
        if (!check_phase(ctx, exported, "export_failed", "Export")) {
            return;
        }
        append_log(job_id, log_source::system, "Dump completed successfully.");
        transition(job_id, job_state::export_complete);

        if (stop_if_cancelled(ctx)) {
            return;
        }

        // Import
        append_log(job_id, log_source::system, "PHASE:PREPARING|Preparing target database...");
        transition(job_id, job_state::importing);
        append_log(job_id, log_source::system, "PHASE:RESTORING|Starting restore to target...");

        auto imported = run_phase(ctx, make_import_spec(ctx.source, ctx.target));
        if (!check_phase(ctx, imported, "import_failed", "Import")) {
            return;
        }
        append_log(job_id, log_source::system, "Restore completed successfully.");

        auto post = reconciler.snapshot_or_unavailable(ctx.target, stats_side::target,
                                                       stats_phase::after, ctx.cancel);
        // A cancel accepted while importing wins over the finished transfer.
        if (stop_if_cancelled(ctx)) {
            return;
        }
        record_stats(job_id, post);
        append_log(job_id, log_source::system,
                   stats_reconciler::compare(pre, post).summary);

        finish(ctx, job_state::completed, "");
    }

    void execute(job_context& ctx) {
        try {
            run_pipeline(ctx);
        } catch (const std::exception& e) {
            logger->error_fmt("Job {} aborted: {}", ctx.job_id, e.what());
            record_error(ctx.job_id, "internal_error", e.what(), std::nullopt);
            finish(ctx, job_state::failed, "internal_error");
        }
    }

    // =========================================================================
    // Completion
    // =========================================================================

    void finish(job_context& ctx, job_state final_state, const std::string& reason) {
        if (ctx.finished.exchange(true)) {
            return;
        }
        cleanup_dump_directory(ctx.job_id);

        // Slot and pins are released before the terminal state is published.
        job_context* expected = &ctx;
        active_slot.compare_exchange_strong(expected, nullptr);
        registry->unpin(ctx.source.profile_id);
        registry->unpin(ctx.target.profile_id);

        if (!transition(ctx.job_id, final_state, reason)) {
            return;
        }
        channel.close(ctx.job_id);

        auto job = snapshot(ctx.job_id);
        if (!job) {
            return;
        }

        integration::logger_adapter::log_migration_finished(
            ctx.job_id, to_string(final_state), reason);
        kcenon::common::get_event_bus().publish(
            events::migration_finished_event{ctx.job_id, to_string(final_state), reason,
                                             job->duration()});

        notify_completion(*job);
    }

    void notify_completion(const migration_job& job) {
        {
            std::shared_lock<std::shared_mutex> lock(callbacks_mutex);
            if (completion_callback) {
                completion_callback(job.job_id, job);
            }
        }

        std::vector<std::shared_ptr<std::promise<migration_job>>> pending;
        {
            std::lock_guard<std::mutex> lock(jobs_mutex);
            notified.insert(job.job_id);
            auto it = waiters.find(job.job_id);
            if (it != waiters.end()) {
                pending = std::move(it->second);
                waiters.erase(it);
            }
        }
        for (auto& promise : pending) {
            promise->set_value(job);
        }
    }

    // =========================================================================
    // Retention
    // =========================================================================

    /**
     * @brief Drop finished jobs beyond the retention limit
     *
     * Contexts are released once their pipeline has returned. Caller holds
     * jobs_mutex.
     */
    void prune_finished_jobs() {
        for (auto it = contexts.begin(); it != contexts.end();) {
            auto& ctx = it->second;
            bool pipeline_done =
                !ctx->pipeline.valid() ||
                ctx->pipeline.wait_for(std::chrono::seconds{0}) == std::future_status::ready;
            if (notified.count(it->first) > 0 && pipeline_done) {
                it = contexts.erase(it);
            } else {
                ++it;
            }
        }

        std::size_t finished = static_cast<std::size_t>(
            std::count_if(job_order.begin(), job_order.end(),
                          [this](const std::string& id) { return notified.count(id) > 0; }));

        for (auto it = job_order.begin();
             finished > config.max_retained_jobs && it != job_order.end();) {
            // Jobs still inside their completion hooks keep their context.
            if (notified.count(*it) == 0 || contexts.count(*it) > 0) {
                ++it;
                continue;
            }
            jobs.erase(*it);
            notified.erase(*it);
            channel.remove(*it);
            it = job_order.erase(it);
            --finished;
        }
    }

    /**
     * @brief Events rebuilt from a finished job's record
     *
     * Used when the channel no longer holds the job's stream.
     */
    [[nodiscard]] static std::vector<telemetry_event> recorded_events(
        const migration_job& job) {
        std::vector<telemetry_event> events;
        if (job.pre_stats) {
            events.push_back(telemetry_event{job.job_id, *job.pre_stats});
        }
        for (const auto& line : job.logs) {
            events.push_back(telemetry_event{job.job_id, line});
        }
        if (job.post_stats) {
            events.push_back(telemetry_event{job.job_id, *job.post_stats});
        }
        if (job.history.size() >= 2) {
            state_change change;
            change.from = job.history[job.history.size() - 2];
            change.to = job.state;
            change.timestamp = job.finished_at.value_or(job.created_at);
            if (job.error) {
                change.reason = job.error->reason;
            }
            events.push_back(telemetry_event{job.job_id, std::move(change)});
        }
        return events;
    }
};

// =============================================================================
// Construction / Destruction
// =============================================================================

migration_orchestrator::migration_orchestrator(
    orchestrator_config config,
    std::shared_ptr<client::connection_registry> registry,
    std::shared_ptr<process_runner> runner,
    std::shared_ptr<database_probe> probe,
    std::shared_ptr<di::ILogger> logger)
    : impl_(std::make_unique<impl>(std::move(config), std::move(registry),
                                   std::move(runner), std::move(probe),
                                   std::move(logger))) {}

migration_orchestrator::~migration_orchestrator() {
    std::vector<std::shared_ptr<job_context>> running;
    {
        std::lock_guard<std::mutex> lock(impl_->jobs_mutex);
        for (auto& [id, ctx] : impl_->contexts) {
            auto job = impl_->jobs.find(id);
            if (job != impl_->jobs.end() && !job->second.is_finished()) {
                ctx->cancel.cancel();
            }
            if (ctx->pipeline.valid()) {
                running.push_back(ctx);
            }
        }
    }
    for (auto& ctx : running) {
        ctx->pipeline.wait();
    }
}

// =============================================================================
// Job Control
// =============================================================================

auto migration_orchestrator::authorize(const start_request& request) const
    -> Result<client::connection_profile> {
    return impl_->guard->authorize(request);
}

auto migration_orchestrator::start_migration(const start_request& request)
    -> Result<std::string> {
    auto reject = [this, &request](const error_info& error) -> Result<std::string> {
        std::string reason = rejection_reason(error.code);
        impl_->logger->warn_fmt("Migration to {} rejected: {}", request.target_profile_id,
                                reason);
        integration::logger_adapter::log_migration_rejected(request.target_profile_id, reason);
        kcenon::common::get_event_bus().publish(
            events::migration_rejected_event{request.target_profile_id, reason});
        return Result<std::string>(error);
    };

    auto target = impl_->guard->authorize(request);
    if (target.is_err()) {
        return reject(target.error());
    }

    auto source = impl_->registry->get_profile(request.source_profile_id);
    if (source.is_err()) {
        return reject(source.error());
    }

    auto ctx = std::make_shared<job_context>();
    ctx->job_id = generate_uuid();
    ctx->source = source.value();
    ctx->target = target.value();

    auto pinned_source = impl_->registry->pin(ctx->source.profile_id);
    if (pinned_source.is_err()) {
        return reject(pinned_source.error());
    }
    auto pinned_target = impl_->registry->pin(ctx->target.profile_id);
    if (pinned_target.is_err()) {
        impl_->registry->unpin(ctx->source.profile_id);
        return reject(pinned_target.error());
    }

    // The guard's check is advisory; the slot is the authoritative gate.
    job_context* expected = nullptr;
    if (!impl_->active_slot.compare_exchange_strong(expected, ctx.get())) {
        impl_->registry->unpin(ctx->source.profile_id);
        impl_->registry->unpin(ctx->target.profile_id);
        return reject(error_info{error_codes::job_in_progress,
                                 "Another migration is in progress", "migrator"});
    }

    migration_job job;
    job.job_id = ctx->job_id;
    job.source = ctx->source;
    job.target = ctx->target;
    job.state = job_state::pending;
    job.history.push_back(job_state::pending);
    job.created_at = std::chrono::system_clock::now();

    impl_->channel.open(ctx->job_id);
    {
        std::lock_guard<std::mutex> lock(impl_->jobs_mutex);
        impl_->prune_finished_jobs();
        impl_->jobs.emplace(ctx->job_id, std::move(job));
        impl_->contexts.emplace(ctx->job_id, ctx);
        impl_->job_order.push_back(ctx->job_id);
    }

    impl_->transition(ctx->job_id, job_state::confirmed);
    impl_->append_log(ctx->job_id, log_source::system,
                      "Migration authorized: " + ctx->source.label() + " -> " +
                          ctx->target.label());

    integration::logger_adapter::log_migration_authorized(
        ctx->job_id, ctx->source.name, ctx->target.name, ctx->target.database);
    kcenon::common::get_event_bus().publish(events::migration_started_event{
        ctx->job_id, ctx->source.name, ctx->target.name, ctx->target.database});

    try {
        auto* state = impl_.get();
        auto future = integration::thread_adapter::submit(
            [state, ctx]() { state->execute(*ctx); });
        std::lock_guard<std::mutex> lock(impl_->jobs_mutex);
        ctx->pipeline = std::move(future);
    } catch (const std::exception& e) {
        impl_->logger->error_fmt("Failed to schedule job {}: {}", ctx->job_id, e.what());
        impl_->record_error(ctx->job_id, "internal_error",
                            std::string("Failed to schedule migration: ") + e.what(),
                            std::nullopt);
        impl_->finish(*ctx, job_state::failed, "internal_error");
    }

    return ok(ctx->job_id);
}

auto migration_orchestrator::cancel_migration(std::string_view job_id) -> VoidResult {
    std::string id_str(job_id);
    {
        std::lock_guard<std::mutex> lock(impl_->jobs_mutex);

        auto job = impl_->jobs.find(id_str);
        if (job == impl_->jobs.end()) {
            return migrator_void_error(error_codes::job_not_found, "Job not found: " + id_str);
        }
        if (!job->second.can_cancel()) {
            return migrator_void_error(error_codes::job_not_active,
                                       "Job is not active: " + id_str,
                                       to_string(job->second.state));
        }
        impl_->contexts.at(id_str)->cancel.cancel();
    }

    impl_->append_log(id_str, log_source::system, "Cancellation requested by operator.");
    return ok();
}

auto migration_orchestrator::subscribe_to_job(std::string_view job_id, bool replay_history)
    -> Result<subscription> {
    std::string id_str(job_id);
    auto live = impl_->channel.subscribe(id_str, replay_history);
    if (live.is_ok() || live.error().code != error_codes::job_not_found) {
        return live;
    }

    // The stream of a retained finished job may already be released.
    auto job = impl_->snapshot(id_str);
    if (!job || !job->is_finished()) {
        return live;
    }
    return ok(telemetry_channel::finished_subscription(
        replay_history ? impl::recorded_events(*job) : std::vector<telemetry_event>{}));
}

auto migration_orchestrator::get_job_status(std::string_view job_id) const
    -> Result<migration_job> {
    auto job = impl_->snapshot(std::string(job_id));
    if (!job) {
        return migrator_error<migration_job>(error_codes::job_not_found,
                                             "Job not found: " + std::string(job_id));
    }
    return ok(std::move(*job));
}

auto migration_orchestrator::list_jobs() const -> std::vector<migration_job> {
    std::lock_guard<std::mutex> lock(impl_->jobs_mutex);

    std::vector<migration_job> result;
    result.reserve(impl_->job_order.size());
    for (const auto& id : impl_->job_order) {
        result.push_back(impl_->jobs.at(id));
    }
    return result;
}

auto migration_orchestrator::active_job_id() const -> std::optional<std::string> {
    std::lock_guard<std::mutex> lock(impl_->jobs_mutex);
    auto* ctx = impl_->active_slot.load();
    if (ctx == nullptr) {
        return std::nullopt;
    }
    return ctx->job_id;
}

auto migration_orchestrator::has_active_job() const noexcept -> bool {
    return impl_->active_slot.load() != nullptr;
}

// =============================================================================
// Completion
// =============================================================================

auto migration_orchestrator::wait_for_completion(std::string_view job_id)
    -> std::future<migration_job> {
    auto promise = std::make_shared<std::promise<migration_job>>();
    auto future = promise->get_future();
    std::string id_str(job_id);

    std::lock_guard<std::mutex> lock(impl_->jobs_mutex);

    auto it = impl_->jobs.find(id_str);
    if (it == impl_->jobs.end()) {
        promise->set_exception(
            std::make_exception_ptr(std::out_of_range("Job not found: " + id_str)));
        return future;
    }
    // Jobs that already ran their completion hooks resolve immediately.
    if (impl_->notified.count(id_str) > 0) {
        promise->set_value(it->second);
        return future;
    }

    impl_->waiters[id_str].push_back(promise);
    return future;
}

void migration_orchestrator::set_completion_callback(job_completion_callback callback) {
    std::unique_lock<std::shared_mutex> lock(impl_->callbacks_mutex);
    impl_->completion_callback = std::move(callback);
}

auto migration_orchestrator::config() const noexcept -> const orchestrator_config& {
    return impl_->config;
}

}  // namespace migrator::migration
