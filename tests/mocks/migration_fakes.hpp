/**
 * @file migration_fakes.hpp
 * @brief Test doubles for the migration components
 *
 * Provides a scriptable database_probe, a recording logger and helpers for
 * writing stand-in export/import tools as /bin/sh scripts.
 */

#pragma once

#include <migrator/core/result.hpp>
#include <migrator/di/ilogger.hpp>
#include <migrator/migration/connection_probe.hpp>
#include <migrator/migration/telemetry_channel.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <sys/stat.h>

namespace migrator::testing {

// =============================================================================
// Temporary Directory
// =============================================================================

/**
 * @brief Unique directory under the system temp path, removed on destruction
 */
class temp_directory {
public:
    explicit temp_directory(const std::string& prefix = "migrator_test") {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "_" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~temp_directory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    temp_directory(const temp_directory&) = delete;
    temp_directory& operator=(const temp_directory&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Write an executable /bin/sh script
 *
 * @param dir Directory to create the script in
 * @param name File name
 * @param body Script body (without the shebang line)
 * @return Full path of the script
 */
inline std::filesystem::path write_script(const std::filesystem::path& dir,
                                          const std::string& name,
                                          const std::string& body) {
    auto path = dir / name;
    {
        std::ofstream out(path);
        out << "#!/bin/sh\n" << body << "\n";
    }
    ::chmod(path.c_str(), 0755);
    return path;
}

// =============================================================================
// Recording Logger
// =============================================================================

class recording_logger final : public di::ILogger {
public:
    void trace(std::string_view message) override { record(message); }
    void debug(std::string_view message) override { record(message); }
    void info(std::string_view message) override { record(message); }
    void warn(std::string_view message) override {
        warn_count_.fetch_add(1, std::memory_order_relaxed);
        record(message);
    }
    void error(std::string_view message) override {
        error_count_.fetch_add(1, std::memory_order_relaxed);
        record(message);
    }
    void fatal(std::string_view message) override { record(message); }

    [[nodiscard]] bool is_enabled(integration::log_level) const noexcept override {
        return true;
    }

    [[nodiscard]] std::vector<std::string> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    [[nodiscard]] bool contains(std::string_view needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& m : messages_) {
            if (m.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] size_t warn_count() const noexcept {
        return warn_count_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] size_t error_count() const noexcept {
        return error_count_.load(std::memory_order_relaxed);
    }

private:
    void record(std::string_view message) {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.emplace_back(message);
    }

    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
    std::atomic<size_t> warn_count_{0};
    std::atomic<size_t> error_count_{0};
};

// =============================================================================
// Fake Probe
// =============================================================================

/**
 * @brief database_probe with scripted answers
 */
class fake_probe final : public migration::database_probe {
public:
    auto ping(const std::string& uri) -> Result<std::string> override {
        std::lock_guard<std::mutex> lock(mutex_);
        pinged_.push_back(uri);
        if (unreachable_uris_.count(uri) > 0) {
            return migrator_error<std::string>(error_codes::connectivity_error,
                                               "connection refused");
        }
        return ok(std::string("MongoDB 7.0.4"));
    }

    auto db_stats(const std::string& uri, const std::string& database,
                  const migration::cancellation_token& cancel)
        -> Result<migration::database_stats> override {
        stats_calls_.fetch_add(1, std::memory_order_relaxed);
        std::unique_lock<std::mutex> lock(mutex_);
        queried_databases_.push_back(database);
        if (hold_databases_.count(database) > 0) {
            held_.fetch_add(1, std::memory_order_relaxed);
            lock.unlock();
            while (!cancel.is_cancelled() && !released_.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds{10});
            }
            lock.lock();
            if (cancel.is_cancelled()) {
                return migrator_error<migration::database_stats>(
                    error_codes::connectivity_error, "Query cancelled");
            }
        }
        if (unreachable_uris_.count(uri) > 0) {
            return migrator_error<migration::database_stats>(
                error_codes::connectivity_timeout, "Query timed out after 15000 ms");
        }
        return ok(stats_);
    }

    void set_unreachable(const std::string& uri) {
        std::lock_guard<std::mutex> lock(mutex_);
        unreachable_uris_.insert(uri);
    }

    /**
     * @brief Block stats queries on database until cancelled or released
     */
    void hold_stats_for(const std::string& database) {
        std::lock_guard<std::mutex> lock(mutex_);
        hold_databases_.insert(database);
    }

    void release_held() noexcept { released_.store(true); }

    /// Number of queries that entered the hold
    [[nodiscard]] int held_queries() const noexcept {
        return held_.load(std::memory_order_relaxed);
    }

    void set_stats(migration::database_stats stats) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_ = stats;
    }

    [[nodiscard]] int stats_calls() const noexcept {
        return stats_calls_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::vector<std::string> pinged() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pinged_;
    }

    [[nodiscard]] std::vector<std::string> queried_databases() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queried_databases_;
    }

private:
    mutable std::mutex mutex_;
    std::set<std::string> unreachable_uris_;
    std::set<std::string> hold_databases_;
    std::atomic<bool> released_{false};
    std::atomic<int> held_{0};
    migration::database_stats stats_{4, 1200, 65536, 131072};
    std::vector<std::string> pinged_;
    std::vector<std::string> queried_databases_;
    std::atomic<int> stats_calls_{0};
};

// =============================================================================
// Subscription Helpers
// =============================================================================

/**
 * @brief Read events until pred matches one or the deadline passes
 *
 * @return true if a matching event was seen
 */
inline bool wait_for_event(migration::subscription& sub,
                           const std::function<bool(const migration::telemetry_event&)>& pred,
                           std::chrono::milliseconds deadline = std::chrono::seconds{10}) {
    auto until = std::chrono::steady_clock::now() + deadline;
    while (std::chrono::steady_clock::now() < until) {
        auto event = sub.next_for(std::chrono::milliseconds{50});
        if (event && pred(*event)) {
            return true;
        }
        if (!event && sub.finished()) {
            return false;
        }
    }
    return false;
}

/**
 * @brief Predicate matching a log line that contains text
 */
inline auto log_contains(std::string text) {
    return [text = std::move(text)](const migration::telemetry_event& event) {
        const auto* line = std::get_if<migration::log_line>(&event.payload);
        return line != nullptr && line->text.find(text) != std::string::npos;
    };
}

}  // namespace migrator::testing
