/**
 * @file telemetry_channel.hpp
 * @brief Per-job fan-out of log lines, statistics and state changes
 *
 * This file provides the telemetry_channel class which distributes the
 * events of a running job to any number of observers. Each observer owns a
 * bounded queue; when it falls behind, its oldest events are dropped so the
 * producing job never waits for a slow observer.
 */

#pragma once

#include "migrator/core/result.hpp"
#include "migrator/migration/job_types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace migrator::migration {

// =============================================================================
// Events
// =============================================================================

/**
 * @brief A job moved from one state to another
 */
struct state_change {
    job_state from{job_state::pending};
    job_state to{job_state::pending};
    std::chrono::system_clock::time_point timestamp;
    std::string reason;  ///< Reason code for failed / cancelled
};

/**
 * @brief One item of a job's event stream
 */
struct telemetry_event {
    std::string job_id;
    std::variant<log_line, stats_snapshot, state_change> payload;

    [[nodiscard]] bool is_log() const noexcept {
        return std::holds_alternative<log_line>(payload);
    }
    [[nodiscard]] bool is_stats() const noexcept {
        return std::holds_alternative<stats_snapshot>(payload);
    }
    [[nodiscard]] bool is_state_change() const noexcept {
        return std::holds_alternative<state_change>(payload);
    }
};

// =============================================================================
// Subscription
// =============================================================================

namespace detail {

/**
 * @brief Bounded drop-oldest queue shared by a subscription and the channel
 */
struct subscriber_queue {
    explicit subscriber_queue(std::size_t cap) : capacity(cap == 0 ? 1 : cap) {}

    void push(const telemetry_event& event);
    void close();

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<telemetry_event> events;
    std::size_t capacity;
    uint64_t dropped{0};
    bool closed{false};    ///< No further events will arrive
    bool detached{false};  ///< Subscriber went away
};

}  // namespace detail

/**
 * @brief Consumer handle for one job's event stream
 *
 * The stream is finite: once the job is terminal the remaining events are
 * drained and next() then reports the end. Destroying the subscription
 * detaches it from the channel; the job is unaffected.
 */
class subscription {
public:
    subscription() = default;
    explicit subscription(std::shared_ptr<detail::subscriber_queue> queue);
    ~subscription();

    subscription(const subscription&) = delete;
    auto operator=(const subscription&) -> subscription& = delete;
    subscription(subscription&& other) noexcept = default;
    auto operator=(subscription&& other) noexcept -> subscription&;

    /**
     * @brief Wait for the next event
     * @return The event, or std::nullopt once the stream has ended
     */
    [[nodiscard]] auto next() -> std::optional<telemetry_event>;

    /**
     * @brief Wait up to timeout for the next event
     * @return The event, or std::nullopt on timeout or end of stream
     */
    [[nodiscard]] auto next_for(std::chrono::milliseconds timeout)
        -> std::optional<telemetry_event>;

    /**
     * @brief Take every queued event without waiting
     */
    [[nodiscard]] auto drain() -> std::vector<telemetry_event>;

    /**
     * @brief True when the stream is closed and nothing is left to read
     */
    [[nodiscard]] auto finished() const -> bool;

    /**
     * @brief Number of events discarded because this subscriber fell behind
     */
    [[nodiscard]] auto dropped_count() const -> uint64_t;

    /**
     * @brief Stop receiving events
     */
    void unsubscribe();

    [[nodiscard]] auto valid() const noexcept -> bool { return queue_ != nullptr; }

private:
    std::shared_ptr<detail::subscriber_queue> queue_;
};

// =============================================================================
// Telemetry Channel
// =============================================================================

/**
 * @brief Fan-out of job events to concurrent subscribers
 *
 * Every subscriber receives the events published after it subscribed, in
 * publication order. The channel also keeps a bounded history per job so
 * late subscribers may ask for a replay. Only the most recently closed
 * streams are retained; older ones are released together with their history.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - publish() never waits for subscribers
 */
class telemetry_channel {
public:
    /**
     * @brief Construct a channel
     *
     * @param queue_capacity Events buffered per subscriber before dropping
     * @param history_capacity Events retained per job for replay
     * @param max_closed_streams Closed streams kept for late subscribers
     */
    explicit telemetry_channel(std::size_t queue_capacity = 1024,
                               std::size_t history_capacity = 10000,
                               std::size_t max_closed_streams = 16);

    /**
     * @brief Register a job stream; publishing to an unknown job is ignored
     */
    void open(const std::string& job_id);

    /**
     * @brief Deliver an event to every subscriber of its job
     */
    void publish(const telemetry_event& event);

    /**
     * @brief End a job stream; subscribers drain what is queued and finish
     */
    void close(const std::string& job_id);

    /**
     * @brief Forget a job stream and its history
     *
     * Remaining subscribers drain what is queued and finish.
     */
    void remove(const std::string& job_id);

    /**
     * @brief Attach a new subscriber
     *
     * Subscribing to a closed job is allowed; without replay the returned
     * subscription is already finished.
     *
     * @param job_id Job to observe
     * @param replay_history Queue the job's retained history first
     * @return The subscription, or job_not_found for unknown or released streams
     */
    [[nodiscard]] auto subscribe(const std::string& job_id, bool replay_history = false)
        -> Result<subscription>;

    /**
     * @brief A finished subscription that yields exactly the given events
     */
    [[nodiscard]] static auto finished_subscription(std::vector<telemetry_event> events)
        -> subscription;

    [[nodiscard]] auto subscriber_count(const std::string& job_id) const -> std::size_t;

    [[nodiscard]] auto is_closed(const std::string& job_id) const -> bool;

private:
    struct stream {
        std::vector<std::shared_ptr<detail::subscriber_queue>> subscribers;
        std::deque<telemetry_event> history;
        bool closed{false};
    };

    std::size_t queue_capacity_;
    std::size_t history_capacity_;
    std::size_t max_closed_streams_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, stream> streams_;
    std::deque<std::string> closed_order_;  ///< Oldest closed stream first
};

}  // namespace migrator::migration
