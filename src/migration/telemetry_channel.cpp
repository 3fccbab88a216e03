/**
 * @file telemetry_channel.cpp
 * @brief Implementation of the telemetry channel
 */

#include "migrator/migration/telemetry_channel.hpp"

#include <algorithm>

namespace migrator::migration {

// =============================================================================
// Subscriber Queue
// =============================================================================

namespace detail {

void subscriber_queue::push(const telemetry_event& event) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed || detached) {
            return;
        }
        if (events.size() >= capacity) {
            events.pop_front();
            ++dropped;
        }
        events.push_back(event);
    }
    cv.notify_one();
}

void subscriber_queue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
    }
    cv.notify_all();
}

}  // namespace detail

// =============================================================================
// Subscription
// =============================================================================

subscription::subscription(std::shared_ptr<detail::subscriber_queue> queue)
    : queue_(std::move(queue)) {}

subscription::~subscription() {
    unsubscribe();
}

auto subscription::operator=(subscription&& other) noexcept -> subscription& {
    if (this != &other) {
        unsubscribe();
        queue_ = std::move(other.queue_);
    }
    return *this;
}

auto subscription::next() -> std::optional<telemetry_event> {
    if (!queue_) {
        return std::nullopt;
    }
    std::unique_lock<std::mutex> lock(queue_->mutex);
    queue_->cv.wait(lock, [this] { return !queue_->events.empty() || queue_->closed; });
    if (queue_->events.empty()) {
        return std::nullopt;
    }
    auto event = std::move(queue_->events.front());
    queue_->events.pop_front();
    return event;
}

auto subscription::next_for(std::chrono::milliseconds timeout)
    -> std::optional<telemetry_event> {
    if (!queue_) {
        return std::nullopt;
    }
    std::unique_lock<std::mutex> lock(queue_->mutex);
    bool ready = queue_->cv.wait_for(lock, timeout, [this] {
        return !queue_->events.empty() || queue_->closed;
    });
    if (!ready || queue_->events.empty()) {
        return std::nullopt;
    }
    auto event = std::move(queue_->events.front());
    queue_->events.pop_front();
    return event;
}

auto subscription::drain() -> std::vector<telemetry_event> {
    std::vector<telemetry_event> result;
    if (!queue_) {
        return result;
    }
    std::lock_guard<std::mutex> lock(queue_->mutex);
    result.assign(std::make_move_iterator(queue_->events.begin()),
                  std::make_move_iterator(queue_->events.end()));
    queue_->events.clear();
    return result;
}

auto subscription::finished() const -> bool {
    if (!queue_) {
        return true;
    }
    std::lock_guard<std::mutex> lock(queue_->mutex);
    return queue_->closed && queue_->events.empty();
}

auto subscription::dropped_count() const -> uint64_t {
    if (!queue_) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(queue_->mutex);
    return queue_->dropped;
}

void subscription::unsubscribe() {
    if (!queue_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queue_->mutex);
        queue_->detached = true;
        queue_->events.clear();
    }
    queue_->cv.notify_all();
    queue_.reset();
}

// =============================================================================
// Telemetry Channel
// =============================================================================

telemetry_channel::telemetry_channel(std::size_t queue_capacity,
                                     std::size_t history_capacity,
                                     std::size_t max_closed_streams)
    : queue_capacity_(queue_capacity),
      history_capacity_(history_capacity),
      max_closed_streams_(max_closed_streams) {}

void telemetry_channel::open(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    streams_.try_emplace(job_id);
}

void telemetry_channel::publish(const telemetry_event& event) {
    // Fan-out happens under the channel lock so every subscriber observes
    // the same order even with several publishing threads.
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = streams_.find(event.job_id);
    if (it == streams_.end() || it->second.closed) {
        return;
    }
    auto& s = it->second;

    if (history_capacity_ > 0) {
        if (s.history.size() >= history_capacity_) {
            s.history.pop_front();
        }
        s.history.push_back(event);
    }

    s.subscribers.erase(
        std::remove_if(s.subscribers.begin(), s.subscribers.end(),
                       [](const auto& q) {
                           std::lock_guard<std::mutex> qlock(q->mutex);
                           return q->detached;
                       }),
        s.subscribers.end());

    for (auto& queue : s.subscribers) {
        queue->push(event);
    }
}

void telemetry_channel::close(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = streams_.find(job_id);
    if (it == streams_.end() || it->second.closed) {
        return;
    }
    it->second.closed = true;
    for (auto& queue : it->second.subscribers) {
        queue->close();
    }
    it->second.subscribers.clear();

    closed_order_.push_back(job_id);
    while (closed_order_.size() > max_closed_streams_) {
        streams_.erase(closed_order_.front());
        closed_order_.pop_front();
    }
}

void telemetry_channel::remove(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = streams_.find(job_id);
    if (it == streams_.end()) {
        return;
    }
    for (auto& queue : it->second.subscribers) {
        queue->close();
    }
    streams_.erase(it);
    closed_order_.erase(std::remove(closed_order_.begin(), closed_order_.end(), job_id),
                        closed_order_.end());
}

auto telemetry_channel::subscribe(const std::string& job_id, bool replay_history)
    -> Result<subscription> {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = streams_.find(job_id);
    if (it == streams_.end()) {
        return migrator_error<subscription>(error_codes::job_not_found,
                                            "Job not found: " + job_id);
    }
    auto& s = it->second;

    // A replaying subscriber gets room for the retained history on top of
    // the regular live-event capacity.
    auto capacity = queue_capacity_;
    if (replay_history) {
        capacity += s.history.size();
    }
    auto queue = std::make_shared<detail::subscriber_queue>(capacity);

    if (replay_history) {
        for (const auto& event : s.history) {
            queue->push(event);
        }
    }

    if (s.closed) {
        queue->close();
    } else {
        s.subscribers.push_back(queue);
    }

    return ok(subscription(std::move(queue)));
}

auto telemetry_channel::finished_subscription(std::vector<telemetry_event> events)
    -> subscription {
    auto queue = std::make_shared<detail::subscriber_queue>(events.size());
    for (auto& event : events) {
        queue->events.push_back(std::move(event));
    }
    queue->closed = true;
    return subscription(std::move(queue));
}

auto telemetry_channel::subscriber_count(const std::string& job_id) const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = streams_.find(job_id);
    if (it == streams_.end()) {
        return 0;
    }
    return static_cast<std::size_t>(std::count_if(
        it->second.subscribers.begin(), it->second.subscribers.end(),
        [](const auto& q) {
            std::lock_guard<std::mutex> qlock(q->mutex);
            return !q->detached;
        }));
}

auto telemetry_channel::is_closed(const std::string& job_id) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(job_id);
    return it != streams_.end() && it->second.closed;
}

}  // namespace migrator::migration
