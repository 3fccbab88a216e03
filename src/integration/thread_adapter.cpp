/**
 * @file thread_adapter.cpp
 * @brief Implementation of thread_adapter for thread_system integration
 */

#include <migrator/integration/thread_adapter.hpp>

#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>

#include <stdexcept>

namespace migrator::integration {

std::shared_ptr<kcenon::thread::thread_pool> thread_adapter::pool_ = nullptr;
thread_pool_config thread_adapter::config_;
std::mutex thread_adapter::mutex_;
bool thread_adapter::initialized_ = false;

void thread_adapter::configure(const thread_pool_config& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    if (config_.worker_count == 0) {
        config_.worker_count = 1;
    }
}

auto thread_adapter::get_config() noexcept -> const thread_pool_config& {
    return config_;
}

auto thread_adapter::start() -> bool {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_ && pool_ && pool_->is_running()) {
        return true;
    }

    if (!pool_) {
        pool_ = std::make_shared<kcenon::thread::thread_pool>(config_.pool_name);
    }

    for (std::size_t i = 0; i < config_.worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool_->get_job_queue());
        auto result = pool_->enqueue(std::move(worker));
        if (!result) {
            return false;
        }
    }

    auto start_result = pool_->start();
    if (!start_result) {
        return false;
    }

    initialized_ = true;
    return true;
}

auto thread_adapter::is_running() noexcept -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ && pool_->is_running();
}

void thread_adapter::shutdown(bool wait_for_completion) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (pool_) {
        pool_->stop(!wait_for_completion);
        pool_.reset();
    }

    initialized_ = false;
}

void thread_adapter::submit_job_internal(std::function<void()> task) {
    if (!is_running()) {
        if (!start()) {
            throw std::runtime_error("Failed to start thread pool");
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!pool_ || !pool_->submit_task(std::move(task))) {
        throw std::runtime_error("Failed to submit task to thread pool");
    }
}

auto thread_adapter::get_thread_count() -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pool_) {
        return pool_->get_thread_count();
    }
    return 0;
}

auto thread_adapter::get_pending_job_count() -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pool_) {
        return pool_->get_pending_task_count();
    }
    return 0;
}

}  // namespace migrator::integration
