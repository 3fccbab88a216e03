/**
 * @file thread_adapter.hpp
 * @brief Adapter for running background work on the thread_system pool
 *
 * Migration pipelines and connectivity probes are submitted here instead of
 * spawning raw std::threads, so the process owns a single bounded pool that
 * is started and shut down with the application.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>

namespace kcenon::thread {
class thread_pool;
}  // namespace kcenon::thread

namespace migrator::integration {

/**
 * @struct thread_pool_config
 * @brief Configuration options for the shared thread pool
 */
struct thread_pool_config {
    /// Number of worker threads started with the pool
    std::size_t worker_count = 2;

    /// Thread pool name for logging
    std::string pool_name = "migrator_pool";
};

/**
 * @class thread_adapter
 * @brief Static facade over a process-wide kcenon::thread::thread_pool
 *
 * Thread Safety: All public methods are thread-safe.
 *
 * @example
 * @code
 * thread_pool_config config;
 * config.worker_count = 2;
 * thread_adapter::configure(config);
 * thread_adapter::start();
 *
 * auto future = thread_adapter::submit([] { return run_pipeline(); });
 * future.get();
 *
 * thread_adapter::shutdown();
 * @endcode
 */
class thread_adapter {
public:
    /**
     * @brief Configure the pool; takes effect on the next start()
     * @param config Configuration options
     */
    static void configure(const thread_pool_config& config);

    [[nodiscard]] static auto get_config() noexcept -> const thread_pool_config&;

    /**
     * @brief Start the worker threads
     *
     * Safe to call multiple times; later calls are no-ops while running.
     *
     * @return true if the pool is running after the call
     */
    [[nodiscard]] static auto start() -> bool;

    [[nodiscard]] static auto is_running() noexcept -> bool;

    /**
     * @brief Stop the pool
     * @param wait_for_completion If true, drains queued tasks before stopping
     */
    static void shutdown(bool wait_for_completion = true);

    /**
     * @brief Submit a task and get a future for its result
     *
     * The pool is started on demand.
     *
     * @throws std::runtime_error if the pool cannot be started or rejects
     *         the task
     */
    template <typename F>
    [[nodiscard]] static auto submit(F&& task)
        -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    [[nodiscard]] static auto get_thread_count() -> std::size_t;

    [[nodiscard]] static auto get_pending_job_count() -> std::size_t;

private:
    static std::shared_ptr<kcenon::thread::thread_pool> pool_;
    static thread_pool_config config_;
    static std::mutex mutex_;
    static bool initialized_;

    static void submit_job_internal(std::function<void()> task);

    thread_adapter() = delete;
    ~thread_adapter() = delete;
    thread_adapter(const thread_adapter&) = delete;
    thread_adapter& operator=(const thread_adapter&) = delete;
};

// ─────────────────────────────────────────────────────
// Template Implementation
// ─────────────────────────────────────────────────────

template <typename F>
auto thread_adapter::submit(F&& task)
    -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using return_type = std::invoke_result_t<std::decay_t<F>>;

    auto packaged_task =
        std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(task));
    auto future = packaged_task->get_future();

    submit_job_internal([packaged_task]() { (*packaged_task)(); });

    return future;
}

}  // namespace migrator::integration
