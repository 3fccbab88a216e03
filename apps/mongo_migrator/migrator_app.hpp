/**
 * @file migrator_app.hpp
 * @brief mongo_migrator CLI application class
 *
 * Wires the connection registry, process runner, probe and orchestrator
 * together and executes one sub-command.
 */

#ifndef MIGRATOR_APP_MONGO_MIGRATOR_MIGRATOR_APP_HPP
#define MIGRATOR_APP_MONGO_MIGRATOR_MIGRATOR_APP_HPP

#include "config.hpp"

#include "migrator/client/connection_registry.hpp"
#include "migrator/di/ilogger.hpp"
#include "migrator/migration/connection_probe.hpp"
#include "migrator/migration/migration_orchestrator.hpp"
#include "migrator/migration/process_runner.hpp"

#include <atomic>
#include <memory>

namespace migrator::app {

/**
 * @brief Terminal front end for the migration orchestrator
 *
 * @example Usage
 * @code
 * migrator_app app{config};
 * if (!app.initialize()) {
 *     return 1;
 * }
 * return app.run();
 * @endcode
 */
class migrator_app {
public:
    explicit migrator_app(const migrator_app_config& config);

    /**
     * @brief Destructor - cancels a running migration and flushes logs
     */
    ~migrator_app();

    migrator_app(const migrator_app&) = delete;
    migrator_app& operator=(const migrator_app&) = delete;
    migrator_app(migrator_app&&) = delete;
    migrator_app& operator=(migrator_app&&) = delete;

    /**
     * @brief Open the profile database and start logging
     * @return true on success
     */
    [[nodiscard]] bool initialize();

    /**
     * @brief Execute the configured sub-command
     * @return Process exit code
     */
    [[nodiscard]] int run();

    /**
     * @brief Ask the running migration to stop
     *
     * Only sets a flag; safe to call from a signal handler.
     */
    void request_cancel() noexcept;

private:
    int list_profiles();
    int add_profile();
    int remove_profile();
    int preflight();
    int show_stats();
    int migrate();

    [[nodiscard]] bool confirm_interactively(const client::connection_profile& target,
                                             migration::start_request& request) const;

    migrator_app_config config_;
    std::shared_ptr<di::ILogger> logger_;
    std::shared_ptr<client::connection_registry> registry_;
    std::shared_ptr<migration::process_runner> runner_;
    std::shared_ptr<migration::database_probe> probe_;
    std::unique_ptr<migration::migration_orchestrator> orchestrator_;

    std::atomic<bool> cancel_requested_{false};
};

}  // namespace migrator::app

#endif  // MIGRATOR_APP_MONGO_MIGRATOR_MIGRATOR_APP_HPP
