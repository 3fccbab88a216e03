/**
 * @file config.hpp
 * @brief Command line configuration for the mongo_migrator CLI
 *
 * Settings are layered: built-in defaults, then the JSON file given with
 * --config, then MIGRATOR_* environment variables, then command line options.
 */

#ifndef MIGRATOR_APP_MONGO_MIGRATOR_CONFIG_HPP
#define MIGRATOR_APP_MONGO_MIGRATOR_CONFIG_HPP

#include "migrator/core/runtime_config.hpp"

#include <optional>
#include <string>

namespace migrator::app {

/**
 * @brief Sub-command selected on the command line
 */
enum class cli_command {
    profiles_list,
    profiles_add,
    profiles_remove,
    preflight,
    stats,
    migrate
};

/**
 * @brief Arguments of the selected sub-command
 */
struct command_options {
    cli_command command{cli_command::profiles_list};

    // profiles add / remove, stats
    std::string profile_id;
    std::string name;
    std::string uri;
    std::string database;
    std::string environment{"production"};

    // preflight, migrate
    std::string source_id;
    std::string target_id;

    // migrate
    bool acknowledge{false};
    std::optional<std::string> typed_name;  ///< Prompted for when absent
    bool skip_preflight{false};
};

/**
 * @brief Complete CLI configuration
 */
struct migrator_app_config {
    runtime_config runtime;
    command_options options;

    /**
     * @brief Parse configuration from command line arguments
     *
     * Global options:
     *   --config <file>           JSON configuration file
     *   --db-path <path>          Connection profile database (default: connections.db)
     *   --log-dir <path>          Log directory (default: logs)
     *   --log-level <level>       trace, debug, info, warn, error, fatal, off
     *   --dump-dir <path>         Dump directory (default: dump)
     *   --mongodump <path>        Export tool
     *   --mongorestore <path>     Import tool
     *   --mongosh <path>          MongoDB shell
     *   --grace-ms <n>            SIGTERM to SIGKILL grace period
     *   --stats-timeout-ms <n>    Upper bound per stats query
     *   --no-drop                 Do not pass --drop to the import tool
     *   --help                    Show help message
     *
     * @param argc Argument count
     * @param argv Argument vector
     * @return Configuration or nullopt if --help was requested or error
     */
    static auto parse_args(int argc, char* argv[]) -> std::optional<migrator_app_config>;

    /**
     * @brief Print help message to stdout
     */
    static void print_help();
};

}  // namespace migrator::app

#endif  // MIGRATOR_APP_MONGO_MIGRATOR_CONFIG_HPP
