/**
 * @file config.cpp
 * @brief Command line parsing for the mongo_migrator CLI
 */

#include "config.hpp"

#include <iostream>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace migrator::app {

namespace {

bool require_value(int i, int argc, std::string_view option) {
    if (i + 1 >= argc) {
        std::cerr << "Error: " << option << " requires a value\n";
        return false;
    }
    return true;
}

bool parse_millis(const char* text, std::string_view option,
                  std::chrono::milliseconds& target) {
    try {
        auto value = std::stoll(text);
        if (value < 0) {
            throw std::out_of_range("negative");
        }
        target = std::chrono::milliseconds{value};
        return true;
    } catch (const std::exception&) {
        std::cerr << "Error: Invalid value for " << option << ": " << text << "\n";
        return false;
    }
}

}  // namespace

void migrator_app_config::print_help() {
    std::cout << R"(
mongo_migrator - Guarded MongoDB database migration

Usage: mongo_migrator [OPTIONS] <command> [ARGS]

Commands:
  profiles list                         List connection profiles by environment
  profiles add --name <n> --uri <u> --db <d> [--env <e>] [--id <id>]
                                        Add a connection profile
  profiles remove <id>                  Remove a connection profile
  preflight --source <id> --target <id> Check that both deployments answer
  stats <id>                            Show collection and document counts
  migrate --source <id> --target <id> [--ack] [--confirm <db name>] [--skip-preflight]
                                        Overwrite the target with the source

Options:
  --config <file>           JSON configuration file
  --db-path <path>          Connection profile database (default: connections.db)
  --log-dir <path>          Log directory (default: logs)
  --log-level <level>       trace, debug, info, warn, error, fatal, off (default: info)
  --dump-dir <path>         Dump directory (default: dump)
  --mongodump <path>        Export tool (default: mongodump)
  --mongorestore <path>     Import tool (default: mongorestore)
  --mongosh <path>          MongoDB shell (default: mongosh)
  --grace-ms <n>            SIGTERM to SIGKILL grace period (default: 5000)
  --stats-timeout-ms <n>    Upper bound per stats query (default: 15000)
  --no-drop                 Keep existing target collections
  --help, -h                Show this help message

Environment:
  MIGRATOR_DB_PATH, MIGRATOR_LOG_DIR, MIGRATOR_LOG_LEVEL, MIGRATOR_DUMP_DIR,
  MIGRATOR_MONGODUMP, MIGRATOR_MONGORESTORE, MIGRATOR_MONGOSH

Examples:
  mongo_migrator profiles add --name "Orders staging" --env staging \
      --uri mongodb://localhost:27017 --db orders
  mongo_migrator migrate --source orders-staging --target orders-prod \
      --ack --confirm orders_prod

Migrations require an explicit acknowledgement and the target database name
typed exactly. Ctrl+C cancels a running migration.
)";
}

auto migrator_app_config::parse_args(int argc, char* argv[])
    -> std::optional<migrator_app_config> {
    migrator_app_config config;

    // The configuration file is applied first so command line options win.
    for (int i = 1; i < argc; ++i) {
        if (std::string_view(argv[i]) == "--config") {
            if (!require_value(i, argc, "--config")) {
                return std::nullopt;
            }
            auto loaded = load_config_file(argv[i + 1], config.runtime);
            if (loaded.is_err()) {
                std::cerr << "Error: " << loaded.error().message << "\n";
                return std::nullopt;
            }
        }
    }
    apply_environment(config.runtime);

    auto& tools = config.runtime.orchestrator.tools;
    auto& opts = config.options;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_help();
            return std::nullopt;
        }

        if (arg == "--config") {
            ++i;
            continue;
        }

        if (arg == "--db-path") {
            if (!require_value(i, argc, arg)) return std::nullopt;
            config.runtime.database_path = argv[++i];
            continue;
        }

        if (arg == "--log-dir") {
            if (!require_value(i, argc, arg)) return std::nullopt;
            config.runtime.logging.log_directory = argv[++i];
            continue;
        }

        if (arg == "--log-level") {
            if (!require_value(i, argc, arg)) return std::nullopt;
            const std::string_view level = argv[++i];
            if (level != "trace" && level != "debug" && level != "info" &&
                level != "warn" && level != "error" && level != "fatal" && level != "off") {
                std::cerr << "Error: Invalid log level: " << level << "\n";
                std::cerr << "Valid levels: trace, debug, info, warn, error, fatal, off\n";
                return std::nullopt;
            }
            config.runtime.logging.min_level = integration::log_level_from_string(level);
            continue;
        }

        if (arg == "--dump-dir") {
            if (!require_value(i, argc, arg)) return std::nullopt;
            tools.dump_directory = argv[++i];
            continue;
        }

        if (arg == "--mongodump") {
            if (!require_value(i, argc, arg)) return std::nullopt;
            tools.dump_path = argv[++i];
            continue;
        }

        if (arg == "--mongorestore") {
            if (!require_value(i, argc, arg)) return std::nullopt;
            tools.restore_path = argv[++i];
            continue;
        }

        if (arg == "--mongosh") {
            if (!require_value(i, argc, arg)) return std::nullopt;
            tools.shell_path = argv[++i];
            continue;
        }

        if (arg == "--grace-ms") {
            if (!require_value(i, argc, arg)) return std::nullopt;
            if (!parse_millis(argv[++i], arg, config.runtime.orchestrator.cancel_grace_period)) {
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--stats-timeout-ms") {
            if (!require_value(i, argc, arg)) return std::nullopt;
            if (!parse_millis(argv[++i], arg, config.runtime.orchestrator.stats_timeout)) {
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--no-drop") {
            tools.drop_target = false;
            continue;
        }

        // Sub-command options
        if (arg == "--name") {
            if (!require_value(i, argc, arg)) return std::nullopt;
            opts.name = argv[++i];
            continue;
        }
        if (arg == "--uri") {
            if (!require_value(i, argc, arg)) return std::nullopt;
            opts.uri = argv[++i];
            continue;
        }
        if (arg == "--db") {
            if (!require_value(i, argc, arg)) return std::nullopt;
            opts.database = argv[++i];
            continue;
        }
        if (arg == "--env") {
            if (!require_value(i, argc, arg)) return std::nullopt;
            opts.environment = argv[++i];
            if (opts.environment != "production" && opts.environment != "staging" &&
                opts.environment != "development") {
                std::cerr << "Error: --env must be production, staging or development\n";
                return std::nullopt;
            }
            continue;
        }
        if (arg == "--id") {
            if (!require_value(i, argc, arg)) return std::nullopt;
            opts.profile_id = argv[++i];
            continue;
        }
        if (arg == "--source") {
            if (!require_value(i, argc, arg)) return std::nullopt;
            opts.source_id = argv[++i];
            continue;
        }
        if (arg == "--target") {
            if (!require_value(i, argc, arg)) return std::nullopt;
            opts.target_id = argv[++i];
            continue;
        }
        if (arg == "--ack") {
            opts.acknowledge = true;
            continue;
        }
        if (arg == "--confirm") {
            if (!require_value(i, argc, arg)) return std::nullopt;
            opts.typed_name = std::string(argv[++i]);
            continue;
        }
        if (arg == "--skip-preflight") {
            opts.skip_preflight = true;
            continue;
        }

        if (!arg.empty() && arg.front() == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return std::nullopt;
        }
        positional.emplace_back(arg);
    }

    if (positional.empty()) {
        print_help();
        return std::nullopt;
    }

    const auto& command = positional[0];
    if (command == "profiles") {
        const std::string action = positional.size() > 1 ? positional[1] : "list";
        if (action == "list") {
            opts.command = cli_command::profiles_list;
        } else if (action == "add") {
            opts.command = cli_command::profiles_add;
            if (opts.name.empty() || opts.uri.empty() || opts.database.empty()) {
                std::cerr << "Error: profiles add requires --name, --uri and --db\n";
                return std::nullopt;
            }
        } else if (action == "remove") {
            opts.command = cli_command::profiles_remove;
            if (positional.size() < 3) {
                std::cerr << "Error: profiles remove requires a profile id\n";
                return std::nullopt;
            }
            opts.profile_id = positional[2];
        } else {
            std::cerr << "Error: Unknown profiles action: " << action << "\n";
            return std::nullopt;
        }
    } else if (command == "preflight" || command == "migrate") {
        opts.command = command == "preflight" ? cli_command::preflight : cli_command::migrate;
        if (opts.source_id.empty() || opts.target_id.empty()) {
            std::cerr << "Error: " << command << " requires --source and --target\n";
            return std::nullopt;
        }
    } else if (command == "stats") {
        opts.command = cli_command::stats;
        if (positional.size() < 2) {
            std::cerr << "Error: stats requires a profile id\n";
            return std::nullopt;
        }
        opts.profile_id = positional[1];
    } else {
        std::cerr << "Error: Unknown command: " << command << "\n";
        std::cerr << "Use --help for usage information\n";
        return std::nullopt;
    }

    return config;
}

}  // namespace migrator::app
