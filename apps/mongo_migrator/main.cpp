/**
 * @file main.cpp
 * @brief Entry point for the mongo_migrator CLI
 *
 * Usage:
 *   mongo_migrator [OPTIONS] <command> [ARGS]
 *
 * Commands:
 *   profiles list | add | remove <id>
 *   preflight --source <id> --target <id>
 *   stats <id>
 *   migrate --source <id> --target <id> [--ack] [--confirm <db name>]
 */

#include "config.hpp"
#include "migrator_app.hpp"

#include <atomic>
#include <csignal>
#include <iostream>

namespace {

/// Global pointer to the app for signal handling
std::atomic<migrator::app::migrator_app*> g_app{nullptr};

/// SIGINT / SIGTERM cancel the running migration
void signal_handler(int /*signal*/) {
    auto* app = g_app.load();
    if (app) {
        app->request_cancel();
    }
}

void install_signal_handlers() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config = migrator::app::migrator_app_config::parse_args(argc, argv);
    if (!config) {
        return 1;
    }

    migrator::app::migrator_app app(config.value());
    if (!app.initialize()) {
        std::cerr << "Failed to initialize mongo_migrator\n";
        return 1;
    }

    g_app = &app;
    install_signal_handlers();

    int exit_code = app.run();

    g_app = nullptr;
    return exit_code;
}
