/**
 * @file runtime_config.cpp
 * @brief JSON and environment configuration loading
 */

#include "migrator/core/runtime_config.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>

using json = nlohmann::json;

namespace migrator {

namespace {

template <typename T>
void read_if_present(const json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section[key].get<T>();
    }
}

void read_millis(const json& section, const char* key, std::chrono::milliseconds& target) {
    if (section.contains(key)) {
        target = std::chrono::milliseconds{section[key].get<int64_t>()};
    }
}

std::optional<std::string> get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

}  // namespace

auto apply_config_json(const std::string& text, runtime_config& config) -> VoidResult {
    try {
        auto doc = json::parse(text);
        if (!doc.is_object()) {
            return migrator_void_error(error_codes::config_parse_error,
                                       "Configuration root must be a JSON object");
        }

        if (doc.contains("database")) {
            const auto& database = doc["database"];
            if (database.contains("path")) {
                config.database_path = database["path"].get<std::string>();
            }
        }

        if (doc.contains("logging")) {
            const auto& logging = doc["logging"];
            auto& log = config.logging;
            if (logging.contains("directory")) {
                log.log_directory = logging["directory"].get<std::string>();
            }
            if (logging.contains("level")) {
                log.min_level = integration::log_level_from_string(
                    logging["level"].get<std::string>());
            }
            read_if_present(logging, "console", log.enable_console);
            read_if_present(logging, "file", log.enable_file);
            read_if_present(logging, "audit", log.enable_audit_log);
            read_if_present(logging, "maxFileSizeMb", log.max_file_size_mb);
            read_if_present(logging, "maxFiles", log.max_files);
            read_if_present(logging, "async", log.async_mode);
        }

        if (doc.contains("tools")) {
            const auto& tools = doc["tools"];
            auto& t = config.orchestrator.tools;
            read_if_present(tools, "mongodump", t.dump_path);
            read_if_present(tools, "mongorestore", t.restore_path);
            read_if_present(tools, "mongosh", t.shell_path);
            if (tools.contains("dumpDirectory")) {
                t.dump_directory = tools["dumpDirectory"].get<std::string>();
            }
            read_if_present(tools, "dropTarget", t.drop_target);
            if (tools.contains("environment") && tools["environment"].is_object()) {
                for (auto it = tools["environment"].begin(); it != tools["environment"].end();
                     ++it) {
                    t.environment[it.key()] = it.value().get<std::string>();
                }
            }
        }

        if (doc.contains("orchestrator")) {
            const auto& orch = doc["orchestrator"];
            auto& o = config.orchestrator;
            read_millis(orch, "cancelGracePeriodMs", o.cancel_grace_period);
            read_millis(orch, "statsTimeoutMs", o.stats_timeout);
            read_millis(orch, "phaseTimeoutMs", o.phase_timeout);
            read_if_present(orch, "logTailLines", o.log_tail_lines);
            read_if_present(orch, "subscriberQueueCapacity", o.subscriber_queue_capacity);
            read_if_present(orch, "cleanupDumpDirectory", o.cleanup_dump_directory);
            read_if_present(orch, "maxRetainedJobs", o.max_retained_jobs);
            read_if_present(orch, "retainedEventStreams", o.retained_event_streams);
        }

        return ok();
    } catch (const json::exception& ex) {
        return migrator_void_error(error_codes::config_parse_error,
                                   "JSON parsing error: " + std::string(ex.what()));
    }
}

auto load_config_file(const std::filesystem::path& path, runtime_config& config)
    -> VoidResult {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return migrator_void_error(error_codes::config_file_not_found,
                                   "Configuration file does not exist: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return migrator_void_error(error_codes::config_file_not_found,
                                   "Failed to open configuration file: " + path.string());
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return apply_config_json(buffer.str(), config);
}

void apply_environment(runtime_config& config, const std::string& prefix) {
    if (auto value = get_env(prefix + "DB_PATH")) {
        config.database_path = *value;
    }
    if (auto value = get_env(prefix + "LOG_DIR")) {
        config.logging.log_directory = *value;
    }
    if (auto value = get_env(prefix + "LOG_LEVEL")) {
        config.logging.min_level = integration::log_level_from_string(*value);
    }
    if (auto value = get_env(prefix + "DUMP_DIR")) {
        config.orchestrator.tools.dump_directory = *value;
    }
    if (auto value = get_env(prefix + "MONGODUMP")) {
        config.orchestrator.tools.dump_path = *value;
    }
    if (auto value = get_env(prefix + "MONGORESTORE")) {
        config.orchestrator.tools.restore_path = *value;
    }
    if (auto value = get_env(prefix + "MONGOSH")) {
        config.orchestrator.tools.shell_path = *value;
    }
}

}  // namespace migrator
