/**
 * @file connection_probe.cpp
 * @brief mongosh based implementation of the database probe
 */

#include "migrator/migration/connection_probe.hpp"
#include "migrator/core/redaction.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

using json = nlohmann::json;

namespace migrator::migration {

namespace {

constexpr std::size_t error_tail_lines = 5;

/**
 * @brief Convert a floating point counter, clamped to the uint64_t range
 *
 * NaN and negative values read as 0.
 */
uint64_t clamp_counter(double value) noexcept {
    if (std::isnan(value) || value <= 0.0) {
        return 0;
    }
    // 2^64 is exactly representable; anything at or above it saturates.
    constexpr double upper = 18446744073709551616.0;
    if (value >= upper) {
        return std::numeric_limits<uint64_t>::max();
    }
    return static_cast<uint64_t>(value);
}

/**
 * @brief Read a dbStats counter that may be a number or {"$numberLong": "..."}
 */
uint64_t read_counter(const json& doc, const char* key) {
    if (!doc.contains(key)) {
        return 0;
    }
    const auto& value = doc[key];
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (value.is_number_integer()) {
        auto v = value.get<int64_t>();
        return v < 0 ? 0 : static_cast<uint64_t>(v);
    }
    if (value.is_number_float()) {
        return clamp_counter(value.get<double>());
    }
    if (value.is_object()) {
        for (const char* wrapper : {"$numberLong", "$numberInt", "$numberDouble"}) {
            if (value.contains(wrapper) && value[wrapper].is_string()) {
                try {
                    return clamp_counter(std::stod(value[wrapper].get<std::string>()));
                } catch (const std::exception&) {
                    return 0;
                }
            }
        }
    }
    return 0;
}

/**
 * @brief Last output line that parses as a JSON object
 */
std::optional<json> last_json_object(const std::vector<std::string>& lines) {
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        auto doc = json::parse(*it, nullptr, false);
        if (!doc.is_discarded() && doc.is_object()) {
            return doc;
        }
    }
    return std::nullopt;
}

std::string tail_text(const std::vector<std::string>& lines) {
    std::string text;
    auto begin = lines.size() > error_tail_lines ? lines.end() - error_tail_lines
                                                 : lines.begin();
    for (auto it = begin; it != lines.end(); ++it) {
        if (!text.empty()) {
            text += '\n';
        }
        text += *it;
    }
    return redact_credentials(text);
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

mongosh_probe::mongosh_probe(std::shared_ptr<process_runner> runner,
                             std::string shell_path,
                             std::chrono::milliseconds timeout,
                             std::map<std::string, std::string> environment,
                             std::shared_ptr<di::ILogger> logger)
    : runner_(std::move(runner)),
      shell_path_(std::move(shell_path)),
      timeout_(timeout),
      environment_(std::move(environment)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

// =============================================================================
// Queries
// =============================================================================

auto mongosh_probe::ping(const std::string& uri) -> Result<std::string> {
    auto output = evaluate(
        uri,
        "EJSON.stringify({ok: db.adminCommand({ping: 1}).ok, version: db.version()}, "
        "{relaxed: true})",
        cancellation_token{});
    if (output.is_err()) {
        return migrator_error<std::string>(output.error().code, output.error().message);
    }
    return parse_ping(output.value());
}

auto mongosh_probe::db_stats(const std::string& uri, const std::string& database,
                             const cancellation_token& cancel)
    -> Result<database_stats> {
    // json::dump() yields a quoted, escaped string literal valid in JavaScript.
    auto script = "EJSON.stringify(db.getSiblingDB(" + json(database).dump() +
                  ").stats(), {relaxed: true})";
    auto output = evaluate(uri, script, cancel);
    if (output.is_err()) {
        return migrator_error<database_stats>(output.error().code, output.error().message);
    }
    return parse_db_stats(output.value());
}

auto mongosh_probe::evaluate(const std::string& uri, const std::string& script,
                             const cancellation_token& cancel)
    -> Result<std::vector<std::string>> {
    process_spec spec;
    spec.executable = shell_path_;
    spec.args = {uri, "--quiet", "--norc", "--eval", script};
    spec.role = process_role::probe;
    spec.environment = environment_;
    spec.timeout = timeout_;

    std::vector<std::string> lines;
    auto result = runner_->run(
        spec,
        [&lines](process_role, std::string_view line) { lines.emplace_back(line); },
        cancel);

    if (result.is_err()) {
        return migrator_error<std::vector<std::string>>(
            error_codes::connectivity_error,
            "Failed to run " + shell_path_ + ": " + result.error().message);
    }

    const auto& outcome = result.value();
    if (cancel.is_cancelled()) {
        return migrator_error<std::vector<std::string>>(error_codes::connectivity_error,
                                                        "Query cancelled");
    }
    if (outcome.timed_out) {
        logger_->warn_fmt("Query against {} timed out after {} ms",
                          redact_credentials(uri), timeout_.count());
        return migrator_error<std::vector<std::string>>(
            error_codes::connectivity_timeout,
            "Query timed out after " + std::to_string(timeout_.count()) + " ms");
    }
    if (!outcome.succeeded()) {
        return migrator_error<std::vector<std::string>>(
            error_codes::connectivity_error,
            "Connection failed (exit code " + std::to_string(outcome.exit_code) + "): " +
                tail_text(lines));
    }
    return ok(std::move(lines));
}

// =============================================================================
// Output Parsing
// =============================================================================

auto mongosh_probe::parse_db_stats(const std::vector<std::string>& lines)
    -> Result<database_stats> {
    auto doc = last_json_object(lines);
    if (!doc) {
        return migrator_error<database_stats>(error_codes::stats_parse_error,
                                              "dbStats returned no JSON document");
    }
    if (doc->contains("ok") && read_counter(*doc, "ok") != 1) {
        return migrator_error<database_stats>(
            error_codes::stats_parse_error, "dbStats failed",
            doc->value("errmsg", std::string{}));
    }

    database_stats stats;
    stats.collections = read_counter(*doc, "collections");
    stats.objects = read_counter(*doc, "objects");
    stats.data_size = read_counter(*doc, "dataSize");
    stats.storage_size = read_counter(*doc, "storageSize");
    return ok(stats);
}

auto mongosh_probe::parse_ping(const std::vector<std::string>& lines) -> Result<std::string> {
    auto doc = last_json_object(lines);
    if (!doc) {
        return migrator_error<std::string>(error_codes::stats_parse_error,
                                           "ping returned no JSON document");
    }
    if (read_counter(*doc, "ok") != 1) {
        return migrator_error<std::string>(error_codes::connectivity_error,
                                           "Server did not acknowledge ping");
    }
    auto version = doc->value("version", std::string{"Unknown"});
    return ok("MongoDB " + version);
}

// =============================================================================
// Preflight
// =============================================================================

auto run_preflight(database_probe& probe,
                   const client::connection_profile& source,
                   const client::connection_profile& target)
    -> std::vector<preflight_check> {
    std::vector<preflight_check> checks;

    auto source_result = probe.ping(source.uri);
    if (source_result.is_ok()) {
        checks.push_back({true, "Source Connected: " + source_result.value()});
    } else {
        checks.push_back({false, "Source Failed: " +
                                     redact_credentials(source_result.error().message)});
        return checks;
    }

    auto target_result = probe.ping(target.uri);
    if (target_result.is_ok()) {
        checks.push_back({true, "Target Connected: " + target_result.value()});
    } else {
        checks.push_back({false, "Target Failed: " +
                                     redact_credentials(target_result.error().message)});
    }
    return checks;
}

auto preflight_passed(const std::vector<preflight_check>& checks) -> bool {
    return !checks.empty() &&
           std::all_of(checks.begin(), checks.end(),
                       [](const preflight_check& c) { return c.passed; });
}

}  // namespace migrator::migration
