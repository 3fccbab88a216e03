/**
 * @file profile_repository.cpp
 * @brief Implementation of the SQLite connection profile repository
 */

#include "migrator/storage/profile_repository.hpp"

#include <sqlite3.h>

#include <cstdio>
#include <ctime>
#include <utility>

namespace migrator::storage {

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

constexpr const char* select_columns = R"(
    SELECT pk, profile_id, name, environment, uri, database_name, created_at
    FROM connection_profiles
)";

/// Parse "YYYY-MM-DD HH:MM:SS" (UTC) to time_point
[[nodiscard]] std::chrono::system_clock::time_point from_timestamp_string(
    const char* str) {
    if (!str || str[0] == '\0') {
        return {};
    }
    std::tm tm{};
    if (std::sscanf(str, "%d-%d-%d %d:%d:%d",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec) != 6) {
        return {};
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

/// Get text column safely (returns empty string if NULL)
[[nodiscard]] std::string get_text_column(sqlite3_stmt* stmt, int col) {
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

/// Bind the mutable profile columns starting at index idx
void bind_profile_fields(sqlite3_stmt* stmt, int idx,
                         const client::connection_profile& profile) {
    sqlite3_bind_text(stmt, idx++, profile.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, client::to_string(profile.env), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, profile.uri.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, profile.database.c_str(), -1, SQLITE_TRANSIENT);
}

}  // namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

profile_repository::profile_repository(std::string db_path)
    : db_path_(std::move(db_path)) {
    auto opened = open_db();
    if (opened.is_err()) {
        open_error_ = opened.error().message;
        return;
    }
    auto schema = initialize_tables();
    if (schema.is_err()) {
        open_error_ = schema.error().message;
        close_db();
    }
}

profile_repository::~profile_repository() { close_db(); }

profile_repository::profile_repository(profile_repository&& other) noexcept
    : db_path_(std::move(other.db_path_)),
      open_error_(std::move(other.open_error_)),
      db_(std::exchange(other.db_, nullptr)) {}

auto profile_repository::operator=(profile_repository&& other) noexcept
    -> profile_repository& {
    if (this != &other) {
        close_db();
        db_path_ = std::move(other.db_path_);
        open_error_ = std::move(other.open_error_);
        db_ = std::exchange(other.db_, nullptr);
    }
    return *this;
}

auto profile_repository::open_db() -> VoidResult {
    if (sqlite3_open(db_path_.c_str(), &db_) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        close_db();
        return migrator_void_error(error_codes::database_open_error,
                                   "Failed to open database " + db_path_, message);
    }
    return ok();
}

void profile_repository::close_db() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

auto profile_repository::initialize_tables() -> VoidResult {
    static constexpr const char* sql = R"(
        CREATE TABLE IF NOT EXISTS connection_profiles (
            pk INTEGER PRIMARY KEY AUTOINCREMENT,
            profile_id TEXT NOT NULL UNIQUE,
            name TEXT NOT NULL UNIQUE,
            environment TEXT NOT NULL DEFAULT 'production',
            uri TEXT NOT NULL,
            database_name TEXT NOT NULL,
            created_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP
        );
    )";

    char* err_msg = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string error = err_msg ? err_msg : "Unknown error";
        sqlite3_free(err_msg);
        return migrator_void_error(error_codes::database_schema_error,
                                   "Failed to create connection_profiles table", error);
    }
    return ok();
}

// =============================================================================
// CRUD Operations
// =============================================================================

auto profile_repository::insert(const client::connection_profile& profile)
    -> Result<int64_t> {
    if (!db_) {
        return migrator_error<int64_t>(error_codes::database_open_error,
                                       "Database not initialized");
    }

    static constexpr const char* sql = R"(
        INSERT INTO connection_profiles (profile_id, name, environment, uri, database_name)
        VALUES (?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return migrator_error<int64_t>(error_codes::database_query_error,
                                       "Failed to prepare statement",
                                       sqlite3_errmsg(db_));
    }

    sqlite3_bind_text(stmt, 1, profile.profile_id.c_str(), -1, SQLITE_TRANSIENT);
    bind_profile_fields(stmt, 2, profile);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_CONSTRAINT) {
        return migrator_error<int64_t>(error_codes::profile_already_exists,
                                       "Connection name already exists",
                                       profile.name);
    }
    if (rc != SQLITE_DONE) {
        return migrator_error<int64_t>(error_codes::database_query_error,
                                       "Failed to insert profile", sqlite3_errmsg(db_));
    }

    return ok(static_cast<int64_t>(sqlite3_last_insert_rowid(db_)));
}

auto profile_repository::update(const client::connection_profile& profile) -> VoidResult {
    if (!db_) {
        return migrator_void_error(error_codes::database_open_error,
                                   "Database not initialized");
    }

    static constexpr const char* sql = R"(
        UPDATE connection_profiles
        SET name = ?, environment = ?, uri = ?, database_name = ?
        WHERE profile_id = ?
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return migrator_void_error(error_codes::database_query_error,
                                   "Failed to prepare statement", sqlite3_errmsg(db_));
    }

    bind_profile_fields(stmt, 1, profile);
    sqlite3_bind_text(stmt, 5, profile.profile_id.c_str(), -1, SQLITE_TRANSIENT);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_CONSTRAINT) {
        return migrator_void_error(error_codes::profile_already_exists,
                                   "Connection name already exists", profile.name);
    }
    if (rc != SQLITE_DONE) {
        return migrator_void_error(error_codes::database_query_error,
                                   "Failed to update profile", sqlite3_errmsg(db_));
    }
    if (sqlite3_changes(db_) == 0) {
        return migrator_void_error(error_codes::profile_not_found,
                                   "Profile not found", profile.profile_id);
    }
    return ok();
}

auto profile_repository::find_by_id(std::string_view profile_id) const
    -> std::optional<client::connection_profile> {
    static const std::string sql = std::string(select_columns) + " WHERE profile_id = ?";
    return find_one(sql.c_str(), profile_id);
}

auto profile_repository::find_by_name(std::string_view name) const
    -> std::optional<client::connection_profile> {
    static const std::string sql = std::string(select_columns) + " WHERE name = ?";
    return find_one(sql.c_str(), name);
}

auto profile_repository::find_all() const -> std::vector<client::connection_profile> {
    std::vector<client::connection_profile> result;
    if (!db_) return result;

    static const std::string sql = std::string(select_columns) + " ORDER BY environment, name";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return result;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        result.push_back(parse_row(stmt));
    }

    sqlite3_finalize(stmt);
    return result;
}

auto profile_repository::remove(std::string_view profile_id) -> VoidResult {
    if (!db_) {
        return migrator_void_error(error_codes::database_open_error,
                                   "Database not initialized");
    }

    static constexpr const char* sql = "DELETE FROM connection_profiles WHERE profile_id = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return migrator_void_error(error_codes::database_query_error,
                                   "Failed to prepare statement", sqlite3_errmsg(db_));
    }

    sqlite3_bind_text(stmt, 1, profile_id.data(), static_cast<int>(profile_id.size()),
                      SQLITE_TRANSIENT);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return migrator_void_error(error_codes::database_query_error,
                                   "Failed to delete profile", sqlite3_errmsg(db_));
    }
    return ok();
}

auto profile_repository::exists(std::string_view profile_id) const -> bool {
    return find_by_id(profile_id).has_value();
}

auto profile_repository::count() const -> std::size_t {
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM connection_profiles", -1, &stmt,
                           nullptr) != SQLITE_OK) {
        return 0;
    }

    std::size_t result = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return result;
}

auto profile_repository::is_valid() const noexcept -> bool {
    return db_ != nullptr;
}

auto profile_repository::open_error() const -> const std::string& {
    return open_error_;
}

// =============================================================================
// Private Helpers
// =============================================================================

auto profile_repository::find_one(const char* sql, std::string_view key) const
    -> std::optional<client::connection_profile> {
    if (!db_) return std::nullopt;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, key.data(), static_cast<int>(key.size()), SQLITE_TRANSIENT);

    std::optional<client::connection_profile> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = parse_row(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

auto profile_repository::parse_row(void* stmt_ptr) const -> client::connection_profile {
    auto* stmt = static_cast<sqlite3_stmt*>(stmt_ptr);

    client::connection_profile profile;
    profile.pk = sqlite3_column_int64(stmt, 0);
    profile.profile_id = get_text_column(stmt, 1);
    profile.name = get_text_column(stmt, 2);
    profile.env = client::environment_from_string(get_text_column(stmt, 3));
    profile.uri = get_text_column(stmt, 4);
    profile.database = get_text_column(stmt, 5);
    profile.created_at = from_timestamp_string(
        reinterpret_cast<const char*>(sqlite3_column_text(stmt, 6)));
    return profile;
}

}  // namespace migrator::storage
