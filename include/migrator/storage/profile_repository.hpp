/**
 * @file profile_repository.hpp
 * @brief SQLite persistence for connection profiles
 *
 * This file provides the profile_repository class which stores the named
 * source/target connection profiles in a single SQLite table.
 */

#pragma once

#include "migrator/client/connection_profile.hpp"
#include "migrator/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declaration for SQLite3
struct sqlite3;

namespace migrator::storage {

/**
 * @brief Repository for connection profile persistence
 *
 * Opens (and creates if necessary) the database file on construction.
 * Pass ":memory:" for a private in-memory database.
 *
 * Thread Safety:
 * - This class is NOT thread-safe. connection_registry serializes access.
 *
 * @example
 * @code
 * profile_repository repo("data/connections.db");
 * if (!repo.is_valid()) { ... }
 *
 * client::connection_profile p;
 * p.profile_id = "orders-staging";
 * p.name = "Orders (staging)";
 * p.uri = "mongodb://localhost:27017";
 * p.database = "orders";
 * auto pk = repo.insert(p);
 * @endcode
 */
class profile_repository {
public:
    explicit profile_repository(std::string db_path);
    ~profile_repository();

    profile_repository(const profile_repository&) = delete;
    auto operator=(const profile_repository&) -> profile_repository& = delete;
    profile_repository(profile_repository&& other) noexcept;
    auto operator=(profile_repository&& other) noexcept -> profile_repository&;

    /**
     * @brief Insert a new profile
     *
     * @param profile Profile to store; profile_id and name must be unique
     * @return Primary key of the new row, or profile_already_exists
     */
    [[nodiscard]] auto insert(const client::connection_profile& profile) -> Result<int64_t>;

    /**
     * @brief Replace the stored fields of an existing profile
     *
     * @param profile Profile whose profile_id identifies the row
     * @return VoidResult, profile_not_found if no row matched
     */
    [[nodiscard]] auto update(const client::connection_profile& profile) -> VoidResult;

    [[nodiscard]] auto find_by_id(std::string_view profile_id) const
        -> std::optional<client::connection_profile>;

    [[nodiscard]] auto find_by_name(std::string_view name) const
        -> std::optional<client::connection_profile>;

    /**
     * @brief All profiles ordered by environment, then name
     */
    [[nodiscard]] auto find_all() const -> std::vector<client::connection_profile>;

    [[nodiscard]] auto remove(std::string_view profile_id) -> VoidResult;

    [[nodiscard]] auto exists(std::string_view profile_id) const -> bool;

    [[nodiscard]] auto count() const -> std::size_t;

    /**
     * @brief Check that the database was opened and the schema created
     */
    [[nodiscard]] auto is_valid() const noexcept -> bool;

    /**
     * @brief Error message from opening the database, empty on success
     */
    [[nodiscard]] auto open_error() const -> const std::string&;

private:
    [[nodiscard]] auto open_db() -> VoidResult;
    void close_db();
    [[nodiscard]] auto initialize_tables() -> VoidResult;
    [[nodiscard]] auto find_one(const char* sql, std::string_view key) const
        -> std::optional<client::connection_profile>;
    [[nodiscard]] auto parse_row(void* stmt) const -> client::connection_profile;

    std::string db_path_;
    std::string open_error_;
    sqlite3* db_{nullptr};
};

}  // namespace migrator::storage
