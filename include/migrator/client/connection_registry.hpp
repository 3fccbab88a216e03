/**
 * @file connection_registry.hpp
 * @brief Registry of named source/target connection profiles
 *
 * This file provides the connection_registry class: an in-memory cache of
 * connection profiles backed by an optional profile_repository. The
 * orchestrator only reads from it; operators mutate it through the CLI.
 */

#pragma once

#include "migrator/client/connection_profile.hpp"
#include "migrator/core/result.hpp"
#include "migrator/di/ilogger.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations
namespace migrator::storage {
class profile_repository;
}

namespace migrator::client {

/**
 * @brief Manager for named connection profiles
 *
 * Provides:
 * - Profile CRUD (add, update, remove, list, grouped listing)
 * - Lookup by identifier for the orchestrator
 * - Reference pinning: a profile referenced by an active job cannot be
 *   removed or modified until the job releases it
 *
 * Thread Safety:
 * - All public methods are thread-safe
 *
 * @example
 * @code
 * auto repo = std::make_shared<storage::profile_repository>("connections.db");
 * auto registry = std::make_shared<connection_registry>(repo);
 *
 * connection_profile p;
 * p.name = "Orders (staging)";
 * p.uri = "mongodb://localhost:27017";
 * p.database = "orders";
 * p.env = environment::staging;
 * auto added = registry->add_profile(p);   // assigns profile_id "orders-staging"
 *
 * auto profile = registry->get_profile("orders-staging");
 * @endcode
 */
class connection_registry {
public:
    /**
     * @brief Construct a registry
     *
     * @param repo Repository for persistence (nullptr keeps profiles in memory only)
     * @param logger Logger instance (optional, defaults to NullLogger)
     */
    explicit connection_registry(
        std::shared_ptr<storage::profile_repository> repo = nullptr,
        std::shared_ptr<di::ILogger> logger = nullptr);

    ~connection_registry();

    connection_registry(const connection_registry&) = delete;
    auto operator=(const connection_registry&) -> connection_registry& = delete;
    connection_registry(connection_registry&&) = delete;
    auto operator=(connection_registry&&) -> connection_registry& = delete;

    // =========================================================================
    // Profile CRUD Operations
    // =========================================================================

    /**
     * @brief Add a new profile
     *
     * An empty profile_id is derived from the name ("Orders (staging)" ->
     * "orders-staging").
     *
     * @param profile The profile to add
     * @return The stored profile, or invalid_argument / profile_already_exists
     */
    [[nodiscard]] auto add_profile(const connection_profile& profile)
        -> Result<connection_profile>;

    /**
     * @brief Update an existing profile
     *
     * @param profile The profile to update (profile_id must match existing)
     * @return VoidResult, profile_not_found or profile_in_use if pinned
     */
    [[nodiscard]] auto update_profile(const connection_profile& profile) -> VoidResult;

    /**
     * @brief Remove a profile
     *
     * @param profile_id ID of the profile to remove
     * @return VoidResult, profile_not_found or profile_in_use if pinned
     */
    [[nodiscard]] auto remove_profile(std::string_view profile_id) -> VoidResult;

    /**
     * @brief Look up a profile by identifier
     *
     * @param profile_id ID of the profile
     * @return The profile, or profile_not_found
     */
    [[nodiscard]] auto get_profile(std::string_view profile_id) const
        -> Result<connection_profile>;

    /**
     * @brief All profiles ordered by environment, then name
     */
    [[nodiscard]] auto list_profiles() const -> std::vector<connection_profile>;

    /**
     * @brief All profiles grouped by environment
     */
    [[nodiscard]] auto list_grouped() const -> grouped_profiles;

    [[nodiscard]] auto profile_count() const -> std::size_t;

    // =========================================================================
    // Reference Pinning
    // =========================================================================

    /**
     * @brief Pin a profile so it stays resolvable while a job holds it
     *
     * Pins are counted; every successful pin must be matched by unpin().
     *
     * @param profile_id ID of the profile
     * @return VoidResult, profile_not_found if unknown
     */
    [[nodiscard]] auto pin(std::string_view profile_id) -> VoidResult;

    /**
     * @brief Release one pin taken by pin()
     */
    void unpin(std::string_view profile_id);

    [[nodiscard]] auto is_pinned(std::string_view profile_id) const -> bool;

    /**
     * @brief Derive a profile identifier from a display name
     */
    [[nodiscard]] static auto make_profile_id(std::string_view name) -> std::string;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace migrator::client
