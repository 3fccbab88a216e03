/**
 * @file connection_registry.cpp
 * @brief Implementation of the connection profile registry
 */

#include "migrator/client/connection_registry.hpp"
#include "migrator/storage/profile_repository.hpp"
#include "migrator/integration/logger_adapter.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <unordered_map>

namespace migrator::client {

// =============================================================================
// Implementation Structure
// =============================================================================

struct connection_registry::impl {
    std::shared_ptr<storage::profile_repository> repo;
    std::shared_ptr<di::ILogger> logger;

    std::unordered_map<std::string, connection_profile> cache;
    std::unordered_map<std::string, std::size_t> pins;
    mutable std::mutex mutex;

    void load_profiles_from_repo() {
        if (!repo) {
            return;
        }
        for (auto& profile : repo->find_all()) {
            cache.emplace(profile.profile_id, std::move(profile));
        }
        logger->debug_fmt("Loaded {} connection profiles", cache.size());
    }

    [[nodiscard]] bool name_taken(const std::string& name,
                                  const std::string& except_id) const {
        return std::any_of(cache.begin(), cache.end(), [&](const auto& entry) {
            return entry.first != except_id && entry.second.name == name;
        });
    }

    [[nodiscard]] bool pinned(const std::string& profile_id) const {
        auto it = pins.find(profile_id);
        return it != pins.end() && it->second > 0;
    }

    [[nodiscard]] std::vector<connection_profile> sorted() const {
        std::vector<connection_profile> result;
        result.reserve(cache.size());
        for (const auto& [id, profile] : cache) {
            result.push_back(profile);
        }
        std::sort(result.begin(), result.end(),
                  [](const connection_profile& a, const connection_profile& b) {
                      if (a.env != b.env) {
                          return static_cast<int>(a.env) < static_cast<int>(b.env);
                      }
                      return a.name < b.name;
                  });
        return result;
    }
};

// =============================================================================
// Construction / Destruction
// =============================================================================

connection_registry::connection_registry(
    std::shared_ptr<storage::profile_repository> repo,
    std::shared_ptr<di::ILogger> logger)
    : impl_(std::make_unique<impl>()) {
    impl_->repo = std::move(repo);
    impl_->logger = logger ? std::move(logger) : di::null_logger();
    impl_->load_profiles_from_repo();
}

connection_registry::~connection_registry() = default;

// =============================================================================
// Profile CRUD Operations
// =============================================================================

auto connection_registry::add_profile(const connection_profile& profile)
    -> Result<connection_profile> {
    auto stored = profile;
    if (stored.profile_id.empty()) {
        stored.profile_id = make_profile_id(stored.name);
    }

    if (!stored.is_valid()) {
        return migrator_error<connection_profile>(
            error_codes::invalid_argument,
            "Profile requires a name, a connection URI and a database name");
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);

    if (impl_->cache.count(stored.profile_id) > 0 ||
        impl_->name_taken(stored.name, stored.profile_id)) {
        return migrator_error<connection_profile>(
            error_codes::profile_already_exists,
            "Connection name already exists", stored.name);
    }

    if (impl_->repo) {
        auto result = impl_->repo->insert(stored);
        if (result.is_err()) {
            return migrator_error<connection_profile>(
                result.error().code,
                "Failed to persist profile: " + result.error().message);
        }
        stored.pk = result.value();
    }
    stored.created_at = std::chrono::system_clock::now();

    impl_->cache[stored.profile_id] = stored;

    impl_->logger->info_fmt("Added connection profile: {} ({})",
                            stored.profile_id, to_string(stored.env));
    integration::logger_adapter::log_profile_change(
        integration::profile_change::added, stored.name, stored.uri);

    return ok(stored);
}

auto connection_registry::update_profile(const connection_profile& profile) -> VoidResult {
    if (!profile.is_valid()) {
        return migrator_void_error(
            error_codes::invalid_argument,
            "Profile requires a name, a connection URI and a database name");
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto it = impl_->cache.find(profile.profile_id);
    if (it == impl_->cache.end()) {
        return migrator_void_error(error_codes::profile_not_found,
                                   "Profile not found: " + profile.profile_id);
    }
    if (impl_->pinned(profile.profile_id)) {
        return migrator_void_error(error_codes::profile_in_use,
                                   "Profile is referenced by an active migration: " +
                                       profile.profile_id);
    }
    if (impl_->name_taken(profile.name, profile.profile_id)) {
        return migrator_void_error(error_codes::profile_already_exists,
                                   "Connection name already exists", profile.name);
    }

    if (impl_->repo) {
        auto result = impl_->repo->update(profile);
        if (result.is_err()) {
            return result;
        }
    }

    auto updated = profile;
    updated.pk = it->second.pk;
    updated.created_at = it->second.created_at;
    it->second = std::move(updated);

    impl_->logger->info_fmt("Updated connection profile: {}", profile.profile_id);
    integration::logger_adapter::log_profile_change(
        integration::profile_change::updated, profile.name, profile.uri);

    return ok();
}

auto connection_registry::remove_profile(std::string_view profile_id) -> VoidResult {
    std::string id_str(profile_id);

    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto it = impl_->cache.find(id_str);
    if (it == impl_->cache.end()) {
        return migrator_void_error(error_codes::profile_not_found,
                                   "Profile not found: " + id_str);
    }
    if (impl_->pinned(id_str)) {
        return migrator_void_error(error_codes::profile_in_use,
                                   "Profile is referenced by an active migration: " + id_str);
    }

    if (impl_->repo) {
        auto result = impl_->repo->remove(id_str);
        if (result.is_err()) {
            return result;
        }
    }

    auto name = it->second.name;
    impl_->cache.erase(it);

    impl_->logger->info_fmt("Removed connection profile: {}", id_str);
    integration::logger_adapter::log_profile_change(
        integration::profile_change::removed, name);

    return ok();
}

auto connection_registry::get_profile(std::string_view profile_id) const
    -> Result<connection_profile> {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto it = impl_->cache.find(std::string(profile_id));
    if (it == impl_->cache.end()) {
        return migrator_error<connection_profile>(
            error_codes::profile_not_found,
            "Profile not found: " + std::string(profile_id));
    }
    return ok(it->second);
}

auto connection_registry::list_profiles() const -> std::vector<connection_profile> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->sorted();
}

auto connection_registry::list_grouped() const -> grouped_profiles {
    grouped_profiles grouped;
    for (auto& profile : list_profiles()) {
        grouped[profile.env].push_back(std::move(profile));
    }
    return grouped;
}

auto connection_registry::profile_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->cache.size();
}

// =============================================================================
// Reference Pinning
// =============================================================================

auto connection_registry::pin(std::string_view profile_id) -> VoidResult {
    std::string id_str(profile_id);

    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->cache.count(id_str) == 0) {
        return migrator_void_error(error_codes::profile_not_found,
                                   "Profile not found: " + id_str);
    }
    ++impl_->pins[id_str];
    return ok();
}

void connection_registry::unpin(std::string_view profile_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->pins.find(std::string(profile_id));
    if (it == impl_->pins.end()) {
        return;
    }
    if (--it->second == 0) {
        impl_->pins.erase(it);
    }
}

auto connection_registry::is_pinned(std::string_view profile_id) const -> bool {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->pinned(std::string(profile_id));
}

auto connection_registry::make_profile_id(std::string_view name) -> std::string {
    std::string id;
    id.reserve(name.size());
    bool pending_dash = false;
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            if (pending_dash && !id.empty()) {
                id.push_back('-');
            }
            pending_dash = false;
            id.push_back(static_cast<char>(std::tolower(uc)));
        } else {
            pending_dash = true;
        }
    }
    return id;
}

}  // namespace migrator::client
