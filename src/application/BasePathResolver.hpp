/**
 * @file BasePathResolver.hpp
 * @brief Resolves the storage root used for a tenant's project folders.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "domain/SettingsStore.hpp"
#include "domain/Tenant.hpp"

namespace fieldtrack::application {

/**
 * @enum BasePathSource
 * @brief Where an effective base path came from.
 */
enum class BasePathSource {
    Configured, ///< The tenant's (or global) workflow_base_path setting.
    Default     ///< The process-wide fallback root.
};

inline std::string BasePathSourceToString(BasePathSource source) {
    switch (source) {
        case BasePathSource::Configured: return "configured";
        case BasePathSource::Default: return "default";
        default: return "unknown";
    }
}

/**
 * @struct ResolvedBasePath
 * @brief Effective base path and its origin. The path is never empty.
 */
struct ResolvedBasePath {
    std::string path;
    BasePathSource source = BasePathSource::Default;
};

/**
 * @class BasePathResolver
 * @brief Stateless per-call resolution: configured setting if present, else the default root.
 *
 * Nothing is memoized; a tenant editing its settings is picked up by the next call.
 * Settings-store failures are logged and degrade to the default root.
 */
class BasePathResolver {
public:
    /**
     * @param settingsStore Backing settings store.
     * @param defaultRoot Fallback root. An empty path means PathUtils::GetDefaultStorageRoot().
     */
    BasePathResolver(std::shared_ptr<domain::SettingsStore> settingsStore, std::filesystem::path defaultRoot = {});

    /** @brief Resolves the base path with its source. Never throws. */
    ResolvedBasePath resolve(const domain::TenantId& tenantId) const;

    /** @brief Resolves the base path string. Never empty. */
    std::string resolveEffectiveBasePath(const domain::TenantId& tenantId) const;

    /**
     * @brief Raw configured value, trimmed; nullopt when absent or blank.
     *
     * The tenant qualifier is passed only if the store is tenant-partitioned, so a
     * legacy global store answers every tenant with the same value.
     * @throws whatever the settings store throws.
     */
    std::optional<std::string> readConfiguredBasePath(const domain::TenantId& tenantId) const;

    const std::filesystem::path& defaultRoot() const { return m_defaultRoot; }

private:
    std::shared_ptr<domain::SettingsStore> m_settingsStore;
    std::filesystem::path m_defaultRoot;
};

} // namespace fieldtrack::application
