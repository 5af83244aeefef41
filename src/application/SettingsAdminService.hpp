/**
 * @file SettingsAdminService.hpp
 * @brief Operator-facing management of the workflow base path setting.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include "application/BasePathResolver.hpp"
#include "domain/FileSystem.hpp"
#include "domain/SettingsStore.hpp"
#include "domain/Tenant.hpp"
#include "infrastructure/PathValidator.hpp"

namespace fieldtrack::application {

/**
 * @struct SettingUpdate
 * @brief Outcome of setBasePath.
 */
struct SettingUpdate {
    bool success = false;
    std::optional<std::string> path;  ///< Stored value, nullopt once cleared.
    std::optional<std::string> error;
};

/**
 * @struct PathStatus
 * @brief Health of the configured base path.
 */
struct PathStatus {
    bool configured = false;
    bool valid = false;
    bool writable = false;
    bool cloudSynced = false;
    std::optional<std::string> path;
    std::optional<std::string> error;
};

/**
 * @class SettingsAdminService
 * @brief Reads, validates and stores a tenant's workflow base path.
 */
class SettingsAdminService {
public:
    SettingsAdminService(std::shared_ptr<domain::SettingsStore> settingsStore,
                         std::shared_ptr<BasePathResolver> resolver,
                         std::shared_ptr<domain::FileSystem> fileSystem);

    /** @throws whatever the settings store throws. */
    std::optional<std::string> getBasePath(const domain::TenantId& tenantId) const;

    /**
     * @brief Stores a new base path, or clears it when the value is absent or blank.
     *
     * A non-blank value must not contain a ".." segment and must pass validation
     * (exists, directory, writable) before it is stored.
     */
    SettingUpdate setBasePath(const domain::TenantId& tenantId, const std::optional<std::string>& path);

    /** @brief Validates a candidate path without storing it. */
    infrastructure::PathValidation testPath(const std::string& path) const;

    /** @brief Configured / valid / writable status of the current setting. */
    PathStatus getPathStatus(const domain::TenantId& tenantId) const;

    /** @brief True if any segment of the path is "..". */
    static bool HasTraversalSegment(const std::string& path);

private:
    std::optional<domain::TenantId> qualifierFor(const domain::TenantId& tenantId) const;

    std::shared_ptr<domain::SettingsStore> m_settingsStore;
    std::shared_ptr<BasePathResolver> m_resolver;
    infrastructure::PathValidator m_validator;
};

} // namespace fieldtrack::application
