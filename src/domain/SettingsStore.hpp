/**
 * @file SettingsStore.hpp
 * @brief Read contract of the key/value settings store.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/Tenant.hpp"

namespace fieldtrack::domain {

/// Setting key holding the configured storage root for project folders.
inline constexpr const char* kWorkflowBasePathKey = "workflow_base_path";

/**
 * @class SettingsStore
 * @brief Abstract key/value store holding tenant settings.
 *
 * Absence of a value is a normal outcome (std::nullopt). Implementations may throw
 * when the backing store itself is unreachable or corrupt.
 */
class SettingsStore {
public:
    virtual ~SettingsStore() = default;

    /**
     * @brief Reads a single setting.
     * @param key Setting name.
     * @param tenant Tenant qualifier, or nullopt for the global (non-partitioned) value.
     */
    virtual std::optional<std::string> readSetting(const std::string& key,
                                                   const std::optional<TenantId>& tenant) = 0;

    /**
     * @brief Writes or clears (nullopt value) a single setting.
     */
    virtual void writeSetting(const std::string& key,
                              const std::optional<std::string>& value,
                              const std::optional<TenantId>& tenant) = 0;

    /** @brief Whether values are partitioned per tenant. */
    virtual bool isTenantPartitioned() const = 0;
};

} // namespace fieldtrack::domain
