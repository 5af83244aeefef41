/**
 * @file JsonSettingsStore.hpp
 * @brief Settings store persisted as a single JSON document.
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include "domain/SettingsStore.hpp"

namespace fieldtrack::infrastructure {

/**
 * @class JsonSettingsStore
 * @brief Reads and writes settings from a JSON file on every call.
 *
 * Layout:
 * @code
 * { "settings": { "workflow_base_path": "/srv/pdfs" },
 *   "tenants":  { "7": { "workflow_base_path": "/mnt/OneDrive/Acme" } } }
 * @endcode
 * Tenant-qualified calls go to "tenants", unqualified calls to "settings".
 */
class JsonSettingsStore : public domain::SettingsStore {
public:
    /**
     * @param filePath Location of the JSON document. A missing file holds no settings.
     * @param tenantPartitioned Whether the store is reported as tenant-partitioned.
     */
    JsonSettingsStore(std::filesystem::path filePath, bool tenantPartitioned);

    /** @throws std::runtime_error if the file exists but cannot be read or parsed. */
    std::optional<std::string> readSetting(const std::string& key,
                                           const std::optional<domain::TenantId>& tenant) override;

    /** @throws std::runtime_error if the document cannot be parsed or written. */
    void writeSetting(const std::string& key,
                      const std::optional<std::string>& value,
                      const std::optional<domain::TenantId>& tenant) override;

    bool isTenantPartitioned() const override { return m_tenantPartitioned; }

    const std::filesystem::path& filePath() const { return m_filePath; }

private:
    std::filesystem::path m_filePath;
    bool m_tenantPartitioned;
    std::mutex m_writeMutex; ///< Serializes read-modify-write cycles within this process.
};

} // namespace fieldtrack::infrastructure
