/**
 * @file SettingsAdminService.cpp
 * @brief Implementation of SettingsAdminService.
 */

#include "application/SettingsAdminService.hpp"
#include <iostream>

namespace fieldtrack::application {

namespace {

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

} // namespace

SettingsAdminService::SettingsAdminService(std::shared_ptr<domain::SettingsStore> settingsStore,
                                           std::shared_ptr<BasePathResolver> resolver,
                                           std::shared_ptr<domain::FileSystem> fileSystem)
    : m_settingsStore(std::move(settingsStore)),
      m_resolver(std::move(resolver)),
      m_validator(std::move(fileSystem)) {}

std::optional<domain::TenantId> SettingsAdminService::qualifierFor(const domain::TenantId& tenantId) const {
    if (m_settingsStore->isTenantPartitioned()) return tenantId;
    return std::nullopt;
}

std::optional<std::string> SettingsAdminService::getBasePath(const domain::TenantId& tenantId) const {
    return m_resolver->readConfiguredBasePath(tenantId);
}

bool SettingsAdminService::HasTraversalSegment(const std::string& path) {
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find_first_of("/\\", start);
        if (end == std::string::npos) end = path.size();
        if (path.compare(start, end - start, "..") == 0) return true;
        start = end + 1;
    }
    return false;
}

SettingUpdate SettingsAdminService::setBasePath(const domain::TenantId& tenantId, const std::optional<std::string>& path) {
    SettingUpdate update;

    std::optional<std::string> value;
    if (path) {
        std::string trimmed = Trim(*path);
        if (!trimmed.empty()) value = trimmed;
    }

    if (value) {
        if (HasTraversalSegment(*value)) {
            update.error = "Invalid path: directory traversal detected";
            return update;
        }
        infrastructure::PathValidation validation = m_validator.validate(*value);
        if (!validation.valid || !validation.writable) {
            update.error = validation.error.value_or("Invalid path");
            return update;
        }
    }

    try {
        m_settingsStore->writeSetting(domain::kWorkflowBasePathKey, value, qualifierFor(tenantId));
    } catch (const std::exception& e) {
        std::cerr << "[SettingsAdminService] Error setting base path for tenant " << tenantId << ": " << e.what() << std::endl;
        update.error = std::string("Failed to set base path: ") + e.what();
        return update;
    }

    update.success = true;
    update.path = value;
    return update;
}

infrastructure::PathValidation SettingsAdminService::testPath(const std::string& path) const {
    return m_validator.validate(path);
}

PathStatus SettingsAdminService::getPathStatus(const domain::TenantId& tenantId) const {
    PathStatus status;

    std::optional<std::string> configured;
    try {
        configured = getBasePath(tenantId);
    } catch (const std::exception& e) {
        std::cerr << "[SettingsAdminService] Error reading base path status: " << e.what() << std::endl;
        status.error = std::string("Failed to check path status: ") + e.what();
        return status;
    }

    if (!configured) {
        return status;
    }

    status.configured = true;
    status.path = configured;
    status.cloudSynced = infrastructure::PathValidator::IsCloudSynced(*configured);

    infrastructure::PathValidation validation = m_validator.validate(*configured);
    status.valid = validation.valid;
    status.writable = validation.writable;
    status.error = validation.error;
    return status;
}

} // namespace fieldtrack::application
