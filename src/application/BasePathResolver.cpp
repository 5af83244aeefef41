/**
 * @file BasePathResolver.cpp
 * @brief Implementation of BasePathResolver.
 */

#include "application/BasePathResolver.hpp"
#include "infrastructure/PathUtils.hpp"
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

BasePathResolver::BasePathResolver(std::shared_ptr<domain::SettingsStore> settingsStore, std::filesystem::path defaultRoot)
    : m_settingsStore(std::move(settingsStore)), m_defaultRoot(std::move(defaultRoot)) {
    if (m_defaultRoot.empty()) {
        m_defaultRoot = infrastructure::PathUtils::GetDefaultStorageRoot();
    }
}

std::optional<std::string> BasePathResolver::readConfiguredBasePath(const domain::TenantId& tenantId) const {
    std::optional<domain::TenantId> qualifier;
    if (m_settingsStore->isTenantPartitioned()) {
        qualifier = tenantId;
    }

    auto value = m_settingsStore->readSetting(domain::kWorkflowBasePathKey, qualifier);
    if (!value) return std::nullopt;

    std::string trimmed = Trim(*value);
    if (trimmed.empty()) return std::nullopt;
    return trimmed;
}

ResolvedBasePath BasePathResolver::resolve(const domain::TenantId& tenantId) const {
    try {
        if (auto configured = readConfiguredBasePath(tenantId)) {
            return {*configured, BasePathSource::Configured};
        }
    } catch (const std::exception& e) {
        std::cerr << "[BasePathResolver] Settings lookup failed for tenant " << tenantId
                  << ", using default root: " << e.what() << std::endl;
    }
    return {m_defaultRoot.string(), BasePathSource::Default};
}

std::string BasePathResolver::resolveEffectiveBasePath(const domain::TenantId& tenantId) const {
    return resolve(tenantId).path;
}

} // namespace fieldtrack::application
