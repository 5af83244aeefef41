/**
 * @file AppServices.cpp
 * @brief Production wiring of AppServices.
 */

#include "application/AppServices.hpp"
#include "infrastructure/JsonSettingsStore.hpp"
#include "infrastructure/LocalFileSystem.hpp"

namespace fieldtrack::application {

AppServices BuildAppServices(const infrastructure::AppConfig& config) {
    AppServices services;
    services.settingsStore = std::make_shared<infrastructure::JsonSettingsStore>(config.settingsFile, config.tenantPartitionedSettings);
    services.fileSystem = std::make_shared<infrastructure::LocalFileSystem>();
    services.resolver = std::make_shared<BasePathResolver>(services.settingsStore, config.defaultBasePath);
    services.provisioningService = std::make_shared<ProjectProvisioningService>(
        services.resolver, services.fileSystem, config.verification);
    services.diagnosticService = std::make_unique<DiagnosticService>(
        services.resolver, services.fileSystem, config.verification);
    services.settingsAdminService = std::make_unique<SettingsAdminService>(
        services.settingsStore, services.resolver, services.fileSystem);
    services.reportPathPlanner = std::make_unique<ReportPathPlanner>(services.provisioningService, services.resolver);
    return services;
}

} // namespace fieldtrack::application
