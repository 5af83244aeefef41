/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/BasePathResolver.hpp"
#include "application/DiagnosticService.hpp"
#include "application/ProjectProvisioningService.hpp"
#include "application/ReportPathPlanner.hpp"
#include "application/SettingsAdminService.hpp"
#include "domain/FileSystem.hpp"
#include "domain/SettingsStore.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace fieldtrack::application {

struct AppServices {
    std::shared_ptr<domain::SettingsStore> settingsStore;
    std::shared_ptr<domain::FileSystem> fileSystem;
    std::shared_ptr<BasePathResolver> resolver;
    std::shared_ptr<ProjectProvisioningService> provisioningService;
    std::unique_ptr<DiagnosticService> diagnosticService;
    std::unique_ptr<SettingsAdminService> settingsAdminService;
    std::unique_ptr<ReportPathPlanner> reportPathPlanner;
};

/**
 * @brief Wires the services against the local filesystem and the JSON settings store.
 */
AppServices BuildAppServices(const infrastructure::AppConfig& config);

} // namespace fieldtrack::application
