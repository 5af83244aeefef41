/**
 * @file JsonMapping.hpp
 * @brief nlohmann::json conversions for the values surfaced to clients.
 *
 * Declared next to the types' namespaces so nlohmann's ADL lookup finds them
 * (json j = result;).
 */

#pragma once

#include <nlohmann/json.hpp>
#include "application/ReportPathPlanner.hpp"
#include "application/SettingsAdminService.hpp"
#include "domain/DiagnosticReport.hpp"
#include "domain/ProvisioningResult.hpp"
#include "infrastructure/PathValidator.hpp"

namespace fieldtrack::domain {
void to_json(nlohmann::json& j, const SubdirectoryOutcome& outcome);
void to_json(nlohmann::json& j, const ProvisioningResult& result);
void to_json(nlohmann::json& j, const DiagnosticStep& step);
void to_json(nlohmann::json& j, const DiagnosticReport& report);
} // namespace fieldtrack::domain

namespace fieldtrack::infrastructure {
void to_json(nlohmann::json& j, const PathValidation& validation);
} // namespace fieldtrack::infrastructure

namespace fieldtrack::application {
void to_json(nlohmann::json& j, const SettingUpdate& update);
void to_json(nlohmann::json& j, const PathStatus& status);
void to_json(nlohmann::json& j, const ReportSavePlan& plan);
} // namespace fieldtrack::application
