/**
 * @file JsonMapping.cpp
 * @brief Implementation of the JSON conversions.
 */

#include "app/JsonMapping.hpp"

using json = nlohmann::json;

namespace {

json OptionalString(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

namespace fieldtrack::domain {

void to_json(json& j, const SubdirectoryOutcome& outcome) {
    j = json{
        {"name", outcome.name},
        {"success", outcome.success},
        {"created", outcome.created}
    };
    if (outcome.error) {
        j["error"] = *outcome.error;
    }
}

void to_json(json& j, const ProvisioningResult& result) {
    j = json{
        {"success", result.success},
        {"path", result.path},
        {"error", OptionalString(result.error)},
        {"warnings", result.warnings},
        {"subdirectories", result.subdirectories},
        {"created", result.created},
        {"cloudSynced", result.cloudSynced}
    };
}

void to_json(json& j, const DiagnosticStep& step) {
    j = json{
        {"name", step.name},
        {"success", step.success},
        {"detail", step.detail}
    };
    if (step.error) {
        j["error"] = *step.error;
    }
}

void to_json(json& j, const DiagnosticReport& report) {
    j = json{
        {"success", report.success()},
        {"tenantId", report.tenantId},
        {"steps", report.steps},
        {"basePath", report.basePath},
        {"basePathSource", report.basePathSource},
        {"cloudSynced", report.cloudSynced},
        {"pathLength", report.pathLength},
        {"exceedsLegacyPathLimit", report.exceedsLegacyPathLimit},
        {"probeDirectory", report.probeDirectory},
        {"probeRemoved", report.probeRemoved}
    };
}

} // namespace fieldtrack::domain

namespace fieldtrack::infrastructure {

void to_json(json& j, const PathValidation& validation) {
    j = json{
        {"valid", validation.valid},
        {"isWritable", validation.writable},
        {"error", OptionalString(validation.error)}
    };
}

} // namespace fieldtrack::infrastructure

namespace fieldtrack::application {

void to_json(json& j, const SettingUpdate& update) {
    j = json{
        {"success", update.success},
        {"path", OptionalString(update.path)}
    };
    if (update.error) {
        j["error"] = *update.error;
    }
}

void to_json(json& j, const PathStatus& status) {
    j = json{
        {"configured", status.configured},
        {"valid", status.valid},
        {"isWritable", status.writable},
        {"cloudSynced", status.cloudSynced},
        {"path", OptionalString(status.path)},
        {"error", OptionalString(status.error)}
    };
}

void to_json(json& j, const ReportSavePlan& plan) {
    j = json{
        {"success", !plan.error.has_value()},
        {"filePath", plan.filePath},
        {"fileName", plan.filename},
        {"sequence", plan.sequence},
        {"isRevision", plan.isRevision},
        {"revisionNumber", plan.revisionNumber},
        {"error", OptionalString(plan.error)},
        {"provisioning", plan.provisioning}
    };
}

} // namespace fieldtrack::application
