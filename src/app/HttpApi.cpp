/**
 * @file HttpApi.cpp
 * @brief Implementation of HttpApi.
 */

#include "app/HttpApi.hpp"
#include "app/JsonMapping.hpp"
#include <httplib.h>
#include <iostream>

namespace fieldtrack::app {

using json = nlohmann::json;

namespace {

constexpr const char* kJson = "application/json";

void Reply(httplib::Response& res, int status, const json& body) {
    res.status = status;
    // Project identifiers are user input and may carry invalid UTF-8.
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), kJson);
}

/** Parses a JSON object body, or writes a 400 and returns nullopt. */
std::optional<json> ParseBody(const httplib::Request& req, httplib::Response& res) {
    json body = json::parse(req.body, nullptr, false);
    if (!body.is_discarded() && body.is_object()) {
        return body;
    }
    Reply(res, 400, {{"success", false}, {"error", "Request body must be a JSON object"}});
    return std::nullopt;
}

/** Reads a required non-empty string field, or writes a 400 and returns nullopt. */
std::optional<std::string> RequireString(const json& body, const char* field, httplib::Response& res) {
    auto it = body.find(field);
    if (it != body.end() && it->is_string() && !it->get<std::string>().empty()) {
        return it->get<std::string>();
    }
    Reply(res, 400, {{"success", false}, {"error", std::string(field) + " is required"}});
    return std::nullopt;
}

} // namespace

HttpApi::HttpApi(application::AppServices& services) : m_services(services) {}

std::optional<std::string> HttpApi::requireTenant(const httplib::Request& req, httplib::Response& res) {
    std::string tenant = req.get_header_value("X-Tenant-Id");
    if (tenant.empty()) {
        Reply(res, 403, {{"error", "Tenant context required"}});
        return std::nullopt;
    }
    return tenant;
}

void HttpApi::registerRoutes(httplib::Server& server) {
    server.Post("/api/projects/folder", [this](const httplib::Request& req, httplib::Response& res) {
        handleProvision(req, res);
    });
    server.Post("/api/projects/folder/retry", [this](const httplib::Request& req, httplib::Response& res) {
        handleProvision(req, res);
    });
    server.Get("/api/diagnostics/base-path", [this](const httplib::Request& req, httplib::Response& res) {
        handleDiagnostic(req, res);
    });
    server.Get("/api/settings/workflow-path", [this](const httplib::Request& req, httplib::Response& res) {
        handleGetWorkflowPath(req, res);
    });
    server.Post("/api/settings/workflow-path", [this](const httplib::Request& req, httplib::Response& res) {
        handleSetWorkflowPath(req, res);
    });
    server.Get("/api/settings/workflow-status", [this](const httplib::Request& req, httplib::Response& res) {
        handleWorkflowStatus(req, res);
    });
    server.Post("/api/settings/workflow-path/test", [this](const httplib::Request& req, httplib::Response& res) {
        handleTestWorkflowPath(req, res);
    });
    server.Post("/api/reports/save-path", [this](const httplib::Request& req, httplib::Response& res) {
        handlePlanReportPath(req, res);
    });
}

bool HttpApi::run(const std::string& host, int port) {
    httplib::Server server;
    registerRoutes(server);
    std::cout << "[HttpApi] Listening on " << host << ":" << port << std::endl;
    if (!server.listen(host.c_str(), port)) {
        std::cerr << "[HttpApi] Could not bind " << host << ":" << port << std::endl;
        return false;
    }
    return true;
}

void HttpApi::handleProvision(const httplib::Request& req, httplib::Response& res) {
    auto tenant = requireTenant(req, res);
    if (!tenant) return;
    auto body = ParseBody(req, res);
    if (!body) return;
    auto projectNumber = RequireString(*body, "projectNumber", res);
    if (!projectNumber) return;

    domain::ProvisioningResult result = m_services.provisioningService->provisionProjectDirectory(*tenant, *projectNumber);
    Reply(res, 200, result);
}

void HttpApi::handleDiagnostic(const httplib::Request& req, httplib::Response& res) {
    auto tenant = requireTenant(req, res);
    if (!tenant) return;

    domain::DiagnosticReport report = m_services.diagnosticService->runDiagnostic(*tenant);
    Reply(res, 200, report);
}

void HttpApi::handleGetWorkflowPath(const httplib::Request& req, httplib::Response& res) {
    auto tenant = requireTenant(req, res);
    if (!tenant) return;

    try {
        auto path = m_services.settingsAdminService->getBasePath(*tenant);
        Reply(res, 200, {{"success", true}, {"path", path ? json(*path) : json(nullptr)}});
    } catch (const std::exception& e) {
        std::cerr << "[HttpApi] Error getting workflow path: " << e.what() << std::endl;
        Reply(res, 500, {{"success", false}, {"error", "Failed to retrieve workflow path"}});
    }
}

void HttpApi::handleSetWorkflowPath(const httplib::Request& req, httplib::Response& res) {
    auto tenant = requireTenant(req, res);
    if (!tenant) return;
    auto body = ParseBody(req, res);
    if (!body) return;

    std::optional<std::string> path;
    auto it = body->find("path");
    if (it != body->end() && !it->is_null()) {
        if (!it->is_string()) {
            Reply(res, 400, {{"success", false}, {"error", "Path must be a string or null"}});
            return;
        }
        path = it->get<std::string>();
    }

    application::SettingUpdate update = m_services.settingsAdminService->setBasePath(*tenant, path);
    Reply(res, update.success ? 200 : 400, update);
}

void HttpApi::handleWorkflowStatus(const httplib::Request& req, httplib::Response& res) {
    auto tenant = requireTenant(req, res);
    if (!tenant) return;

    json body = m_services.settingsAdminService->getPathStatus(*tenant);
    body["success"] = true;
    Reply(res, 200, body);
}

void HttpApi::handleTestWorkflowPath(const httplib::Request& req, httplib::Response& res) {
    auto tenant = requireTenant(req, res);
    if (!tenant) return;
    auto body = ParseBody(req, res);
    if (!body) return;
    auto path = RequireString(*body, "path", res);
    if (!path) return;

    json verdict = m_services.settingsAdminService->testPath(*path);
    verdict["success"] = true;
    verdict["path"] = *path;
    verdict["cloudSynced"] = infrastructure::PathValidator::IsCloudSynced(*path);
    Reply(res, 200, verdict);
}

void HttpApi::handlePlanReportPath(const httplib::Request& req, httplib::Response& res) {
    auto tenant = requireTenant(req, res);
    if (!tenant) return;
    auto body = ParseBody(req, res);
    if (!body) return;
    auto projectNumber = RequireString(*body, "projectNumber", res);
    if (!projectNumber) return;
    auto taskType = RequireString(*body, "taskType", res);
    if (!taskType) return;

    std::string fieldDate;
    auto date = body->find("fieldDate");
    if (date != body->end() && date->is_string()) {
        fieldDate = date->get<std::string>();
    }
    auto regeneration = body->find("isRegeneration");
    bool isRegeneration = regeneration != body->end() && regeneration->is_boolean() && regeneration->get<bool>();

    application::ReportSavePlan plan = m_services.reportPathPlanner->planSavePath(
        *tenant, *projectNumber, *taskType, fieldDate, isRegeneration);
    Reply(res, 200, plan);
}

} // namespace fieldtrack::app
