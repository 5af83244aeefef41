/**
 * @file HttpApi.hpp
 * @brief Thin HTTP transport over the provisioning, diagnostic and settings services.
 */

#pragma once

#include <optional>
#include <string>
#include "application/AppServices.hpp"

namespace httplib {
class Server;
struct Request;
struct Response;
} // namespace httplib

namespace fieldtrack::app {

/**
 * @class HttpApi
 * @brief Maps JSON-over-HTTP routes onto AppServices.
 *
 * The tenant comes from the X-Tenant-Id header set by the upstream auth layer.
 * Results are returned verbatim in their JSON shape; success=false is still HTTP 200.
 */
class HttpApi {
public:
    explicit HttpApi(application::AppServices& services);

    /** @brief Installs every route on the given server. */
    void registerRoutes(httplib::Server& server);

    /**
     * @brief Binds and serves until the server is stopped.
     * @return False if the address could not be bound.
     */
    bool run(const std::string& host, int port);

private:
    /** @brief Tenant from the request, or nullopt after writing a 403 response. */
    static std::optional<std::string> requireTenant(const httplib::Request& req, httplib::Response& res);

    void handleProvision(const httplib::Request& req, httplib::Response& res);
    void handleDiagnostic(const httplib::Request& req, httplib::Response& res);
    void handleGetWorkflowPath(const httplib::Request& req, httplib::Response& res);
    void handleSetWorkflowPath(const httplib::Request& req, httplib::Response& res);
    void handleWorkflowStatus(const httplib::Request& req, httplib::Response& res);
    void handleTestWorkflowPath(const httplib::Request& req, httplib::Response& res);
    void handlePlanReportPath(const httplib::Request& req, httplib::Response& res);

    application::AppServices& m_services;
};

} // namespace fieldtrack::app
