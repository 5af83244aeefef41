/**
 * @file DiagnosticService.hpp
 * @brief Operator-facing diagnosis of a tenant's storage configuration.
 */

#pragma once

#include <memory>
#include "application/BasePathResolver.hpp"
#include "domain/DiagnosticReport.hpp"
#include "domain/FileSystem.hpp"
#include "domain/RetryPolicy.hpp"
#include "domain/Tenant.hpp"
#include "infrastructure/PathValidator.hpp"

namespace fieldtrack::application {

/**
 * @class DiagnosticService
 * @brief Replays resolve / validate / create / verify / cleanup against a throwaway probe directory.
 *
 * Steps run independently: a failing step is recorded and the remaining steps still run.
 * Real project directories are never touched, and the probe directory is removed on every
 * path out of the probe cycle.
 */
class DiagnosticService {
public:
    DiagnosticService(std::shared_ptr<BasePathResolver> resolver,
                      std::shared_ptr<domain::FileSystem> fileSystem,
                      domain::VerificationPolicy policy = {});

    domain::DiagnosticReport runDiagnostic(const domain::TenantId& tenantId);

private:
    domain::DiagnosticStep checkSettingsStore(const domain::TenantId& tenantId) const;
    domain::DiagnosticStep checkResolution(const domain::TenantId& tenantId, domain::DiagnosticReport& report) const;
    domain::DiagnosticStep checkValidation(const domain::DiagnosticReport& report) const;
    domain::DiagnosticStep runProbeCycle(domain::DiagnosticReport& report) const;

    std::shared_ptr<BasePathResolver> m_resolver;
    std::shared_ptr<domain::FileSystem> m_fileSystem;
    infrastructure::PathValidator m_validator;
    domain::VerificationPolicy m_policy;
};

} // namespace fieldtrack::application
