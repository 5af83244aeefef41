/**
 * @file DiagnosticService.cpp
 * @brief Implementation of DiagnosticService.
 */

#include "application/DiagnosticService.hpp"
#include "infrastructure/PathUtils.hpp"
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

namespace fieldtrack::application {

namespace {

/// Removes the probe directory when the probe cycle is left, whichever way.
class ProbeDirectoryGuard {
public:
    ProbeDirectoryGuard(domain::FileSystem& fileSystem, fs::path path, bool& removed)
        : m_fileSystem(fileSystem), m_path(std::move(path)), m_removed(removed) {}

    ~ProbeDirectoryGuard() {
        try {
            m_fileSystem.removeAll(m_path);
            m_removed = !m_fileSystem.exists(m_path);
        } catch (const std::exception& e) {
            std::cerr << "[DiagnosticService] Failed to remove probe directory " << m_path << ": " << e.what() << std::endl;
            m_removed = false;
        }
    }

    ProbeDirectoryGuard(const ProbeDirectoryGuard&) = delete;
    ProbeDirectoryGuard& operator=(const ProbeDirectoryGuard&) = delete;

private:
    domain::FileSystem& m_fileSystem;
    fs::path m_path;
    bool& m_removed;
};

} // namespace

DiagnosticService::DiagnosticService(std::shared_ptr<BasePathResolver> resolver,
                                     std::shared_ptr<domain::FileSystem> fileSystem,
                                     domain::VerificationPolicy policy)
    : m_resolver(std::move(resolver)),
      m_fileSystem(fileSystem),
      m_validator(fileSystem),
      m_policy(policy) {}

domain::DiagnosticReport DiagnosticService::runDiagnostic(const domain::TenantId& tenantId) {
    domain::DiagnosticReport report;
    report.tenantId = tenantId;

    report.steps.push_back(checkSettingsStore(tenantId));
    report.steps.push_back(checkResolution(tenantId, report));
    report.steps.push_back(checkValidation(report));
    report.steps.push_back(runProbeCycle(report));

    if (!report.success()) {
        std::cerr << "[DiagnosticService] Tenant " << tenantId << ": storage diagnostic found problems" << std::endl;
    }
    return report;
}

domain::DiagnosticStep DiagnosticService::checkSettingsStore(const domain::TenantId& tenantId) const {
    domain::DiagnosticStep step;
    step.name = "settings_store";
    try {
        auto configured = m_resolver->readConfiguredBasePath(tenantId);
        step.success = true;
        step.detail = configured ? "Reachable; workflow base path is configured"
                                 : "Reachable; no workflow base path configured";
    } catch (const std::exception& e) {
        step.detail = "Settings store query failed";
        step.error = e.what();
    }
    return step;
}

domain::DiagnosticStep DiagnosticService::checkResolution(const domain::TenantId& tenantId,
                                                          domain::DiagnosticReport& report) const {
    domain::DiagnosticStep step;
    step.name = "base_path_resolution";

    ResolvedBasePath base = m_resolver->resolve(tenantId);
    report.basePath = base.path;
    report.basePathSource = BasePathSourceToString(base.source);
    report.cloudSynced = infrastructure::PathValidator::IsCloudSynced(base.path);
    report.pathLength = base.path.size();
    report.exceedsLegacyPathLimit = report.pathLength >= infrastructure::PathUtils::kLegacyMaxPath;

    step.success = !base.path.empty();
    step.detail = "Resolved " + report.basePathSource + " base path: " + base.path;
    if (report.cloudSynced) {
        step.detail += " (cloud-synced)";
    }
    if (!step.success) {
        step.error = "Resolution produced an empty path";
    }
    return step;
}

domain::DiagnosticStep DiagnosticService::checkValidation(const domain::DiagnosticReport& report) const {
    domain::DiagnosticStep step;
    step.name = "base_path_validation";

    infrastructure::PathValidation validation = m_validator.validate(report.basePath);
    step.success = validation.valid && validation.writable;
    if (step.success) {
        step.detail = "Exists, is a directory and is writable";
    } else {
        step.detail = validation.valid ? "Exists but is not writable" : "Base path is not usable";
        step.error = validation.error.value_or("unknown error");
    }
    return step;
}

domain::DiagnosticStep DiagnosticService::runProbeCycle(domain::DiagnosticReport& report) const {
    domain::DiagnosticStep step;
    step.name = "probe_cycle";

    report.probeDirectory = infrastructure::PathValidator::MakeUniqueName(".fieldtrack_diagnostic");
    const fs::path probePath = fs::path(report.basePath) / report.probeDirectory;
    const domain::RetryPolicy& retry = m_policy.select(report.cloudSynced);

    // Creating the probe must never create the base path as a side effect.
    if (!m_fileSystem->isDirectory(fs::path(report.basePath))) {
        step.detail = "Probe skipped";
        step.error = "Base path is not an existing directory: " + report.basePath;
        return step;
    }

    try {
        ProbeDirectoryGuard guard(*m_fileSystem, probePath, report.probeRemoved);

        m_fileSystem->createDirectories(infrastructure::PathUtils::ToCreationPath(probePath));

        bool visible = false;
        const int attempts = retry.maxAttempts < 1 ? 1 : retry.maxAttempts;
        for (int attempt = 1; attempt <= attempts && !visible; ++attempt) {
            visible = m_fileSystem->isDirectory(probePath);
            if (!visible && attempt < attempts) {
                std::this_thread::sleep_for(retry.delay);
            }
        }
        if (!visible) {
            step.detail = "Probe directory created but never became visible";
            step.error = "Verification exhausted after " + std::to_string(attempts) + " attempts";
            return step;
        }

        infrastructure::WriteProbe probe = m_validator.probeWritable(probePath);
        if (!probe.writable) {
            step.detail = "Probe directory is not writable";
            step.error = probe.error.value_or("unknown error");
            return step;
        }
    } catch (const std::exception& e) {
        step.detail = "Probe directory could not be created";
        step.error = e.what();
        return step;
    }

    // The guard has run by now.
    if (!report.probeRemoved) {
        step.detail = "Probe directory could not be removed: " + probePath.string();
        step.error = "Cleanup failed";
        return step;
    }

    step.success = true;
    step.detail = "Created, verified, wrote to and removed " + report.probeDirectory;
    return step;
}

} // namespace fieldtrack::application
