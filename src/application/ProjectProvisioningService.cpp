/**
 * @file ProjectProvisioningService.cpp
 * @brief Implementation of ProjectProvisioningService.
 */

#include "application/ProjectProvisioningService.hpp"
#include "domain/PathSanitizer.hpp"
#include "domain/ProjectLayout.hpp"
#include "infrastructure/PathUtils.hpp"
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

namespace fieldtrack::application {

ProjectProvisioningService::ProjectProvisioningService(std::shared_ptr<BasePathResolver> resolver,
                                                       std::shared_ptr<domain::FileSystem> fileSystem,
                                                       domain::VerificationPolicy policy,
                                                       CreationPathMapper creationPathMapper)
    : m_resolver(std::move(resolver)),
      m_fileSystem(fileSystem),
      m_validator(fileSystem),
      m_policy(policy),
      m_toCreationPath(std::move(creationPathMapper)) {
    if (!m_toCreationPath) {
        m_toCreationPath = infrastructure::PathUtils::ToCreationPath;
    }
}

fs::path ProjectProvisioningService::LogicalProjectPath(const std::string& basePath, const std::string& projectIdentifier) {
    return fs::path(basePath) / domain::PathSanitizer::Sanitize(projectIdentifier);
}

domain::ProvisioningResult ProjectProvisioningService::provisionProjectDirectory(const domain::TenantId& tenantId,
                                                                                 const std::string& projectIdentifier) {
    domain::ProvisioningResult result;

    // 1. Resolve
    ResolvedBasePath base = m_resolver->resolve(tenantId);
    result.cloudSynced = infrastructure::PathValidator::IsCloudSynced(base.path);
    const domain::RetryPolicy& retry = m_policy.select(result.cloudSynced);

    const fs::path logicalPath = LogicalProjectPath(base.path, projectIdentifier);
    result.path = logicalPath.string();

    if (base.source == BasePathSource::Default) {
        ensureDefaultRoot(base.path);
    }

    // 2. Validate base path (hard failure)
    infrastructure::PathValidation validation = m_validator.validate(base.path);
    if (!validation.valid || !validation.writable) {
        result.error = "Base path is invalid: " + validation.error.value_or("not writable") + " (" + base.path + ")";
        std::cerr << "[ProjectProvisioningService] Tenant " << tenantId << ": " << *result.error << std::endl;
        return result;
    }

    // 3-5. Create the project root through the platform-safe form, check through the logical form
    if (m_fileSystem->exists(logicalPath) && !m_fileSystem->isDirectory(logicalPath)) {
        result.error = "Project path exists but is not a directory: " + result.path;
        std::cerr << "[ProjectProvisioningService] " << *result.error << std::endl;
        return result;
    }

    if (!m_fileSystem->isDirectory(logicalPath)) {
        try {
            result.created = m_fileSystem->createDirectories(m_toCreationPath(logicalPath));
            if (result.created) {
                std::cout << "Created project directory: " << result.path << std::endl;
            }
        } catch (const std::exception& e) {
            result.error = std::string("Failed to create project directory: ") + e.what();
            std::cerr << "[ProjectProvisioningService] " << *result.error << std::endl;
            return result;
        }
    }

    // 6. Verify (soft)
    if (!waitUntilVisible(logicalPath, retry)) {
        result.warnings.push_back("Project folder may have been created but is not yet visible at " + result.path +
                                  "; check sync status");
        std::cerr << "[ProjectProvisioningService] Verification exhausted after " << retry.maxAttempts
                  << " attempts: " << result.path << std::endl;
    }

    // 7. Write probe (soft)
    infrastructure::WriteProbe probe = m_validator.probeWritable(logicalPath);
    if (!probe.writable) {
        result.warnings.push_back("Project folder is not writable yet: " + probe.error.value_or("unknown error"));
    }

    // 8. Subdirectories, each independent
    for (const auto& name : domain::ProjectSubdirectories()) {
        domain::SubdirectoryOutcome outcome = ensureSubdirectory(logicalPath, name, retry);
        if (!outcome.success) {
            result.warnings.push_back("Subdirectory '" + name + "': " + outcome.error.value_or("unknown error"));
        }
        result.subdirectories.push_back(std::move(outcome));
    }

    // 9.
    result.success = true;
    return result;
}

bool ProjectProvisioningService::waitUntilVisible(const fs::path& logicalPath, const domain::RetryPolicy& retry) const {
    const int attempts = retry.maxAttempts < 1 ? 1 : retry.maxAttempts;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (m_fileSystem->isDirectory(logicalPath)) {
            return true;
        }
        if (attempt < attempts) {
            std::this_thread::sleep_for(retry.delay);
        }
    }
    return false;
}

domain::SubdirectoryOutcome ProjectProvisioningService::ensureSubdirectory(const fs::path& projectPath,
                                                                           const std::string& name,
                                                                           const domain::RetryPolicy& retry) const {
    domain::SubdirectoryOutcome outcome;
    outcome.name = name;
    const fs::path logicalPath = projectPath / name;

    if (m_fileSystem->isDirectory(logicalPath)) {
        outcome.success = true;
        return outcome;
    }
    if (m_fileSystem->exists(logicalPath)) {
        outcome.error = "Exists but is not a directory";
        return outcome;
    }

    try {
        outcome.created = m_fileSystem->createDirectories(m_toCreationPath(logicalPath));
    } catch (const std::exception& e) {
        outcome.error = std::string("Creation failed: ") + e.what();
        std::cerr << "[ProjectProvisioningService] Subdirectory " << logicalPath << ": " << *outcome.error << std::endl;
        return outcome;
    }

    if (!waitUntilVisible(logicalPath, retry)) {
        outcome.error = "Created but not yet visible; check sync status";
        return outcome;
    }

    outcome.success = true;
    return outcome;
}

void ProjectProvisioningService::ensureDefaultRoot(const std::string& basePath) const {
    fs::path root(basePath);
    if (m_fileSystem->exists(root)) return;

    try {
        if (m_fileSystem->createDirectories(m_toCreationPath(root))) {
            std::cout << "Created default storage root: " << basePath << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ProjectProvisioningService] Cannot create default storage root " << basePath
                  << ": " << e.what() << std::endl;
    }
}

} // namespace fieldtrack::application
