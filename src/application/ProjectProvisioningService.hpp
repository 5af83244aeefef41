/**
 * @file ProjectProvisioningService.hpp
 * @brief Idempotent creation and verification of per-project storage folders.
 */

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "application/BasePathResolver.hpp"
#include "domain/FileSystem.hpp"
#include "domain/ProvisioningResult.hpp"
#include "domain/RetryPolicy.hpp"
#include "domain/Tenant.hpp"
#include "infrastructure/PathValidator.hpp"

namespace fieldtrack::application {

/**
 * @class ProjectProvisioningService
 * @brief Ensures <base>/<sanitized project>/<each fixed subdirectory>/ exists and is usable.
 *
 * The base path may live inside a cloud-sync client folder, where a directory can be
 * created without being visible yet. Creation is therefore followed by a bounded
 * verification loop, and lag-related problems are reported as warnings on an otherwise
 * successful result. Only an unusable base path or an error while creating the project
 * root produce success=false.
 *
 * Safe to call repeatedly and concurrently for the same project: "already exists" is success.
 */
class ProjectProvisioningService {
public:
    /// Maps a logical path to the form handed to createDirectories.
    using CreationPathMapper = std::function<std::filesystem::path(const std::filesystem::path&)>;

    /**
     * @param creationPathMapper Defaults to PathUtils::ToCreationPath. Existence checks
     *        always use the logical path, whatever form creation goes through.
     */
    ProjectProvisioningService(std::shared_ptr<BasePathResolver> resolver,
                               std::shared_ptr<domain::FileSystem> fileSystem,
                               domain::VerificationPolicy policy = {},
                               CreationPathMapper creationPathMapper = {});

    /**
     * @brief Provisions (or re-checks) the project folder of a tenant.
     * @param tenantId Tenant owning the project.
     * @param projectIdentifier Tenant-supplied project number, any characters.
     * @return Structured result; never throws for filesystem conditions.
     */
    domain::ProvisioningResult provisionProjectDirectory(const domain::TenantId& tenantId,
                                                         const std::string& projectIdentifier);

    /**
     * @brief Logical project path for a base path and identifier, without touching the disk.
     */
    static std::filesystem::path LogicalProjectPath(const std::string& basePath, const std::string& projectIdentifier);

    const domain::VerificationPolicy& policy() const { return m_policy; }

private:
    /**
     * @brief Polls the logical path until it is a directory or the budget runs out.
     */
    bool waitUntilVisible(const std::filesystem::path& logicalPath, const domain::RetryPolicy& retry) const;

    domain::SubdirectoryOutcome ensureSubdirectory(const std::filesystem::path& projectPath,
                                                   const std::string& name,
                                                   const domain::RetryPolicy& retry) const;

    /** @brief Creates the fallback root on first use. Failures are left for validation to report. */
    void ensureDefaultRoot(const std::string& basePath) const;

    std::shared_ptr<BasePathResolver> m_resolver;
    std::shared_ptr<domain::FileSystem> m_fileSystem;
    infrastructure::PathValidator m_validator;
    domain::VerificationPolicy m_policy;
    CreationPathMapper m_toCreationPath;
};

} // namespace fieldtrack::application
