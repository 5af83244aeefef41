/**
 * @file ReportPathPlanner.hpp
 * @brief Decides where a generated report PDF is filed inside a project folder.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "application/BasePathResolver.hpp"
#include "application/ProjectProvisioningService.hpp"
#include "domain/ProvisioningResult.hpp"
#include "domain/Tenant.hpp"

namespace fieldtrack::application {

/**
 * @struct ReportSavePlan
 * @brief Target location of a report. filePath is empty when error is set.
 */
struct ReportSavePlan {
    std::string filePath;
    std::string filename;
    int sequence = 0;
    bool isRevision = false;
    int revisionNumber = 0;
    std::optional<std::string> error;
    domain::ProvisioningResult provisioning; ///< Result of the preceding project folder check.
};

/**
 * @class ReportPathPlanner
 * @brief Names report files <Project>_<Folder>_<NN>_Field_<YYYYMMDD>[_REV<n>].pdf.
 *
 * Only computes names and locations; writing the PDF is the caller's business.
 */
class ReportPathPlanner {
public:
    ReportPathPlanner(std::shared_ptr<ProjectProvisioningService> provisioning,
                      std::shared_ptr<BasePathResolver> resolver);

    /**
     * @brief Provisions the project folder, then picks sequence and revision for a new report.
     * @param isRegeneration Forces a revision filename even without a collision.
     */
    ReportSavePlan planSavePath(const domain::TenantId& tenantId,
                                const std::string& projectNumber,
                                const std::string& taskType,
                                const std::string& fieldDate,
                                bool isRegeneration = false);

    /** @brief Next free sequence number in the task-type folder, starting at 1. */
    int nextSequenceNumber(const domain::TenantId& tenantId, const std::string& projectNumber, const std::string& taskType) const;

    static std::string TestTypeFolder(const std::string& taskType);

    /** @brief "YYYY-MM-DD[...]" -> "YYYYMMDD"; empty or unparseable input gives today's local date. */
    static std::string FormatDateForFilename(const std::string& dateString);

    static std::string GenerateFilename(const std::string& projectNumber,
                                        const std::string& taskType,
                                        int sequence,
                                        const std::string& fieldDate,
                                        int revisionNumber = 0);

    /** @brief 0 if the file is free, else 1 + the highest existing _REV<n> sibling. */
    static int RevisionNumber(const std::filesystem::path& filePath);

    /** @brief Highest "_NN_Field_" sequence among non-revision PDFs in a folder, 0 if none. */
    static int HighestSequence(const std::filesystem::path& folder);

private:
    std::shared_ptr<ProjectProvisioningService> m_provisioning;
    std::shared_ptr<BasePathResolver> m_resolver;
};

} // namespace fieldtrack::application
