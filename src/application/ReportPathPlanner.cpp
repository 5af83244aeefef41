/**
 * @file ReportPathPlanner.cpp
 * @brief Implementation of ReportPathPlanner.
 */

#include "application/ReportPathPlanner.hpp"
#include "domain/ProjectLayout.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <regex>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace fieldtrack::application {

namespace {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

std::string Today() {
    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = ToLocalTime(tt);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y%m%d", &tm);
    return buf;
}

bool IsLeap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && IsLeap(year)) return 29;
    return kDays[month - 1];
}

std::string EscapeRegex(const std::string& s) {
    static const std::string kSpecial = ".^$|()[]{}*+?\\";
    std::string out;
    for (char c : s) {
        if (kSpecial.find(c) != std::string::npos) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

/// Names in a folder; iteration errors end the listing early instead of throwing.
std::vector<std::string> ListFileNames(const fs::path& folder) {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(folder, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        std::cerr << "[ReportPathPlanner] Listing " << folder << " stopped: " << ec.message() << std::endl;
    }
    return names;
}

/// Digits of a sequence or revision number; nullopt when out of int range.
std::optional<int> ParseCounter(const std::string& digits) {
    if (digits.empty() || digits.size() > 9) return std::nullopt;
    return std::stoi(digits);
}

} // namespace

ReportPathPlanner::ReportPathPlanner(std::shared_ptr<ProjectProvisioningService> provisioning,
                                     std::shared_ptr<BasePathResolver> resolver)
    : m_provisioning(std::move(provisioning)), m_resolver(std::move(resolver)) {}

std::string ReportPathPlanner::TestTypeFolder(const std::string& taskType) {
    return domain::TaskTypeToFolder(taskType);
}

std::string ReportPathPlanner::FormatDateForFilename(const std::string& dateString) {
    if (dateString.size() < 10) return Today();

    // Only the leading YYYY-MM-DD matters; a trailing time part is ignored.
    for (size_t i = 0; i < 10; ++i) {
        bool dashSlot = (i == 4 || i == 7);
        char c = dateString[i];
        if (dashSlot ? c != '-' : !std::isdigit(static_cast<unsigned char>(c))) {
            return Today();
        }
    }

    int year = std::stoi(dateString.substr(0, 4));
    int month = std::stoi(dateString.substr(5, 2));
    int day = std::stoi(dateString.substr(8, 2));
    if (month < 1 || month > 12 || day < 1 || day > DaysInMonth(year, month)) {
        return Today();
    }

    return dateString.substr(0, 4) + dateString.substr(5, 2) + dateString.substr(8, 2);
}

std::string ReportPathPlanner::GenerateFilename(const std::string& projectNumber,
                                                const std::string& taskType,
                                                int sequence,
                                                const std::string& fieldDate,
                                                int revisionNumber) {
    std::string cleanProject = projectNumber;
    std::replace_if(cleanProject.begin(), cleanProject.end(), [](unsigned char c) {
        return !(std::isalnum(c) || c == '_' || c == '-');
    }, '_');

    std::ostringstream oss;
    oss << cleanProject << "_" << TestTypeFolder(taskType) << "_"
        << std::setw(2) << std::setfill('0') << sequence
        << "_Field_" << FormatDateForFilename(fieldDate);
    if (revisionNumber > 0) {
        oss << "_REV" << revisionNumber;
    }
    oss << ".pdf";
    return oss.str();
}

int ReportPathPlanner::RevisionNumber(const fs::path& filePath) {
    std::error_code ec;
    if (!fs::exists(filePath, ec)) {
        return 0;
    }

    const std::string baseName = filePath.stem().string();
    const std::regex revisionRegex("^" + EscapeRegex(baseName) + "_REV(\\d+)\\.pdf$");

    int highest = 0;
    for (const std::string& name : ListFileNames(filePath.parent_path())) {
        std::smatch match;
        if (std::regex_match(name, match, revisionRegex)) {
            if (auto number = ParseCounter(match[1].str())) {
                highest = std::max(highest, *number);
            }
        }
    }
    return highest + 1;
}

int ReportPathPlanner::HighestSequence(const fs::path& folder) {
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        return 0;
    }

    static const std::regex sequenceRegex("_(\\d+)_Field_");
    int highest = 0;
    for (const std::string& name : ListFileNames(folder)) {
        if (fs::path(name).extension() != ".pdf") continue;
        if (name.find("_REV") != std::string::npos) continue; // revisions share their original's sequence

        std::smatch match;
        if (std::regex_search(name, match, sequenceRegex)) {
            if (auto number = ParseCounter(match[1].str())) {
                highest = std::max(highest, *number);
            }
        }
    }
    return highest;
}

int ReportPathPlanner::nextSequenceNumber(const domain::TenantId& tenantId,
                                          const std::string& projectNumber,
                                          const std::string& taskType) const {
    const fs::path projectPath = ProjectProvisioningService::LogicalProjectPath(
        m_resolver->resolveEffectiveBasePath(tenantId), projectNumber);
    return HighestSequence(projectPath / TestTypeFolder(taskType)) + 1;
}

ReportSavePlan ReportPathPlanner::planSavePath(const domain::TenantId& tenantId,
                                               const std::string& projectNumber,
                                               const std::string& taskType,
                                               const std::string& fieldDate,
                                               bool isRegeneration) {
    ReportSavePlan plan;
    plan.provisioning = m_provisioning->provisionProjectDirectory(tenantId, projectNumber);
    if (!plan.provisioning.success) {
        plan.error = plan.provisioning.error.value_or("Project folder could not be provisioned");
        return plan;
    }

    try {
        const fs::path folder = fs::path(plan.provisioning.path) / TestTypeFolder(taskType);
        plan.sequence = HighestSequence(folder) + 1;

        fs::path filePath = folder / GenerateFilename(projectNumber, taskType, plan.sequence, fieldDate);
        std::error_code ec;
        if (isRegeneration || fs::exists(filePath, ec)) {
            plan.revisionNumber = std::max(1, RevisionNumber(filePath));
            plan.isRevision = true;
            filePath = folder / GenerateFilename(projectNumber, taskType, plan.sequence, fieldDate, plan.revisionNumber);
        }

        plan.filePath = filePath.string();
        plan.filename = filePath.filename().string();
    } catch (const std::exception& e) {
        std::cerr << "[ReportPathPlanner] Error planning report path: " << e.what() << std::endl;
        plan.error = std::string("Failed to plan report path: ") + e.what();
    }
    return plan;
}

} // namespace fieldtrack::application
