/**
 * @file DiagnosticReport.hpp
 * @brief Step-by-step report of a storage diagnostic run.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fieldtrack::domain {

/**
 * @struct DiagnosticStep
 * @brief One independently executed diagnostic step.
 */
struct DiagnosticStep {
    std::string name;                 ///< Stable step key, e.g. "settings_store".
    bool success = false;
    std::string detail;               ///< Human-readable summary of what was observed.
    std::optional<std::string> error;
};

/**
 * @struct DiagnosticReport
 * @brief Full picture of a tenant's storage configuration.
 */
struct DiagnosticReport {
    std::string tenantId;
    std::vector<DiagnosticStep> steps;
    std::string basePath;
    std::string basePathSource;       ///< "configured" or "default".
    bool cloudSynced = false;
    std::size_t pathLength = 0;
    bool exceedsLegacyPathLimit = false;
    std::string probeDirectory;       ///< Name of the throwaway directory used in the probe cycle.
    bool probeRemoved = false;

    /** @brief True when every step succeeded. */
    bool success() const {
        if (steps.empty()) return false;
        for (const auto& step : steps) {
            if (!step.success) return false;
        }
        return true;
    }
};

} // namespace fieldtrack::domain
