/**
 * @file ProjectLayout.hpp
 * @brief Fixed folder layout created under every project root.
 */

#pragma once

#include <array>
#include <string>

namespace fieldtrack::domain {

/// One subdirectory per report/test category, plus uploaded drawings.
inline const std::array<std::string, 6>& ProjectSubdirectories() {
    static const std::array<std::string, 6> kSubdirectories = {
        "Proctor",
        "Density",
        "CompressiveStrength",
        "Rebar",
        "CylinderPickup",
        "Drawings"
    };
    return kSubdirectories;
}

/// Folder used for task types without a dedicated subdirectory.
inline constexpr const char* kOtherFolder = "Other";

/**
 * @brief Maps a report task type to the folder its PDFs are filed under.
 */
inline std::string TaskTypeToFolder(const std::string& taskType) {
    if (taskType == "PROCTOR") return "Proctor";
    if (taskType == "DENSITY_MEASUREMENT") return "Density";
    if (taskType == "COMPRESSIVE_STRENGTH") return "CompressiveStrength";
    if (taskType == "WP1") return "CompressiveStrength";
    if (taskType == "REBAR") return "Rebar";
    if (taskType == "CYLINDER_PICKUP") return "CylinderPickup";
    return kOtherFolder;
}

} // namespace fieldtrack::domain
