/**
 * @file ProvisioningResult.hpp
 * @brief Value objects returned by project directory provisioning.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace fieldtrack::domain {

/**
 * @struct SubdirectoryOutcome
 * @brief Outcome of ensuring one categorical subdirectory under a project root.
 */
struct SubdirectoryOutcome {
    std::string name;                 ///< Subdirectory name (e.g. "Proctor").
    bool created = false;             ///< True if this call created it, false if it pre-existed.
    bool success = false;             ///< True once the subdirectory was seen as a directory.
    std::optional<std::string> error; ///< Failure detail when success is false.
};

/**
 * @struct ProvisioningResult
 * @brief Structured outcome of provisionProjectDirectory.
 *
 * success is false only for hard failures (unusable base path, error while creating
 * the project root). Everything likely to self-heal, such as sync lag, lands in warnings
 * and the overall result stays successful.
 */
struct ProvisioningResult {
    bool success = false;
    std::string path;                 ///< Logical project path, as shown to users.
    std::optional<std::string> error; ///< Present iff success is false.
    std::vector<std::string> warnings;
    std::vector<SubdirectoryOutcome> subdirectories;
    bool created = false;             ///< True if the project root was created by this call.
    bool cloudSynced = false;         ///< Base path classified as cloud-synced.
};

} // namespace fieldtrack::domain
