/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the application configuration (config.json).
 *
 * Keeps JSON parsing of the configuration in one place; everything else receives
 * a plain AppConfig.
 */

#pragma once

#include <filesystem>
#include <string>
#include "domain/RetryPolicy.hpp"

namespace fieldtrack::infrastructure {

/**
 * @struct AppConfig
 * @brief Effective process configuration after defaults are applied.
 */
struct AppConfig {
    std::filesystem::path settingsFile;      ///< JSON settings store location.
    bool tenantPartitionedSettings = true;   ///< Settings store partitions values per tenant.
    std::filesystem::path defaultBasePath;   ///< Fallback storage root.
    domain::VerificationPolicy verification;
    std::string httpHost = "127.0.0.1";
    int httpPort = 5050;
};

class ConfigLoader {
public:
    /**
     * @brief Configuration with every value at its default.
     */
    static AppConfig Defaults();

    /**
     * @brief Reads config.json, overlaying present keys onto Defaults().
     * @param configPath Path to the JSON file. A missing file yields the defaults.
     * @return The effective configuration. A malformed file is logged and yields the defaults.
     */
    static AppConfig Load(const std::filesystem::path& configPath);

    /**
     * @brief Parses configuration from a JSON string.
     * @throws nlohmann::json::exception on malformed input or mistyped values.
     */
    static AppConfig Parse(const std::string& jsonText);
};

} // namespace fieldtrack::infrastructure
