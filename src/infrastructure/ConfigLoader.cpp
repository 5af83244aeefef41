/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace fieldtrack::infrastructure {

using json = nlohmann::json;

namespace {

void ApplyRetry(const json& j, domain::RetryPolicy& policy) {
    if (!j.is_object()) return;
    if (j.contains("attempts")) {
        int attempts = j["attempts"].get<int>();
        policy.maxAttempts = attempts < 1 ? 1 : attempts;
    }
    if (j.contains("delay_ms")) {
        int delayMs = j["delay_ms"].get<int>();
        policy.delay = std::chrono::milliseconds(delayMs < 0 ? 0 : delayMs);
    }
}

} // namespace

AppConfig ConfigLoader::Defaults() {
    AppConfig config;
    config.settingsFile = PathUtils::GetDefaultSettingsFile();
    config.defaultBasePath = PathUtils::GetDefaultStorageRoot();
    return config;
}

AppConfig ConfigLoader::Parse(const std::string& jsonText) {
    AppConfig config = Defaults();
    json j = json::parse(jsonText);

    if (j.contains("settings_file")) {
        config.settingsFile = j["settings_file"].get<std::string>();
    }
    if (j.contains("tenant_partitioned_settings")) {
        config.tenantPartitionedSettings = j["tenant_partitioned_settings"].get<bool>();
    }
    if (j.contains("default_base_path")) {
        std::string base = j["default_base_path"].get<std::string>();
        if (!base.empty()) config.defaultBasePath = base;
    }
    if (j.contains("retry")) {
        const json& retry = j["retry"];
        if (retry.contains("cloud")) ApplyRetry(retry["cloud"], config.verification.cloudSynced);
        if (retry.contains("local")) ApplyRetry(retry["local"], config.verification.local);
    }
    if (j.contains("http")) {
        const json& http = j["http"];
        if (http.contains("host")) config.httpHost = http["host"].get<std::string>();
        if (http.contains("port")) config.httpPort = http["port"].get<int>();
    }
    return config;
}

AppConfig ConfigLoader::Load(const std::filesystem::path& configPath) {
    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec)) {
        return Defaults();
    }

    try {
        std::ifstream f(configPath);
        std::stringstream buffer;
        buffer << f.rdbuf();
        return Parse(buffer.str());
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what()
                  << ". Using defaults." << std::endl;
    }
    return Defaults();
}

} // namespace fieldtrack::infrastructure
