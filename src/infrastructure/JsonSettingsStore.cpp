/**
 * @file JsonSettingsStore.cpp
 * @brief Implementation of JsonSettingsStore.
 */

#include "infrastructure/JsonSettingsStore.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace fieldtrack::infrastructure {

namespace {

constexpr const char* kGlobalSection = "settings";
constexpr const char* kTenantSection = "tenants";

json LoadDocument(const fs::path& filePath) {
    std::error_code ec;
    if (!fs::exists(filePath, ec)) {
        return json::object();
    }

    std::ifstream f(filePath);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open settings file: " + filePath.string());
    }

    json doc;
    try {
        f >> doc;
    } catch (const json::exception& e) {
        throw std::runtime_error("Malformed settings file " + filePath.string() + ": " + e.what());
    }
    if (!doc.is_object()) {
        throw std::runtime_error("Settings file is not a JSON object: " + filePath.string());
    }
    return doc;
}

} // namespace

JsonSettingsStore::JsonSettingsStore(fs::path filePath, bool tenantPartitioned)
    : m_filePath(std::move(filePath)), m_tenantPartitioned(tenantPartitioned) {}

std::optional<std::string> JsonSettingsStore::readSetting(const std::string& key,
                                                          const std::optional<domain::TenantId>& tenant) {
    json doc = LoadDocument(m_filePath);

    const json* section = nullptr;
    if (tenant) {
        auto tenants = doc.find(kTenantSection);
        if (tenants == doc.end() || !tenants->is_object()) return std::nullopt;
        auto entry = tenants->find(*tenant);
        if (entry == tenants->end()) return std::nullopt;
        section = &(*entry);
    } else {
        auto global = doc.find(kGlobalSection);
        if (global == doc.end()) return std::nullopt;
        section = &(*global);
    }

    if (!section->is_object()) return std::nullopt;
    auto it = section->find(key);
    if (it == section->end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

void JsonSettingsStore::writeSetting(const std::string& key,
                                     const std::optional<std::string>& value,
                                     const std::optional<domain::TenantId>& tenant) {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    json doc = LoadDocument(m_filePath);

    json* section = nullptr;
    if (tenant) {
        json& tenants = doc[kTenantSection];
        if (!tenants.is_object()) tenants = json::object();
        section = &tenants[*tenant];
    } else {
        section = &doc[kGlobalSection];
    }
    if (!section->is_object()) *section = json::object();

    if (value) {
        (*section)[key] = *value;
    } else {
        section->erase(key);
    }

    // Same temp -> rename sequence the rest of the code base uses for durable writes.
    try {
        if (m_filePath.has_parent_path()) {
            fs::create_directories(m_filePath.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        throw std::runtime_error(std::string("Cannot create settings directory: ") + e.what());
    }

    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = m_filePath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            throw std::runtime_error("Cannot write settings file: " + tempPath.string());
        }
        ofs << doc.dump(4);
        if (ofs.fail()) {
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw std::runtime_error("Write failed for settings file: " + tempPath.string());
        }
    }

    try {
        fs::rename(tempPath, m_filePath);
    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove(tempPath, ec);
        throw std::runtime_error(std::string("Cannot replace settings file: ") + e.what());
    }

    std::cout << "[JsonSettingsStore] " << (value ? "Updated " : "Cleared ") << key
              << (tenant ? " for tenant " + *tenant : std::string(" (global)")) << std::endl;
}

} // namespace fieldtrack::infrastructure
