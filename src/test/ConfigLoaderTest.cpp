#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "test/support/TestSupport.hpp"

namespace fs = std::filesystem;
using namespace fieldtrack;
using infrastructure::ConfigLoader;
using infrastructure::PathUtils;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;
    test::ScratchDirectory scratch("config");

    // Defaults
    {
        auto config = ConfigLoader::Defaults();
        assert(config.tenantPartitionedSettings);
        assert(config.httpHost == "127.0.0.1");
        assert(config.httpPort == 5050);
        assert(config.verification.cloudSynced.maxAttempts == 5);
        assert(config.verification.cloudSynced.delay == std::chrono::milliseconds(1000));
        assert(config.verification.local.maxAttempts == 2);
        assert(config.verification.local.delay == std::chrono::milliseconds(500));
        assert(!config.settingsFile.empty());
        assert(!config.defaultBasePath.empty());
    }

    // Overlay of present keys only.
    {
        auto config = ConfigLoader::Parse(R"({
            "settings_file": "/etc/fieldtrack/settings.json",
            "tenant_partitioned_settings": false,
            "default_base_path": "/srv/pdfs",
            "retry": { "cloud": { "attempts": 8, "delay_ms": 250 }, "local": { "attempts": 0 } },
            "http": { "port": 8080 }
        })");
        assert(config.settingsFile == "/etc/fieldtrack/settings.json");
        assert(!config.tenantPartitionedSettings);
        assert(config.defaultBasePath == "/srv/pdfs");
        assert(config.verification.cloudSynced.maxAttempts == 8);
        assert(config.verification.cloudSynced.delay == std::chrono::milliseconds(250));
        assert(config.verification.local.maxAttempts == 1);
        assert(config.verification.local.delay == std::chrono::milliseconds(500));
        assert(config.httpHost == "127.0.0.1");
        assert(config.httpPort == 8080);
    }

    // Parse is strict; Load is forgiving.
    {
        bool threw = false;
        try {
            ConfigLoader::Parse(R"({ "http": { "port": "eighty" } })");
        } catch (const nlohmann::json::exception&) {
            threw = true;
        }
        assert(threw);

        fs::path broken = scratch.path() / "broken.json";
        std::ofstream(broken) << "{ \"http\": ";
        auto config = ConfigLoader::Load(broken);
        assert(config.httpPort == 5050);

        auto missing = ConfigLoader::Load(scratch.path() / "absent.json");
        assert(missing.httpPort == 5050);

        fs::path good = scratch.path() / "config.json";
        std::ofstream(good) << R"({ "http": { "host": "0.0.0.0" } })";
        assert(ConfigLoader::Load(good).httpHost == "0.0.0.0");
    }
    std::cout << "[PASS] ConfigLoader." << std::endl;

    // Default storage root honours the environment override.
    {
        setenv("FIELDTRACK_PDF_BASE_PATH", "/srv/override", 1);
        assert(PathUtils::GetDefaultStorageRoot() == fs::path("/srv/override"));
        unsetenv("FIELDTRACK_PDF_BASE_PATH");
        assert(PathUtils::GetDefaultStorageRoot().filename() == "pdfs");
    }

    // Extended-length form.
    {
        assert(PathUtils::MakeExtendedLengthPath("C:\\Users\\pm\\OneDrive") == "\\\\?\\C:\\Users\\pm\\OneDrive");
        assert(PathUtils::MakeExtendedLengthPath("C:/Users/pm") == "\\\\?\\C:\\Users\\pm");
        assert(PathUtils::MakeExtendedLengthPath("\\\\fileserver\\share\\pdfs") == "\\\\?\\UNC\\fileserver\\share\\pdfs");
        assert(PathUtils::MakeExtendedLengthPath("\\\\?\\C:\\already") == "\\\\?\\C:\\already");

#if !defined(_WIN32)
        fs::path longPath = fs::path("/srv") / std::string(300, 'x');
        assert(PathUtils::ToCreationPath(longPath) == longPath);
#endif
        fs::path shortPath("/srv/pdfs/P-1");
        assert(PathUtils::ToCreationPath(shortPath) == shortPath);
    }
    std::cout << "[PASS] PathUtils." << std::endl;

    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
