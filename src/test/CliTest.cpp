#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "app/Cli.hpp"
#include "test/support/TestSupport.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace fieldtrack;

namespace {

struct Run {
    int exitCode;
    std::string output;
};

Run Invoke(const std::vector<std::string>& args) {
    std::ostringstream out;
    int code = app::RunCommand(args, out);
    return {code, out.str()};
}

} // namespace

int main() {
    std::cout << "[Test] Starting Cli Test..." << std::endl;
    test::ScratchDirectory scratch("cli");

    fs::path defaultRoot = scratch.path() / "default-pdfs";
    fs::path settingsFile = scratch.path() / "settings.json";
    fs::path configFile = scratch.path() / "config.json";
    {
        json config = {
            {"settings_file", settingsFile.string()},
            {"default_base_path", defaultRoot.string()},
            {"retry", {{"cloud", {{"attempts", 2}, {"delay_ms", 5}}}, {"local", {{"attempts", 2}, {"delay_ms", 5}}}}}
        };
        std::ofstream(configFile) << config.dump();
        json settings = {{"tenants", {{"9", {{"workflow_base_path", "/does/not/exist"}}}}}};
        std::ofstream(settingsFile) << settings.dump();
    }
    const std::string cfg = configFile.string();

    // Usage errors.
    assert(Invoke({}).exitCode == app::kExitUsage);
    assert(Invoke({"--config"}).exitCode == app::kExitUsage);
    assert(Invoke({"--config", cfg}).exitCode == app::kExitUsage);
    assert(Invoke({"--config", cfg, "provision", "7"}).exitCode == app::kExitUsage);
    assert(Invoke({"--config", cfg, "frobnicate"}).exitCode == app::kExitUsage);
    assert(Invoke({"check-path"}).exitCode == app::kExitUsage);
    assert(Invoke({}).output.empty());
    assert(!fs::exists(defaultRoot));
    std::cout << "[PASS] Usage errors." << std::endl;

    // Hard failure: the configured base path does not exist.
    {
        Run run = Invoke({"--config", cfg, "provision", "9", "P-1"});
        assert(run.exitCode == app::kExitFailed);
        json result = json::parse(run.output);
        assert(result["success"] == false);
        assert(result["error"].get<std::string>().find("Base path is invalid") != std::string::npos);
        assert(result["subdirectories"].empty());
    }
    std::cout << "[PASS] Provision hard failure." << std::endl;

    // Success against the default root from the config file.
    {
        Run run = Invoke({"--config", cfg, "provision", "7", "02-2026-0019"});
        assert(run.exitCode == app::kExitOk);
        json result = json::parse(run.output);
        assert(result["success"] == true);
        assert(result["path"] == (defaultRoot / "02-2026-0019").string());
        assert(fs::is_directory(defaultRoot / "02-2026-0019" / "Proctor"));
    }
    std::cout << "[PASS] Provision success." << std::endl;

    // Identifiers that are not valid UTF-8 still produce parseable output.
    {
        Run run = Invoke({"--config", cfg, "provision", "7", "P-\xff"});
        assert(run.exitCode == app::kExitOk);
        json result = json::parse(run.output);
        assert(result["success"] == true);
        assert(result["path"].get<std::string>().find("\xEF\xBF\xBD") != std::string::npos);
    }
    std::cout << "[PASS] Invalid UTF-8 in output." << std::endl;

    // Diagnostic.
    {
        Run run = Invoke({"--config", cfg, "diagnose", "7"});
        assert(run.exitCode == app::kExitOk);
        json report = json::parse(run.output);
        assert(report["success"] == true);
        assert(report["basePathSource"] == "default");

        run = Invoke({"--config", cfg, "diagnose", "9"});
        assert(run.exitCode == app::kExitFailed);
    }
    std::cout << "[PASS] Diagnose." << std::endl;

    // check-path needs no configuration.
    {
        Run missing = Invoke({"check-path", (scratch.path() / "missing").string()});
        assert(missing.exitCode == app::kExitFailed);
        json verdict = json::parse(missing.output);
        assert(verdict["valid"] == false);
        assert(verdict["error"] == "Path does not exist");

        Run ok = Invoke({"check-path", scratch.str()});
        assert(ok.exitCode == app::kExitOk);
        json good = json::parse(ok.output);
        assert(good["valid"] == true && good["isWritable"] == true);
        assert(good["path"] == scratch.str());
        assert(good["exceedsLegacyPathLimit"] == false);
    }
    std::cout << "[PASS] check-path." << std::endl;

    std::cout << "[PASS] Cli Test." << std::endl;
    return 0;
}
