/**
 * @file Cli.cpp
 * @brief Implementation of the command dispatch.
 */

#include "app/Cli.hpp"
#include "app/HttpApi.hpp"
#include "app/JsonMapping.hpp"
#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/LocalFileSystem.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PathValidator.hpp"
#include <filesystem>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace fieldtrack::app {

namespace {

void PrintUsage() {
    std::cerr << "Usage: fieldtrack [--config <file>] <command>\n"
              << "  provision <tenant> <projectNumber>   Create or re-check a project folder\n"
              << "  diagnose <tenant>                    Run the storage diagnostic\n"
              << "  check-path <path>                    Validate an arbitrary directory\n"
              << "  serve                                Run the HTTP API" << std::endl;
}

int RunCheckPath(const std::string& path, std::ostream& out) {
    infrastructure::PathValidator validator(std::make_shared<infrastructure::LocalFileSystem>());
    infrastructure::PathValidation verdict = validator.validate(path);

    json result = verdict;
    result["path"] = path;
    result["cloudSynced"] = infrastructure::PathValidator::IsCloudSynced(path);
    result["pathLength"] = path.size();
    result["exceedsLegacyPathLimit"] = path.size() >= infrastructure::PathUtils::kLegacyMaxPath;
    out << DumpForOutput(result) << std::endl;
    return verdict.valid && verdict.writable ? kExitOk : kExitFailed;
}

int Dispatch(std::vector<std::string> args, std::ostream& out) {
    fs::path configPath = infrastructure::PathUtils::GetDefaultConfigFile();
    if (!args.empty() && args[0] == "--config") {
        if (args.size() < 2) {
            PrintUsage();
            return kExitUsage;
        }
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty()) {
        PrintUsage();
        return kExitUsage;
    }

    const std::string command = args[0];

    // check-path needs no configuration or settings store.
    if (command == "check-path") {
        if (args.size() != 2) {
            PrintUsage();
            return kExitUsage;
        }
        return RunCheckPath(args[1], out);
    }

    const bool known = (command == "provision" && args.size() == 3) ||
                       (command == "diagnose" && args.size() == 2) ||
                       (command == "serve" && args.size() == 1);
    if (!known) {
        if (command != "provision" && command != "diagnose" && command != "serve") {
            std::cerr << "Unknown command: " << command << std::endl;
        }
        PrintUsage();
        return kExitUsage;
    }

    infrastructure::AppConfig config = infrastructure::ConfigLoader::Load(configPath);
    application::AppServices services = application::BuildAppServices(config);

    if (command == "provision") {
        domain::ProvisioningResult result = services.provisioningService->provisionProjectDirectory(args[1], args[2]);
        out << DumpForOutput(result) << std::endl;
        return result.success ? kExitOk : kExitFailed;
    }

    if (command == "diagnose") {
        domain::DiagnosticReport report = services.diagnosticService->runDiagnostic(args[1]);
        out << DumpForOutput(report) << std::endl;
        return report.success() ? kExitOk : kExitFailed;
    }

    HttpApi api(services);
    return api.run(config.httpHost, config.httpPort) ? kExitOk : kExitFailed;
}

} // namespace

std::string DumpForOutput(const json& value) {
    return value.dump(2, ' ', false, json::error_handler_t::replace);
}

int RunCommand(const std::vector<std::string>& args, std::ostream& out) {
    try {
        return Dispatch(args, out);
    } catch (const std::exception& e) {
        std::cerr << "[fieldtrack] " << e.what() << std::endl;
        return kExitFailed;
    }
}

} // namespace fieldtrack::app
