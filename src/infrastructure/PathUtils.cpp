#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace fieldtrack::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path CurrentPathOrDot() {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        std::cerr << "[PathUtils] Cannot read working directory: " << ec.message() << std::endl;
        return fs::path(".");
    }
    return cwd;
}

} // namespace

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return CurrentPathOrDot(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return CurrentPathOrDot();
}

fs::path PathUtils::GetDefaultStorageRoot() {
    const char* envBase = std::getenv("FIELDTRACK_PDF_BASE_PATH");
    if (envBase && *envBase) {
        return fs::path(envBase);
    }
    return GetDataHome() / "FieldTrack" / "pdfs";
}

fs::path PathUtils::GetDefaultSettingsFile() {
    return GetDataHome() / "FieldTrack" / "settings.json";
}

fs::path PathUtils::GetDefaultConfigFile() {
    return GetConfigHome() / "FieldTrack" / "config.json";
}

std::string PathUtils::MakeExtendedLengthPath(const std::string& absoluteWindowsPath) {
    static const std::string kPrefix = "\\\\?\\";
    if (absoluteWindowsPath.rfind(kPrefix, 0) == 0) {
        return absoluteWindowsPath;
    }

    std::string normalized = absoluteWindowsPath;
    for (auto& c : normalized) {
        if (c == '/') c = '\\';
    }

    // \\server\share\dir -> \\?\UNC\server\share\dir
    if (normalized.rfind("\\\\", 0) == 0) {
        return kPrefix + "UNC\\" + normalized.substr(2);
    }
    return kPrefix + normalized;
}

fs::path PathUtils::ToCreationPath(const fs::path& logicalPath) {
#if defined(_WIN32)
    if (logicalPath.native().size() < kLegacyMaxPath) {
        return logicalPath;
    }
    std::error_code ec;
    fs::path absolute = fs::absolute(logicalPath, ec);
    if (ec) {
        return logicalPath;
    }
    return fs::path(MakeExtendedLengthPath(absolute.string()));
#else
    return logicalPath;
#endif
}

} // namespace fieldtrack::infrastructure
