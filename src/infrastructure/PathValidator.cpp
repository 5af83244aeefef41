/**
 * @file PathValidator.cpp
 * @brief Implementation of PathValidator.
 */

#include "infrastructure/PathValidator.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

namespace fs = std::filesystem;

namespace fieldtrack::infrastructure {

namespace {

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

PathValidator::PathValidator(std::shared_ptr<domain::FileSystem> fileSystem)
    : m_fileSystem(std::move(fileSystem)) {}

PathValidation PathValidator::validate(const std::string& path) const {
    PathValidation result;

    std::string trimmed = Trim(path);
    if (trimmed.empty()) {
        result.error = "Path is required";
        return result;
    }

    if (auto bad = FindForbiddenPathCharacter(trimmed)) {
        std::ostringstream oss;
        oss << "Path contains invalid character";
        if (static_cast<unsigned char>(*bad) >= 0x20) {
            oss << " '" << *bad << "'";
        } else {
            oss << " (control character 0x" << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(static_cast<unsigned char>(*bad)) << ")";
        }
        result.error = oss.str();
        return result;
    }

    fs::path candidate(trimmed);
    if (!m_fileSystem->exists(candidate)) {
        result.error = "Path does not exist";
        return result;
    }
    if (!m_fileSystem->isDirectory(candidate)) {
        result.error = "Path is not a directory";
        return result;
    }

    result.valid = true;
    WriteProbe probe = probeWritable(candidate);
    result.writable = probe.writable;
    if (!probe.writable) {
        result.error = "Directory is not writable: " + probe.error.value_or("unknown error");
    }
    return result;
}

WriteProbe PathValidator::probeWritable(const fs::path& directory) const {
    WriteProbe probe;
    fs::path probeFile = directory / MakeUniqueName(".fieldtrack_write_test");

    try {
        m_fileSystem->createEmptyFile(probeFile);
    } catch (const std::exception& e) {
        probe.error = e.what();
        return probe;
    }

    try {
        m_fileSystem->remove(probeFile);
    } catch (const std::exception& e) {
        // The write itself succeeded; a stuck probe file is only noise.
        std::cerr << "[PathValidator] Could not remove probe file " << probeFile << ": " << e.what() << std::endl;
    }

    probe.writable = true;
    return probe;
}

bool PathValidator::IsCloudSynced(const std::string& path) {
    static const std::array<const char*, 8> kMarkers = {
        "onedrive",
        "dropbox",
        "google drive",
        "googledrive",
        "icloud drive",
        "iclouddrive",
        "mobile documents",
        "box sync"
    };

    std::string lowered = ToLower(path);
    for (const char* marker : kMarkers) {
        if (lowered.find(marker) != std::string::npos) return true;
    }
    return false;
}

std::optional<char> PathValidator::FindForbiddenPathCharacter(const std::string& path) {
    size_t start = 0;
    if (path.rfind("\\\\?\\", 0) == 0) {
        start = 4;
    }
    // Drive letter, e.g. "C:\..."
    size_t driveColon = std::string::npos;
    if (path.size() >= start + 2 && std::isalpha(static_cast<unsigned char>(path[start])) && path[start + 1] == ':') {
        driveColon = start + 1;
    }

    for (size_t i = start; i < path.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(path[i]);
        if (c < 0x20 || c == 0x7F) return static_cast<char>(c);
        switch (c) {
            case '<': case '>': case '"': case '|': case '?': case '*':
                return static_cast<char>(c);
            case ':':
                if (i != driveColon) return ':';
                break;
            default:
                break;
        }
    }
    return std::nullopt;
}

std::string PathValidator::MakeUniqueName(const std::string& prefix) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    auto timestamp = std::chrono::system_clock::now().time_since_epoch().count();

    std::ostringstream oss;
    oss << prefix << "_" << timestamp << "_" << std::hex << rng();
    return oss.str();
}

} // namespace fieldtrack::infrastructure
