/**
 * @file LocalFileSystem.cpp
 * @brief Implementation of LocalFileSystem.
 */

#include "infrastructure/LocalFileSystem.hpp"
#include <cerrno>
#include <cstdio>
#include <system_error>

namespace fs = std::filesystem;

namespace fieldtrack::infrastructure {

bool LocalFileSystem::exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool LocalFileSystem::isDirectory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool LocalFileSystem::createDirectories(const fs::path& path) {
    return fs::create_directories(path);
}

void LocalFileSystem::createEmptyFile(const fs::path& path) {
    // "x": exclusive create, fails with EEXIST if anything is already there.
    errno = 0;
    std::FILE* file = std::fopen(path.string().c_str(), "wbx");
    if (file == nullptr) {
        int err = errno != 0 ? errno : EACCES;
        throw fs::filesystem_error("Cannot create file", path, std::error_code(err, std::generic_category()));
    }
    std::fclose(file);
}

void LocalFileSystem::remove(const fs::path& path) {
    fs::remove(path);
}

void LocalFileSystem::removeAll(const fs::path& path) {
    fs::remove_all(path);
}

} // namespace fieldtrack::infrastructure
