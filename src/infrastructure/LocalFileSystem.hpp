/**
 * @file LocalFileSystem.hpp
 * @brief std::filesystem-backed implementation of domain::FileSystem.
 */

#pragma once
#include "domain/FileSystem.hpp"

namespace fieldtrack::infrastructure {

/**
 * @class LocalFileSystem
 * @brief Passes every operation straight to the operating system.
 */
class LocalFileSystem : public domain::FileSystem {
public:
    bool exists(const std::filesystem::path& path) override;
    bool isDirectory(const std::filesystem::path& path) override;
    bool createDirectories(const std::filesystem::path& path) override;
    void createEmptyFile(const std::filesystem::path& path) override;
    void remove(const std::filesystem::path& path) override;
    void removeAll(const std::filesystem::path& path) override;
};

} // namespace fieldtrack::infrastructure
