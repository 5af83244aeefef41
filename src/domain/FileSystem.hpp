/**
 * @file FileSystem.hpp
 * @brief Interface for the filesystem calls made by provisioning and validation.
 */

#pragma once
#include <filesystem>

namespace fieldtrack::domain {

/**
 * @class FileSystem
 * @brief Abstract seam over the handful of filesystem operations the engine performs.
 *
 * Query methods never throw: an entry that cannot be inspected is reported as absent.
 * Mutating methods throw std::filesystem::filesystem_error on failure.
 */
class FileSystem {
public:
    virtual ~FileSystem() = default;

    /** @brief True if any entry (file, directory, other) exists at the path. */
    virtual bool exists(const std::filesystem::path& path) = 0;

    /** @brief True if the path exists and is a directory. */
    virtual bool isDirectory(const std::filesystem::path& path) = 0;

    /**
     * @brief Creates the directory and any missing ancestors.
     * @return True if a directory was created, false if it was already there.
     */
    virtual bool createDirectories(const std::filesystem::path& path) = 0;

    /** @brief Creates a zero-byte file, failing if it already exists. */
    virtual void createEmptyFile(const std::filesystem::path& path) = 0;

    /** @brief Removes a single file or empty directory. */
    virtual void remove(const std::filesystem::path& path) = 0;

    /** @brief Removes a directory tree. */
    virtual void removeAll(const std::filesystem::path& path) = 0;
};

} // namespace fieldtrack::domain
