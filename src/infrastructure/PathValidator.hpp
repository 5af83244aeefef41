/**
 * @file PathValidator.hpp
 * @brief Existence, type and write-capability checks for storage paths.
 */

#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "domain/FileSystem.hpp"

namespace fieldtrack::infrastructure {

/**
 * @struct PathValidation
 * @brief Verdict of PathValidator::validate.
 */
struct PathValidation {
    bool valid = false;     ///< Non-empty, well-formed, exists and is a directory.
    bool writable = false;  ///< A probe file could be created and removed inside it.
    std::optional<std::string> error;
};

/**
 * @struct WriteProbe
 * @brief Outcome of a create-then-delete probe file.
 */
struct WriteProbe {
    bool writable = false;
    std::optional<std::string> error;
};

/**
 * @class PathValidator
 * @brief Checks candidate storage paths the way the engine needs them checked.
 *
 * Never throws: every filesystem failure is folded into the returned verdict.
 */
class PathValidator {
public:
    explicit PathValidator(std::shared_ptr<domain::FileSystem> fileSystem);

    /**
     * @brief Runs the ordered checks, stopping at the first failure:
     * non-empty, no forbidden characters, exists, is a directory, writable.
     */
    PathValidation validate(const std::string& path) const;

    /** @brief Creates and removes a uniquely named zero-byte file inside the directory. */
    WriteProbe probeWritable(const std::filesystem::path& directory) const;

    /**
     * @brief Heuristic: the path contains a known cloud-sync client folder name.
     * False negatives are expected; the result only tunes retry budgets.
     */
    static bool IsCloudSynced(const std::string& path);

    /**
     * @brief First character that Windows forbids in a directory path, if any.
     * A drive-letter colon ("C:") and the \\?\ prefix are allowed.
     */
    static std::optional<char> FindForbiddenPathCharacter(const std::string& path);

    /** @brief Name unique to this process and moment, e.g. ".fieldtrack_write_test_<time>_<rand>". */
    static std::string MakeUniqueName(const std::string& prefix);

private:
    std::shared_ptr<domain::FileSystem> m_fileSystem;
};

} // namespace fieldtrack::infrastructure
