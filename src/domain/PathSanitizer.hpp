/**
 * @file PathSanitizer.hpp
 * @brief Maps arbitrary project identifiers to filesystem-safe folder names.
 */

#pragma once
#include <cstddef>
#include <string>

namespace fieldtrack::domain {

/**
 * @class PathSanitizer
 * @brief Pure, total mapping from an identifier (e.g. a project number) to a single path segment.
 *
 * The output is valid on both Windows and POSIX filesystems, contains no separators and
 * no ".." sequence, and is bounded in length so subdirectory names still fit under it.
 * The mapping is deterministic and idempotent.
 */
class PathSanitizer {
public:
    static constexpr char kPlaceholder = '_';
    static constexpr std::size_t kMaxSegmentLength = 200;
    static constexpr const char* kFallbackSegment = "unnamed";

    /**
     * @brief Sanitizes an identifier. Never throws, never returns an empty string.
     */
    static std::string Sanitize(const std::string& identifier);

    /** @brief True for characters that may not appear in a Windows or POSIX file name. */
    static bool IsForbiddenCharacter(unsigned char c);

    /** @brief True for Windows device names (CON, NUL, COM1...), with or without extension. */
    static bool IsReservedDeviceName(const std::string& segment);
};

} // namespace fieldtrack::domain
