// PathUtils Header
#pragma once
#include <cstddef>
#include <string>
#include <filesystem>

namespace fieldtrack::infrastructure {

class PathUtils {
public:
    /// Classic Windows MAX_PATH; longer paths need the extended-length form.
    static constexpr std::size_t kLegacyMaxPath = 260;

    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /// Process-wide fallback storage root: $FIELDTRACK_PDF_BASE_PATH, else <data home>/FieldTrack/pdfs.
    static std::filesystem::path GetDefaultStorageRoot();
    static std::filesystem::path GetDefaultSettingsFile();
    static std::filesystem::path GetDefaultConfigFile();

    /**
     * Converts an absolute Windows path to its \\?\ form (\\?\UNC\ for shares).
     * Already-prefixed paths are returned unchanged.
     */
    static std::string MakeExtendedLengthPath(const std::string& absoluteWindowsPath);

    /**
     * Path to hand to the directory-creation call. Differs from the logical path only
     * on Windows and only past kLegacyMaxPath; every existence check uses the logical path.
     */
    static std::filesystem::path ToCreationPath(const std::filesystem::path& logicalPath);
};

} // namespace fieldtrack::infrastructure
