// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace docforge::infrastructure {

/**
 * Per-user locations. DOCFORGE_HOME, when set, roots every directory below
 * a single tree; otherwise the XDG base directories are used.
 */
class PathUtils {
public:
    static std::filesystem::path GetTemplatesDir();
    static std::filesystem::path GetExportsDir();
    static std::filesystem::path GetScratchDir();
    static std::filesystem::path GetSettingsFile();

private:
    static std::filesystem::path XdgDir(const char* variable, const char* homeFallback);
};

} // namespace docforge::infrastructure
