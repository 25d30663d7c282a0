// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace timenotes::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetCacheHome();
    static std::filesystem::path GetAppDataDir();
    static std::filesystem::path GetModelsDir();

    /** @brief Creates @p dir if missing. Returns false (and logs) on failure. */
    static bool EnsureDirectory(const std::filesystem::path& dir);

    /** @brief True for ids that are safe to embed in a file name. */
    static bool IsSafeFileToken(const std::string& token);
};

} // namespace timenotes::infrastructure
