#include "infrastructure/PathUtils.hpp"
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace timenotes::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetCacheHome() {
    const char* xdgCacheHome = std::getenv("XDG_CACHE_HOME");
    if (xdgCacheHome && *xdgCacheHome) {
        return fs::path(xdgCacheHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".cache";
    }
    return fs::current_path();
}

fs::path PathUtils::GetAppDataDir() {
    return GetDataHome() / "TimeNotes";
}

fs::path PathUtils::GetModelsDir() {
    fs::path base = GetAppDataDir() / "models";
    EnsureDirectory(base);
    return base;
}

bool PathUtils::EnsureDirectory(const fs::path& dir) {
    if (dir.empty()) {
        return true;
    }
    std::error_code ec;
    if (fs::is_directory(dir, ec)) {
        return true;
    }
    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[PathUtils] Cannot create directory " << dir << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}

bool PathUtils::IsSafeFileToken(const std::string& token) {
    if (token.empty() || token.size() > 128) {
        return false;
    }
    for (unsigned char c : token) {
        if (!std::isalnum(c) && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

} // namespace timenotes::infrastructure
