#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>

namespace docforge::infrastructure {

namespace fs = std::filesystem;

namespace {
    const char* kAppDir = "DocForge";

    fs::path EnsureDir(const fs::path& base) {
        std::error_code ec;
        fs::create_directories(base, ec);
        if (ec) {
            std::cerr << "[PathUtils] Could not create " << base << ": " << ec.message() << std::endl;
        }
        return base;
    }

    std::optional<fs::path> HomeOverride() {
        const char* root = std::getenv("DOCFORGE_HOME");
        if (root && *root) return fs::path(root);
        return std::nullopt;
    }
}

fs::path PathUtils::XdgDir(const char* variable, const char* homeFallback) {
    const char* xdg = std::getenv(variable);
    if (xdg && *xdg) {
        return fs::path(xdg) / kAppDir;
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeFallback / kAppDir;
    }
    return fs::current_path() / kAppDir; // Fallback
}

fs::path PathUtils::GetTemplatesDir() {
    if (auto root = HomeOverride()) return EnsureDir(*root / "templates");
    return EnsureDir(XdgDir("XDG_DATA_HOME", ".local/share") / "templates");
}

fs::path PathUtils::GetExportsDir() {
    if (auto root = HomeOverride()) return EnsureDir(*root / "exports");
    return EnsureDir(XdgDir("XDG_DATA_HOME", ".local/share") / "exports");
}

fs::path PathUtils::GetScratchDir() {
    if (auto root = HomeOverride()) return EnsureDir(*root / "scratch");
    return EnsureDir(XdgDir("XDG_CACHE_HOME", ".cache") / "diagrams");
}

fs::path PathUtils::GetSettingsFile() {
    if (auto root = HomeOverride()) return *root / "settings.json";
    return XdgDir("XDG_CONFIG_HOME", ".config") / "settings.json";
}

} // namespace docforge::infrastructure
