/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving export configuration (settings.json).
 *
 * Provides a unified way to build ExportSettings without scattering JSON
 * parsing logic throughout the codebase.
 */

#pragma once

#include "infrastructure/ExportSettings.hpp"
#include <string>

namespace docforge::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Returns the built-in defaults, with directories under the XDG locations.
     */
    static ExportSettings Defaults();

    /**
     * @brief Reads settings.json. Missing keys keep their defaults; a missing or
     * unreadable file yields Defaults().
     * @param configPath Path to the settings file.
     */
    static ExportSettings Load(const std::string& configPath);

    /**
     * @brief Writes settings to disk, preserving keys this version does not know about.
     * @return false when the file cannot be written.
     */
    static bool Save(const std::string& configPath, const ExportSettings& settings);
};

} // namespace docforge::infrastructure
