/**
 * @file ExportSettings.hpp
 * @brief Static configuration passed to services at construction.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docforge::infrastructure {

struct DiagramSettings {
    bool enabled = true;
    std::string command = "mmdc";
    int timeoutSeconds = 30;
    int width = 800;
    int height = 600;
    std::string theme = "default";
    std::string background = "white";
};

/**
 * @struct ExportSettings
 * @brief Everything an export pipeline needs to know about its environment.
 */
struct ExportSettings {
    std::string outputDir;
    std::string templatesDir;
    std::string scratchDir;
    std::vector<std::string> imageSearchPaths;
    std::string footerText = "Generated by DocForge";
    std::string defaultTemplate = "whitepaper";
    int trackerCleanupSeconds = 300;
    std::size_t maxTrackedMessages = 100;
    int diagramWorkers = 2;
    bool compressStreams = true;
    DiagramSettings diagrams;
};

} // namespace docforge::infrastructure
