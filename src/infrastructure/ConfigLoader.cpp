/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileUtils.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace docforge::infrastructure {

ExportSettings ConfigLoader::Defaults() {
    ExportSettings settings;
    settings.outputDir = PathUtils::GetExportsDir().string();
    settings.templatesDir = PathUtils::GetTemplatesDir().string();
    settings.scratchDir = PathUtils::GetScratchDir().string();
    return settings;
}

ExportSettings ConfigLoader::Load(const std::string& configPath) {
    ExportSettings settings = Defaults();
    if (!std::filesystem::exists(configPath)) {
        return settings;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        settings.outputDir = j.value("output_dir", settings.outputDir);
        settings.templatesDir = j.value("templates_dir", settings.templatesDir);
        settings.scratchDir = j.value("scratch_dir", settings.scratchDir);
        settings.imageSearchPaths = j.value("image_search_paths", settings.imageSearchPaths);
        settings.footerText = j.value("footer_text", settings.footerText);
        settings.defaultTemplate = j.value("default_template", settings.defaultTemplate);
        settings.trackerCleanupSeconds = j.value("tracker_cleanup_seconds", settings.trackerCleanupSeconds);
        settings.maxTrackedMessages = j.value("max_tracked_messages", settings.maxTrackedMessages);
        settings.diagramWorkers = j.value("diagram_workers", settings.diagramWorkers);
        settings.compressStreams = j.value("compress_streams", settings.compressStreams);

        if (j.contains("diagrams") && j["diagrams"].is_object()) {
            const auto& d = j["diagrams"];
            DiagramSettings& diagrams = settings.diagrams;
            diagrams.enabled = d.value("enabled", diagrams.enabled);
            diagrams.command = d.value("command", diagrams.command);
            diagrams.timeoutSeconds = d.value("timeout_seconds", diagrams.timeoutSeconds);
            diagrams.width = d.value("width", diagrams.width);
            diagrams.height = d.value("height", diagrams.height);
            diagrams.theme = d.value("theme", diagrams.theme);
            diagrams.background = d.value("background", diagrams.background);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
        return Defaults();
    }

    if (settings.diagramWorkers < 1) settings.diagramWorkers = 1;
    if (settings.maxTrackedMessages < 1) settings.maxTrackedMessages = 1;
    return settings;
}

bool ConfigLoader::Save(const std::string& configPath, const ExportSettings& settings) {
    nlohmann::json j = nlohmann::json::object();

    // Try to load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
            if (!j.is_object()) j = nlohmann::json::object();
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Existing settings unreadable, rewriting: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    j["output_dir"] = settings.outputDir;
    j["templates_dir"] = settings.templatesDir;
    j["scratch_dir"] = settings.scratchDir;
    j["image_search_paths"] = settings.imageSearchPaths;
    j["footer_text"] = settings.footerText;
    j["default_template"] = settings.defaultTemplate;
    j["tracker_cleanup_seconds"] = settings.trackerCleanupSeconds;
    j["max_tracked_messages"] = settings.maxTrackedMessages;
    j["diagram_workers"] = settings.diagramWorkers;
    j["compress_streams"] = settings.compressStreams;
    j["diagrams"] = {
        {"enabled", settings.diagrams.enabled},
        {"command", settings.diagrams.command},
        {"timeout_seconds", settings.diagrams.timeoutSeconds},
        {"width", settings.diagrams.width},
        {"height", settings.diagrams.height},
        {"theme", settings.diagrams.theme},
        {"background", settings.diagrams.background}
    };

    if (!FileUtils::WriteFileAtomically(configPath, j.dump(4))) {
        std::cerr << "[ConfigLoader] Error writing " << configPath << std::endl;
        return false;
    }
    return true;
}

} // namespace docforge::infrastructure
