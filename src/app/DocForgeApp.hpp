/**
 * @file DocForgeApp.hpp
 * @brief Command-line front end for DocForge.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace docforge::app {

/**
 * @struct CliOptions
 * @brief Parsed command line.
 */
struct CliOptions {
    enum class Command { Export, ListTemplates, CreateTemplate, DeleteTemplate, Help };

    Command command = Command::Help;
    std::string inputPath;
    std::string format = "pdf";      ///< "pdf", "docx"/"word" or "both".
    std::string templateName;
    std::string outputName;
    std::string settingsPath;
    std::string templateFile;        ///< JSON record for --create-template.
    bool json = false;               ///< Print the result record instead of a summary.
};

/**
 * @class DocForgeApp
 * @brief Loads settings, wires the services and runs one command.
 */
class DocForgeApp {
public:
    /**
     * @brief Runs the command described by argv.
     * @return Process exit code (0 for success).
     */
    int Run(int argc, char** argv);

    /**
     * @brief Parses arguments. Returns nullopt and fills error on invalid input.
     */
    static std::optional<CliOptions> ParseArgs(const std::vector<std::string>& args, std::string& error);

    static void PrintUsage();
};

} // namespace docforge::app
