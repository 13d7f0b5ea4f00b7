/**
 * @file DocForgeApp.cpp
 * @brief Implementation of the DocForgeApp class.
 */
#include "app/DocForgeApp.hpp"

#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileUtils.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/TemplateRepositoryFs.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>

namespace docforge::app {

namespace fs = std::filesystem;

namespace {

application::ProgressTracker::Callback ConsoleProgress() {
    auto lastBucket = std::make_shared<int>(-1);
    auto lastStage = std::make_shared<domain::ExportStage>(domain::ExportStage::Initializing);
    return [lastBucket, lastStage](const application::OperationStatus& status) {
        int bucket = static_cast<int>(status.progressPercentage / 10.0);
        if (bucket == *lastBucket && status.currentStage == *lastStage) return;
        *lastBucket = bucket;
        *lastStage = status.currentStage;
        std::cout << "[Progress] " << std::setw(3) << static_cast<int>(status.progressPercentage) << "% "
                  << domain::StageToString(status.currentStage) << std::endl;
    };
}

void PrintResult(const application::ExportResult& result) {
    if (result.success) {
        std::cout << result.message << ": " << result.outputPath.value_or("") << " ("
                  << result.fileSize.value_or(0) << " bytes)" << std::endl;
    } else {
        std::cerr << "Export failed: " << result.error.value_or("unknown error") << std::endl;
    }
}

int ListTemplates(application::TemplateRegistry& registry) {
    for (const auto& summary : registry.list()) {
        std::cout << std::left << std::setw(20) << summary.name
                  << std::setw(10) << (summary.builtIn ? "built-in" : "custom")
                  << summary.displayName;
        if (!summary.description.empty()) std::cout << " - " << summary.description;
        std::cout << std::endl;
    }
    return 0;
}

int CreateTemplate(application::TemplateRegistry& registry, const CliOptions& options) {
    auto content = infrastructure::FileUtils::ReadFile(options.templateFile);
    if (!content) {
        std::cerr << "Cannot read " << options.templateFile << std::endl;
        return 1;
    }
    domain::TemplateConfig config;
    try {
        config = infrastructure::TemplateRepositoryFs::FromJson(nlohmann::json::parse(*content));
    } catch (const std::exception& e) {
        std::cerr << "Invalid template record: " << e.what() << std::endl;
        return 1;
    }
    if (!registry.create(options.templateName, config)) {
        std::cerr << "Could not create template '" << options.templateName << "'" << std::endl;
        return 1;
    }
    std::cout << "Template '" << options.templateName << "' saved" << std::endl;
    return 0;
}

} // namespace

void DocForgeApp::PrintUsage() {
    std::cout <<
        "Usage: docforge [options] <input.md>\n"
        "       docforge --list-templates\n"
        "       docforge --create-template <name> <record.json>\n"
        "       docforge --delete-template <name>\n"
        "\n"
        "Options:\n"
        "  --format pdf|docx|both   Output format (default: pdf)\n"
        "  --template <name>        Template preset (default from settings)\n"
        "  --output <name>          Output file name inside the output directory\n"
        "  --settings <path>        Settings file (default: XDG config location)\n"
        "  --json                   Print the result record as JSON\n"
        "  -h, --help               Show this help\n";
}

std::optional<CliOptions> DocForgeApp::ParseArgs(const std::vector<std::string>& args, std::string& error) {
    CliOptions options;
    bool sawCommand = false;

    auto next = [&](std::size_t& i, const std::string& flag) -> std::optional<std::string> {
        if (i + 1 >= args.size()) {
            error = flag + " requires a value";
            return std::nullopt;
        }
        return args[++i];
    };

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            options.command = CliOptions::Command::Help;
            return options;
        } else if (arg == "--format") {
            auto v = next(i, arg);
            if (!v) return std::nullopt;
            if (*v != "pdf" && *v != "docx" && *v != "word" && *v != "both") {
                error = "Unknown format '" + *v + "'";
                return std::nullopt;
            }
            options.format = *v;
        } else if (arg == "--template") {
            auto v = next(i, arg);
            if (!v) return std::nullopt;
            options.templateName = *v;
        } else if (arg == "--output") {
            auto v = next(i, arg);
            if (!v) return std::nullopt;
            options.outputName = *v;
        } else if (arg == "--settings") {
            auto v = next(i, arg);
            if (!v) return std::nullopt;
            options.settingsPath = *v;
        } else if (arg == "--json") {
            options.json = true;
        } else if (arg == "--list-templates") {
            options.command = CliOptions::Command::ListTemplates;
            sawCommand = true;
        } else if (arg == "--create-template") {
            auto name = next(i, arg);
            if (!name) return std::nullopt;
            auto file = next(i, arg);
            if (!file) return std::nullopt;
            options.command = CliOptions::Command::CreateTemplate;
            options.templateName = *name;
            options.templateFile = *file;
            sawCommand = true;
        } else if (arg == "--delete-template") {
            auto name = next(i, arg);
            if (!name) return std::nullopt;
            options.command = CliOptions::Command::DeleteTemplate;
            options.templateName = *name;
            sawCommand = true;
        } else if (!arg.empty() && arg[0] == '-') {
            error = "Unknown option '" + arg + "'";
            return std::nullopt;
        } else if (options.inputPath.empty()) {
            options.inputPath = arg;
        } else {
            error = "Unexpected argument '" + arg + "'";
            return std::nullopt;
        }
    }

    if (!sawCommand && !options.inputPath.empty()) {
        options.command = CliOptions::Command::Export;
    }
    return options;
}

int DocForgeApp::Run(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string error;
    auto options = ParseArgs(args, error);
    if (!options) {
        std::cerr << "docforge: " << error << std::endl;
        PrintUsage();
        return 2;
    }
    if (options->command == CliOptions::Command::Help) {
        PrintUsage();
        return 0;
    }

    const std::string settingsPath = options->settingsPath.empty()
        ? infrastructure::PathUtils::GetSettingsFile().string()
        : options->settingsPath;
    infrastructure::ExportSettings settings = infrastructure::ConfigLoader::Load(settingsPath);
    auto services = application::CreateAppServices(settings);

    switch (options->command) {
        case CliOptions::Command::ListTemplates:
            return ListTemplates(*services->templateRegistry);
        case CliOptions::Command::CreateTemplate:
            return CreateTemplate(*services->templateRegistry, *options);
        case CliOptions::Command::DeleteTemplate:
            if (!services->templateRegistry->remove(options->templateName)) {
                std::cerr << "Could not delete template '" << options->templateName << "'" << std::endl;
                return 1;
            }
            std::cout << "Template '" << options->templateName << "' deleted" << std::endl;
            return 0;
        default:
            break;
    }

    auto markdown = infrastructure::FileUtils::ReadFile(options->inputPath);
    if (!markdown) {
        std::cerr << "Cannot read " << options->inputPath << std::endl;
        return 1;
    }

    application::ExportRequest request;
    request.markdown = std::move(*markdown);
    request.templateName = options->templateName;
    request.outputName = options->outputName;
    request.baseDirectory = fs::absolute(options->inputPath).parent_path().string();
    if (!options->json) request.progressCallback = ConsoleProgress();

    auto& orchestrator = *services->exportOrchestrator;
    int exitCode = 0;
    if (options->format == "both") {
        application::DualExportResult result = orchestrator.exportBoth(request);
        if (options->json) {
            std::cout << application::ToJson(result).dump(2) << std::endl;
        } else {
            PrintResult(result.pdfResult);
            PrintResult(result.wordResult);
        }
        exitCode = result.success ? 0 : 1;
    } else {
        request.format = options->format == "pdf" ? domain::ExportFormat::Pdf : domain::ExportFormat::Word;
        application::ExportResult result = orchestrator.exportDocument(request);
        if (options->json) {
            std::cout << application::ToJson(result).dump(2) << std::endl;
        } else {
            PrintResult(result);
        }
        exitCode = result.success ? 0 : 1;
    }

    services->operationRegistry->stop();
    services->blockingExecutor->stop();
    return exitCode;
}

} // namespace docforge::app
