#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "app/DocForgeApp.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileUtils.hpp"
#include "test/TestSupport.hpp"

using namespace docforge;
using app::CliOptions;
using app::DocForgeApp;

namespace fs = std::filesystem;

namespace {

int RunCli(std::vector<std::string> args) {
    args.insert(args.begin(), "docforge");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    return DocForgeApp().Run(static_cast<int>(argv.size()), argv.data());
}

void TestParseArgs() {
    std::cout << "[Test] Argument parsing..." << std::endl;
    std::string error;

    auto empty = DocForgeApp::ParseArgs({}, error);
    assert(empty && empty->command == CliOptions::Command::Help);

    auto exportArgs = DocForgeApp::ParseArgs({"notes.md", "--format", "both", "--template", "academic_paper",
                                              "--output", "paper", "--json"}, error);
    assert(exportArgs);
    assert(exportArgs->command == CliOptions::Command::Export);
    assert(exportArgs->inputPath == "notes.md");
    assert(exportArgs->format == "both");
    assert(exportArgs->templateName == "academic_paper");
    assert(exportArgs->outputName == "paper");
    assert(exportArgs->json);

    auto create = DocForgeApp::ParseArgs({"--create-template", "mine", "mine.json"}, error);
    assert(create && create->command == CliOptions::Command::CreateTemplate);
    assert(create->templateName == "mine" && create->templateFile == "mine.json");

    assert(!DocForgeApp::ParseArgs({"--format", "html", "a.md"}, error));
    assert(error == "Unknown format 'html'");
    assert(!DocForgeApp::ParseArgs({"a.md", "--template"}, error));
    assert(error == "--template requires a value");
    assert(!DocForgeApp::ParseArgs({"a.md", "b.md"}, error));
    assert(!DocForgeApp::ParseArgs({"--verbose"}, error));
}

void TestRun(const test::ScratchDir& dir) {
    std::cout << "[Test] Command execution..." << std::endl;
    infrastructure::ExportSettings settings = infrastructure::ConfigLoader::Defaults();
    settings.outputDir = dir.file("out");
    settings.templatesDir = dir.file("templates");
    settings.scratchDir = dir.file("scratch");
    settings.diagrams.enabled = false;
    const std::string settingsPath = dir.file("settings.json");
    assert(infrastructure::ConfigLoader::Save(settingsPath, settings));

    const std::string input = dir.file("notes.md");
    assert(infrastructure::FileUtils::WriteFileAtomically(input, "# Notes\n\nHello.\n"));

    assert(RunCli({"--settings", settingsPath, input, "--format", "both", "--output", "notes"}) == 0);
    assert(fs::exists(fs::path(settings.outputDir) / "notes.pdf"));
    assert(fs::exists(fs::path(settings.outputDir) / "notes.docx"));

    assert(RunCli({"--settings", settingsPath, dir.file("absent.md")}) == 1);
    assert(RunCli({"--settings", settingsPath, input, "--template", "nope"}) == 1);
    assert(RunCli({"--bogus"}) == 2);

    const std::string record = dir.file("record.json");
    assert(infrastructure::FileUtils::WriteFileAtomically(record, R"({"description": "Mine"})"));
    assert(RunCli({"--settings", settingsPath, "--create-template", "mine", record}) == 0);
    assert(fs::exists(fs::path(settings.templatesDir) / "mine.json"));
    assert(RunCli({"--settings", settingsPath, "--list-templates"}) == 0);
    assert(RunCli({"--settings", settingsPath, "--delete-template", "mine"}) == 0);
    assert(RunCli({"--settings", settingsPath, "--delete-template", "whitepaper"}) == 1);
}

} // namespace

int main() {
    std::cout << "[Test] Starting DocForgeApp Test..." << std::endl;

    test::ScratchDir dir("docforge_cli");
    TestParseArgs();
    TestRun(dir);

    std::cout << "[PASS] DocForgeApp Test Passed." << std::endl;
    return 0;
}
