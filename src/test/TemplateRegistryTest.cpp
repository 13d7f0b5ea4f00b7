#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "application/TemplateRegistry.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/TemplateRepositoryFs.hpp"
#include "test/TestSupport.hpp"

using namespace docforge;
using application::TemplateRegistry;
using infrastructure::TemplateRepositoryFs;

namespace fs = std::filesystem;

namespace {

void TestBuiltIns(TemplateRegistry& registry) {
    std::cout << "[Test] Built-in templates..." << std::endl;
    auto summaries = registry.list();
    assert(summaries.size() >= 5);
    assert(summaries[0].name == "executive_summary");
    assert(summaries[1].name == "technical_report");
    assert(summaries[2].name == "business_report");
    assert(summaries[3].name == "academic_paper");
    assert(summaries[4].name == "whitepaper");
    for (size_t i = 0; i < 5; ++i) assert(summaries[i].builtIn);

    auto whitepaper = registry.get("whitepaper");
    assert(whitepaper);
    assert(whitepaper->metadata.subject == "Whitepaper");
    assert(whitepaper->pdf.body.fontSize == 12.0);
    assert(whitepaper->pdf.title.alignment == "center");

    auto academic = registry.get("academic_paper");
    assert(academic);
    assert(academic->pdf.body.font == "Times-Roman");
    assert(academic->pdf.margins.left == 1.5);

    assert(registry.isBuiltIn("technical_report"));
    assert(!registry.get("no_such_template"));
    assert(!registry.get("../etc/passwd"));
}

void TestCustomTemplates(TemplateRegistry& registry, const std::string& dir) {
    std::cout << "[Test] Custom template lifecycle..." << std::endl;
    domain::TemplateConfig config = TemplateRegistry::BaseTemplate();
    config.description = "Quarterly numbers";
    config.pdf.pageSize = "letter";
    config.pdf.body.fontSize = 10.5;
    config.pdf.table.gridColor = "#123456";
    config.word.fontFamily = "Georgia";
    config.metadata.keywords = {"q3", "finance"};

    assert(registry.create("quarterly_review", config));
    assert(fs::exists(fs::path(dir) / "quarterly_review.json"));

    auto loaded = registry.get("quarterly_review");
    assert(loaded);
    assert(loaded->name == "quarterly_review");
    assert(loaded->displayName == "Quarterly Review");
    assert(loaded->description == "Quarterly numbers");
    assert(loaded->pdf.pageSize == "letter");
    assert(loaded->pdf.body.fontSize == 10.5);
    assert(loaded->pdf.table.gridColor == "#123456");
    assert(loaded->word.fontFamily == "Georgia");
    assert(loaded->metadata.keywords.size() == 2);

    auto summaries = registry.list();
    assert(summaries.size() == 6);
    assert(summaries.back().name == "quarterly_review");
    assert(!summaries.back().builtIn);

    // Overwriting a custom template replaces it.
    config.description = "Revised";
    assert(registry.create("quarterly_review", config));
    assert(registry.get("quarterly_review")->description == "Revised");

    // Built-ins are neither overwritten nor deleted; unsafe names are rejected.
    assert(!registry.create("whitepaper", config));
    assert(!registry.remove("whitepaper"));
    assert(!registry.create("../escape", config));
    assert(!registry.create("", config));
    assert(!registry.create("a/b", config));

    assert(registry.remove("quarterly_review"));
    assert(!registry.remove("quarterly_review"));
    assert(!registry.get("quarterly_review"));
    assert(registry.list().size() == 5);
}

void TestLegacyRecord(TemplateRegistry& registry, const std::string& dir) {
    std::cout << "[Test] Partial template record..." << std::endl;
    std::ofstream out(fs::path(dir) / "legacy.json");
    out << R"({
        "name": "Legacy Layout",
        "pdf_styles": { "body": { "font_size": 9, "line_spacing": 1.5, "spacing": 4 } }
    })";
    out.close();

    auto legacy = registry.get("legacy");
    assert(legacy);
    assert(legacy->name == "legacy");
    assert(legacy->displayName == "Legacy Layout");
    assert(legacy->pdf.body.fontSize == 9.0);
    assert(legacy->pdf.body.leading == 1.5);
    assert(legacy->pdf.body.spaceAfter == 4.0);

    std::ofstream broken(fs::path(dir) / "broken.json");
    broken << "{ not json";
    broken.close();
    assert(!registry.get("broken"));
    for (const auto& s : registry.list()) assert(s.name != "broken");
}

void TestNames() {
    std::cout << "[Test] Template names..." << std::endl;
    assert(TemplateRegistry::DisplayName("business_report") == "Business Report");
    assert(TemplateRegistry::DisplayName("my-custom_one") == "My Custom One");
    assert(TemplateRegistry::IsValidName("ok_name"));
    assert(!TemplateRegistry::IsValidName("..hidden"));
    assert(!TemplateRegistry::IsValidName("a\\b"));
}

void TestSettings(const test::ScratchDir& scratch) {
    std::cout << "[Test] Settings load and save..." << std::endl;
    const std::string path = scratch.file("settings.json");

    auto defaults = infrastructure::ConfigLoader::Load(path);
    assert(defaults.defaultTemplate == "whitepaper");
    assert(defaults.diagrams.command == "mmdc");
    assert(!defaults.outputDir.empty());

    std::ofstream out(path);
    out << R"({
        "output_dir": "/tmp/docforge-out",
        "footer_text": "ACME Confidential",
        "diagram_workers": 0,
        "image_search_paths": ["/srv/images"],
        "custom_key": 42,
        "diagrams": { "enabled": false, "timeout_seconds": 5, "theme": "dark" }
    })";
    out.close();

    auto loaded = infrastructure::ConfigLoader::Load(path);
    assert(loaded.outputDir == "/tmp/docforge-out");
    assert(loaded.footerText == "ACME Confidential");
    assert(loaded.diagramWorkers == 1);
    assert(loaded.imageSearchPaths.size() == 1);
    assert(!loaded.diagrams.enabled);
    assert(loaded.diagrams.timeoutSeconds == 5);
    assert(loaded.diagrams.theme == "dark");
    assert(loaded.diagrams.width == 800);

    loaded.defaultTemplate = "academic_paper";
    assert(infrastructure::ConfigLoader::Save(path, loaded));
    auto reloaded = infrastructure::ConfigLoader::Load(path);
    assert(reloaded.defaultTemplate == "academic_paper");
    assert(reloaded.footerText == "ACME Confidential");

    // Unknown keys survive a save.
    std::ifstream in(path);
    nlohmann::json j;
    in >> j;
    assert(j["custom_key"] == 42);

    std::ofstream corrupt(path);
    corrupt << "[[[";
    corrupt.close();
    auto fallback = infrastructure::ConfigLoader::Load(path);
    assert(fallback.footerText == "Generated by DocForge");
}

} // namespace

int main() {
    std::cout << "[Test] Starting TemplateRegistry Test..." << std::endl;

    test::ScratchDir scratch("docforge_templates");
    const std::string templatesDir = scratch.file("templates");
    auto repository = std::make_shared<TemplateRepositoryFs>(templatesDir);
    TemplateRegistry registry(repository);

    TestBuiltIns(registry);
    TestCustomTemplates(registry, templatesDir);
    TestLegacyRecord(registry, templatesDir);
    TestNames();
    TestSettings(scratch);

    std::cout << "[PASS] TemplateRegistry Test Passed." << std::endl;
    return 0;
}
