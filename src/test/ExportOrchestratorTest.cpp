#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "application/ExportOrchestrator.hpp"
#include "infrastructure/FileUtils.hpp"
#include "infrastructure/TemplateRepositoryFs.hpp"
#include "infrastructure/docx/DocxRenderer.hpp"
#include "infrastructure/pdf/PdfRenderer.hpp"
#include "test/TestSupport.hpp"

using namespace docforge;
using namespace docforge::application;
using domain::ExportFormat;
using domain::ExportStage;
using infrastructure::FileUtils;

namespace fs = std::filesystem;

namespace {

// Writes a small PNG per diagram, optionally holding every call until released.
class FakeDiagramRenderer : public domain::DiagramRenderer {
public:
    FakeDiagramRenderer(std::string scratchDir, bool available)
        : m_scratchDir(std::move(scratchDir)), m_available(available), m_gate(m_release.get_future().share()) {}

    std::optional<std::string> render(const std::string& source, const std::string& id,
                                      const RenderOptions&) override {
        if (m_blocking) m_gate.wait();
        ++calls;
        if (source.find("fail") != std::string::npos) return std::nullopt;
        const std::string path = (fs::path(m_scratchDir) / (id + "_" + FileUtils::RandomToken(6) + ".png")).string();
        if (!FileUtils::WriteFileAtomically(path, test::MakePng(30, 20))) return std::nullopt;
        std::lock_guard<std::mutex> lock(m_mutex);
        produced.push_back(path);
        return path;
    }

    bool isAvailable() const override { return m_available; }

    void block() { m_blocking = true; }
    void release() { m_release.set_value(); }

    std::atomic<int> calls{0};
    std::vector<std::string> produced;

private:
    std::string m_scratchDir;
    bool m_available;
    std::atomic<bool> m_blocking{false};
    std::mutex m_mutex;
    std::promise<void> m_release;
    std::shared_future<void> m_gate;
};

class FailingRenderer : public domain::DocumentRenderer {
public:
    explicit FailingRenderer(ExportFormat format) : m_format(format) {}
    ExportFormat format() const override { return m_format; }
    bool render(const std::vector<domain::MarkdownElement>&, const domain::TemplateConfig&,
                const domain::DocumentAssets&, const std::string&, const domain::RenderHooks&) override {
        return false;
    }

private:
    ExportFormat m_format;
};

struct Fixture {
    explicit Fixture(const test::ScratchDir& dir,
                     std::shared_ptr<domain::DiagramRenderer> diagrams = nullptr,
                     std::shared_ptr<domain::DocumentRenderer> wordRenderer = nullptr) {
        settings.outputDir = dir.file("out");
        settings.templatesDir = dir.file("templates");
        settings.scratchDir = dir.file("scratch");
        fs::create_directories(settings.scratchDir);

        operations = std::make_shared<OperationRegistry>(std::chrono::seconds(300));
        auto templates = std::make_shared<TemplateRegistry>(
            std::make_shared<infrastructure::TemplateRepositoryFs>(settings.templatesDir));
        std::vector<std::shared_ptr<domain::DocumentRenderer>> renderers{
            std::make_shared<infrastructure::pdf::PdfRenderer>("Test footer"),
            wordRenderer ? wordRenderer : std::make_shared<infrastructure::docx::DocxRenderer>("Test footer")};
        orchestrator = std::make_unique<ExportOrchestrator>(settings, templates, diagrams, operations,
                                                            std::make_shared<BlockingExecutor>(2), renderers);
    }

    infrastructure::ExportSettings settings;
    std::shared_ptr<OperationRegistry> operations;
    std::unique_ptr<ExportOrchestrator> orchestrator;
};

const char* kReport = "# Report\n\nSummary of the quarter.\n\n| A | B |\n|---|---|\n| 1 | 2 |\n";

bool HasWarning(const OperationStatus& status, const std::string& text) {
    for (const auto& w : status.warnings) {
        if (w == text) return true;
    }
    return false;
}

void TestSinglePdfExport(const test::ScratchDir& dir) {
    std::cout << "[Test] Single PDF export..." << std::endl;
    Fixture fx(dir);

    std::vector<ExportStage> stages;
    std::vector<double> percentages;
    ExportRequest request;
    request.markdown = kReport;
    request.format = ExportFormat::Pdf;
    request.templateName = "business_report";
    request.outputName = "quarterly.PDF";
    request.progressCallback = [&](const OperationStatus& s) {
        stages.push_back(s.currentStage);
        percentages.push_back(s.progressPercentage);
    };

    ExportResult result = fx.orchestrator->exportDocument(request);
    assert(result.success);
    assert(!result.error);
    assert(result.message == "PDF export completed successfully");
    assert(result.outputPath && fs::path(*result.outputPath) == fs::path(fx.settings.outputDir) / "quarterly.pdf");
    assert(result.fileSize && *result.fileSize > 0);
    assert(FileUtils::ReadFile(*result.outputPath).value_or("").rfind("%PDF", 0) == 0);

    assert(!stages.empty());
    assert(stages.back() == ExportStage::Completed);
    assert(std::find(stages.begin(), stages.end(), ExportStage::ParsingMarkdown) != stages.end());
    assert(std::find(stages.begin(), stages.end(), ExportStage::GeneratingPdf) != stages.end());
    for (size_t i = 1; i < percentages.size(); ++i) assert(percentages[i] >= percentages[i - 1]);
    assert(percentages.back() == 100.0);

    auto status = fx.orchestrator->status(result.operationId);
    assert(status);
    assert(status->currentStage == ExportStage::Completed);
    assert(status->errors.empty());
    assert(status->lastMessages.back() == "PDF export completed successfully");

    nlohmann::json j = ToJson(result);
    assert(j["success"] == true);
    assert(j["operation_id"] == result.operationId);
    assert(j["error"].is_null());
    assert(j["file_size"].get<std::uintmax_t>() == *result.fileSize);
}

void TestTemplateErrors(const test::ScratchDir& dir) {
    std::cout << "[Test] Template resolution..." << std::endl;
    Fixture fx(dir);

    ExportRequest request;
    request.markdown = kReport;
    request.templateName = "nope";
    request.outputName = "missing_template";
    ExportResult result = fx.orchestrator->exportDocument(request);
    assert(!result.success);
    assert(result.error && *result.error == "Template 'nope' not found");
    assert(!fs::exists(fs::path(fx.settings.outputDir) / "missing_template.pdf"));
    auto status = fx.orchestrator->status(result.operationId);
    assert(status && status->currentStage == ExportStage::Failed);
    assert(status->errors.size() == 1);
    nlohmann::json j = ToJson(result);
    assert(j["output_path"].is_null());

    // A caller-supplied template wins over the name.
    request.customTemplate = TemplateRegistry::BaseTemplate();
    request.customTemplate->pdf.pageSize = "letter";
    ExportResult custom = fx.orchestrator->exportDocument(request);
    assert(custom.success);

    // An empty name selects the configured default.
    request.customTemplate.reset();
    request.templateName.clear();
    request.outputName.clear();
    request.format = ExportFormat::Word;
    ExportResult defaulted = fx.orchestrator->exportDocument(request);
    assert(defaulted.success);
    assert(defaulted.message == "Word export completed successfully");
    std::string stem = fs::path(*defaulted.outputPath).stem().string();
    assert(stem.rfind("export_", 0) == 0);
    assert(fs::path(*defaulted.outputPath).extension() == ".docx");
}

void TestDiagramsAndImages(const test::ScratchDir& dir) {
    std::cout << "[Test] Diagram conversion and image resolution..." << std::endl;
    auto diagrams = std::make_shared<FakeDiagramRenderer>(dir.file("scratch"), true);
    Fixture fx(dir, diagrams);

    const fs::path docDir = dir.path() / "doc";
    fs::create_directories(docDir / "images");
    assert(FileUtils::WriteFileAtomically((docDir / "images" / "chart.png").string(), test::MakePng(50, 25)));

    ExportRequest request;
    request.markdown =
        "# Architecture\n"
        "```mermaid\ngraph TD\n  A-->B\n```\n"
        "```mermaid\nfail here\n```\n"
        "![Chart](chart.png)\n"
        "![Gone](missing.png)\n"
        "![Web](https://example.com/x.png)\n";
    request.baseDirectory = docDir.string();
    request.outputName = "architecture";

    ExportResult result = fx.orchestrator->exportDocument(request);
    assert(result.success);
    assert(diagrams->calls == 2);
    assert(diagrams->produced.size() == 1);
    // Rendered diagram rasters are scratch files and are removed afterwards.
    assert(!fs::exists(diagrams->produced[0]));

    auto status = fx.orchestrator->status(result.operationId);
    assert(status);
    assert(HasWarning(*status, "Diagram diagram_2 could not be converted; rendered as source"));
    assert(HasWarning(*status, "Image not found: missing.png"));
    assert(HasWarning(*status, "Remote image not supported: https://example.com/x.png"));
    assert(status->warnings.size() == 3);
}

void TestUnavailableDiagramTool(const test::ScratchDir& dir) {
    std::cout << "[Test] Diagram tool unavailable..." << std::endl;
    auto diagrams = std::make_shared<FakeDiagramRenderer>(dir.file("scratch"), false);
    Fixture fx(dir, diagrams);

    ExportRequest request;
    request.markdown = "```mermaid\ngraph LR\n```\n\n```diagram\nsequenceDiagram\n```\n";
    request.outputName = "fallback";
    ExportResult result = fx.orchestrator->exportDocument(request);
    assert(result.success);
    assert(diagrams->calls == 0);
    auto status = fx.orchestrator->status(result.operationId);
    assert(status && HasWarning(*status, "Diagram renderer unavailable; 2 diagram(s) rendered as source"));

    // Without any diagram renderer the null renderer is used.
    Fixture none(dir);
    request.outputName = "fallback_null";
    assert(none.orchestrator->exportDocument(request).success);
}

void TestDualExport(const test::ScratchDir& dir) {
    std::cout << "[Test] Dual export..." << std::endl;
    {
        Fixture fx(dir);
        ExportRequest request;
        request.markdown = kReport;
        request.outputName = "both.docx";
        DualExportResult result = fx.orchestrator->exportBoth(request);
        assert(result.success);
        assert(!result.error);
        assert(result.message == "Both PDF and Word exports completed successfully");
        assert(result.pdfResult.success && result.wordResult.success);
        assert(fs::path(*result.pdfResult.outputPath).filename() == "both.pdf");
        assert(fs::path(*result.wordResult.outputPath).filename() == "both.docx");
        assert(result.pdfResult.operationId == result.operationId);

        nlohmann::json j = ToJson(result);
        assert(j["pdf_result"]["success"] == true);
        assert(j["word_result"]["output_path"].is_string());
        assert(j["error"].is_null());
    }
    {
        Fixture fx(dir, nullptr, std::make_shared<FailingRenderer>(ExportFormat::Word));
        ExportRequest request;
        request.markdown = kReport;
        request.outputName = "partial";
        DualExportResult result = fx.orchestrator->exportBoth(request);
        assert(!result.success);
        assert(result.message == "Dual export completed with errors");
        assert(result.pdfResult.success);
        assert(fs::exists(*result.pdfResult.outputPath));
        assert(!result.wordResult.success);
        assert(*result.wordResult.error == "Failed to generate Word document");
        assert(result.error && *result.error == "Word: Failed to generate Word document");

        auto status = fx.orchestrator->status(result.operationId);
        assert(status && status->currentStage == ExportStage::Failed);

        request.templateName = "nope";
        DualExportResult missing = fx.orchestrator->exportBoth(request);
        assert(!missing.success);
        assert(*missing.error == "PDF: Template 'nope' not found; Word: Template 'nope' not found");
    }
}

void TestAsyncAndCancel(const test::ScratchDir& dir) {
    std::cout << "[Test] Background export and cancellation..." << std::endl;
    auto diagrams = std::make_shared<FakeDiagramRenderer>(dir.file("scratch"), true);
    diagrams->block();
    Fixture fx(dir, diagrams);

    ExportRequest request;
    request.markdown = "# Held\n```mermaid\ngraph TD\n```\n";
    request.outputName = "held";
    auto pending = fx.orchestrator->startExport(request);
    assert(!pending.operationId.empty());

    auto status = fx.orchestrator->status(pending.operationId);
    assert(status);
    assert(!IsTerminal(status->currentStage));

    assert(fx.orchestrator->cancel(pending.operationId));
    assert(!fx.orchestrator->cancel("no-such-operation"));
    diagrams->release();

    // Cancellation is advisory: the export still runs to completion.
    ExportResult result = pending.result.get();
    assert(result.success);
    assert(result.operationId == pending.operationId);
    status = fx.orchestrator->status(pending.operationId);
    assert(status && status->cancelled);
    assert(status->currentStage == ExportStage::Completed);
    nlohmann::json j = ToJson(*status);
    assert(j["cancelled"] == true);

    auto dual = fx.orchestrator->startDualExport(request);
    DualExportResult dualResult = dual.result.get();
    assert(dualResult.success);
    assert(dualResult.operationId == dual.operationId);
    assert(!fx.orchestrator->status("unknown"));
}

void TestSampleDocumentBothFormats(const test::ScratchDir& dir) {
    std::cout << "[Test] Sample document through both renderers..." << std::endl;
    Fixture fx(dir);
    ExportRequest request;
    request.markdown = "# Title\n\nSome **bold** text.\n\n| A | B |\n|---|---|\n| 1 | 2 |\n";
    request.outputName = "sample";

    DualExportResult result = fx.orchestrator->exportBoth(request);
    assert(result.success);
    for (const ExportResult* single : {&result.pdfResult, &result.wordResult}) {
        assert(single->success);
        assert(single->outputPath);
        assert(fs::file_size(*single->outputPath) > 0);
        assert(single->fileSize && *single->fileSize == fs::file_size(*single->outputPath));
    }
}

void TestWordOnlyProgress(const test::ScratchDir& dir) {
    std::cout << "[Test] Word-only export progress bands..." << std::endl;
    Fixture fx(dir);
    std::vector<std::pair<ExportStage, double>> updates;
    ExportRequest request;
    request.markdown = kReport;
    request.format = ExportFormat::Word;
    request.outputName = "word_progress";
    request.progressCallback = [&](const OperationStatus& s) {
        updates.emplace_back(s.currentStage, s.progressPercentage);
    };
    assert(fx.orchestrator->exportDocument(request).success);

    bool sawWord = false;
    for (const auto& update : updates) {
        assert(update.first != ExportStage::GeneratingPdf);
        if (update.first == ExportStage::GeneratingWord && !sawWord) {
            sawWord = true;
            // The unused PDF band is not counted as done.
            assert(update.second == 45.0);
        }
    }
    assert(sawWord);
}

void TestCallbackThrowingNonException(const test::ScratchDir& dir) {
    std::cout << "[Test] Throwing progress callback does not escape..." << std::endl;
    Fixture fx(dir);
    ExportRequest request;
    request.markdown = kReport;
    request.outputName = "throwing_callback";
    request.progressCallback = [](const OperationStatus&) { throw "listener"; };
    ExportResult result = fx.orchestrator->exportDocument(request);
    assert(result.success);

    auto pending = fx.orchestrator->startExport(request);
    assert(pending.result.get().success);
}

void TestBackgroundThreadsReaped(const test::ScratchDir& dir) {
    std::cout << "[Test] Finished background exports are reaped..." << std::endl;
    Fixture fx(dir);
    ExportRequest request;
    request.markdown = kReport;
    request.format = ExportFormat::Word;

    for (int round = 0; round < 3; ++round) {
        std::vector<std::future<ExportResult>> results;
        for (int i = 0; i < 4; ++i) {
            request.outputName = "bg_" + std::to_string(round) + "_" + std::to_string(i);
            results.push_back(fx.orchestrator->startExport(request).result);
        }
        for (auto& r : results) assert(r.get().success);

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (fx.orchestrator->activeBackgroundTasks() > 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        assert(fx.orchestrator->activeBackgroundTasks() == 0);
    }

    // A new launch also prunes what has finished, so the list never exceeds the live work.
    request.outputName = "bg_last";
    auto last = fx.orchestrator->startExport(request);
    assert(fx.orchestrator->activeBackgroundTasks() <= 1);
    assert(last.result.get().success);
}

void TestNaming() {
    std::cout << "[Test] Output naming..." << std::endl;
    assert(ExportOrchestrator::StripExtension("report.pdf", ExportFormat::Pdf) == "report");
    assert(ExportOrchestrator::StripExtension("report.PDF", ExportFormat::Pdf) == "report");
    assert(ExportOrchestrator::StripExtension("report.docx", ExportFormat::Pdf) == "report.docx");
    assert(ExportOrchestrator::StripExtension("report.docx", ExportFormat::Word) == "report");
    assert(ExportOrchestrator::StripExtension(".pdf", ExportFormat::Pdf) == ".pdf");

    std::string name = ExportOrchestrator::TimestampedName();
    assert(name.size() == std::string("export_20240101_120000").size());
    assert(name.rfind("export_", 0) == 0);
    assert(name[15] == '_');
}

} // namespace

int main() {
    std::cout << "[Test] Starting ExportOrchestrator Test..." << std::endl;

    test::ScratchDir dir("docforge_export");
    TestSinglePdfExport(dir);
    TestTemplateErrors(dir);
    TestDiagramsAndImages(dir);
    TestUnavailableDiagramTool(dir);
    TestDualExport(dir);
    TestAsyncAndCancel(dir);
    TestSampleDocumentBothFormats(dir);
    TestWordOnlyProgress(dir);
    TestCallbackThrowingNonException(dir);
    TestBackgroundThreadsReaped(dir);
    TestNaming();

    std::cout << "[PASS] ExportOrchestrator Test Passed." << std::endl;
    return 0;
}
