/**
 * @file ExportOrchestrator.cpp
 * @brief Implementation of ExportOrchestrator.
 */

#include "application/ExportOrchestrator.hpp"
#include "application/ImageResolver.hpp"
#include "domain/MarkdownParser.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <variant>

namespace docforge::application {

using namespace docforge::domain;
namespace fs = std::filesystem;

namespace {

std::string FormatLabel(ExportFormat format) {
    return format == ExportFormat::Pdf ? "PDF" : "Word";
}

ExportResult Failure(const std::string& operationId, const std::string& error) {
    ExportResult result;
    result.operationId = operationId;
    result.success = false;
    result.error = error;
    result.message = "Export failed";
    return result;
}

} // namespace

ExportOrchestrator::ExportOrchestrator(infrastructure::ExportSettings settings,
                                       std::shared_ptr<TemplateRegistry> templates,
                                       std::shared_ptr<DiagramRenderer> diagrams,
                                       std::shared_ptr<OperationRegistry> operations,
                                       std::shared_ptr<BlockingExecutor> executor,
                                       std::vector<std::shared_ptr<DocumentRenderer>> renderers)
    : m_settings(std::move(settings)),
      m_templates(std::move(templates)),
      m_diagrams(diagrams ? std::move(diagrams) : std::make_shared<NullDiagramRenderer>()),
      m_operations(std::move(operations)),
      m_executor(std::move(executor)) {
    for (auto& renderer : renderers) {
        if (renderer) {
            ExportFormat format = renderer->format();
            m_renderers[format] = std::move(renderer);
        }
    }
}

ExportOrchestrator::~ExportOrchestrator() {
    std::vector<BackgroundTask> tasks;
    {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        tasks.swap(m_tasks);
    }
    for (auto& task : tasks) {
        if (task.thread.joinable()) task.thread.join();
    }
}

ExportResult ExportOrchestrator::exportDocument(const ExportRequest& request) {
    return runSingle(m_operations->create(), request);
}

DualExportResult ExportOrchestrator::exportBoth(const ExportRequest& request) {
    return runDual(m_operations->create(), request);
}

PendingExport<ExportResult> ExportOrchestrator::startExport(ExportRequest request) {
    auto tracker = m_operations->create();
    auto promise = std::make_shared<std::promise<ExportResult>>();
    PendingExport<ExportResult> pending{tracker->operationId(), promise->get_future()};
    launch([this, tracker, promise, request = std::move(request)]() {
        promise->set_value(runSingle(tracker, request));
    });
    return pending;
}

PendingExport<DualExportResult> ExportOrchestrator::startDualExport(ExportRequest request) {
    auto tracker = m_operations->create();
    auto promise = std::make_shared<std::promise<DualExportResult>>();
    PendingExport<DualExportResult> pending{tracker->operationId(), promise->get_future()};
    launch([this, tracker, promise, request = std::move(request)]() {
        promise->set_value(runDual(tracker, request));
    });
    return pending;
}

void ExportOrchestrator::launch(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(m_tasksMutex);
    reapFinishedLocked();
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([task = std::move(task), done]() {
        task();
        done->store(true);
    });
    m_tasks.push_back(BackgroundTask{std::move(thread), std::move(done)});
}

void ExportOrchestrator::reapFinishedLocked() {
    auto finished = std::partition(m_tasks.begin(), m_tasks.end(),
                                   [](const BackgroundTask& t) { return !t.done->load(); });
    for (auto it = finished; it != m_tasks.end(); ++it) {
        if (it->thread.joinable()) it->thread.join();
    }
    m_tasks.erase(finished, m_tasks.end());
}

std::size_t ExportOrchestrator::activeBackgroundTasks() {
    std::lock_guard<std::mutex> lock(m_tasksMutex);
    reapFinishedLocked();
    return m_tasks.size();
}

std::optional<OperationStatus> ExportOrchestrator::status(const std::string& operationId) const {
    auto tracker = m_operations->find(operationId);
    if (!tracker) return std::nullopt;
    return tracker->status();
}

bool ExportOrchestrator::cancel(const std::string& operationId) {
    auto tracker = m_operations->find(operationId);
    if (!tracker) return false;
    tracker->cancel();
    std::cout << "[ExportOrchestrator] Cancel requested for " << operationId << std::endl;
    return true;
}

std::string ExportOrchestrator::TimestampedName() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    std::ostringstream out;
    out << "export_" << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return out.str();
}

std::string ExportOrchestrator::StripExtension(const std::string& name, ExportFormat format) {
    const std::string ext = FormatExtension(format);
    if (name.size() <= ext.size()) return name;
    std::string tail = name.substr(name.size() - ext.size());
    std::transform(tail.begin(), tail.end(), tail.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return tail == ext ? name.substr(0, name.size() - ext.size()) : name;
}

std::string ExportOrchestrator::outputPathFor(const std::string& baseName, ExportFormat format) const {
    return (fs::path(m_settings.outputDir) / (baseName + FormatExtension(format))).string();
}

std::shared_ptr<DocumentRenderer> ExportOrchestrator::rendererFor(ExportFormat format) const {
    auto it = m_renderers.find(format);
    return it == m_renderers.end() ? nullptr : it->second;
}

std::optional<TemplateConfig> ExportOrchestrator::resolveTemplate(const ExportRequest& request,
                                                                  std::string& error) const {
    if (request.customTemplate) {
        TemplateConfig config = *request.customTemplate;
        if (config.name.empty()) config.name = "custom";
        return config;
    }
    const std::string name = request.templateName.empty() ? m_settings.defaultTemplate : request.templateName;
    auto config = m_templates->get(name);
    if (!config) {
        error = "Template '" + name + "' not found";
    }
    return config;
}

ExportOrchestrator::PreparedDocument ExportOrchestrator::prepare(ProgressTracker& tracker,
                                                                 const ExportRequest& request) {
    PreparedDocument doc;
    tracker.updateProgress(ExportStage::ParsingMarkdown, 0.0, "Parsing markdown");
    doc.elements = MarkdownParser::Parse(request.markdown);
    tracker.updateProgress(ExportStage::ParsingMarkdown, 100.0,
                           "Parsed " + std::to_string(doc.elements.size()) + " elements");

    convertDiagrams(tracker, doc);
    resolveImages(tracker, request, doc);
    return doc;
}

void ExportOrchestrator::convertDiagrams(ProgressTracker& tracker, PreparedDocument& doc) {
    std::vector<std::pair<std::string, std::string>> blocks; // id, source
    for (const auto& element : doc.elements) {
        if (const auto* diagram = std::get_if<DiagramBlock>(&element)) {
            blocks.emplace_back(DiagramId(static_cast<int>(blocks.size()) + 1), diagram->source);
        }
    }

    if (blocks.empty()) {
        tracker.updateProgress(ExportStage::ConvertingDiagrams, 100.0, "No diagrams to convert");
        return;
    }
    tracker.updateProgress(ExportStage::ConvertingDiagrams, 0.0,
                           "Converting " + std::to_string(blocks.size()) + " diagrams");

    if (!m_diagrams->isAvailable()) {
        tracker.addWarning("Diagram renderer unavailable; " + std::to_string(blocks.size()) +
                           " diagram(s) rendered as source");
        tracker.updateProgress(ExportStage::ConvertingDiagrams, 100.0, "Diagram conversion skipped");
        return;
    }

    DiagramRenderer::RenderOptions options;
    options.width = m_settings.diagrams.width;
    options.height = m_settings.diagrams.height;
    options.theme = m_settings.diagrams.theme;

    std::vector<std::future<std::optional<std::string>>> futures;
    futures.reserve(blocks.size());
    for (const auto& block : blocks) {
        auto renderer = m_diagrams;
        auto id = block.first;
        auto source = block.second;
        try {
            futures.push_back(m_executor->submit([renderer, id, source, options]() {
                return renderer->render(source, id, options);
            }));
        } catch (const std::exception& e) {
            std::cerr << "[ExportOrchestrator] Could not queue " << id << ": " << e.what() << std::endl;
            std::promise<std::optional<std::string>> failed;
            failed.set_value(std::nullopt);
            futures.push_back(failed.get_future());
        }
    }

    for (std::size_t i = 0; i < blocks.size(); ++i) {
        const std::string& id = blocks[i].first;
        std::optional<std::string> path;
        try {
            path = futures[i].get();
        } catch (const std::exception& e) {
            std::cerr << "[ExportOrchestrator] Diagram " << id << " threw: " << e.what() << std::endl;
        }

        if (path) {
            doc.assets.diagrams[id] = *path;
        } else {
            tracker.addWarning("Diagram " + id + " could not be converted; rendered as source");
        }
        tracker.updateProgress(ExportStage::ConvertingDiagrams,
                               100.0 * static_cast<double>(i + 1) / static_cast<double>(blocks.size()),
                               "Converted diagram " + std::to_string(i + 1) + "/" + std::to_string(blocks.size()));
    }
}

void ExportOrchestrator::resolveImages(ProgressTracker& tracker, const ExportRequest& request,
                                       PreparedDocument& doc) {
    std::vector<std::string> roots{request.baseDirectory, m_settings.outputDir};
    roots.insert(roots.end(), m_settings.imageSearchPaths.begin(), m_settings.imageSearchPaths.end());
    ImageResolver resolver(std::move(roots));

    std::size_t total = 0;
    for (const auto& element : doc.elements) {
        if (std::holds_alternative<Image>(element)) ++total;
    }
    tracker.updateProgress(ExportStage::ProcessingImages, 0.0,
                           "Processing " + std::to_string(total) + " images");

    std::size_t processed = 0;
    for (const auto& element : doc.elements) {
        const auto* image = std::get_if<Image>(&element);
        if (!image) continue;
        ++processed;
        if (doc.assets.images.count(image->url) == 0) {
            if (ImageResolver::IsRemote(image->url)) {
                tracker.addWarning("Remote image not supported: " + image->url);
            } else if (auto path = resolver.resolve(image->url)) {
                doc.assets.images[image->url] = *path;
            } else {
                tracker.addWarning("Image not found: " + image->url);
            }
        }
        tracker.updateProgress(ExportStage::ProcessingImages,
                               100.0 * static_cast<double>(processed) / static_cast<double>(total));
    }

    doc.elements.erase(std::remove_if(doc.elements.begin(), doc.elements.end(),
                                      [&doc](const MarkdownElement& element) {
                                          const auto* image = std::get_if<Image>(&element);
                                          return image && doc.assets.images.count(image->url) == 0;
                                      }),
                       doc.elements.end());
    tracker.updateProgress(ExportStage::ProcessingImages, 100.0,
                           "Resolved " + std::to_string(doc.assets.images.size()) + " images");
}

ExportResult ExportOrchestrator::renderFormat(ProgressTracker& tracker, ExportFormat format,
                                              const PreparedDocument& doc, const TemplateConfig& config,
                                              const std::string& outputPath) {
    const std::string label = FormatLabel(format);
    const ExportStage stage = GeneratingStageFor(format);

    auto renderer = rendererFor(format);
    if (!renderer) {
        return Failure(tracker.operationId(), "No " + label + " renderer configured");
    }

    tracker.updateProgress(stage, 0.0, "Generating " + label + " document");
    RenderHooks hooks;
    hooks.onProgress = [&tracker, stage](double percent, const std::string& message) {
        tracker.updateProgress(stage, percent, message);
    };
    hooks.onElementError = [&tracker](const std::string& message) {
        tracker.addError(message);
    };

    if (!renderer->render(doc.elements, config, doc.assets, outputPath, hooks)) {
        return Failure(tracker.operationId(), "Failed to generate " + label + " document");
    }
    tracker.updateProgress(stage, 100.0, label + " document generated");

    ExportResult result;
    result.operationId = tracker.operationId();
    result.success = true;
    result.outputPath = outputPath;
    std::error_code ec;
    auto size = fs::file_size(outputPath, ec);
    if (!ec) result.fileSize = size;
    result.message = label + " export completed successfully";
    return result;
}

void ExportOrchestrator::finalize(ProgressTracker& tracker, const PreparedDocument& doc) {
    tracker.updateProgress(ExportStage::Finalizing, 0.0, "Finalizing");
    for (const auto& entry : doc.assets.diagrams) {
        std::error_code ec;
        fs::remove(entry.second, ec);
        if (ec) {
            std::cerr << "[ExportOrchestrator] Could not remove " << entry.second << ": " << ec.message() << std::endl;
        }
    }
    tracker.updateProgress(ExportStage::Finalizing, 100.0, "Temporary files cleaned up");
}

ExportResult ExportOrchestrator::runSingle(const std::shared_ptr<ProgressTracker>& tracker,
                                           const ExportRequest& request) {
    const std::string id = tracker->operationId();
    if (request.progressCallback) tracker->addCallback(request.progressCallback);

    tracker->skipStage(GeneratingStageFor(request.format == ExportFormat::Pdf ? ExportFormat::Word : ExportFormat::Pdf));

    ExportResult result;
    PreparedDocument doc;
    try {
        tracker->updateProgress(ExportStage::Initializing, 0.0,
                                "Starting " + FormatLabel(request.format) + " export");
        std::string error;
        auto config = resolveTemplate(request, error);
        if (!config) {
            result = Failure(id, error);
        } else {
            tracker->updateProgress(ExportStage::Initializing, 100.0, "Using template " + config->name);
            doc = prepare(*tracker, request);

            const std::string base = request.outputName.empty()
                ? TimestampedName() : StripExtension(request.outputName, request.format);
            result = renderFormat(*tracker, request.format, doc, *config, outputPathFor(base, request.format));
            finalize(*tracker, doc);
        }
    } catch (const std::exception& e) {
        result = Failure(id, e.what());
    } catch (...) {
        result = Failure(id, "Unknown error during export");
    }

    if (!result.success) {
        tracker->addError(result.error.value_or("Export failed"));
        std::cerr << "[ExportOrchestrator] " << id << " failed: " << result.error.value_or("") << std::endl;
        for (const auto& entry : doc.assets.diagrams) {
            std::error_code ec;
            fs::remove(entry.second, ec);
        }
    } else {
        std::cout << "[ExportOrchestrator] " << id << " wrote " << *result.outputPath << std::endl;
    }
    tracker->complete(result.success, result.success ? result.message : result.error.value_or(""));
    m_operations->scheduleRemoval(id);
    return result;
}

DualExportResult ExportOrchestrator::runDual(const std::shared_ptr<ProgressTracker>& tracker,
                                             const ExportRequest& request) {
    const std::string id = tracker->operationId();
    if (request.progressCallback) tracker->addCallback(request.progressCallback);

    DualExportResult dual;
    dual.operationId = id;
    PreparedDocument doc;
    try {
        tracker->updateProgress(ExportStage::Initializing, 0.0, "Starting dual export");
        std::string error;
        auto config = resolveTemplate(request, error);
        if (!config) {
            dual.pdfResult = Failure(id, error);
            dual.wordResult = Failure(id, error);
        } else {
            tracker->updateProgress(ExportStage::Initializing, 100.0, "Using template " + config->name);
            doc = prepare(*tracker, request);

            std::string base = request.outputName.empty() ? TimestampedName()
                : StripExtension(StripExtension(request.outputName, ExportFormat::Pdf), ExportFormat::Word);
            dual.pdfResult = renderFormat(*tracker, ExportFormat::Pdf, doc, *config,
                                          outputPathFor(base, ExportFormat::Pdf));
            dual.wordResult = renderFormat(*tracker, ExportFormat::Word, doc, *config,
                                           outputPathFor(base, ExportFormat::Word));
            finalize(*tracker, doc);
        }
    } catch (const std::exception& e) {
        if (!dual.pdfResult.success) dual.pdfResult = Failure(id, e.what());
        dual.wordResult = Failure(id, e.what());
    } catch (...) {
        if (!dual.pdfResult.success) dual.pdfResult = Failure(id, "Unknown error during export");
        dual.wordResult = Failure(id, "Unknown error during export");
    }

    dual.success = dual.pdfResult.success && dual.wordResult.success;
    std::string errors;
    if (!dual.pdfResult.success) {
        errors = "PDF: " + dual.pdfResult.error.value_or("unknown error");
    }
    if (!dual.wordResult.success) {
        if (!errors.empty()) errors += "; ";
        errors += "Word: " + dual.wordResult.error.value_or("unknown error");
    }
    if (dual.success) {
        dual.message = "Both PDF and Word exports completed successfully";
        std::cout << "[ExportOrchestrator] " << id << " dual export completed" << std::endl;
    } else {
        dual.error = errors;
        dual.message = "Dual export completed with errors";
        tracker->addError(errors);
        std::cerr << "[ExportOrchestrator] " << id << " dual export failed: " << errors << std::endl;
        for (const auto& entry : doc.assets.diagrams) {
            std::error_code ec;
            fs::remove(entry.second, ec);
        }
    }
    tracker->complete(dual.success, dual.message);
    m_operations->scheduleRemoval(id);
    return dual;
}

} // namespace docforge::application
