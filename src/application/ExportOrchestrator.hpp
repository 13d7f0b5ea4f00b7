/**
 * @file ExportOrchestrator.hpp
 * @brief Drives one export from markdown text to a written file, reporting progress.
 */

#pragma once

#include "application/BlockingExecutor.hpp"
#include "application/ExportResult.hpp"
#include "application/OperationRegistry.hpp"
#include "application/ProgressTracker.hpp"
#include "application/TemplateRegistry.hpp"
#include "domain/DiagramRenderer.hpp"
#include "domain/DocumentRenderer.hpp"
#include "infrastructure/ExportSettings.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace docforge::application {

/**
 * @struct ExportRequest
 * @brief Inputs of one export call.
 */
struct ExportRequest {
    std::string markdown;
    domain::ExportFormat format = domain::ExportFormat::Pdf;
    std::string templateName;                             ///< Empty selects the configured default.
    std::optional<domain::TemplateConfig> customTemplate; ///< Takes precedence over templateName.
    std::string outputName;                               ///< Empty selects export_YYYYmmdd_HHMMSS.
    std::string baseDirectory;                            ///< First root for relative image URLs.
    ProgressTracker::Callback progressCallback;
};

template<typename T>
struct PendingExport {
    std::string operationId;
    std::future<T> result;
};

/**
 * @class ExportOrchestrator
 * @brief Sequences parse, diagram conversion, image resolution and rendering for one
 * operation. No exception escapes an export call; failures come back as result data.
 */
class ExportOrchestrator {
public:
    ExportOrchestrator(infrastructure::ExportSettings settings,
                       std::shared_ptr<TemplateRegistry> templates,
                       std::shared_ptr<domain::DiagramRenderer> diagrams,
                       std::shared_ptr<OperationRegistry> operations,
                       std::shared_ptr<BlockingExecutor> executor,
                       std::vector<std::shared_ptr<domain::DocumentRenderer>> renderers);
    ~ExportOrchestrator();

    ExportOrchestrator(const ExportOrchestrator&) = delete;
    ExportOrchestrator& operator=(const ExportOrchestrator&) = delete;

    ExportResult exportDocument(const ExportRequest& request);

    /** @brief Parses and converts diagrams once, then renders PDF followed by Word. */
    DualExportResult exportBoth(const ExportRequest& request);

    /** @brief Runs exportDocument on its own thread. The id is usable immediately. */
    PendingExport<ExportResult> startExport(ExportRequest request);
    PendingExport<DualExportResult> startDualExport(ExportRequest request);

    std::optional<OperationStatus> status(const std::string& operationId) const;

    /** @brief Joins finished background exports and returns how many are still held. */
    std::size_t activeBackgroundTasks();

    /** @brief Marks the operation cancelled. Work already in flight runs to completion. */
    bool cancel(const std::string& operationId);

    TemplateRegistry& templates() { return *m_templates; }

    /** @brief "<outputDir>/<base><ext>" for a base name without extension. */
    std::string outputPathFor(const std::string& baseName, domain::ExportFormat format) const;

    /** @brief Strips a trailing extension matching the format, case-insensitively. */
    static std::string StripExtension(const std::string& name, domain::ExportFormat format);

    /** @brief export_YYYYmmdd_HHMMSS in local time. */
    static std::string TimestampedName();

private:
    struct PreparedDocument {
        std::vector<domain::MarkdownElement> elements;
        domain::DocumentAssets assets;
    };

    ExportResult runSingle(const std::shared_ptr<ProgressTracker>& tracker, const ExportRequest& request);
    DualExportResult runDual(const std::shared_ptr<ProgressTracker>& tracker, const ExportRequest& request);

    std::optional<domain::TemplateConfig> resolveTemplate(const ExportRequest& request, std::string& error) const;
    PreparedDocument prepare(ProgressTracker& tracker, const ExportRequest& request);
    void convertDiagrams(ProgressTracker& tracker, PreparedDocument& doc);
    void resolveImages(ProgressTracker& tracker, const ExportRequest& request, PreparedDocument& doc);
    ExportResult renderFormat(ProgressTracker& tracker, domain::ExportFormat format,
                              const PreparedDocument& doc, const domain::TemplateConfig& config,
                              const std::string& outputPath);
    void finalize(ProgressTracker& tracker, const PreparedDocument& doc);

    std::shared_ptr<domain::DocumentRenderer> rendererFor(domain::ExportFormat format) const;
    void launch(std::function<void()> task);
    void reapFinishedLocked();

    infrastructure::ExportSettings m_settings;
    std::shared_ptr<TemplateRegistry> m_templates;
    std::shared_ptr<domain::DiagramRenderer> m_diagrams;
    std::shared_ptr<OperationRegistry> m_operations;
    std::shared_ptr<BlockingExecutor> m_executor;
    std::map<domain::ExportFormat, std::shared_ptr<domain::DocumentRenderer>> m_renderers;

    struct BackgroundTask {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::mutex m_tasksMutex;
    std::vector<BackgroundTask> m_tasks;
};

} // namespace docforge::application
