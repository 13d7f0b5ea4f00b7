#include "application/AppServices.hpp"
#include "infrastructure/MermaidCliRenderer.hpp"
#include "infrastructure/TemplateRepositoryFs.hpp"
#include "infrastructure/docx/DocxRenderer.hpp"
#include "infrastructure/pdf/PdfRenderer.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace docforge::application {

std::unique_ptr<AppServices> CreateAppServices(const infrastructure::ExportSettings& settings) {
    auto services = std::make_unique<AppServices>();
    services->settings = settings;

    services->templateRepository = std::make_shared<infrastructure::TemplateRepositoryFs>(settings.templatesDir);
    services->templateRegistry = std::make_shared<TemplateRegistry>(services->templateRepository);

    if (settings.diagrams.enabled) {
        services->diagramRenderer =
            std::make_shared<infrastructure::MermaidCliRenderer>(settings.diagrams, settings.scratchDir);
    } else {
        std::cout << "[AppServices] Diagram rendering disabled by configuration" << std::endl;
        services->diagramRenderer = std::make_shared<domain::NullDiagramRenderer>();
    }

    services->operationRegistry = std::make_shared<OperationRegistry>(
        std::chrono::seconds(std::max(0, settings.trackerCleanupSeconds)), settings.maxTrackedMessages);
    services->blockingExecutor = std::make_shared<BlockingExecutor>(
        static_cast<std::size_t>(std::max(1, settings.diagramWorkers)));

    std::vector<std::shared_ptr<domain::DocumentRenderer>> renderers{
        std::make_shared<infrastructure::pdf::PdfRenderer>(settings.footerText, settings.compressStreams),
        std::make_shared<infrastructure::docx::DocxRenderer>(settings.footerText)
    };

    services->exportOrchestrator = std::make_unique<ExportOrchestrator>(
        settings,
        services->templateRegistry,
        services->diagramRenderer,
        services->operationRegistry,
        services->blockingExecutor,
        std::move(renderers));
    return services;
}

} // namespace docforge::application
