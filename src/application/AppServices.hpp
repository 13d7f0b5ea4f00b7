/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/BlockingExecutor.hpp"
#include "application/ExportOrchestrator.hpp"
#include "application/OperationRegistry.hpp"
#include "application/TemplateRegistry.hpp"
#include "domain/DiagramRenderer.hpp"
#include "domain/ITemplateRepository.hpp"
#include "infrastructure/ExportSettings.hpp"

namespace docforge::application {

struct AppServices {
    infrastructure::ExportSettings settings;
    std::shared_ptr<domain::ITemplateRepository> templateRepository;
    std::shared_ptr<TemplateRegistry> templateRegistry;
    std::shared_ptr<domain::DiagramRenderer> diagramRenderer;
    std::shared_ptr<OperationRegistry> operationRegistry;
    std::shared_ptr<BlockingExecutor> blockingExecutor;
    std::unique_ptr<ExportOrchestrator> exportOrchestrator;
};

/**
 * @brief Wires the concrete services for the given settings.
 * Diagrams use the Mermaid CLI when enabled, otherwise the null renderer.
 */
std::unique_ptr<AppServices> CreateAppServices(const infrastructure::ExportSettings& settings);

} // namespace docforge::application
