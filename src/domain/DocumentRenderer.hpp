/**
 * @file DocumentRenderer.hpp
 * @brief Interface shared by the print-layout and flow-document renderers.
 */

#pragma once

#include "domain/DocumentAssets.hpp"
#include "domain/ExportStage.hpp"
#include "domain/MarkdownElement.hpp"
#include "domain/TemplateConfig.hpp"

#include <functional>
#include <string>
#include <vector>

namespace docforge::domain {

/**
 * @struct RenderHooks
 * @brief Optional observers for a render pass.
 */
struct RenderHooks {
    /** @brief Called after each element with the share of elements processed (0..100). */
    std::function<void(double percent, const std::string& message)> onProgress;

    /** @brief Called when one element fails to render; the pass continues. */
    std::function<void(const std::string& message)> onElementError;
};

/**
 * @class DocumentRenderer
 * @brief Walks an element sequence and writes one output file.
 */
class DocumentRenderer {
public:
    virtual ~DocumentRenderer() = default;

    virtual ExportFormat format() const = 0;

    /**
     * @brief Renders the document.
     * @param elements Parsed (and image-filtered) element sequence.
     * @param templateConfig Resolved style preset.
     * @param assets Rendered diagrams and resolved images.
     * @param outputPath Destination file.
     * @param hooks Progress and per-element error observers.
     * @return false only when the output container could not be assembled or written.
     */
    virtual bool render(const std::vector<MarkdownElement>& elements,
                        const TemplateConfig& templateConfig,
                        const DocumentAssets& assets,
                        const std::string& outputPath,
                        const RenderHooks& hooks = {}) = 0;
};

} // namespace docforge::domain
