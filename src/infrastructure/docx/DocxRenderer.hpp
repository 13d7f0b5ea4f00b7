/**
 * @file DocxRenderer.hpp
 * @brief Flow-document renderer producing a WordprocessingML (.docx) package.
 */

#pragma once

#include "domain/DocumentRenderer.hpp"

#include <functional>
#include <string>

namespace tinyxml2 {
class XMLElement;
}

namespace docforge::infrastructure::docx {

class DocxRenderer : public domain::DocumentRenderer {
public:
    explicit DocxRenderer(std::string footerText);

    domain::ExportFormat format() const override { return domain::ExportFormat::Word; }

    bool render(const std::vector<domain::MarkdownElement>& elements,
                const domain::TemplateConfig& templateConfig,
                const domain::DocumentAssets& assets,
                const std::string& outputPath,
                const domain::RenderHooks& hooks = {}) override;

    /** @brief Style identifier for a display name ("Heading 1" -> "Heading1"). */
    static std::string StyleId(const std::string& styleName);

    /** @brief Normalizes "#rgb" / "#rrggbb" to "RRGGBB"; empty for anything else. */
    static std::string HexColor(const std::string& color);

    /**
     * @brief Runs build against a detached element of the same name, then moves what it
     * produced to the end of parent. If build throws, parent is left untouched and the
     * exception propagates.
     */
    static void AppendTransactionally(tinyxml2::XMLElement* parent,
                                      const std::function<void(tinyxml2::XMLElement*)>& build);

private:
    std::string m_footerText;
};

} // namespace docforge::infrastructure::docx
