/**
 * @file PdfRenderer.hpp
 * @brief Print-layout renderer: flows the element sequence onto fixed-size PDF pages.
 */

#pragma once

#include "domain/DocumentRenderer.hpp"
#include "infrastructure/pdf/PdfDocument.hpp"

#include <optional>
#include <string>
#include <utility>

namespace docforge::infrastructure::pdf {

class PdfRenderer : public domain::DocumentRenderer {
public:
    explicit PdfRenderer(std::string footerText, bool compressStreams = true);

    domain::ExportFormat format() const override { return domain::ExportFormat::Pdf; }

    bool render(const std::vector<domain::MarkdownElement>& elements,
                const domain::TemplateConfig& templateConfig,
                const domain::DocumentAssets& assets,
                const std::string& outputPath,
                const domain::RenderHooks& hooks = {}) override;

    /** @brief Page size in points for "A4" or "letter" (case-insensitive); unknown names give A4. */
    static std::pair<double, double> PageSize(const std::string& name);

    /** @brief Reads a PNG or JPEG file into an embeddable image. */
    static std::optional<PdfImage> LoadImage(const std::string& path);

private:
    std::string m_footerText;
    bool m_compressStreams;
};

} // namespace docforge::infrastructure::pdf
