#pragma once

#include "domain/DiagramRenderer.hpp"
#include "infrastructure/ExportSettings.hpp"
#include <optional>
#include <string>

namespace docforge::infrastructure {

/**
 * @class MermaidCliRenderer
 * @brief Renders Mermaid diagrams to PNG by invoking the mermaid CLI (mmdc) as a child process.
 *
 * The call blocks for the duration of the external process (bounded by the configured
 * timeout) and must be issued from a blocking-task executor, not from a UI or
 * orchestration thread that has other work to do.
 */
class MermaidCliRenderer : public domain::DiagramRenderer {
public:
    MermaidCliRenderer(DiagramSettings settings, std::string scratchDir);
    ~MermaidCliRenderer() override = default;

    std::optional<std::string> render(const std::string& source,
                                      const std::string& id,
                                      const RenderOptions& options) override;

    bool isAvailable() const override { return m_available; }

    /**
     * @brief Renders, then returns the PNG as base64. The intermediate file is deleted.
     */
    std::optional<std::string> renderBase64(const std::string& source,
                                            const std::string& id,
                                            const RenderOptions& options);

    /** @brief Same as renderBase64, prefixed as a data URI. */
    std::optional<std::string> renderDataUri(const std::string& source,
                                             const std::string& id,
                                             const RenderOptions& options);

    static bool HasTool(const std::string& tool);
    static std::string ShellQuote(const std::string& arg);
    static std::string Base64Encode(const std::string& bytes);

private:
    DiagramSettings m_settings;
    std::string m_scratchDir;
    bool m_available = false;
};

} // namespace docforge::infrastructure
