/**
 * @file DiagramRenderer.hpp
 * @brief Interface for diagram-source to raster conversion.
 */

#pragma once

#include <optional>
#include <string>

namespace docforge::domain {

/**
 * @class DiagramRenderer
 * @brief Abstract interface for services that turn one diagram block into an image file.
 *
 * A failed render is an expected outcome and is reported as std::nullopt; callers
 * fall back to showing the raw diagram source.
 */
class DiagramRenderer {
public:
    virtual ~DiagramRenderer() = default;

    struct RenderOptions {
        int width = 800;
        int height = 600;
        std::string theme = "default";
    };

    /**
     * @brief Renders a diagram synchronously.
     * @param source Diagram-language text.
     * @param id Caller-side identifier, used to name the output file.
     * @param options Raster size and theme.
     * @return Path to the produced image, or nullopt on any failure.
     */
    virtual std::optional<std::string> render(const std::string& source,
                                              const std::string& id,
                                              const RenderOptions& options) = 0;

    /** @brief True when the backing tool was reachable at construction. */
    virtual bool isAvailable() const = 0;
};

/**
 * @class NullDiagramRenderer
 * @brief No-op renderer used when diagram rendering is disabled. Every diagram falls back to its source.
 */
class NullDiagramRenderer : public DiagramRenderer {
public:
    std::optional<std::string> render(const std::string&, const std::string&, const RenderOptions&) override {
        return std::nullopt;
    }

    bool isAvailable() const override { return false; }
};

} // namespace docforge::domain
