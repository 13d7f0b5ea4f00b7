/**
 * @file DocumentAssets.hpp
 * @brief Resolved files (rendered diagrams, local images) owned by one export operation.
 */

#pragma once

#include <map>
#include <optional>
#include <string>

namespace docforge::domain {

/**
 * @brief Builds the position-derived identifier of the n-th diagram block (1-based).
 */
inline std::string DiagramId(int position) {
    return "diagram_" + std::to_string(position);
}

/**
 * @struct DocumentAssets
 * @brief Lookup tables consulted by the renderers while walking the element sequence.
 */
struct DocumentAssets {
    std::map<std::string, std::string> diagrams; ///< diagram id -> rendered raster path
    std::map<std::string, std::string> images;   ///< markdown url -> local file path

    std::optional<std::string> diagramPath(const std::string& id) const {
        auto it = diagrams.find(id);
        if (it == diagrams.end()) return std::nullopt;
        return it->second;
    }

    std::optional<std::string> imagePath(const std::string& url) const {
        auto it = images.find(url);
        if (it == images.end()) return std::nullopt;
        return it->second;
    }
};

} // namespace docforge::domain
