/**
 * @file ImageResolver.hpp
 * @brief Maps markdown image URLs to local files.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace docforge::application {

/**
 * @class ImageResolver
 * @brief Absolute paths are used as-is; relative ones are probed under each search
 * root, first directly and then under an "images/" subdirectory. Remote URLs never resolve.
 */
class ImageResolver {
public:
    explicit ImageResolver(std::vector<std::string> searchRoots);

    std::optional<std::string> resolve(const std::string& url) const;

    const std::vector<std::string>& searchRoots() const { return m_searchRoots; }

    static bool IsRemote(const std::string& url);

private:
    std::vector<std::string> m_searchRoots;
};

} // namespace docforge::application
