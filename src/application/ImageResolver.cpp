#include "application/ImageResolver.hpp"

#include <filesystem>

namespace docforge::application {

namespace fs = std::filesystem;

namespace {
    bool IsFile(const fs::path& path) {
        std::error_code ec;
        return fs::is_regular_file(path, ec);
    }
}

ImageResolver::ImageResolver(std::vector<std::string> searchRoots) {
    for (auto& root : searchRoots) {
        if (!root.empty()) m_searchRoots.push_back(std::move(root));
    }
}

bool ImageResolver::IsRemote(const std::string& url) {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

std::optional<std::string> ImageResolver::resolve(const std::string& url) const {
    if (url.empty() || IsRemote(url)) {
        return std::nullopt;
    }

    std::string relative = url;
    if (relative.rfind("file://", 0) == 0) relative.erase(0, 7);
    fs::path candidate(relative);
    if (candidate.is_absolute()) {
        if (IsFile(candidate)) return candidate.string();
        return std::nullopt;
    }

    while (relative.rfind("./", 0) == 0) relative.erase(0, 2);
    for (const auto& root : m_searchRoots) {
        for (const fs::path& path : {fs::path(root) / relative, fs::path(root) / "images" / relative}) {
            if (IsFile(path)) {
                return path.lexically_normal().string();
            }
        }
    }
    return std::nullopt;
}

} // namespace docforge::application
