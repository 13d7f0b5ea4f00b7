/**
 * @file FileUtils.hpp
 * @brief Atomic writes and whole-file reads used by the renderers and repositories.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace docforge::infrastructure {

class FileUtils {
public:
    /**
     * @brief Writes content to a temp file beside the target, then renames it into place.
     * Creates missing parent directories.
     * @return false on any I/O failure; the target is left untouched.
     */
    static bool WriteFileAtomically(const std::string& path, const std::string& content);

    /** @brief Reads a file in binary mode. */
    static std::optional<std::string> ReadFile(const std::string& path);

    /** @brief Random alphanumeric token for unique file names and identifiers. */
    static std::string RandomToken(std::size_t length = 12);
};

} // namespace docforge::infrastructure
