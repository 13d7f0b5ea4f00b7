/**
 * @file DocxPackage.hpp
 * @brief OPC zip container for WordprocessingML parts.
 */

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace docforge::infrastructure::docx {

/**
 * @class DocxPackage
 * @brief Collects named parts in insertion order and zips them in memory.
 */
class DocxPackage {
public:
    /** @brief Adds or replaces a part. */
    void addPart(const std::string& name, std::string data);

    bool hasPart(const std::string& name) const;
    std::size_t partCount() const { return m_parts.size(); }

    /**
     * @brief Builds the archive bytes.
     * @return false with error set when the zip writer fails.
     */
    bool build(std::string& archive, std::string& error) const;

private:
    std::vector<std::pair<std::string, std::string>> m_parts;
};

} // namespace docforge::infrastructure::docx
