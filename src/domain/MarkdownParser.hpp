#pragma once

#include "domain/MarkdownElement.hpp"
#include <string>
#include <vector>

namespace docforge::domain {

/**
 * @brief Line-oriented markdown parser producing the format-agnostic element sequence.
 * This service is stateless and never throws on malformed input; unmatched lines
 * degrade into Paragraph elements.
 */
class MarkdownParser {
public:
    /**
     * @brief Parses markdown text into an ordered sequence of elements.
     * @param text Raw UTF-8 markdown.
     * @return Elements in document order.
     */
    static std::vector<MarkdownElement> Parse(const std::string& text);

    /**
     * @brief Returns every image reference in the text, in order of appearance.
     */
    static std::vector<Image> ExtractImages(const std::string& text);

    /**
     * @brief Returns the source of every diagram block, in document order.
     */
    static std::vector<std::string> ExtractDiagramSources(const std::string& text);

    /**
     * @brief True for fence language tags that route to DiagramBlock.
     */
    static bool IsDiagramLanguage(const std::string& language);
};

} // namespace docforge::domain
