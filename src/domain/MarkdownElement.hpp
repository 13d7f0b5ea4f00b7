/**
 * @file MarkdownElement.hpp
 * @brief Format-agnostic document model produced by the markdown parser.
 */

#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace docforge::domain {

struct Header {
    int level = 1;      ///< 1..6, equals the number of leading '#'.
    std::string text;
};

struct Paragraph {
    std::string text;
};

struct ListItem {
    int indent = 0;     ///< Leading whitespace count, used for nesting.
    std::string marker; ///< "-", "*", "+" or "N."
    std::string text;
};

struct ListBlock {
    std::vector<ListItem> items;
};

struct Table {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows; ///< Rows may be ragged.
};

struct CodeBlock {
    std::optional<std::string> language;
    std::string text;
};

struct DiagramBlock {
    std::string language;
    std::string source;
};

struct Image {
    std::string url;
    std::string alt;
};

struct Link {
    std::string url;
    std::string text;
};

struct Blockquote {
    std::string text;
};

struct HorizontalRule {};

struct PlainText {
    std::string text;
};

using MarkdownElement = std::variant<
    Header,
    Paragraph,
    ListBlock,
    Table,
    CodeBlock,
    DiagramBlock,
    Image,
    Link,
    Blockquote,
    HorizontalRule,
    PlainText>;

/**
 * @brief Helper to convert an element kind to string for logging.
 */
inline std::string ElementKindName(const MarkdownElement& element) {
    switch (element.index()) {
        case 0: return "Header";
        case 1: return "Paragraph";
        case 2: return "List";
        case 3: return "Table";
        case 4: return "CodeBlock";
        case 5: return "DiagramBlock";
        case 6: return "Image";
        case 7: return "Link";
        case 8: return "Blockquote";
        case 9: return "HorizontalRule";
        case 10: return "PlainText";
        default: return "Unknown";
    }
}

} // namespace docforge::domain
