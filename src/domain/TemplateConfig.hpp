/**
 * @file TemplateConfig.hpp
 * @brief Named style presets consumed read-only by both format renderers.
 */

#pragma once

#include <string>
#include <vector>

namespace docforge::domain {

/**
 * @struct TextStyle
 * @brief Font and spacing attributes for one element kind in the print layout.
 */
struct TextStyle {
    std::string font = "Helvetica";
    double fontSize = 12.0;
    std::string color = "#2c3e50";
    std::string alignment = "left";  ///< "left", "center", "right" or "justify".
    double spaceBefore = 0.0;
    double spaceAfter = 12.0;
    double leading = 1.2;            ///< Line height as a multiple of fontSize.
    std::string background;          ///< Empty means no fill.
    std::string borderColor;         ///< Empty means no border.
    double leftIndent = 0.0;
};

struct TableStyle {
    std::string headerFont = "Helvetica-Bold";
    double headerFontSize = 9.0;
    std::string headerBackground = "#f8f9fa";
    std::string cellFont = "Helvetica";
    double cellFontSize = 8.0;
    std::string gridColor = "#dee2e6";
    std::string textColor = "#2c3e50";
    double padding = 4.0;
};

struct Margins {
    double top = 1.0;    ///< Inches.
    double bottom = 1.0;
    double left = 1.0;
    double right = 1.0;
};

/**
 * @struct PrintStyles
 * @brief Page geometry and per-element styles for the print-layout renderer.
 */
struct PrintStyles {
    std::string pageSize = "A4"; ///< "A4" or "letter".
    Margins margins;
    TextStyle title;
    TextStyle heading1;
    TextStyle heading2;
    TextStyle body;
    TextStyle code;
    TextStyle blockquote;
    TextStyle caption;
    TextStyle footer;
    std::string linkColor = "#3498db";
    std::string ruleColor = "#bdc3c7";
    TableStyle table;
};

/**
 * @struct FlowStyles
 * @brief Style names and base font for the flow-document renderer.
 */
struct FlowStyles {
    std::string titleStyle = "Title";
    std::string heading1Style = "Heading 1";
    std::string heading2Style = "Heading 2";
    std::string bodyStyle = "Normal";
    std::string listStyle = "List Bullet";
    std::string quoteStyle = "Quote";
    std::string codeStyle = "No Spacing";
    std::string tableStyle = "Table Grid";
    std::string fontFamily = "Calibri";
    double fontSize = 11.0;
    std::string codeFont = "Courier New";
};

struct TemplateMetadata {
    std::string author = "DocForge";
    std::string subject;
    std::vector<std::string> keywords;
};

/**
 * @struct TemplateConfig
 * @brief A complete template preset. Immutable after creation.
 */
struct TemplateConfig {
    std::string name;        ///< Registry key (file stem for custom presets).
    std::string displayName; ///< Human-readable title, stored as "name" in the record.
    std::string description;
    std::string category = "custom";
    PrintStyles pdf;
    FlowStyles word;
    TemplateMetadata metadata;
};

/**
 * @struct TemplateSummary
 * @brief Listing entry for a template.
 */
struct TemplateSummary {
    std::string name;
    std::string displayName;
    std::string description;
    std::string category;
    bool builtIn = false;
};

} // namespace docforge::domain
