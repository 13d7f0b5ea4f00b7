/**
 * @file TemplateRepositoryFs.cpp
 * @brief Implementation of TemplateRepositoryFs.
 */

#include "infrastructure/TemplateRepositoryFs.hpp"
#include "infrastructure/FileUtils.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

namespace docforge::infrastructure {

using json = nlohmann::json;
using namespace docforge::domain;
namespace fs = std::filesystem;

namespace {
    json StyleToJson(const TextStyle& s) {
        return {
            {"font", s.font},
            {"font_size", s.fontSize},
            {"color", s.color},
            {"alignment", s.alignment},
            {"space_before", s.spaceBefore},
            {"space_after", s.spaceAfter},
            {"leading", s.leading},
            {"background", s.background},
            {"border_color", s.borderColor},
            {"left_indent", s.leftIndent}
        };
    }

    void StyleFromJson(const json& j, const char* key, TextStyle& s) {
        if (!j.contains(key) || !j[key].is_object()) return;
        const json& o = j[key];
        s.font = o.value("font", s.font);
        s.fontSize = o.value("font_size", s.fontSize);
        s.color = o.value("color", s.color);
        s.alignment = o.value("alignment", s.alignment);
        s.spaceBefore = o.value("space_before", s.spaceBefore);
        s.spaceAfter = o.value("spacing", s.spaceAfter); // legacy key
        s.spaceAfter = o.value("space_after", s.spaceAfter);
        s.leading = o.value("line_spacing", s.leading);   // legacy key
        s.leading = o.value("leading", s.leading);
        s.background = o.value("background", s.background);
        s.borderColor = o.value("border_color", s.borderColor);
        s.leftIndent = o.value("left_indent", s.leftIndent);
    }
}

TemplateRepositoryFs::TemplateRepositoryFs(std::string templatesDir)
    : m_templatesDir(std::move(templatesDir)) {}

std::string TemplateRepositoryFs::pathFor(const std::string& name) const {
    return (fs::path(m_templatesDir) / (name + ".json")).string();
}

json TemplateRepositoryFs::ToJson(const TemplateConfig& config) {
    const PrintStyles& p = config.pdf;
    const FlowStyles& w = config.word;

    json j;
    j["name"] = config.displayName.empty() ? config.name : config.displayName;
    j["description"] = config.description;
    j["category"] = config.category;
    j["pdf_styles"] = {
        {"page_size", p.pageSize},
        {"margins", {{"top", p.margins.top}, {"bottom", p.margins.bottom},
                     {"left", p.margins.left}, {"right", p.margins.right}}},
        {"title", StyleToJson(p.title)},
        {"heading1", StyleToJson(p.heading1)},
        {"heading2", StyleToJson(p.heading2)},
        {"body", StyleToJson(p.body)},
        {"code", StyleToJson(p.code)},
        {"blockquote", StyleToJson(p.blockquote)},
        {"caption", StyleToJson(p.caption)},
        {"footer", StyleToJson(p.footer)},
        {"link_color", p.linkColor},
        {"rule_color", p.ruleColor},
        {"table", {
            {"header_font", p.table.headerFont},
            {"header_font_size", p.table.headerFontSize},
            {"header_background", p.table.headerBackground},
            {"cell_font", p.table.cellFont},
            {"cell_font_size", p.table.cellFontSize},
            {"grid_color", p.table.gridColor},
            {"text_color", p.table.textColor},
            {"padding", p.table.padding}
        }}
    };
    j["word_styles"] = {
        {"title_style", w.titleStyle},
        {"heading1_style", w.heading1Style},
        {"heading2_style", w.heading2Style},
        {"body_style", w.bodyStyle},
        {"list_style", w.listStyle},
        {"quote_style", w.quoteStyle},
        {"code_style", w.codeStyle},
        {"table_style", w.tableStyle},
        {"font_family", w.fontFamily},
        {"font_size", w.fontSize},
        {"code_font", w.codeFont}
    };
    j["metadata"] = {
        {"author", config.metadata.author},
        {"subject", config.metadata.subject},
        {"keywords", config.metadata.keywords}
    };
    return j;
}

TemplateConfig TemplateRepositoryFs::FromJson(const json& j) {
    TemplateConfig config;
    config.displayName = j.value("name", config.displayName);
    config.description = j.value("description", config.description);
    config.category = j.value("category", config.category);

    if (j.contains("pdf_styles") && j["pdf_styles"].is_object()) {
        const json& p = j["pdf_styles"];
        PrintStyles& out = config.pdf;
        out.pageSize = p.value("page_size", out.pageSize);
        if (p.contains("margins") && p["margins"].is_object()) {
            const json& m = p["margins"];
            out.margins.top = m.value("top", out.margins.top);
            out.margins.bottom = m.value("bottom", out.margins.bottom);
            out.margins.left = m.value("left", out.margins.left);
            out.margins.right = m.value("right", out.margins.right);
        }
        StyleFromJson(p, "title", out.title);
        StyleFromJson(p, "heading1", out.heading1);
        StyleFromJson(p, "heading2", out.heading2);
        StyleFromJson(p, "body", out.body);
        StyleFromJson(p, "code", out.code);
        StyleFromJson(p, "blockquote", out.blockquote);
        StyleFromJson(p, "caption", out.caption);
        StyleFromJson(p, "footer", out.footer);
        out.linkColor = p.value("link_color", out.linkColor);
        out.ruleColor = p.value("rule_color", out.ruleColor);
        if (p.contains("table") && p["table"].is_object()) {
            const json& t = p["table"];
            out.table.headerFont = t.value("header_font", out.table.headerFont);
            out.table.headerFontSize = t.value("header_font_size", out.table.headerFontSize);
            out.table.headerBackground = t.value("header_background", out.table.headerBackground);
            out.table.cellFont = t.value("cell_font", out.table.cellFont);
            out.table.cellFontSize = t.value("cell_font_size", out.table.cellFontSize);
            out.table.gridColor = t.value("grid_color", out.table.gridColor);
            out.table.textColor = t.value("text_color", out.table.textColor);
            out.table.padding = t.value("padding", out.table.padding);
        }
    }

    if (j.contains("word_styles") && j["word_styles"].is_object()) {
        const json& w = j["word_styles"];
        FlowStyles& out = config.word;
        out.titleStyle = w.value("title_style", out.titleStyle);
        out.heading1Style = w.value("heading1_style", out.heading1Style);
        out.heading2Style = w.value("heading2_style", out.heading2Style);
        out.bodyStyle = w.value("body_style", out.bodyStyle);
        out.listStyle = w.value("list_style", out.listStyle);
        out.quoteStyle = w.value("quote_style", out.quoteStyle);
        out.codeStyle = w.value("code_style", out.codeStyle);
        out.tableStyle = w.value("table_style", out.tableStyle);
        out.fontFamily = w.value("font_family", out.fontFamily);
        out.fontSize = w.value("font_size", out.fontSize);
        out.codeFont = w.value("code_font", out.codeFont);
    }

    if (j.contains("metadata") && j["metadata"].is_object()) {
        const json& m = j["metadata"];
        config.metadata.author = m.value("author", config.metadata.author);
        config.metadata.subject = m.value("subject", config.metadata.subject);
        config.metadata.keywords = m.value("keywords", config.metadata.keywords);
    }
    return config;
}

bool TemplateRepositoryFs::save(const TemplateConfig& config) {
    return FileUtils::WriteFileAtomically(pathFor(config.name), ToJson(config).dump(2));
}

std::optional<TemplateConfig> TemplateRepositoryFs::findByName(const std::string& name) {
    auto content = FileUtils::ReadFile(pathFor(name));
    if (!content) {
        return std::nullopt;
    }

    try {
        TemplateConfig config = FromJson(json::parse(*content));
        config.name = name;
        return config;
    } catch (const std::exception& e) {
        std::cerr << "[TemplateRepository] Error parsing template '" << name << "': " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::vector<std::string> TemplateRepositoryFs::listNames() {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(m_templatesDir, ec)) {
        return names;
    }

    for (const auto& entry : fs::directory_iterator(m_templatesDir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            names.push_back(entry.path().stem().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool TemplateRepositoryFs::remove(const std::string& name) {
    std::error_code ec;
    bool removed = fs::remove(pathFor(name), ec);
    if (ec) {
        std::cerr << "[TemplateRepository] Error deleting template '" << name << "': " << ec.message() << std::endl;
        return false;
    }
    return removed;
}

} // namespace docforge::infrastructure
