/**
 * @file TemplateRegistry.cpp
 * @brief Implementation of TemplateRegistry and the built-in presets.
 */

#include "application/TemplateRegistry.hpp"

#include <cctype>
#include <iostream>

namespace docforge::application {

using namespace docforge::domain;

namespace {
    void SetHeadingFonts(TemplateConfig& t, const std::string& bold, const std::string& color,
                         double title, double h1, double h2) {
        t.pdf.title.font = bold;
        t.pdf.title.fontSize = title;
        t.pdf.heading1.font = bold;
        t.pdf.heading1.fontSize = h1;
        t.pdf.heading1.color = color;
        t.pdf.heading2.font = bold;
        t.pdf.heading2.fontSize = h2;
        t.pdf.heading2.color = color;
    }

    TemplateConfig ExecutiveSummary() {
        TemplateConfig t = TemplateRegistry::BaseTemplate();
        t.name = "executive_summary";
        t.displayName = "Executive Summary";
        t.description = "Professional template for executive summaries";
        t.category = "business";
        SetHeadingFonts(t, "Helvetica-Bold", "#34495e", 18, 16, 14);
        t.pdf.title.spaceAfter = 20;
        t.pdf.heading1.spaceAfter = 15;
        t.pdf.heading2.spaceAfter = 12;
        t.pdf.body.fontSize = 11;
        t.pdf.body.leading = 1.2;
        t.word.fontFamily = "Calibri";
        t.word.fontSize = 11;
        t.metadata.subject = "Executive Summary";
        t.metadata.keywords = {"executive", "summary", "business"};
        return t;
    }

    TemplateConfig TechnicalReport() {
        TemplateConfig t = TemplateRegistry::BaseTemplate();
        t.name = "technical_report";
        t.displayName = "Technical Report";
        t.description = "Comprehensive template for technical documentation";
        t.category = "technical";
        SetHeadingFonts(t, "Helvetica-Bold", "#34495e", 20, 16, 14);
        t.pdf.title.spaceAfter = 25;
        t.pdf.heading1.spaceAfter = 18;
        t.pdf.heading2.spaceAfter = 15;
        t.pdf.body.fontSize = 10;
        t.pdf.body.leading = 1.3;
        t.pdf.code.fontSize = 9;
        t.word.codeStyle = "Code";
        t.word.fontFamily = "Consolas";
        t.word.fontSize = 10;
        t.metadata.subject = "Technical Report";
        t.metadata.keywords = {"technical", "documentation", "report"};
        return t;
    }

    TemplateConfig BusinessReport() {
        TemplateConfig t = TemplateRegistry::BaseTemplate();
        t.name = "business_report";
        t.displayName = "Business Report";
        t.description = "Professional template for business reports";
        t.category = "business";
        SetHeadingFonts(t, "Helvetica-Bold", "#34495e", 18, 16, 14);
        t.pdf.title.spaceAfter = 20;
        t.pdf.heading1.spaceAfter = 15;
        t.pdf.heading2.spaceAfter = 12;
        t.pdf.body.fontSize = 11;
        t.pdf.body.leading = 1.4;
        t.pdf.table.headerFontSize = 10;
        t.pdf.table.cellFontSize = 9;
        t.pdf.table.gridColor = "#bdc3c7";
        t.word.fontFamily = "Calibri";
        t.word.fontSize = 11;
        t.metadata.subject = "Business Report";
        t.metadata.keywords = {"business", "report", "analysis"};
        return t;
    }

    TemplateConfig AcademicPaper() {
        TemplateConfig t = TemplateRegistry::BaseTemplate();
        t.name = "academic_paper";
        t.displayName = "Academic Paper";
        t.description = "Formal template for academic papers";
        t.category = "academic";
        t.pdf.margins.left = 1.5;
        SetHeadingFonts(t, "Times-Bold", "#2c3e50", 16, 14, 12);
        t.pdf.title.spaceAfter = 20;
        t.pdf.heading1.spaceAfter = 15;
        t.pdf.heading2.spaceAfter = 12;
        t.pdf.body.font = "Times-Roman";
        t.pdf.body.fontSize = 11;
        t.pdf.body.leading = 2.0;
        t.pdf.blockquote.font = "Times-Italic";
        t.pdf.blockquote.fontSize = 10;
        t.pdf.blockquote.color = "#2c3e50";
        t.pdf.blockquote.leftIndent = 36;
        t.pdf.table.headerFont = "Times-Bold";
        t.pdf.table.cellFont = "Times-Roman";
        t.word.fontFamily = "Times New Roman";
        t.word.fontSize = 11;
        t.metadata.subject = "Academic Paper";
        t.metadata.keywords = {"academic", "research", "paper"};
        return t;
    }

    TemplateConfig Whitepaper() {
        TemplateConfig t = TemplateRegistry::BaseTemplate();
        t.name = "whitepaper";
        t.displayName = "Whitepaper";
        t.description = "Professional template for whitepapers";
        t.category = "business";
        t.pdf.body.color = "#333333";
        t.pdf.body.leading = 1.6;
        t.word.fontSize = 12;
        t.metadata.subject = "Whitepaper";
        t.metadata.keywords = {"whitepaper", "technical", "documentation"};
        return t;
    }
}

TemplateConfig TemplateRegistry::BaseTemplate() {
    TemplateConfig t;
    t.category = "business";

    TextStyle& title = t.pdf.title;
    title.font = "Helvetica-Bold";
    title.fontSize = 24;
    title.alignment = "center";
    title.spaceAfter = 30;

    TextStyle& h1 = t.pdf.heading1;
    h1.font = "Helvetica-Bold";
    h1.fontSize = 18;
    h1.color = "#34495e";
    h1.spaceBefore = 12;
    h1.spaceAfter = 20;

    TextStyle& h2 = t.pdf.heading2;
    h2.font = "Helvetica-Bold";
    h2.fontSize = 14;
    h2.color = "#34495e";
    h2.spaceBefore = 10;
    h2.spaceAfter = 15;

    TextStyle& body = t.pdf.body;
    body.font = "Helvetica";
    body.fontSize = 12;
    body.alignment = "justify";

    TextStyle& code = t.pdf.code;
    code.font = "Courier";
    code.fontSize = 10;
    code.background = "#f8f9fa";
    code.borderColor = "#dee2e6";
    code.leftIndent = 20;
    code.leading = 1.3;

    TextStyle& quote = t.pdf.blockquote;
    quote.font = "Helvetica-Oblique";
    quote.fontSize = 11;
    quote.color = "#555555";
    quote.borderColor = "#3498db";
    quote.leftIndent = 20;

    TextStyle& caption = t.pdf.caption;
    caption.font = "Helvetica";
    caption.fontSize = 9;
    caption.color = "#666666";
    caption.alignment = "center";
    caption.spaceAfter = 12;

    TextStyle& footer = t.pdf.footer;
    footer.font = "Helvetica";
    footer.fontSize = 9;
    footer.color = "#666666";
    footer.alignment = "center";
    return t;
}

TemplateRegistry::TemplateRegistry(std::shared_ptr<ITemplateRepository> repository)
    : m_repository(std::move(repository)) {
    loadBuiltIns();
}

void TemplateRegistry::loadBuiltIns() {
    for (TemplateConfig t : {ExecutiveSummary(), TechnicalReport(), BusinessReport(), AcademicPaper(), Whitepaper()}) {
        m_builtInOrder.push_back(t.name);
        m_builtIns.emplace(t.name, std::move(t));
    }
}

bool TemplateRegistry::isBuiltIn(const std::string& name) const {
    return m_builtIns.count(name) > 0;
}

bool TemplateRegistry::IsValidName(const std::string& name) {
    if (name.empty()) return false;
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) return false;
    if (name.find("..") != std::string::npos) return false;
    return true;
}

std::string TemplateRegistry::DisplayName(const std::string& name) {
    std::string out;
    bool capitalize = true;
    for (char c : name) {
        if (c == '_' || c == '-') {
            out += ' ';
            capitalize = true;
            continue;
        }
        out += capitalize ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
        capitalize = false;
    }
    return out;
}

std::optional<TemplateConfig> TemplateRegistry::get(const std::string& name) const {
    auto it = m_builtIns.find(name);
    if (it != m_builtIns.end()) {
        return it->second;
    }
    if (!IsValidName(name) || !m_repository) {
        return std::nullopt;
    }
    return m_repository->findByName(name);
}

std::vector<TemplateSummary> TemplateRegistry::list() const {
    std::vector<TemplateSummary> out;
    for (const auto& name : m_builtInOrder) {
        const TemplateConfig& t = m_builtIns.at(name);
        out.push_back({t.name, t.displayName, t.description, t.category, true});
    }

    if (!m_repository) return out;
    for (const auto& name : m_repository->listNames()) {
        if (isBuiltIn(name)) continue;
        auto t = m_repository->findByName(name);
        if (!t) continue;
        std::string display = t->displayName.empty() ? DisplayName(name) : t->displayName;
        out.push_back({name, display, t->description, t->category, false});
    }
    return out;
}

bool TemplateRegistry::create(const std::string& name, TemplateConfig config) {
    if (!IsValidName(name)) {
        std::cerr << "[TemplateRegistry] Invalid template name: '" << name << "'" << std::endl;
        return false;
    }
    if (isBuiltIn(name)) {
        std::cerr << "[TemplateRegistry] Cannot overwrite built-in template: " << name << std::endl;
        return false;
    }
    if (!m_repository) {
        return false;
    }

    config.name = name;
    if (config.displayName.empty()) config.displayName = DisplayName(name);
    if (!m_repository->save(config)) {
        std::cerr << "[TemplateRegistry] Failed to persist template: " << name << std::endl;
        return false;
    }
    std::cout << "[TemplateRegistry] Created custom template: " << name << std::endl;
    return true;
}

bool TemplateRegistry::remove(const std::string& name) {
    if (isBuiltIn(name) || !IsValidName(name) || !m_repository) {
        return false;
    }
    bool removed = m_repository->remove(name);
    if (removed) {
        std::cout << "[TemplateRegistry] Deleted custom template: " << name << std::endl;
    } else {
        std::cerr << "[TemplateRegistry] Template not found: " << name << std::endl;
    }
    return removed;
}

} // namespace docforge::application
