/**
 * @file DocxRenderer.cpp
 * @brief Implementation of DocxRenderer.
 */

#include "infrastructure/docx/DocxRenderer.hpp"
#include "domain/RichText.hpp"
#include "infrastructure/FileUtils.hpp"
#include "infrastructure/ImageLoader.hpp"
#include "infrastructure/docx/DocxPackage.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <tinyxml2.h>
#include <variant>

namespace docforge::infrastructure::docx {

using namespace docforge::domain;
using tinyxml2::XMLDocument;
using tinyxml2::XMLElement;

namespace {

constexpr const char* kNsW = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";
constexpr const char* kNsR = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
constexpr const char* kNsWp = "http://schemas.openxmlformats.org/drawingml/2006/wordprocessingDrawing";
constexpr const char* kNsA = "http://schemas.openxmlformats.org/drawingml/2006/main";
constexpr const char* kNsPic = "http://schemas.openxmlformats.org/drawingml/2006/picture";
constexpr const char* kNsPkgRels = "http://schemas.openxmlformats.org/package/2006/relationships";
constexpr const char* kRelBase = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/";

constexpr long kEmuPerInch = 914400;
constexpr long kEmuPerPixel = 9525; // 96 dpi
constexpr int kTwipsPerInch = 1440;

XMLElement* Add(XMLElement* parent, const char* name) {
    XMLElement* child = parent->GetDocument()->NewElement(name);
    parent->InsertEndChild(child);
    return child;
}

XMLElement* AddVal(XMLElement* parent, const char* name, const std::string& value) {
    XMLElement* child = Add(parent, name);
    child->SetAttribute("w:val", value.c_str());
    return child;
}

std::string Print(XMLDocument& doc) {
    tinyxml2::XMLPrinter printer(nullptr, true);
    doc.Print(&printer);
    return printer.CStr();
}

XMLElement* NewRoot(XMLDocument& doc, const char* name) {
    doc.InsertEndChild(doc.NewDeclaration("xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\""));
    XMLElement* root = doc.NewElement(name);
    doc.InsertEndChild(root);
    return root;
}

/** Drops characters XML 1.0 cannot carry. */
std::string XmlSafe(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x20 && c != '\t' && c != '\n' && c != '\r') continue;
        out.push_back(c);
    }
    return out;
}

std::string Alignment(const std::string& alignment) {
    if (alignment == "center") return "center";
    if (alignment == "right") return "right";
    if (alignment == "justify") return "both";
    return "left";
}

std::string HalfPoints(double points) {
    return std::to_string(static_cast<int>(std::lround(points * 2.0)));
}

std::string StripOrdinal(const std::string& text) {
    std::size_t i = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
    if (i == 0 || i >= text.size() || text[i] != '.') return text;
    ++i;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    return text.substr(i);
}

std::string IsoNow() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

bool IsLetter(const std::string& pageSize) {
    std::string lower = pageSize;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "letter";
}

struct RunFormat {
    bool bold = false;
    bool italic = false;
    double size = 0.0;     // points, 0 keeps the style size
    std::string color;     // RRGGBB, empty keeps the style colour
};

struct Relationship {
    std::string id;
    std::string type;
    std::string target;
    bool external = false;
};

/**
 * Builds word/document.xml element by element and records the relationships and
 * media parts it needs.
 */
class DocumentBuilder {
public:
    DocumentBuilder(const TemplateConfig& config, const DocumentAssets& assets)
        : m_config(config), m_assets(assets) {
        XMLElement* root = NewRoot(m_doc, "w:document");
        root->SetAttribute("xmlns:w", kNsW);
        root->SetAttribute("xmlns:r", kNsR);
        root->SetAttribute("xmlns:wp", kNsWp);
        root->SetAttribute("xmlns:a", kNsA);
        root->SetAttribute("xmlns:pic", kNsPic);
        m_body = Add(root, "w:body");

        m_relationships.push_back({"rId1", std::string(kRelBase) + "styles", "styles.xml", false});
        m_relationships.push_back({"rId2", std::string(kRelBase) + "numbering", "numbering.xml", false});
    }

    /** An element that throws leaves no partial markup, relationships or media behind. */
    void render(const MarkdownElement& element) {
        XMLElement* body = m_body;
        const std::size_t relationships = m_relationships.size();
        const std::size_t media = m_media.size();
        const int diagrams = m_diagramCount;
        try {
            DocxRenderer::AppendTransactionally(body, [this, &element](XMLElement* staging) {
                m_body = staging;
                std::visit([this](const auto& e) { this->add(e); }, element);
            });
        } catch (...) {
            m_body = body;
            m_relationships.erase(m_relationships.begin() + static_cast<long>(relationships), m_relationships.end());
            m_media.erase(m_media.begin() + static_cast<long>(media), m_media.end());
            m_diagramCount = diagrams;
            throw;
        }
        m_body = body;
    }

    void footer(const std::string& text) {
        if (text.empty()) return;
        const TextStyle& style = m_config.pdf.footer;
        XMLElement* p = paragraph(m_config.word.bodyStyle, "center");
        RunFormat fmt;
        fmt.size = style.fontSize;
        fmt.color = DocxRenderer::HexColor(style.color);
        textRun(p, text, fmt, false);
    }

    void finishSection() {
        const PrintStyles& pdf = m_config.pdf;
        bool letter = IsLetter(pdf.pageSize);
        XMLElement* sect = Add(m_body, "w:sectPr");
        XMLElement* size = Add(sect, "w:pgSz");
        size->SetAttribute("w:w", letter ? 12240 : 11906);
        size->SetAttribute("w:h", letter ? 15840 : 16838);
        XMLElement* margins = Add(sect, "w:pgMar");
        margins->SetAttribute("w:top", Twips(pdf.margins.top));
        margins->SetAttribute("w:right", Twips(pdf.margins.right));
        margins->SetAttribute("w:bottom", Twips(pdf.margins.bottom));
        margins->SetAttribute("w:left", Twips(pdf.margins.left));
        margins->SetAttribute("w:header", 720);
        margins->SetAttribute("w:footer", 720);
        margins->SetAttribute("w:gutter", 0);
    }

    std::string documentXml() { return Print(m_doc); }
    const std::vector<Relationship>& relationships() const { return m_relationships; }
    const std::vector<std::pair<std::string, std::string>>& media() const { return m_media; }

    /** Content width between the margins in twips. */
    int contentTwips() const {
        bool letter = IsLetter(m_config.pdf.pageSize);
        int page = letter ? 12240 : 11906;
        return std::max(kTwipsPerInch, page - Twips(m_config.pdf.margins.left) - Twips(m_config.pdf.margins.right));
    }

private:
    static int Twips(double inches) { return static_cast<int>(std::lround(inches * kTwipsPerInch)); }

    XMLElement* paragraph(const std::string& styleName, const std::string& alignment = {}) {
        XMLElement* p = Add(m_body, "w:p");
        XMLElement* pPr = Add(p, "w:pPr");
        AddVal(pPr, "w:pStyle", DocxRenderer::StyleId(styleName));
        if (!alignment.empty()) AddVal(pPr, "w:jc", Alignment(alignment));
        return p;
    }

    XMLElement* styledParagraph(const std::string& styleName, const TextStyle& style) {
        XMLElement* p = Add(m_body, "w:p");
        XMLElement* pPr = Add(p, "w:pPr");
        AddVal(pPr, "w:pStyle", DocxRenderer::StyleId(styleName));
        XMLElement* spacing = Add(pPr, "w:spacing");
        spacing->SetAttribute("w:before", static_cast<int>(std::lround(style.spaceBefore * 20)));
        spacing->SetAttribute("w:after", static_cast<int>(std::lround(style.spaceAfter * 20)));
        AddVal(pPr, "w:jc", Alignment(style.alignment));
        return p;
    }

    XMLElement* run(XMLElement* parent, const TextRun& text, const RunFormat& fmt) {
        XMLElement* r = Add(parent, "w:r");
        XMLElement* rPr = Add(r, "w:rPr");
        if (text.code) {
            XMLElement* fonts = Add(rPr, "w:rFonts");
            fonts->SetAttribute("w:ascii", m_config.word.codeFont.c_str());
            fonts->SetAttribute("w:hAnsi", m_config.word.codeFont.c_str());
        }
        if (fmt.bold || text.bold) Add(rPr, "w:b");
        if (fmt.italic || text.italic) Add(rPr, "w:i");
        if (text.strike) Add(rPr, "w:strike");
        if (!fmt.color.empty()) AddVal(rPr, "w:color", fmt.color);
        if (fmt.size > 0.0) AddVal(rPr, "w:sz", HalfPoints(fmt.size));
        if (rPr->NoChildren()) r->DeleteChild(rPr);

        XMLElement* t = Add(r, "w:t");
        t->SetAttribute("xml:space", "preserve");
        t->SetText(XmlSafe(text.text).c_str());
        return r;
    }

    void textRun(XMLElement* parent, const std::string& text, const RunFormat& fmt, bool inline_markup = true) {
        if (!inline_markup) {
            TextRun plain;
            plain.text = text;
            run(parent, plain, fmt);
            return;
        }
        for (const auto& piece : ParseInlineRuns(text)) {
            run(parent, piece, fmt);
        }
    }

    std::string addRelationship(const std::string& type, const std::string& target, bool external) {
        std::string id = "rId" + std::to_string(m_relationships.size() + 1);
        m_relationships.push_back({id, std::string(kRelBase) + type, target, external});
        return id;
    }

    void add(const Header& h) {
        const FlowStyles& word = m_config.word;
        const PrintStyles& pdf = m_config.pdf;
        const std::string& styleName = h.level <= 1 ? word.titleStyle
                                     : h.level == 2 ? word.heading1Style : word.heading2Style;
        TextStyle style = h.level <= 1 ? pdf.title : h.level == 2 ? pdf.heading1 : pdf.heading2;
        if (h.level > 3) {
            style.fontSize = std::max(pdf.body.fontSize, pdf.heading2.fontSize - (h.level - 3));
        }
        XMLElement* p = styledParagraph(styleName, style);
        RunFormat fmt;
        fmt.bold = true;
        fmt.size = style.fontSize;
        fmt.color = DocxRenderer::HexColor(style.color);
        textRun(p, h.text, fmt);
    }

    void add(const Paragraph& para) { bodyParagraph(para.text); }
    void add(const PlainText& text) { bodyParagraph(text.text); }

    void bodyParagraph(const std::string& text) {
        const TextStyle& style = m_config.pdf.body;
        XMLElement* p = styledParagraph(m_config.word.bodyStyle, style);
        RunFormat fmt;
        fmt.size = style.fontSize;
        fmt.color = DocxRenderer::HexColor(style.color);
        textRun(p, text, fmt);
    }

    void add(const ListBlock& list) {
        for (const auto& item : list.items) {
            XMLElement* p = Add(m_body, "w:p");
            XMLElement* pPr = Add(p, "w:pPr");
            AddVal(pPr, "w:pStyle", DocxRenderer::StyleId(m_config.word.listStyle));
            XMLElement* numPr = Add(pPr, "w:numPr");
            AddVal(numPr, "w:ilvl", std::to_string(std::clamp(item.indent / 2, 0, 6)));
            AddVal(numPr, "w:numId", "1");
            textRun(p, StripOrdinal(item.text), RunFormat{});
        }
    }

    void add(const Blockquote& quote) {
        const TextStyle& style = m_config.pdf.blockquote;
        XMLElement* p = Add(m_body, "w:p");
        XMLElement* pPr = Add(p, "w:pPr");
        AddVal(pPr, "w:pStyle", DocxRenderer::StyleId(m_config.word.quoteStyle));
        std::string bar = DocxRenderer::HexColor(style.borderColor);
        if (!bar.empty()) {
            XMLElement* borders = Add(pPr, "w:pBdr");
            XMLElement* left = AddVal(borders, "w:left", "single");
            left->SetAttribute("w:sz", 18);
            left->SetAttribute("w:space", 8);
            left->SetAttribute("w:color", bar.c_str());
        }
        RunFormat fmt;
        fmt.italic = true;
        fmt.color = DocxRenderer::HexColor(style.color);
        textRun(p, quote.text, fmt);
    }

    void add(const HorizontalRule&) {
        XMLElement* p = Add(m_body, "w:p");
        XMLElement* pPr = Add(p, "w:pPr");
        XMLElement* borders = Add(pPr, "w:pBdr");
        XMLElement* bottom = AddVal(borders, "w:bottom", "single");
        bottom->SetAttribute("w:sz", 6);
        bottom->SetAttribute("w:space", 1);
        std::string color = DocxRenderer::HexColor(m_config.pdf.ruleColor);
        bottom->SetAttribute("w:color", color.empty() ? "auto" : color.c_str());
    }

    void add(const Link& link) {
        XMLElement* p = paragraph(m_config.word.bodyStyle);
        XMLElement* hyperlink = Add(p, "w:hyperlink");
        hyperlink->SetAttribute("r:id", addRelationship("hyperlink", link.url, true).c_str());
        hyperlink->SetAttribute("w:history", 1);

        XMLElement* r = Add(hyperlink, "w:r");
        XMLElement* rPr = Add(r, "w:rPr");
        AddVal(rPr, "w:rStyle", "Hyperlink");
        std::string color = DocxRenderer::HexColor(m_config.pdf.linkColor);
        if (!color.empty()) AddVal(rPr, "w:color", color);
        AddVal(rPr, "w:u", "single");
        XMLElement* t = Add(r, "w:t");
        t->SetAttribute("xml:space", "preserve");
        std::string label = link.text.empty() ? link.url : PlainTextOf(link.text) + " (" + link.url + ")";
        t->SetText(XmlSafe(label).c_str());
    }

    void add(const CodeBlock& block) { codeBlock(block.text); }

    void codeBlock(const std::string& text) {
        XMLElement* p = Add(m_body, "w:p");
        XMLElement* pPr = Add(p, "w:pPr");
        AddVal(pPr, "w:pStyle", DocxRenderer::StyleId(m_config.word.codeStyle));
        std::string fill = DocxRenderer::HexColor(m_config.pdf.code.background);
        if (!fill.empty()) {
            XMLElement* shd = AddVal(pPr, "w:shd", "clear");
            shd->SetAttribute("w:color", "auto");
            shd->SetAttribute("w:fill", fill.c_str());
        }

        XMLElement* r = Add(p, "w:r");
        XMLElement* rPr = Add(r, "w:rPr");
        XMLElement* fonts = Add(rPr, "w:rFonts");
        fonts->SetAttribute("w:ascii", m_config.word.codeFont.c_str());
        fonts->SetAttribute("w:hAnsi", m_config.word.codeFont.c_str());
        AddVal(rPr, "w:sz", "20");

        std::size_t start = 0;
        bool first = true;
        while (start <= text.size()) {
            std::size_t end = text.find('\n', start);
            if (end == std::string::npos) end = text.size();
            std::string line = text.substr(start, end - start);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!first) Add(r, "w:br");
            XMLElement* t = Add(r, "w:t");
            t->SetAttribute("xml:space", "preserve");
            t->SetText(XmlSafe(line).c_str());
            first = false;
            start = end + 1;
        }
    }

    void add(const DiagramBlock& block) {
        ++m_diagramCount;
        auto path = m_assets.diagramPath(DiagramId(m_diagramCount));
        if (path && picture(*path, 6.0, 4.0, {})) {
            return;
        }
        codeBlock(block.source);
    }

    void add(const Image& image) {
        auto path = m_assets.imagePath(image.url);
        if (!path) {
            std::cerr << "[DocxRenderer] Image not resolved, omitted: " << image.url << std::endl;
            return;
        }
        picture(*path, 5.0, 3.0, image.alt);
    }

    bool picture(const std::string& path, double maxWidthIn, double maxHeightIn, const std::string& caption) {
        auto bytes = FileUtils::ReadFile(path);
        if (!bytes) {
            std::cerr << "[DocxRenderer] Could not read image: " << path << std::endl;
            return false;
        }
        auto info = ImageLoader::Probe(*bytes);
        if (!info || info->width == 0 || info->height == 0) {
            std::cerr << "[DocxRenderer] Unsupported image: " << path << std::endl;
            return false;
        }

        double cx = static_cast<double>(info->width) * kEmuPerPixel;
        double cy = static_cast<double>(info->height) * kEmuPerPixel;
        double scale = std::min({1.0, maxWidthIn * kEmuPerInch / cx, maxHeightIn * kEmuPerInch / cy});
        const long width = static_cast<long>(std::lround(cx * scale));
        const long height = static_cast<long>(std::lround(cy * scale));

        const int number = static_cast<int>(m_media.size()) + 1;
        const std::string ext = info->format == ImageFormat::Png ? "png" : "jpeg";
        const std::string mediaName = "image" + std::to_string(number) + "." + ext;
        m_media.emplace_back("word/media/" + mediaName, std::move(*bytes));
        const std::string relId = addRelationship("image", "media/" + mediaName, false);

        XMLElement* p = paragraph(m_config.word.bodyStyle, "center");
        XMLElement* drawing = Add(Add(p, "w:r"), "w:drawing");
        XMLElement* anchor = Add(drawing, "wp:inline");
        for (const char* dist : {"distT", "distB", "distL", "distR"}) anchor->SetAttribute(dist, 0);
        XMLElement* extent = Add(anchor, "wp:extent");
        extent->SetAttribute("cx", static_cast<int64_t>(width));
        extent->SetAttribute("cy", static_cast<int64_t>(height));
        XMLElement* docPr = Add(anchor, "wp:docPr");
        docPr->SetAttribute("id", number);
        docPr->SetAttribute("name", ("Picture " + std::to_string(number)).c_str());
        if (!caption.empty()) docPr->SetAttribute("descr", XmlSafe(caption).c_str());
        Add(Add(anchor, "wp:cNvGraphicFramePr"), "a:graphicFrameLocks")->SetAttribute("noChangeAspect", 1);

        XMLElement* graphicData = Add(Add(anchor, "a:graphic"), "a:graphicData");
        graphicData->SetAttribute("uri", kNsPic);
        XMLElement* pic = Add(graphicData, "pic:pic");
        XMLElement* nvPicPr = Add(pic, "pic:nvPicPr");
        XMLElement* cNvPr = Add(nvPicPr, "pic:cNvPr");
        cNvPr->SetAttribute("id", 0);
        cNvPr->SetAttribute("name", mediaName.c_str());
        Add(nvPicPr, "pic:cNvPicPr");
        XMLElement* blipFill = Add(pic, "pic:blipFill");
        Add(blipFill, "a:blip")->SetAttribute("r:embed", relId.c_str());
        Add(Add(blipFill, "a:stretch"), "a:fillRect");
        XMLElement* spPr = Add(pic, "pic:spPr");
        XMLElement* xfrm = Add(spPr, "a:xfrm");
        XMLElement* off = Add(xfrm, "a:off");
        off->SetAttribute("x", 0);
        off->SetAttribute("y", 0);
        XMLElement* ext2 = Add(xfrm, "a:ext");
        ext2->SetAttribute("cx", static_cast<int64_t>(width));
        ext2->SetAttribute("cy", static_cast<int64_t>(height));
        XMLElement* geom = Add(spPr, "a:prstGeom");
        geom->SetAttribute("prst", "rect");
        Add(geom, "a:avLst");

        if (!caption.empty()) {
            XMLElement* cp = paragraph("Caption", "center");
            RunFormat fmt;
            fmt.size = m_config.pdf.caption.fontSize;
            fmt.color = DocxRenderer::HexColor(m_config.pdf.caption.color);
            textRun(cp, caption, fmt, false);
        }
        return true;
    }

    void add(const Table& table) {
        if (table.headers.empty()) return;
        const TableStyle& ts = m_config.pdf.table;
        const std::size_t columns = table.headers.size();
        const int colWidth = contentTwips() / static_cast<int>(columns);

        XMLElement* tbl = Add(m_body, "w:tbl");
        XMLElement* tblPr = Add(tbl, "w:tblPr");
        AddVal(tblPr, "w:tblStyle", DocxRenderer::StyleId(m_config.word.tableStyle));
        XMLElement* tblW = Add(tblPr, "w:tblW");
        tblW->SetAttribute("w:w", 5000);
        tblW->SetAttribute("w:type", "pct");
        std::string grid = DocxRenderer::HexColor(ts.gridColor);
        XMLElement* borders = Add(tblPr, "w:tblBorders");
        for (const char* side : {"w:top", "w:left", "w:bottom", "w:right", "w:insideH", "w:insideV"}) {
            XMLElement* b = AddVal(borders, side, "single");
            b->SetAttribute("w:sz", 4);
            b->SetAttribute("w:space", 0);
            b->SetAttribute("w:color", grid.empty() ? "auto" : grid.c_str());
        }

        XMLElement* tblGrid = Add(tbl, "w:tblGrid");
        for (std::size_t c = 0; c < columns; ++c) {
            Add(tblGrid, "w:gridCol")->SetAttribute("w:w", colWidth);
        }

        auto addRow = [&](const std::vector<std::string>& cells, bool header) {
            XMLElement* tr = Add(tbl, "w:tr");
            if (header) Add(Add(tr, "w:trPr"), "w:tblHeader");
            for (std::size_t c = 0; c < columns; ++c) {
                XMLElement* tc = Add(tr, "w:tc");
                XMLElement* tcPr = Add(tc, "w:tcPr");
                XMLElement* tcW = Add(tcPr, "w:tcW");
                tcW->SetAttribute("w:w", colWidth);
                tcW->SetAttribute("w:type", "dxa");
                std::string fill = DocxRenderer::HexColor(ts.headerBackground);
                if (header && !fill.empty()) {
                    XMLElement* shd = AddVal(tcPr, "w:shd", "clear");
                    shd->SetAttribute("w:color", "auto");
                    shd->SetAttribute("w:fill", fill.c_str());
                }
                XMLElement* p = Add(tc, "w:p");
                RunFormat fmt;
                fmt.bold = header;
                fmt.size = header ? ts.headerFontSize : ts.cellFontSize;
                fmt.color = DocxRenderer::HexColor(ts.textColor);
                if (c < cells.size() && !cells[c].empty()) {
                    textRun(p, cells[c], fmt);
                }
            }
        };

        addRow(table.headers, true);
        for (const auto& row : table.rows) {
            addRow(row, false);
        }
        // Word requires a paragraph between adjacent tables and before sectPr.
        Add(m_body, "w:p");
    }

    const TemplateConfig& m_config;
    const DocumentAssets& m_assets;
    XMLDocument m_doc;
    XMLElement* m_body = nullptr;
    std::vector<Relationship> m_relationships;
    std::vector<std::pair<std::string, std::string>> m_media;
    int m_diagramCount = 0;
};

void AddStyle(XMLElement* styles, std::set<std::string>& seen, const char* type, const std::string& name,
              const std::string& basedOn, const std::function<void(XMLElement* pPr, XMLElement* rPr)>& fill) {
    const std::string id = DocxRenderer::StyleId(name);
    if (id.empty() || !seen.insert(id).second) return;
    XMLElement* style = Add(styles, "w:style");
    style->SetAttribute("w:type", type);
    style->SetAttribute("w:styleId", id.c_str());
    if (id == "Normal") style->SetAttribute("w:default", 1);
    AddVal(style, "w:name", name);
    if (!basedOn.empty() && DocxRenderer::StyleId(basedOn) != id) {
        AddVal(style, "w:basedOn", DocxRenderer::StyleId(basedOn));
    }
    if (std::string(type) == "paragraph") Add(style, "w:qFormat");
    XMLElement* pPr = std::string(type) == "paragraph" ? Add(style, "w:pPr") : nullptr;
    XMLElement* rPr = Add(style, "w:rPr");
    if (fill) fill(pPr, rPr);
    if (pPr && pPr->NoChildren()) style->DeleteChild(pPr);
    if (rPr->NoChildren()) style->DeleteChild(rPr);
}

std::string StylesXml(const TemplateConfig& config) {
    const FlowStyles& word = config.word;
    XMLDocument doc;
    XMLElement* styles = NewRoot(doc, "w:styles");
    styles->SetAttribute("xmlns:w", kNsW);

    XMLElement* defaults = Add(styles, "w:docDefaults");
    XMLElement* rPrDefault = Add(Add(defaults, "w:rPrDefault"), "w:rPr");
    XMLElement* fonts = Add(rPrDefault, "w:rFonts");
    fonts->SetAttribute("w:ascii", word.fontFamily.c_str());
    fonts->SetAttribute("w:hAnsi", word.fontFamily.c_str());
    fonts->SetAttribute("w:cs", word.fontFamily.c_str());
    AddVal(rPrDefault, "w:sz", HalfPoints(word.fontSize));
    XMLElement* spacing = Add(Add(Add(defaults, "w:pPrDefault"), "w:pPr"), "w:spacing");
    spacing->SetAttribute("w:after", 160);
    spacing->SetAttribute("w:line", 259);
    spacing->SetAttribute("w:lineRule", "auto");

    std::set<std::string> seen;
    auto heading = [](double size, int outline) {
        return [size, outline](XMLElement* pPr, XMLElement* rPr) {
            Add(pPr, "w:keepNext");
            XMLElement* sp = Add(pPr, "w:spacing");
            sp->SetAttribute("w:before", 240);
            sp->SetAttribute("w:after", 120);
            if (outline >= 0) AddVal(pPr, "w:outlineLvl", std::to_string(outline));
            Add(rPr, "w:b");
            AddVal(rPr, "w:sz", HalfPoints(size));
        };
    };

    AddStyle(styles, seen, "paragraph", "Normal", {}, nullptr);
    AddStyle(styles, seen, "paragraph", word.bodyStyle, "Normal", nullptr);
    AddStyle(styles, seen, "paragraph", word.titleStyle, "Normal", heading(26.0, -1));
    AddStyle(styles, seen, "paragraph", word.heading1Style, "Normal", heading(16.0, 0));
    AddStyle(styles, seen, "paragraph", word.heading2Style, "Normal", heading(13.0, 1));
    AddStyle(styles, seen, "paragraph", word.listStyle, "Normal", [](XMLElement* pPr, XMLElement*) {
        Add(pPr, "w:contextualSpacing");
    });
    AddStyle(styles, seen, "paragraph", word.quoteStyle, "Normal", [](XMLElement* pPr, XMLElement* rPr) {
        XMLElement* ind = Add(pPr, "w:ind");
        ind->SetAttribute("w:left", 720);
        ind->SetAttribute("w:right", 720);
        Add(rPr, "w:i");
        AddVal(rPr, "w:color", "555555");
    });
    const std::string codeFont = word.codeFont;
    AddStyle(styles, seen, "paragraph", word.codeStyle, "Normal", [codeFont](XMLElement* pPr, XMLElement* rPr) {
        XMLElement* sp = Add(pPr, "w:spacing");
        sp->SetAttribute("w:after", 0);
        sp->SetAttribute("w:line", 240);
        sp->SetAttribute("w:lineRule", "auto");
        XMLElement* f = Add(rPr, "w:rFonts");
        f->SetAttribute("w:ascii", codeFont.c_str());
        f->SetAttribute("w:hAnsi", codeFont.c_str());
    });
    AddStyle(styles, seen, "paragraph", "Caption", "Normal", [](XMLElement* pPr, XMLElement* rPr) {
        AddVal(pPr, "w:jc", "center");
        Add(rPr, "w:i");
        AddVal(rPr, "w:color", "666666");
        AddVal(rPr, "w:sz", "18");
    });
    AddStyle(styles, seen, "character", "Hyperlink", {}, [](XMLElement*, XMLElement* rPr) {
        AddVal(rPr, "w:color", "0563C1");
        AddVal(rPr, "w:u", "single");
    });

    const std::string tableId = DocxRenderer::StyleId(word.tableStyle);
    if (!tableId.empty() && seen.insert(tableId).second) {
        XMLElement* style = Add(styles, "w:style");
        style->SetAttribute("w:type", "table");
        style->SetAttribute("w:styleId", tableId.c_str());
        AddVal(style, "w:name", word.tableStyle);
        XMLElement* borders = Add(Add(style, "w:tblPr"), "w:tblBorders");
        for (const char* side : {"w:top", "w:left", "w:bottom", "w:right", "w:insideH", "w:insideV"}) {
            XMLElement* b = AddVal(borders, side, "single");
            b->SetAttribute("w:sz", 4);
            b->SetAttribute("w:space", 0);
            b->SetAttribute("w:color", "auto");
        }
    }
    return Print(doc);
}

std::string NumberingXml() {
    XMLDocument doc;
    XMLElement* numbering = NewRoot(doc, "w:numbering");
    numbering->SetAttribute("xmlns:w", kNsW);

    XMLElement* abstractNum = Add(numbering, "w:abstractNum");
    abstractNum->SetAttribute("w:abstractNumId", 0);
    AddVal(abstractNum, "w:multiLevelType", "hybridMultilevel");
    static const char* kBullets[] = {"\xE2\x80\xA2", "\xE2\x97\xA6", "\xE2\x96\xAA"};
    for (int level = 0; level < 7; ++level) {
        XMLElement* lvl = Add(abstractNum, "w:lvl");
        lvl->SetAttribute("w:ilvl", level);
        AddVal(lvl, "w:start", "1");
        AddVal(lvl, "w:numFmt", "bullet");
        AddVal(lvl, "w:lvlText", kBullets[level % 3]);
        AddVal(lvl, "w:lvlJc", "left");
        XMLElement* ind = Add(Add(lvl, "w:pPr"), "w:ind");
        ind->SetAttribute("w:left", 720 * (level + 1));
        ind->SetAttribute("w:hanging", 360);
    }

    XMLElement* num = Add(numbering, "w:num");
    num->SetAttribute("w:numId", 1);
    AddVal(num, "w:abstractNumId", "0");
    return Print(doc);
}

std::string ContentTypesXml(bool hasPng, bool hasJpeg) {
    XMLDocument doc;
    XMLElement* types = NewRoot(doc, "Types");
    types->SetAttribute("xmlns", "http://schemas.openxmlformats.org/package/2006/content-types");

    auto addDefault = [&](const char* ext, const char* type) {
        XMLElement* d = Add(types, "Default");
        d->SetAttribute("Extension", ext);
        d->SetAttribute("ContentType", type);
    };
    addDefault("rels", "application/vnd.openxmlformats-package.relationships+xml");
    addDefault("xml", "application/xml");
    if (hasPng) addDefault("png", "image/png");
    if (hasJpeg) addDefault("jpeg", "image/jpeg");

    auto addOverride = [&](const char* part, const char* type) {
        XMLElement* o = Add(types, "Override");
        o->SetAttribute("PartName", part);
        o->SetAttribute("ContentType", type);
    };
    addOverride("/word/document.xml",
                "application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml");
    addOverride("/word/styles.xml", "application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml");
    addOverride("/word/numbering.xml",
                "application/vnd.openxmlformats-officedocument.wordprocessingml.numbering+xml");
    addOverride("/docProps/core.xml", "application/vnd.openxmlformats-package.core-properties+xml");
    addOverride("/docProps/app.xml", "application/vnd.openxmlformats-officedocument.extended-properties+xml");
    return Print(doc);
}

std::string RelationshipsXml(const std::vector<Relationship>& relationships) {
    XMLDocument doc;
    XMLElement* root = NewRoot(doc, "Relationships");
    root->SetAttribute("xmlns", kNsPkgRels);
    for (const auto& rel : relationships) {
        XMLElement* r = Add(root, "Relationship");
        r->SetAttribute("Id", rel.id.c_str());
        r->SetAttribute("Type", rel.type.c_str());
        r->SetAttribute("Target", XmlSafe(rel.target).c_str());
        if (rel.external) r->SetAttribute("TargetMode", "External");
    }
    return Print(doc);
}

std::string PackageRelationshipsXml() {
    return RelationshipsXml({
        {"rId1", std::string(kRelBase) + "officeDocument", "word/document.xml", false},
        {"rId2", "http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties",
         "docProps/core.xml", false},
        {"rId3", std::string(kRelBase) + "extended-properties", "docProps/app.xml", false},
    });
}

std::string CorePropertiesXml(const TemplateConfig& config, const std::string& title) {
    XMLDocument doc;
    XMLElement* root = NewRoot(doc, "cp:coreProperties");
    root->SetAttribute("xmlns:cp", "http://schemas.openxmlformats.org/package/2006/metadata/core-properties");
    root->SetAttribute("xmlns:dc", "http://purl.org/dc/elements/1.1/");
    root->SetAttribute("xmlns:dcterms", "http://purl.org/dc/terms/");
    root->SetAttribute("xmlns:xsi", "http://www.w3.org/2001/XMLSchema-instance");

    std::string keywords;
    for (const auto& k : config.metadata.keywords) {
        if (!keywords.empty()) keywords += ", ";
        keywords += k;
    }
    Add(root, "dc:title")->SetText(XmlSafe(title).c_str());
    Add(root, "dc:subject")->SetText(XmlSafe(config.metadata.subject).c_str());
    Add(root, "dc:creator")->SetText(XmlSafe(config.metadata.author).c_str());
    Add(root, "cp:keywords")->SetText(XmlSafe(keywords).c_str());
    const std::string now = IsoNow();
    XMLElement* created = Add(root, "dcterms:created");
    created->SetAttribute("xsi:type", "dcterms:W3CDTF");
    created->SetText(now.c_str());
    XMLElement* modified = Add(root, "dcterms:modified");
    modified->SetAttribute("xsi:type", "dcterms:W3CDTF");
    modified->SetText(now.c_str());
    return Print(doc);
}

std::string AppPropertiesXml() {
    XMLDocument doc;
    XMLElement* root = NewRoot(doc, "Properties");
    root->SetAttribute("xmlns", "http://schemas.openxmlformats.org/officeDocument/2006/extended-properties");
    Add(root, "Application")->SetText("DocForge");
    return Print(doc);
}

std::string DocumentTitle(const std::vector<MarkdownElement>& elements) {
    for (const auto& e : elements) {
        if (const auto* h = std::get_if<Header>(&e); h && h->level == 1) {
            return PlainTextOf(h->text);
        }
    }
    return {};
}

} // namespace

DocxRenderer::DocxRenderer(std::string footerText)
    : m_footerText(std::move(footerText)) {}

std::string DocxRenderer::StyleId(const std::string& styleName) {
    std::string id;
    for (char c : styleName) {
        if (std::isalnum(static_cast<unsigned char>(c))) id.push_back(c);
    }
    return id;
}

std::string DocxRenderer::HexColor(const std::string& color) {
    std::string hex = color;
    if (!hex.empty() && hex[0] == '#') hex.erase(0, 1);
    if (hex.size() == 3) {
        hex = std::string{hex[0], hex[0], hex[1], hex[1], hex[2], hex[2]};
    }
    if (hex.size() != 6) return {};
    for (char& c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return {};
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return hex;
}

void DocxRenderer::AppendTransactionally(XMLElement* parent, const std::function<void(XMLElement*)>& build) {
    XMLDocument* doc = parent->GetDocument();
    XMLElement* staging = doc->NewElement(parent->Name());
    try {
        build(staging);
    } catch (...) {
        doc->DeleteNode(staging);
        throw;
    }
    while (tinyxml2::XMLNode* child = staging->FirstChild()) {
        parent->InsertEndChild(child);
    }
    doc->DeleteNode(staging);
}

bool DocxRenderer::render(const std::vector<MarkdownElement>& elements,
                          const TemplateConfig& templateConfig,
                          const DocumentAssets& assets,
                          const std::string& outputPath,
                          const RenderHooks& hooks) {
    try {
        DocumentBuilder builder(templateConfig, assets);

        const std::size_t total = elements.size();
        for (std::size_t i = 0; i < total; ++i) {
            try {
                builder.render(elements[i]);
            } catch (const std::exception& e) {
                std::string msg = "Error rendering " + ElementKindName(elements[i]) + ": " + e.what();
                std::cerr << "[DocxRenderer] " << msg << std::endl;
                if (hooks.onElementError) hooks.onElementError(msg);
            }
            if (hooks.onProgress) {
                hooks.onProgress(100.0 * static_cast<double>(i + 1) / static_cast<double>(total),
                                 "Rendered " + std::to_string(i + 1) + "/" + std::to_string(total) + " elements");
            }
        }
        builder.footer(m_footerText);
        builder.finishSection();

        bool hasPng = false;
        bool hasJpeg = false;
        for (const auto& m : builder.media()) {
            hasPng = hasPng || (m.first.size() > 4 && m.first.compare(m.first.size() - 4, 4, ".png") == 0);
            hasJpeg = hasJpeg || (m.first.size() > 5 && m.first.compare(m.first.size() - 5, 5, ".jpeg") == 0);
        }

        DocxPackage package;
        package.addPart("[Content_Types].xml", ContentTypesXml(hasPng, hasJpeg));
        package.addPart("_rels/.rels", PackageRelationshipsXml());
        package.addPart("docProps/core.xml", CorePropertiesXml(templateConfig, DocumentTitle(elements)));
        package.addPart("docProps/app.xml", AppPropertiesXml());
        package.addPart("word/document.xml", builder.documentXml());
        package.addPart("word/styles.xml", StylesXml(templateConfig));
        package.addPart("word/numbering.xml", NumberingXml());
        package.addPart("word/_rels/document.xml.rels", RelationshipsXml(builder.relationships()));
        for (const auto& m : builder.media()) {
            package.addPart(m.first, m.second);
        }

        std::string archive;
        std::string error;
        if (!package.build(archive, error)) {
            std::cerr << "[DocxRenderer] " << error << std::endl;
            return false;
        }
        if (!FileUtils::WriteFileAtomically(outputPath, archive)) {
            std::cerr << "[DocxRenderer] Failed to write " << outputPath << std::endl;
            return false;
        }
    } catch (const std::exception& e) {
        std::cerr << "[DocxRenderer] Failed to build document: " << e.what() << std::endl;
        return false;
    }

    std::cout << "[DocxRenderer] Wrote " << outputPath << std::endl;
    return true;
}

} // namespace docforge::infrastructure::docx
