/**
 * @file PdfRenderer.cpp
 * @brief Implementation of PdfRenderer.
 */

#include "infrastructure/pdf/PdfRenderer.hpp"
#include "domain/RichText.hpp"
#include "infrastructure/FileUtils.hpp"
#include "infrastructure/ImageLoader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <map>
#include <stdexcept>
#include <variant>

namespace docforge::infrastructure::pdf {

using namespace docforge::domain;

namespace {

constexpr double kPointsPerInch = 72.0;
constexpr double kImageMaxWidth = 5.0 * kPointsPerInch;
constexpr double kImageMaxHeight = 3.0 * kPointsPerInch;
constexpr double kDiagramMaxWidth = 6.0 * kPointsPerInch;
constexpr double kDiagramMaxHeight = 4.0 * kPointsPerInch;
constexpr double kListIndent = 18.0;
constexpr double kCodePadding = 6.0;

struct PieceStyle {
    StandardFont font = StandardFont::Helvetica;
    double size = 12.0;
    Color color;
    bool strike = false;
    bool underline = false;
    std::string uri;
};

/** A word fragment in one face. Several pieces form a word when emphasis changes mid-word. */
struct Piece {
    std::string text; // WinAnsi
    PieceStyle style;
    double width = 0.0;
};

/** An unbreakable word; spaceWidth is the gap before it when it does not start a line. */
struct Cluster {
    std::vector<Piece> pieces;
    double width = 0.0;
    double spaceWidth = 0.0;
};

struct Line {
    std::vector<Cluster> clusters;
    double width = 0.0;
    double maxSize = 0.0;
};

struct TextOptions {
    bool bold = false;
    bool italic = false;
    Color color;
    std::string uri;
    bool underline = false;
};

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<Cluster> BuildClusters(const std::vector<TextRun>& runs, const std::string& fontName,
                                   double size, const TextOptions& opts) {
    std::vector<Cluster> clusters;
    bool pendingSpace = true;

    for (const auto& run : runs) {
        PieceStyle style;
        style.font = FontMetrics::Resolve(run.code ? "Courier" : fontName,
                                          opts.bold || run.bold, opts.italic || run.italic);
        style.size = size;
        style.color = opts.color;
        style.strike = run.strike;
        style.underline = opts.underline;
        style.uri = opts.uri;

        const std::string text = FontMetrics::ToWinAnsi(run.text);
        std::string word;

        auto flush = [&]() {
            if (word.empty()) return;
            Piece piece{word, style, FontMetrics::TextWidth(style.font, word, size)};
            if (pendingSpace || clusters.empty()) {
                Cluster cluster;
                cluster.spaceWidth = FontMetrics::TextWidth(style.font, " ", size);
                clusters.push_back(std::move(cluster));
                pendingSpace = false;
            }
            clusters.back().width += piece.width;
            clusters.back().pieces.push_back(std::move(piece));
            word.clear();
        };

        for (char c : text) {
            if (c == ' ' || c == '\n' || c == '\r') {
                flush();
                pendingSpace = true;
            } else {
                word.push_back(c);
            }
        }
        flush();
    }
    return clusters;
}

/** Breaks a cluster wider than maxWidth at character boundaries. */
std::vector<Cluster> SplitOversized(const Cluster& cluster, double maxWidth) {
    std::vector<Cluster> out;
    Cluster current;
    current.spaceWidth = cluster.spaceWidth;

    for (const auto& piece : cluster.pieces) {
        Piece part{"", piece.style, 0.0};
        for (char c : piece.text) {
            double cw = FontMetrics::TextWidth(piece.style.font, std::string(1, c), piece.style.size);
            if (current.width + part.width + cw > maxWidth && (current.width > 0.0 || !part.text.empty())) {
                if (!part.text.empty()) {
                    current.width += part.width;
                    current.pieces.push_back(part);
                }
                out.push_back(std::move(current));
                current = Cluster{};
                part = Piece{"", piece.style, 0.0};
            }
            part.text.push_back(c);
            part.width += cw;
        }
        if (!part.text.empty()) {
            current.width += part.width;
            current.pieces.push_back(std::move(part));
        }
    }
    if (!current.pieces.empty()) out.push_back(std::move(current));
    return out;
}

std::vector<Line> WrapClusters(const std::vector<Cluster>& input, double maxWidth) {
    std::vector<Cluster> clusters;
    for (const auto& c : input) {
        if (c.width > maxWidth && maxWidth > 0.0) {
            auto parts = SplitOversized(c, maxWidth);
            clusters.insert(clusters.end(), parts.begin(), parts.end());
        } else {
            clusters.push_back(c);
        }
    }

    std::vector<Line> lines;
    Line current;
    for (auto& cluster : clusters) {
        double added = current.clusters.empty() ? cluster.width : cluster.spaceWidth + cluster.width;
        if (!current.clusters.empty() && current.width + added > maxWidth) {
            lines.push_back(std::move(current));
            current = Line{};
            added = cluster.width;
        }
        current.width += added;
        for (const auto& p : cluster.pieces) current.maxSize = std::max(current.maxSize, p.style.size);
        current.clusters.push_back(cluster);
    }
    if (!current.clusters.empty()) lines.push_back(std::move(current));
    return lines;
}

TextStyle HeadingStyle(const PrintStyles& styles, int level) {
    if (level <= 1) return styles.title;
    if (level == 2) return styles.heading1;
    TextStyle style = styles.heading2;
    if (level > 3) {
        style.fontSize = std::max(styles.body.fontSize, styles.heading2.fontSize - (level - 3));
    }
    return style;
}

std::string StripOrdinal(const std::string& text) {
    std::size_t i = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
    if (i == 0 || i >= text.size() || text[i] != '.') return text;
    ++i;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    return text.substr(i);
}

/**
 * Cursor-based layout over a PdfDocument. y runs downward from the top margin.
 */
class LayoutPass {
public:
    LayoutPass(PdfDocument& doc, const TemplateConfig& config, const DocumentAssets& assets,
               double pageWidth, double pageHeight)
        : m_doc(doc), m_styles(config.pdf), m_assets(assets) {
        m_left = m_styles.margins.left * kPointsPerInch;
        m_right = pageWidth - m_styles.margins.right * kPointsPerInch;
        m_top = pageHeight - m_styles.margins.top * kPointsPerInch;
        m_bottom = m_styles.margins.bottom * kPointsPerInch;
        if (m_right - m_left < kPointsPerInch || m_top - m_bottom < kPointsPerInch) {
            throw std::runtime_error("Page margins leave no printable area");
        }
        newPage();
    }

    void render(const MarkdownElement& element) {
        std::visit([this](const auto& e) { this->draw(e); }, element);
    }

private:
    double width() const { return m_right - m_left; }
    PdfPage& page() { return *m_page; }

    void newPage() {
        m_page = &m_doc.addPage();
        m_y = m_top;
    }

    bool atPageTop() const { return m_y >= m_top; }

    void ensureSpace(double height) {
        if (m_y - height < m_bottom && !atPageTop()) newPage();
    }

    void addSpace(double height) {
        if (atPageTop()) return;
        m_y -= height;
        if (m_y < m_bottom) newPage();
    }

    void drawLine(const Line& line, double x0, double lineWidth, const std::string& alignment,
                  bool lastLine, double baseline) {
        double extra = 0.0;
        double x = x0;
        const std::size_t gaps = line.clusters.empty() ? 0 : line.clusters.size() - 1;
        if (alignment == "justify" && !lastLine && gaps > 0) {
            extra = (lineWidth - line.width) / static_cast<double>(gaps);
        } else if (alignment == "center") {
            x += (lineWidth - line.width) / 2.0;
        } else if (alignment == "right") {
            x += lineWidth - line.width;
        }

        for (std::size_t k = 0; k < line.clusters.size(); ++k) {
            const Cluster& cluster = line.clusters[k];
            if (k > 0) x += cluster.spaceWidth + extra;
            for (const auto& piece : cluster.pieces) {
                const PieceStyle& s = piece.style;
                page().drawText(x, baseline, s.font, s.size, piece.text, s.color);
                if (s.strike) {
                    double sy = baseline + s.size * 0.3;
                    page().drawLine(x, sy, x + piece.width, sy, s.color, s.size / 18.0);
                }
                if (s.underline) {
                    double uy = baseline - s.size * 0.12;
                    page().drawLine(x, uy, x + piece.width, uy, s.color, s.size / 18.0);
                }
                if (!s.uri.empty()) {
                    page().addLink(x, baseline - s.size * 0.2, piece.width, s.size, s.uri);
                }
                x += piece.width;
            }
        }
    }

    static double BaselineOffset(double size, double lineHeight) {
        return (lineHeight - size) / 2.0 + size * 0.8;
    }

    /** Flows lines from the cursor, breaking pages between lines. */
    void flowLines(const std::vector<Line>& lines, double x0, double lineWidth, const TextStyle& style,
                   const std::optional<Color>& bar = std::nullopt, const std::string& bullet = {}) {
        for (std::size_t i = 0; i < lines.size(); ++i) {
            const Line& line = lines[i];
            double size = line.maxSize > 0.0 ? line.maxSize : style.fontSize;
            double lineHeight = size * style.leading;
            ensureSpace(lineHeight);
            double baseline = m_y - BaselineOffset(size, lineHeight);

            if (i == 0 && !bullet.empty()) {
                StandardFont f = FontMetrics::Resolve(style.font);
                page().drawText(x0 - kListIndent * 0.67, baseline, f, style.fontSize, bullet,
                                Color::FromHex(style.color));
            }
            drawLine(line, x0, lineWidth, style.alignment, i + 1 == lines.size(), baseline);
            if (bar) {
                page().fillRect(x0 - 10.0, m_y - lineHeight, 3.0, lineHeight, *bar);
            }
            m_y -= lineHeight;
        }
    }

    void textBlock(const std::string& text, const TextStyle& style, TextOptions opts,
                   double indent = 0.0, const std::optional<Color>& bar = std::nullopt,
                   const std::string& bullet = {}) {
        opts.color = Color::FromHex(style.color);
        auto clusters = BuildClusters(ParseInlineRuns(text), style.font, style.fontSize, opts);
        if (clusters.empty()) return;
        double x0 = m_left + indent;
        double lineWidth = width() - indent;
        addSpace(style.spaceBefore);
        flowLines(WrapClusters(clusters, lineWidth), x0, lineWidth, style, bar, bullet);
        addSpace(style.spaceAfter);
    }

    void draw(const Header& h) {
        textBlock(h.text, HeadingStyle(m_styles, h.level), TextOptions{true, false, {}, {}, false});
    }

    void draw(const Paragraph& p) { textBlock(p.text, m_styles.body, {}); }

    void draw(const PlainText& p) { textBlock(p.text, m_styles.body, {}); }

    void draw(const ListBlock& list) {
        TextStyle item = m_styles.body;
        item.spaceBefore = 0.0;
        item.spaceAfter = 2.0;
        for (const auto& entry : list.items) {
            int level = std::clamp(entry.indent / 2, 0, 6);
            double indent = kListIndent * (level + 1);
            textBlock(StripOrdinal(entry.text), item, {}, indent, std::nullopt, "\x95");
        }
        addSpace(m_styles.body.spaceAfter);
    }

    void draw(const Blockquote& q) {
        const TextStyle& style = m_styles.blockquote;
        std::optional<Color> bar;
        if (!style.borderColor.empty()) bar = Color::FromHex(style.borderColor);
        double indent = std::max(style.leftIndent, 14.0);
        textBlock(q.text, style, TextOptions{false, true, {}, {}, false}, indent, bar);
    }

    void draw(const HorizontalRule&) {
        addSpace(6.0);
        ensureSpace(2.0);
        page().drawLine(m_left, m_y, m_right, m_y, Color::FromHex(m_styles.ruleColor), 1.0);
        m_y -= 1.0;
        addSpace(10.0);
    }

    void draw(const Link& link) {
        TextOptions opts;
        opts.uri = link.url;
        opts.underline = true;
        TextStyle style = m_styles.body;
        style.color = m_styles.linkColor;
        std::string label = link.text.empty() ? link.url : link.text + " (" + link.url + ")";
        textBlock(label, style, opts);
    }

    void draw(const CodeBlock& block) { codeBlock(block.text); }

    void draw(const DiagramBlock& block) {
        ++m_diagramCount;
        auto path = m_assets.diagramPath(DiagramId(m_diagramCount));
        if (path && image(*path, {}, kDiagramMaxWidth, kDiagramMaxHeight)) {
            return;
        }
        codeBlock(block.source);
    }

    void draw(const Image& img) {
        auto path = m_assets.imagePath(img.url);
        if (!path) {
            std::cerr << "[PdfRenderer] Image not resolved, omitted: " << img.url << std::endl;
            return;
        }
        std::string caption;
        if (!img.alt.empty()) {
            caption = "Figure " + std::to_string(m_figureCount + 1) + ": " + img.alt;
        }
        if (image(*path, caption, kImageMaxWidth, kImageMaxHeight) && !caption.empty()) {
            ++m_figureCount;
        }
    }

    void draw(const Table& table) {
        if (table.headers.empty()) return;
        const TableStyle& ts = m_styles.table;
        const std::size_t columns = table.headers.size();
        const double colWidth = width() / static_cast<double>(columns);
        const double pad = ts.padding;

        struct RowLayout {
            std::vector<std::vector<Line>> cells;
            double height = 0.0;
        };

        TextStyle cellStyle;
        cellStyle.leading = 1.2;
        cellStyle.alignment = "left";

        auto layoutRow = [&](const std::vector<std::string>& cells, bool header) {
            RowLayout row;
            TextOptions opts;
            opts.bold = header;
            opts.color = Color::FromHex(ts.textColor);
            const std::string& font = header ? ts.headerFont : ts.cellFont;
            const double size = header ? ts.headerFontSize : ts.cellFontSize;
            double tallest = size * cellStyle.leading;
            for (std::size_t c = 0; c < columns; ++c) {
                const std::string text = c < cells.size() ? cells[c] : std::string();
                auto lines = WrapClusters(BuildClusters(ParseInlineRuns(text), font, size, opts), colWidth - 2 * pad);
                double h = 0.0;
                for (const auto& l : lines) h += (l.maxSize > 0.0 ? l.maxSize : size) * cellStyle.leading;
                tallest = std::max(tallest, h);
                row.cells.push_back(std::move(lines));
            }
            row.height = tallest + 2 * pad;
            return row;
        };

        auto drawRow = [&](const RowLayout& row, bool header) {
            const Color grid = Color::FromHex(ts.gridColor);
            if (header && !ts.headerBackground.empty()) {
                page().fillRect(m_left, m_y - row.height, width(), row.height, Color::FromHex(ts.headerBackground));
            }
            for (std::size_t c = 0; c < columns; ++c) {
                double x = m_left + colWidth * static_cast<double>(c);
                page().strokeRect(x, m_y - row.height, colWidth, row.height, grid);
                double top = m_y - pad;
                const auto& lines = row.cells[c];
                for (std::size_t i = 0; i < lines.size(); ++i) {
                    double size = lines[i].maxSize;
                    double lh = size * cellStyle.leading;
                    drawLine(lines[i], x + pad, colWidth - 2 * pad, "left", true, top - BaselineOffset(size, lh));
                    top -= lh;
                }
            }
            m_y -= row.height;
        };

        const RowLayout header = layoutRow(table.headers, true);
        addSpace(6.0);
        ensureSpace(header.height);
        drawRow(header, true);

        for (const auto& cells : table.rows) {
            if (cells.size() > columns) {
                std::cerr << "[PdfRenderer] Table row has " << cells.size() << " cells, truncated to "
                          << columns << std::endl;
            }
            RowLayout row = layoutRow(cells, false);
            if (m_y - row.height < m_bottom) {
                newPage();
                drawRow(header, true);
            }
            drawRow(row, false);
        }
        addSpace(m_styles.body.spaceAfter);
    }

    void codeBlock(const std::string& text) {
        const TextStyle& style = m_styles.code;
        const StandardFont font = FontMetrics::Resolve(style.font.empty() ? "Courier" : style.font);
        const double size = style.fontSize;
        const double x0 = m_left + style.leftIndent;
        const double boxWidth = width() - 2 * style.leftIndent;
        const double charWidth = FontMetrics::TextWidth(font, "M", size);
        const std::size_t perLine = std::max<std::size_t>(
            1, static_cast<std::size_t>((boxWidth - 2 * kCodePadding) / std::max(charWidth, 0.1)));

        std::vector<std::string> lines;
        std::size_t start = 0;
        const std::string encoded = FontMetrics::ToWinAnsi(text);
        while (start <= encoded.size()) {
            std::size_t end = encoded.find('\n', start);
            if (end == std::string::npos) end = encoded.size();
            std::string raw = encoded.substr(start, end - start);
            if (!raw.empty() && raw.back() == '\r') raw.pop_back();
            if (raw.empty()) {
                lines.emplace_back();
            }
            for (std::size_t i = 0; i < raw.size(); i += perLine) {
                lines.push_back(raw.substr(i, perLine));
            }
            start = end + 1;
        }

        const double lineHeight = size * style.leading;
        const Color textColor = Color::FromHex(style.color);
        addSpace(style.spaceBefore);

        std::size_t index = 0;
        while (index < lines.size()) {
            ensureSpace(lineHeight + 2 * kCodePadding);
            double available = m_y - m_bottom - 2 * kCodePadding;
            std::size_t fit = std::max<std::size_t>(1, static_cast<std::size_t>(available / lineHeight));
            std::size_t count = std::min(fit, lines.size() - index);
            double boxHeight = static_cast<double>(count) * lineHeight + 2 * kCodePadding;

            if (!style.background.empty()) {
                page().fillRect(x0, m_y - boxHeight, boxWidth, boxHeight, Color::FromHex(style.background));
            }
            if (!style.borderColor.empty()) {
                page().strokeRect(x0, m_y - boxHeight, boxWidth, boxHeight, Color::FromHex(style.borderColor));
            }
            double top = m_y - kCodePadding;
            for (std::size_t k = 0; k < count; ++k) {
                const std::string& line = lines[index + k];
                if (!line.empty()) {
                    page().drawText(x0 + kCodePadding, top - BaselineOffset(size, lineHeight), font, size, line, textColor);
                }
                top -= lineHeight;
            }
            m_y -= boxHeight;
            index += count;
            if (index < lines.size()) newPage();
        }
        addSpace(style.spaceAfter);
    }

    bool image(const std::string& path, const std::string& caption, double maxWidth, double maxHeight) {
        auto it = m_imageCache.find(path);
        if (it == m_imageCache.end()) {
            auto loaded = PdfRenderer::LoadImage(path);
            std::optional<CachedImage> cached;
            if (loaded) {
                CachedImage entry;
                entry.width = loaded->width;
                entry.height = loaded->height;
                entry.resource = m_doc.addImage(std::move(*loaded));
                cached = entry;
            } else {
                std::cerr << "[PdfRenderer] Unsupported or unreadable image: " << path << std::endl;
            }
            it = m_imageCache.emplace(path, cached).first;
        }
        if (!it->second) return false;

        const CachedImage& img = *it->second;
        if (img.width == 0 || img.height == 0) return false;
        double w = static_cast<double>(img.width);
        double h = static_cast<double>(img.height);
        double scale = std::min({1.0, maxWidth / w, maxHeight / h, width() / w});
        w *= scale;
        h *= scale;

        double captionHeight = caption.empty() ? 0.0 : m_styles.caption.fontSize * m_styles.caption.leading;
        addSpace(6.0);
        ensureSpace(h + captionHeight);
        double x = m_left + (width() - w) / 2.0;
        page().drawImage(img.resource, x, m_y - h, w, h);
        m_y -= h + 4.0;

        if (!caption.empty()) {
            TextStyle style = m_styles.caption;
            style.alignment = "center";
            textBlock(caption, style, TextOptions{false, true, {}, {}, false});
        } else {
            addSpace(8.0);
        }
        return true;
    }

    struct CachedImage {
        std::string resource;
        std::uint32_t width = 0;
        std::uint32_t height = 0;
    };

    PdfDocument& m_doc;
    const PrintStyles& m_styles;
    const DocumentAssets& m_assets;
    double m_left = 0.0;
    double m_right = 0.0;
    double m_top = 0.0;
    double m_bottom = 0.0;
    double m_y = 0.0;
    PdfPage* m_page = nullptr;
    int m_diagramCount = 0;
    int m_figureCount = 0;
    std::map<std::string, std::optional<CachedImage>> m_imageCache;
};

std::string DocumentTitle(const std::vector<MarkdownElement>& elements) {
    for (const auto& e : elements) {
        if (const auto* h = std::get_if<Header>(&e); h && h->level == 1) {
            return PlainTextOf(h->text);
        }
    }
    return {};
}

std::string JoinKeywords(const std::vector<std::string>& keywords) {
    std::string out;
    for (const auto& k : keywords) {
        if (!out.empty()) out += ", ";
        out += k;
    }
    return out;
}

} // namespace

PdfRenderer::PdfRenderer(std::string footerText, bool compressStreams)
    : m_footerText(std::move(footerText)), m_compressStreams(compressStreams) {}

std::pair<double, double> PdfRenderer::PageSize(const std::string& name) {
    if (ToLower(name) == "letter") {
        return {612.0, 792.0};
    }
    return {595.28, 841.89};
}

std::optional<PdfImage> PdfRenderer::LoadImage(const std::string& path) {
    auto bytes = FileUtils::ReadFile(path);
    if (!bytes) return std::nullopt;

    switch (ImageLoader::DetectFormat(*bytes)) {
        case ImageFormat::Jpeg: {
            auto info = ImageLoader::Probe(*bytes);
            if (!info || info->width == 0 || info->height == 0) return std::nullopt;
            PdfImage image;
            image.width = info->width;
            image.height = info->height;
            image.colorSpace = info->components == 1 ? "DeviceGray"
                             : info->components == 4 ? "DeviceCMYK" : "DeviceRGB";
            image.filter = "DCTDecode";
            image.invertedCmyk = info->components == 4;
            image.data = std::move(*bytes);
            return image;
        }
        case ImageFormat::Png: {
            auto decoded = ImageLoader::DecodePng(*bytes);
            if (!decoded) return std::nullopt;
            PdfImage image;
            image.width = decoded->width;
            image.height = decoded->height;
            image.colorSpace = decoded->components == 1 ? "DeviceGray" : "DeviceRGB";
            image.data = std::move(decoded->pixels);
            image.alpha = std::move(decoded->alpha);
            return image;
        }
        default:
            return std::nullopt;
    }
}

bool PdfRenderer::render(const std::vector<MarkdownElement>& elements,
                         const TemplateConfig& templateConfig,
                         const DocumentAssets& assets,
                         const std::string& outputPath,
                         const RenderHooks& hooks) {
    const auto [pageWidth, pageHeight] = PageSize(templateConfig.pdf.pageSize);

    try {
        PdfDocument doc(pageWidth, pageHeight, m_compressStreams);
        LayoutPass layout(doc, templateConfig, assets, pageWidth, pageHeight);

        const std::size_t total = elements.size();
        for (std::size_t i = 0; i < total; ++i) {
            try {
                layout.render(elements[i]);
            } catch (const std::exception& e) {
                std::string msg = "Error rendering " + ElementKindName(elements[i]) + ": " + e.what();
                std::cerr << "[PdfRenderer] " << msg << std::endl;
                if (hooks.onElementError) hooks.onElementError(msg);
            }
            if (hooks.onProgress) {
                hooks.onProgress(100.0 * static_cast<double>(i + 1) / static_cast<double>(total),
                                 "Rendered " + std::to_string(i + 1) + "/" + std::to_string(total) + " elements");
            }
        }

        if (!m_footerText.empty()) {
            const TextStyle& style = templateConfig.pdf.footer;
            const StandardFont font = FontMetrics::Resolve(style.font);
            const std::string text = FontMetrics::ToWinAnsi(m_footerText);
            const double textWidth = FontMetrics::TextWidth(font, text, style.fontSize);
            const double y = templateConfig.pdf.margins.bottom * kPointsPerInch / 2.0;
            for (std::size_t p = 0; p < doc.pageCount(); ++p) {
                doc.page(p).drawText((pageWidth - textWidth) / 2.0, y, font, style.fontSize, text,
                                     Color::FromHex(style.color));
            }
        }

        DocumentInfo info;
        info.title = DocumentTitle(elements);
        info.author = templateConfig.metadata.author;
        info.subject = templateConfig.metadata.subject;
        info.keywords = JoinKeywords(templateConfig.metadata.keywords);
        doc.setInfo(std::move(info));

        if (!FileUtils::WriteFileAtomically(outputPath, doc.serialize())) {
            std::cerr << "[PdfRenderer] Failed to write " << outputPath << std::endl;
            return false;
        }
    } catch (const std::exception& e) {
        std::cerr << "[PdfRenderer] Failed to build document: " << e.what() << std::endl;
        return false;
    }

    std::cout << "[PdfRenderer] Wrote " << outputPath << std::endl;
    return true;
}

} // namespace docforge::infrastructure::pdf
