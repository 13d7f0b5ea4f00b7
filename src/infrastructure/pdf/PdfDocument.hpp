/**
 * @file PdfDocument.hpp
 * @brief Minimal PDF 1.4 writer: pages of drawing operators, standard fonts,
 *        raster images and URI link annotations.
 */

#pragma once

#include "infrastructure/pdf/FontMetrics.hpp"

#include <array>
#include <cstdint>
#include <deque>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace docforge::infrastructure::pdf {

struct Color {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;

    /** @brief Parses "#rrggbb" or "#rgb"; anything else yields black. */
    static Color FromHex(const std::string& hex);
};

/**
 * @struct PdfImage
 * @brief An image XObject ready to embed. data is already encoded for the given filter.
 */
struct PdfImage {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::string colorSpace = "DeviceRGB";
    int bitsPerComponent = 8;
    std::string filter;     ///< "DCTDecode", or empty for raw samples (Flate applied on write).
    std::string data;
    std::string alpha;      ///< Raw 8-bit soft mask samples, empty when opaque.
    bool invertedCmyk = false;
};

struct DocumentInfo {
    std::string title;
    std::string author;
    std::string subject;
    std::string keywords;
};

/**
 * @class PdfPage
 * @brief Accumulates the content stream of one page. Coordinates are PDF user space (origin bottom-left).
 */
class PdfPage {
public:
    PdfPage(double width, double height);

    /** @param text WinAnsi-encoded. */
    void drawText(double x, double y, StandardFont font, double size, const std::string& text, const Color& color);
    void fillRect(double x, double y, double w, double h, const Color& color);
    void strokeRect(double x, double y, double w, double h, const Color& color, double lineWidth = 0.5);
    void drawLine(double x1, double y1, double x2, double y2, const Color& color, double lineWidth = 1.0);
    void drawImage(const std::string& resourceName, double x, double y, double w, double h);
    void addLink(double x, double y, double w, double h, const std::string& uri);

    double width() const { return m_width; }
    double height() const { return m_height; }
    std::string content() const { return m_content.str(); }

    struct Link {
        std::array<double, 4> rect;
        std::string uri;
    };
    const std::vector<Link>& links() const { return m_links; }
    const std::set<StandardFont>& fonts() const { return m_fonts; }
    const std::set<std::string>& images() const { return m_images; }

private:
    double m_width;
    double m_height;
    std::ostringstream m_content;
    std::vector<Link> m_links;
    std::set<StandardFont> m_fonts;
    std::set<std::string> m_images;
};

/**
 * @class PdfDocument
 * @brief Owns the pages and shared resources and serializes them with an xref table.
 */
class PdfDocument {
public:
    PdfDocument(double pageWidth, double pageHeight, bool compressStreams = true);

    PdfPage& addPage();
    PdfPage& page(std::size_t index) { return m_pages.at(index); }
    std::size_t pageCount() const { return m_pages.size(); }

    /** @brief Registers an image and returns its resource name (e.g. "Im1"). */
    std::string addImage(PdfImage image);

    void setInfo(DocumentInfo info) { m_info = std::move(info); }

    /** @brief Produces the complete file contents. */
    std::string serialize() const;

    static std::string ResourceName(StandardFont font);
    static std::string EscapeString(const std::string& text);
    static std::string Num(double value);

    /** @brief zlib deflate of a stream body. */
    static bool Compress(const std::string& input, std::string& output, std::string& error);

private:
    std::string streamObject(const std::string& dict, const std::string& data, bool compress) const;

    double m_pageWidth;
    double m_pageHeight;
    bool m_compress;
    std::deque<PdfPage> m_pages; // stable references across addPage()
    std::vector<PdfImage> m_imageList;
    DocumentInfo m_info;
};

} // namespace docforge::infrastructure::pdf
