#include "infrastructure/pdf/PdfDocument.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <zlib.h>

namespace docforge::infrastructure::pdf {

namespace {
    int HexDigit(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
        return -1;
    }

    std::string ColorOperands(const Color& c) {
        return PdfDocument::Num(c.r) + " " + PdfDocument::Num(c.g) + " " + PdfDocument::Num(c.b);
    }

    std::string CreationDate() {
        std::time_t now = std::time(nullptr);
        std::tm tm{};
        gmtime_r(&now, &tm);
        char buf[32];
        std::strftime(buf, sizeof(buf), "D:%Y%m%d%H%M%SZ", &tm);
        return buf;
    }
}

Color Color::FromHex(const std::string& hex) {
    std::string h = hex;
    if (!h.empty() && h[0] == '#') h = h.substr(1);
    if (h.size() == 3) {
        h = std::string{h[0], h[0], h[1], h[1], h[2], h[2]};
    }
    if (h.size() != 6) return Color{};

    int v[6];
    for (int i = 0; i < 6; ++i) {
        v[i] = HexDigit(h[i]);
        if (v[i] < 0) return Color{};
    }
    return Color{(v[0] * 16 + v[1]) / 255.0, (v[2] * 16 + v[3]) / 255.0, (v[4] * 16 + v[5]) / 255.0};
}

PdfPage::PdfPage(double width, double height)
    : m_width(width)
    , m_height(height) {}

void PdfPage::drawText(double x, double y, StandardFont font, double size, const std::string& text, const Color& color) {
    if (text.empty()) return;
    m_fonts.insert(font);
    m_content << "BT /" << PdfDocument::ResourceName(font) << " " << PdfDocument::Num(size) << " Tf "
              << ColorOperands(color) << " rg "
              << PdfDocument::Num(x) << " " << PdfDocument::Num(y) << " Td ("
              << PdfDocument::EscapeString(text) << ") Tj ET\n";
}

void PdfPage::fillRect(double x, double y, double w, double h, const Color& color) {
    m_content << ColorOperands(color) << " rg "
              << PdfDocument::Num(x) << " " << PdfDocument::Num(y) << " "
              << PdfDocument::Num(w) << " " << PdfDocument::Num(h) << " re f\n";
}

void PdfPage::strokeRect(double x, double y, double w, double h, const Color& color, double lineWidth) {
    m_content << ColorOperands(color) << " RG " << PdfDocument::Num(lineWidth) << " w "
              << PdfDocument::Num(x) << " " << PdfDocument::Num(y) << " "
              << PdfDocument::Num(w) << " " << PdfDocument::Num(h) << " re S\n";
}

void PdfPage::drawLine(double x1, double y1, double x2, double y2, const Color& color, double lineWidth) {
    m_content << ColorOperands(color) << " RG " << PdfDocument::Num(lineWidth) << " w "
              << PdfDocument::Num(x1) << " " << PdfDocument::Num(y1) << " m "
              << PdfDocument::Num(x2) << " " << PdfDocument::Num(y2) << " l S\n";
}

void PdfPage::drawImage(const std::string& resourceName, double x, double y, double w, double h) {
    m_images.insert(resourceName);
    m_content << "q " << PdfDocument::Num(w) << " 0 0 " << PdfDocument::Num(h) << " "
              << PdfDocument::Num(x) << " " << PdfDocument::Num(y) << " cm /" << resourceName << " Do Q\n";
}

void PdfPage::addLink(double x, double y, double w, double h, const std::string& uri) {
    m_links.push_back(Link{{x, y, x + w, y + h}, uri});
}

PdfDocument::PdfDocument(double pageWidth, double pageHeight, bool compressStreams)
    : m_pageWidth(pageWidth)
    , m_pageHeight(pageHeight)
    , m_compress(compressStreams) {}

PdfPage& PdfDocument::addPage() {
    m_pages.emplace_back(m_pageWidth, m_pageHeight);
    return m_pages.back();
}

std::string PdfDocument::addImage(PdfImage image) {
    m_imageList.push_back(std::move(image));
    return "Im" + std::to_string(m_imageList.size());
}

std::string PdfDocument::ResourceName(StandardFont font) {
    return "F" + std::to_string(static_cast<int>(font) + 1);
}

std::string PdfDocument::EscapeString(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '(' || c == ')' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

std::string PdfDocument::Num(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    std::string s = buf;
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    if (s == "-0" || s.empty()) s = "0";
    return s;
}

bool PdfDocument::Compress(const std::string& input, std::string& output, std::string& error) {
    if (input.empty()) {
        output.clear();
        return true;
    }

    uLongf bound = compressBound(static_cast<uLong>(input.size()));
    std::string compressed;
    compressed.resize(bound);

    int zres = compress2(reinterpret_cast<Bytef*>(&compressed[0]), &bound,
                         reinterpret_cast<const Bytef*>(input.data()),
                         static_cast<uLong>(input.size()), Z_BEST_SPEED);
    if (zres != Z_OK) {
        error = "compress2 failed (" + std::to_string(zres) + ")";
        return false;
    }

    compressed.resize(bound);
    output.swap(compressed);
    return true;
}

std::string PdfDocument::streamObject(const std::string& dict, const std::string& data, bool compress) const {
    std::string body = data;
    bool compressed = false;
    if (compress && !data.empty()) {
        std::string error;
        std::string deflated;
        if (Compress(data, deflated, error)) {
            body.swap(deflated);
            compressed = true;
        } else {
            std::cerr << "[PdfDocument] " << error << "; writing stream uncompressed" << std::endl;
        }
    }

    std::ostringstream obj;
    obj << "<< " << dict << " /Length " << body.size();
    if (compressed) obj << " /Filter /FlateDecode";
    obj << " >>\nstream\n" << body << "\nendstream";
    return obj.str();
}

std::string PdfDocument::serialize() const {
    // Object ids are 1-based indices into this vector. 1: Catalog, 2: Pages, 3: Info.
    std::vector<std::string> objects(3);

    std::set<StandardFont> usedFonts;
    for (const auto& p : m_pages) usedFonts.insert(p.fonts().begin(), p.fonts().end());
    if (usedFonts.empty()) usedFonts.insert(StandardFont::Helvetica);

    std::ostringstream fontResources;
    fontResources << "<< ";
    for (StandardFont font : usedFonts) {
        objects.push_back(std::string("<< /Type /Font /Subtype /Type1 /BaseFont /") + FontMetrics::BaseFontName(font) +
                          " /Encoding /WinAnsiEncoding >>");
        fontResources << "/" << ResourceName(font) << " " << objects.size() << " 0 R ";
    }
    fontResources << ">>";

    std::ostringstream imageResources;
    for (std::size_t i = 0; i < m_imageList.size(); ++i) {
        const PdfImage& img = m_imageList[i];
        std::size_t smaskId = 0;
        if (!img.alpha.empty()) {
            std::ostringstream dict;
            dict << "/Type /XObject /Subtype /Image /Width " << img.width << " /Height " << img.height
                 << " /ColorSpace /DeviceGray /BitsPerComponent 8";
            objects.push_back(streamObject(dict.str(), img.alpha, true));
            smaskId = objects.size();
        }

        std::ostringstream dict;
        dict << "/Type /XObject /Subtype /Image /Width " << img.width << " /Height " << img.height
             << " /ColorSpace /" << img.colorSpace << " /BitsPerComponent " << img.bitsPerComponent;
        if (img.invertedCmyk) dict << " /Decode [1 0 1 0 1 0 1 0]";
        if (smaskId != 0) dict << " /SMask " << smaskId << " 0 R";

        if (img.filter.empty()) {
            objects.push_back(streamObject(dict.str(), img.data, true));
        } else {
            dict << " /Filter /" << img.filter;
            objects.push_back(streamObject(dict.str(), img.data, false));
        }
        imageResources << "/Im" << (i + 1) << " " << objects.size() << " 0 R ";
    }

    std::ostringstream resources;
    resources << "<< /Font " << fontResources.str();
    if (!m_imageList.empty()) resources << " /XObject << " << imageResources.str() << ">>";
    resources << " >>";

    std::vector<std::size_t> pageIds;
    for (const auto& p : m_pages) {
        objects.push_back(streamObject("", p.content(), m_compress));
        std::size_t contentId = objects.size();

        std::vector<std::size_t> annotIds;
        for (const auto& link : p.links()) {
            std::ostringstream annot;
            annot << "<< /Type /Annot /Subtype /Link /Rect [" << Num(link.rect[0]) << " " << Num(link.rect[1]) << " "
                  << Num(link.rect[2]) << " " << Num(link.rect[3]) << "] /Border [0 0 0] /A << /S /URI /URI ("
                  << EscapeString(link.uri) << ") >> >>";
            objects.push_back(annot.str());
            annotIds.push_back(objects.size());
        }

        std::ostringstream pageObj;
        pageObj << "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 " << Num(p.width()) << " " << Num(p.height())
                << "] /Contents " << contentId << " 0 R /Resources " << resources.str();
        if (!annotIds.empty()) {
            pageObj << " /Annots [";
            for (std::size_t id : annotIds) pageObj << id << " 0 R ";
            pageObj << "]";
        }
        pageObj << " >>";
        objects.push_back(pageObj.str());
        pageIds.push_back(objects.size());
    }

    std::ostringstream kids;
    for (std::size_t id : pageIds) kids << id << " 0 R ";
    objects[0] = "<< /Type /Catalog /Pages 2 0 R >>";
    objects[1] = "<< /Type /Pages /Kids [" + kids.str() + "] /Count " + std::to_string(pageIds.size()) + " >>";

    std::ostringstream info;
    info << "<< /Producer (DocForge) /Creator (DocForge) /CreationDate (" << CreationDate() << ")";
    if (!m_info.title.empty()) info << " /Title (" << EscapeString(FontMetrics::ToWinAnsi(m_info.title)) << ")";
    if (!m_info.author.empty()) info << " /Author (" << EscapeString(FontMetrics::ToWinAnsi(m_info.author)) << ")";
    if (!m_info.subject.empty()) info << " /Subject (" << EscapeString(FontMetrics::ToWinAnsi(m_info.subject)) << ")";
    if (!m_info.keywords.empty()) info << " /Keywords (" << EscapeString(FontMetrics::ToWinAnsi(m_info.keywords)) << ")";
    info << " >>";
    objects[2] = info.str();

    std::ostringstream file;
    file << "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";
    std::vector<std::size_t> offsets;
    offsets.reserve(objects.size());
    for (std::size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(static_cast<std::size_t>(file.tellp()));
        file << (i + 1) << " 0 obj\n" << objects[i] << "\nendobj\n";
    }

    std::size_t xrefPos = static_cast<std::size_t>(file.tellp());
    file << "xref\n0 " << (objects.size() + 1) << "\n0000000000 65535 f \n";
    for (std::size_t off : offsets) {
        file << std::setw(10) << std::setfill('0') << off << " 00000 n \n";
    }
    file << "trailer\n<< /Size " << (objects.size() + 1) << " /Root 1 0 R /Info 3 0 R >>\nstartxref\n"
         << xrefPos << "\n%%EOF\n";
    return file.str();
}

} // namespace docforge::infrastructure::pdf
