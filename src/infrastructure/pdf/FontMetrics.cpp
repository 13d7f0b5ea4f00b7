#include "infrastructure/pdf/FontMetrics.hpp"

#include <cstdint>

namespace docforge::infrastructure::pdf {

namespace {
    // Advance widths (1/1000 em) for codes 32..126, from the Adobe AFM files.
    constexpr short kHelvetica[95] = {
        278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333, 278, 278,
        556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 278, 278, 584, 584, 584, 556,
        1015, 667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833, 722, 778,
        667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 278, 278, 278, 469, 556,
        333, 556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833, 556, 556,
        556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500, 334, 260, 334, 584};

    constexpr short kHelveticaBold[95] = {
        278, 333, 474, 556, 556, 889, 722, 238, 333, 333, 389, 584, 278, 333, 278, 278,
        556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 333, 333, 584, 584, 584, 611,
        975, 722, 722, 722, 722, 667, 611, 778, 722, 278, 556, 722, 611, 833, 722, 778,
        667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 333, 278, 333, 584, 556,
        333, 556, 611, 556, 611, 556, 333, 611, 611, 278, 278, 556, 278, 889, 611, 611,
        611, 611, 389, 556, 333, 611, 556, 778, 556, 556, 500, 389, 280, 389, 584};

    constexpr short kTimesRoman[95] = {
        250, 333, 408, 500, 500, 833, 778, 180, 333, 333, 500, 564, 250, 333, 250, 278,
        500, 500, 500, 500, 500, 500, 500, 500, 500, 500, 278, 278, 564, 564, 564, 444,
        921, 722, 667, 667, 722, 611, 556, 722, 722, 333, 389, 722, 611, 889, 722, 722,
        556, 722, 667, 556, 611, 722, 722, 944, 722, 722, 611, 333, 278, 333, 469, 500,
        333, 444, 500, 444, 500, 444, 333, 500, 500, 278, 278, 500, 278, 778, 500, 500,
        500, 500, 333, 389, 278, 500, 500, 722, 500, 500, 444, 480, 200, 480, 541};

    constexpr short kTimesBold[95] = {
        250, 333, 555, 500, 500, 1000, 833, 278, 333, 333, 500, 570, 250, 333, 250, 278,
        500, 500, 500, 500, 500, 500, 500, 500, 500, 500, 333, 333, 570, 570, 570, 500,
        930, 722, 667, 722, 722, 667, 611, 778, 778, 389, 500, 778, 667, 944, 722, 778,
        611, 778, 722, 556, 667, 722, 722, 1000, 722, 722, 667, 333, 278, 333, 581, 500,
        333, 500, 556, 444, 556, 444, 333, 500, 556, 278, 333, 556, 278, 833, 556, 500,
        556, 556, 444, 389, 333, 556, 500, 722, 500, 500, 444, 394, 220, 394, 520};

    enum class Family { Helvetica, Times, Courier };

    Family FamilyOf(StandardFont font) {
        switch (font) {
            case StandardFont::TimesRoman:
            case StandardFont::TimesBold:
            case StandardFont::TimesItalic:
            case StandardFont::TimesBoldItalic:
                return Family::Times;
            case StandardFont::Courier:
            case StandardFont::CourierBold:
            case StandardFont::CourierOblique:
            case StandardFont::CourierBoldOblique:
                return Family::Courier;
            default:
                return Family::Helvetica;
        }
    }

    bool IsBold(StandardFont font) {
        switch (font) {
            case StandardFont::HelveticaBold:
            case StandardFont::HelveticaBoldOblique:
            case StandardFont::TimesBold:
            case StandardFont::TimesBoldItalic:
            case StandardFont::CourierBold:
            case StandardFont::CourierBoldOblique:
                return true;
            default:
                return false;
        }
    }

    int GlyphWidth(StandardFont font, unsigned char c) {
        Family family = FamilyOf(font);
        if (family == Family::Courier) return 600;

        // Italic faces share the advance widths of their upright counterparts closely enough for line breaking.
        const short* table = nullptr;
        if (family == Family::Times) table = IsBold(font) ? kTimesBold : kTimesRoman;
        else table = IsBold(font) ? kHelveticaBold : kHelvetica;

        if (c >= 32 && c <= 126) return table[c - 32];
        if (c == 0x95) return 350;                 // bullet
        if (c == 0x96) return 500;                 // en dash
        if (c == 0x97) return 1000;                // em dash
        if (c == 0x85) return 1000;                // ellipsis
        if (c >= 0x91 && c <= 0x94) return family == Family::Times ? 333 : 222;
        return family == Family::Times ? 500 : 556;
    }

    // Unicode -> WinAnsi for the 0x80..0x9F block.
    struct SpecialMapping {
        std::uint32_t codepoint;
        unsigned char code;
    };

    constexpr SpecialMapping kSpecials[] = {
        {0x20AC, 0x80}, {0x201A, 0x82}, {0x0192, 0x83}, {0x201E, 0x84}, {0x2026, 0x85},
        {0x2020, 0x86}, {0x2021, 0x87}, {0x02C6, 0x88}, {0x2030, 0x89}, {0x0160, 0x8A},
        {0x2039, 0x8B}, {0x0152, 0x8C}, {0x017D, 0x8E}, {0x2018, 0x91}, {0x2019, 0x92},
        {0x201C, 0x93}, {0x201D, 0x94}, {0x2022, 0x95}, {0x2013, 0x96}, {0x2014, 0x97},
        {0x02DC, 0x98}, {0x2122, 0x99}, {0x0161, 0x9A}, {0x203A, 0x9B}, {0x0153, 0x9C},
        {0x017E, 0x9E}, {0x0178, 0x9F}};
}

const char* FontMetrics::BaseFontName(StandardFont font) {
    switch (font) {
        case StandardFont::Helvetica: return "Helvetica";
        case StandardFont::HelveticaBold: return "Helvetica-Bold";
        case StandardFont::HelveticaOblique: return "Helvetica-Oblique";
        case StandardFont::HelveticaBoldOblique: return "Helvetica-BoldOblique";
        case StandardFont::TimesRoman: return "Times-Roman";
        case StandardFont::TimesBold: return "Times-Bold";
        case StandardFont::TimesItalic: return "Times-Italic";
        case StandardFont::TimesBoldItalic: return "Times-BoldItalic";
        case StandardFont::Courier: return "Courier";
        case StandardFont::CourierBold: return "Courier-Bold";
        case StandardFont::CourierOblique: return "Courier-Oblique";
        case StandardFont::CourierBoldOblique: return "Courier-BoldOblique";
    }
    return "Helvetica";
}

StandardFont FontMetrics::Resolve(const std::string& name, bool bold, bool italic) {
    bool b = bold || name.find("Bold") != std::string::npos;
    bool i = italic || name.find("Italic") != std::string::npos || name.find("Oblique") != std::string::npos;

    if (name.rfind("Times", 0) == 0) {
        if (b && i) return StandardFont::TimesBoldItalic;
        if (b) return StandardFont::TimesBold;
        if (i) return StandardFont::TimesItalic;
        return StandardFont::TimesRoman;
    }
    if (name.rfind("Courier", 0) == 0) {
        if (b && i) return StandardFont::CourierBoldOblique;
        if (b) return StandardFont::CourierBold;
        if (i) return StandardFont::CourierOblique;
        return StandardFont::Courier;
    }
    if (b && i) return StandardFont::HelveticaBoldOblique;
    if (b) return StandardFont::HelveticaBold;
    if (i) return StandardFont::HelveticaOblique;
    return StandardFont::Helvetica;
}

double FontMetrics::TextWidth(StandardFont font, const std::string& winAnsi, double size) {
    long units = 0;
    for (unsigned char c : winAnsi) {
        units += GlyphWidth(font, c);
    }
    return static_cast<double>(units) * size / 1000.0;
}

std::string FontMetrics::ToWinAnsi(const std::string& utf8) {
    std::string out;
    out.reserve(utf8.size());

    size_t i = 0;
    while (i < utf8.size()) {
        unsigned char c = static_cast<unsigned char>(utf8[i]);
        std::uint32_t cp = 0;
        size_t extra = 0;
        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            extra = 2;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            extra = 3;
        } else {
            out += '?';
            ++i;
            continue;
        }

        if (extra > 0 && i + extra >= utf8.size()) {
            out += '?';
            break;
        }
        bool valid = true;
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(utf8[i + k]);
            if ((cc & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!valid) {
            out += '?';
            ++i;
            continue;
        }
        i += extra + 1;

        if (cp == '\t') {
            out += "    ";
        } else if (cp < 0x20) {
            continue;
        } else if (cp < 0x7F || (cp >= 0xA0 && cp <= 0xFF)) {
            out += static_cast<char>(cp);
        } else {
            char mapped = '?';
            for (const auto& m : kSpecials) {
                if (m.codepoint == cp) {
                    mapped = static_cast<char>(m.code);
                    break;
                }
            }
            out += mapped;
        }
    }
    return out;
}

} // namespace docforge::infrastructure::pdf
