/**
 * @file FontMetrics.hpp
 * @brief Standard-14 font selection, glyph widths and WinAnsi transcoding.
 */

#pragma once

#include <string>

namespace docforge::infrastructure::pdf {

enum class StandardFont {
    Helvetica,
    HelveticaBold,
    HelveticaOblique,
    HelveticaBoldOblique,
    TimesRoman,
    TimesBold,
    TimesItalic,
    TimesBoldItalic,
    Courier,
    CourierBold,
    CourierOblique,
    CourierBoldOblique
};

constexpr int kStandardFontCount = 12;

class FontMetrics {
public:
    /** @brief PostScript name used as /BaseFont. */
    static const char* BaseFontName(StandardFont font);

    /**
     * @brief Maps a template font name plus emphasis flags to a standard face.
     * Unknown families fall back to Helvetica.
     */
    static StandardFont Resolve(const std::string& name, bool bold = false, bool italic = false);

    /** @brief Width in points of WinAnsi-encoded text. */
    static double TextWidth(StandardFont font, const std::string& winAnsi, double size);

    /** @brief Transcodes UTF-8 to WinAnsiEncoding; unmappable characters become '?'. */
    static std::string ToWinAnsi(const std::string& utf8);
};

} // namespace docforge::infrastructure::pdf
