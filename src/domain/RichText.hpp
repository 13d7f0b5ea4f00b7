/**
 * @file RichText.hpp
 * @brief Inline emphasis post-pass shared by both format renderers.
 */

#pragma once

#include <string>
#include <vector>

namespace docforge::domain {

/**
 * @struct TextRun
 * @brief A contiguous piece of text with uniform emphasis.
 */
struct TextRun {
    std::string text;
    bool bold = false;
    bool italic = false;
    bool code = false;
    bool strike = false;

    bool sameStyle(const TextRun& other) const {
        return bold == other.bold && italic == other.italic && code == other.code && strike == other.strike;
    }
};

/**
 * @brief Splits text into emphasis runs.
 *
 * Recognizes `**bold**` / `__bold__`, `*italic*` / `_italic_`, `` `code` `` and `~~strike~~`.
 * Markers nest; an unclosed marker is kept as literal text. Adjacent runs with
 * the same style are merged.
 */
std::vector<TextRun> ParseInlineRuns(const std::string& text);

/**
 * @brief Returns the text with all emphasis markers removed.
 */
std::string PlainTextOf(const std::string& text);

} // namespace docforge::domain
