#include "domain/RichText.hpp"
#include <cctype>

namespace docforge::domain {

namespace {
    bool IsWordChar(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
    }

    bool OpensAt(const std::string& text, size_t pos, char marker) {
        // Intra-word underscores (snake_case) are literal.
        if (marker == '_' && pos > 0 && IsWordChar(text[pos - 1])) return false;
        return true;
    }

    size_t FindDoubleClose(const std::string& text, size_t from, const char* marker) {
        size_t pos = text.find(marker, from);
        while (pos != std::string::npos) {
            if (marker[0] != '_' || pos + 2 >= text.size() || !IsWordChar(text[pos + 2])) return pos;
            pos = text.find(marker, pos + 1);
        }
        return std::string::npos;
    }

    size_t FindSingleClose(const std::string& text, size_t from, char marker) {
        size_t j = from;
        while (j < text.size()) {
            if (text[j] == '`') {
                size_t tick = text.find('`', j + 1);
                if (tick == std::string::npos) return std::string::npos;
                j = tick + 1;
                continue;
            }
            if (text[j] == marker) {
                if (j + 1 < text.size() && text[j + 1] == marker) {
                    j += 2;
                    continue;
                }
                if (marker == '_' && j + 1 < text.size() && IsWordChar(text[j + 1])) {
                    ++j;
                    continue;
                }
                return j;
            }
            ++j;
        }
        return std::string::npos;
    }

    void Append(std::vector<TextRun>& runs, TextRun run) {
        if (run.text.empty()) return;
        if (!runs.empty() && runs.back().sameStyle(run)) {
            runs.back().text += run.text;
            return;
        }
        runs.push_back(std::move(run));
    }

    void ParseInto(const std::string& text, const TextRun& style, std::vector<TextRun>& runs) {
        std::string literal;
        auto flush = [&]() {
            TextRun run = style;
            run.text = literal;
            Append(runs, run);
            literal.clear();
        };

        size_t i = 0;
        while (i < text.size()) {
            char c = text[i];
            bool hasNext = i + 1 < text.size();

            if (c == '`') {
                size_t close = text.find('`', i + 1);
                if (close != std::string::npos && close > i + 1) {
                    flush();
                    TextRun run = style;
                    run.code = true;
                    run.text = text.substr(i + 1, close - i - 1);
                    Append(runs, run);
                    i = close + 1;
                    continue;
                }
            } else if ((c == '*' || c == '_' || c == '~') && hasNext && text[i + 1] == c && OpensAt(text, i, c)) {
                const char marker[3] = {c, c, '\0'};
                size_t close = FindDoubleClose(text, i + 2, marker);
                if (close != std::string::npos && close > i + 2) {
                    flush();
                    TextRun inner = style;
                    if (c == '~') inner.strike = true;
                    else inner.bold = true;
                    ParseInto(text.substr(i + 2, close - i - 2), inner, runs);
                    i = close + 2;
                    continue;
                }
                literal += text.substr(i, 2);
                i += 2;
                continue;
            } else if ((c == '*' || c == '_') && hasNext && text[i + 1] != ' ' && OpensAt(text, i, c)) {
                size_t close = FindSingleClose(text, i + 1, c);
                if (close != std::string::npos && close > i + 1) {
                    flush();
                    TextRun inner = style;
                    inner.italic = true;
                    ParseInto(text.substr(i + 1, close - i - 1), inner, runs);
                    i = close + 1;
                    continue;
                }
            }

            literal += c;
            ++i;
        }
        flush();
    }
}

std::vector<TextRun> ParseInlineRuns(const std::string& text) {
    std::vector<TextRun> runs;
    ParseInto(text, TextRun{}, runs);
    return runs;
}

std::string PlainTextOf(const std::string& text) {
    std::string out;
    for (const auto& run : ParseInlineRuns(text)) {
        out += run.text;
    }
    return out;
}

} // namespace docforge::domain
