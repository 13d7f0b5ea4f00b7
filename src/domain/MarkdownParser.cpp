#include "domain/MarkdownParser.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>

namespace docforge::domain {

namespace {
    bool StartsWith(const std::string& text, const char* prefix) {
        return text.compare(0, std::string(prefix).length(), prefix) == 0;
    }

    bool IsSpace(char c) {
        return c == ' ' || c == '\t';
    }

    std::string Trim(const std::string& s) {
        size_t start = s.find_first_not_of(" \t");
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(" \t");
        return s.substr(start, end - start + 1);
    }

    std::string TrimRight(const std::string& s) {
        size_t end = s.find_last_not_of(" \t\r");
        if (end == std::string::npos) return "";
        return s.substr(0, end + 1);
    }

    std::vector<std::string> SplitLines(const std::string& text) {
        std::vector<std::string> lines;
        std::stringstream ss(text);
        std::string line;
        while (std::getline(ss, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            lines.push_back(line);
        }
        return lines;
    }

    std::string Join(const std::vector<std::string>& parts, const std::string& sep) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) out += sep;
            out += parts[i];
        }
        return out;
    }

    std::optional<Header> MatchHeader(const std::string& line) {
        size_t hashes = 0;
        while (hashes < line.size() && line[hashes] == '#') ++hashes;
        if (hashes == 0 || hashes > 6) return std::nullopt;
        if (hashes >= line.size() || !IsSpace(line[hashes])) return std::nullopt;

        std::string text = Trim(line.substr(hashes));
        if (text.empty()) return std::nullopt;
        return Header{static_cast<int>(hashes), text};
    }

    bool IsHorizontalRule(const std::string& line) {
        std::string t = Trim(line);
        if (t.size() < 3) return false;
        char c = t[0];
        if (c != '-' && c != '*' && c != '_') return false;
        return std::all_of(t.begin(), t.end(), [c](char ch) { return ch == c; });
    }

    bool IsFence(const std::string& line) {
        return StartsWith(Trim(line), "```");
    }

    bool IsBlockquote(const std::string& line) {
        return StartsWith(Trim(line), ">");
    }

    bool IsTableCandidate(const std::string& line) {
        std::string t = Trim(line);
        return t.size() >= 2 && t.front() == '|' && t.back() == '|';
    }

    bool IsTableSeparator(const std::string& line) {
        std::string t = Trim(line);
        if (t.empty() || t.find('-') == std::string::npos) return false;
        return std::all_of(t.begin(), t.end(), [](char ch) {
            return ch == '-' || ch == ':' || ch == '|' || IsSpace(ch);
        });
    }

    std::optional<std::vector<std::string>> SplitRow(const std::string& line) {
        std::string t = Trim(line);
        if (t.size() < 2 || t.front() != '|' || t.back() != '|') return std::nullopt;

        std::vector<std::string> cells;
        std::string inner = t.substr(1, t.size() - 2);
        size_t start = 0;
        while (true) {
            size_t bar = inner.find('|', start);
            if (bar == std::string::npos) {
                cells.push_back(Trim(inner.substr(start)));
                break;
            }
            cells.push_back(Trim(inner.substr(start, bar - start)));
            start = bar + 1;
        }
        return cells;
    }

    std::optional<ListItem> MatchListItem(const std::string& line) {
        size_t pos = 0;
        while (pos < line.size() && IsSpace(line[pos])) ++pos;
        if (pos >= line.size()) return std::nullopt;

        ListItem item;
        item.indent = static_cast<int>(pos);

        char c = line[pos];
        if (c == '-' || c == '*' || c == '+') {
            item.marker = std::string(1, c);
            ++pos;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            size_t digitsEnd = pos;
            while (digitsEnd < line.size() && std::isdigit(static_cast<unsigned char>(line[digitsEnd]))) ++digitsEnd;
            if (digitsEnd >= line.size() || line[digitsEnd] != '.') return std::nullopt;
            item.marker = line.substr(pos, digitsEnd - pos + 1);
            pos = digitsEnd + 1;
        } else {
            return std::nullopt;
        }

        if (pos >= line.size() || !IsSpace(line[pos])) return std::nullopt;
        item.text = Trim(line.substr(pos));
        if (item.text.empty()) return std::nullopt;
        return item;
    }

    struct SpanMatch {
        size_t start = 0;
        size_t end = 0; // one past the closing ')'
        bool isImage = false;
        std::string label;
        std::string url;
    };

    // Matches "[label](url)" with '[' at pos. Image labels may be empty, link labels may not.
    std::optional<SpanMatch> MatchBracketSpan(const std::string& line, size_t bracket, bool allowEmptyLabel) {
        size_t close = line.find(']', bracket + 1);
        if (close == std::string::npos) return std::nullopt;
        if (close + 1 >= line.size() || line[close + 1] != '(') return std::nullopt;
        size_t urlEnd = line.find(')', close + 2);
        if (urlEnd == std::string::npos) return std::nullopt;

        SpanMatch m;
        m.label = line.substr(bracket + 1, close - bracket - 1);
        m.url = Trim(line.substr(close + 2, urlEnd - close - 2));
        m.end = urlEnd + 1;
        if (m.url.empty()) return std::nullopt;
        if (!allowEmptyLabel && m.label.empty()) return std::nullopt;
        return m;
    }

    std::vector<SpanMatch> FindImages(const std::string& line) {
        std::vector<SpanMatch> out;
        size_t pos = 0;
        while ((pos = line.find("![", pos)) != std::string::npos) {
            auto m = MatchBracketSpan(line, pos + 1, true);
            if (m) {
                m->start = pos;
                m->isImage = true;
                pos = m->end;
                out.push_back(*m);
            } else {
                pos += 2;
            }
        }
        return out;
    }

    std::vector<SpanMatch> FindLinks(const std::string& line, const std::vector<SpanMatch>& images) {
        std::vector<SpanMatch> out;
        size_t pos = 0;
        while ((pos = line.find('[', pos)) != std::string::npos) {
            auto m = MatchBracketSpan(line, pos, false);
            if (!m) {
                ++pos;
                continue;
            }
            m->start = pos;
            bool overlapsImage = std::any_of(images.begin(), images.end(), [&](const SpanMatch& img) {
                return m->start < img.end && img.start < m->end;
            });
            if (overlapsImage) {
                ++pos;
                continue;
            }
            out.push_back(*m);
            pos = m->end;
        }
        return out;
    }

    std::optional<Image> MatchStandaloneImage(const std::string& line) {
        std::string t = Trim(line);
        if (!StartsWith(t, "![")) return std::nullopt;
        auto images = FindImages(t);
        if (images.size() != 1 || images[0].start != 0 || images[0].end != t.size()) return std::nullopt;
        return Image{images[0].url, images[0].label};
    }

    bool StartsConstruct(const std::string& line) {
        return MatchHeader(line) || IsHorizontalRule(line) || IsFence(line) || IsBlockquote(line) ||
               IsTableCandidate(line) || MatchListItem(line) || MatchStandaloneImage(line);
    }

    std::string FenceLanguage(const std::string& line) {
        return Trim(Trim(line).substr(3));
    }

    bool IsClosingFence(const std::string& line) {
        return Trim(line) == "```";
    }
}

bool MarkdownParser::IsDiagramLanguage(const std::string& language) {
    std::string lower = language;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "mermaid" || lower == "diagram";
}

std::vector<MarkdownElement> MarkdownParser::Parse(const std::string& text) {
    std::vector<MarkdownElement> elements;
    const std::vector<std::string> raw = SplitLines(text);
    std::vector<std::string> lines;
    lines.reserve(raw.size());
    for (const auto& l : raw) lines.push_back(TrimRight(l));

    const size_t n = lines.size();
    size_t i = 0;
    while (i < n) {
        const std::string& line = lines[i];

        if (Trim(line).empty()) {
            ++i;
            continue;
        }

        if (auto header = MatchHeader(line)) {
            elements.emplace_back(*header);
            ++i;
            continue;
        }

        if (IsHorizontalRule(line)) {
            elements.emplace_back(HorizontalRule{});
            ++i;
            continue;
        }

        if (IsFence(line)) {
            size_t close = i + 1;
            while (close < n && !IsClosingFence(lines[close])) ++close;
            if (close >= n) {
                // Unterminated fence: the block and everything after it is dropped.
                break;
            }

            std::vector<std::string> body(raw.begin() + static_cast<long>(i) + 1, raw.begin() + static_cast<long>(close));
            std::string language = FenceLanguage(line);
            std::string content = Join(body, "\n");

            if (IsDiagramLanguage(language)) {
                elements.emplace_back(DiagramBlock{language, content});
            } else {
                CodeBlock block;
                if (!language.empty()) block.language = language;
                block.text = content;
                elements.emplace_back(block);
            }
            i = close + 1;
            continue;
        }

        if (IsBlockquote(line)) {
            std::vector<std::string> quoted;
            while (i < n && !Trim(lines[i]).empty() && IsBlockquote(lines[i])) {
                std::string content = Trim(lines[i]).substr(1);
                quoted.push_back(Trim(content));
                ++i;
            }
            std::string joined = Trim(Join(quoted, "\n"));
            if (!joined.empty()) {
                elements.emplace_back(Blockquote{joined});
            }
            continue;
        }

        if (IsTableCandidate(line) && i + 1 < n && IsTableSeparator(lines[i + 1])) {
            Table table;
            table.headers = SplitRow(line).value_or(std::vector<std::string>{});
            size_t j = i + 2;
            while (j < n && StartsWith(Trim(lines[j]), "|")) {
                if (auto row = SplitRow(lines[j])) {
                    table.rows.push_back(*row);
                }
                ++j;
            }
            elements.emplace_back(std::move(table));
            i = j;
            continue;
        }

        if (MatchListItem(line)) {
            ListBlock list;
            while (i < n) {
                auto item = MatchListItem(lines[i]);
                if (!item) break;
                list.items.push_back(*item);
                ++i;
            }
            elements.emplace_back(std::move(list));
            continue;
        }

        if (auto image = MatchStandaloneImage(line)) {
            elements.emplace_back(*image);
            ++i;
            continue;
        }

        std::string trimmed = Trim(line);
        auto images = FindImages(trimmed);
        auto links = FindLinks(trimmed, images);
        if (!images.empty() || !links.empty()) {
            std::vector<SpanMatch> spans = images;
            spans.insert(spans.end(), links.begin(), links.end());
            std::sort(spans.begin(), spans.end(),
                      [](const SpanMatch& a, const SpanMatch& b) { return a.start < b.start; });

            size_t cursor = 0;
            for (const auto& span : spans) {
                std::string before = Trim(trimmed.substr(cursor, span.start - cursor));
                if (!before.empty()) elements.emplace_back(PlainText{before});
                if (span.isImage) {
                    elements.emplace_back(Image{span.url, span.label});
                } else {
                    elements.emplace_back(Link{span.url, span.label});
                }
                cursor = span.end;
            }
            std::string after = Trim(trimmed.substr(cursor));
            if (!after.empty()) elements.emplace_back(PlainText{after});
            ++i;
            continue;
        }

        std::vector<std::string> paragraph{trimmed};
        ++i;
        while (i < n && !Trim(lines[i]).empty() && !StartsConstruct(lines[i])) {
            paragraph.push_back(Trim(lines[i]));
            ++i;
        }
        elements.emplace_back(Paragraph{Join(paragraph, "\n")});
    }

    return elements;
}

std::vector<Image> MarkdownParser::ExtractImages(const std::string& text) {
    std::vector<Image> images;
    for (const auto& line : SplitLines(text)) {
        for (const auto& m : FindImages(line)) {
            images.push_back(Image{m.url, m.label});
        }
    }
    return images;
}

std::vector<std::string> MarkdownParser::ExtractDiagramSources(const std::string& text) {
    std::vector<std::string> sources;
    for (const auto& element : Parse(text)) {
        if (const auto* diagram = std::get_if<DiagramBlock>(&element)) {
            sources.push_back(diagram->source);
        }
    }
    return sources;
}

} // namespace docforge::domain
