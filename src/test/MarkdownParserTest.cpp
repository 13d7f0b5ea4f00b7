#include <cassert>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "domain/MarkdownParser.hpp"

using namespace docforge::domain;

namespace {

template<typename T>
const T& As(const MarkdownElement& element) {
    const T* value = std::get_if<T>(&element);
    assert(value != nullptr);
    return *value;
}

void TestHeadersAndParagraphs() {
    std::cout << "[Test] Headers and paragraphs..." << std::endl;
    auto elements = MarkdownParser::Parse("# Title\n\nFirst line\nsecond line\n\n###### Deep\n####### Seven\n#NoSpace");
    assert(elements.size() == 4);
    assert(As<Header>(elements[0]).level == 1);
    assert(As<Header>(elements[0]).text == "Title");
    assert(As<Paragraph>(elements[1]).text == "First line\nsecond line");
    assert(As<Header>(elements[2]).level == 6);
    assert(As<Header>(elements[2]).text == "Deep");
    // Seven hashes and a missing space are plain paragraph text.
    assert(As<Paragraph>(elements[3]).text == "####### Seven\n#NoSpace");
}

void TestParagraphStopsAtConstruct() {
    std::cout << "[Test] Paragraph ends at the next block construct..." << std::endl;
    auto elements = MarkdownParser::Parse("Some text\n- item one\n- item two\n---\n> quoted\n> more");
    assert(elements.size() == 4);
    assert(As<Paragraph>(elements[0]).text == "Some text");
    const auto& list = As<ListBlock>(elements[1]);
    assert(list.items.size() == 2);
    assert(list.items[0].marker == "-");
    assert(list.items[1].text == "item two");
    assert(std::holds_alternative<HorizontalRule>(elements[2]));
    assert(As<Blockquote>(elements[3]).text == "quoted\nmore");
}

void TestLists() {
    std::cout << "[Test] Ordered and nested lists..." << std::endl;
    auto elements = MarkdownParser::Parse("1. first\n  * nested\n10. tenth\n-nospace");
    assert(elements.size() == 2);
    const auto& list = As<ListBlock>(elements[0]);
    assert(list.items.size() == 3);
    assert(list.items[0].marker == "1.");
    assert(list.items[0].indent == 0);
    assert(list.items[1].marker == "*");
    assert(list.items[1].indent == 2);
    assert(list.items[1].text == "nested");
    assert(list.items[2].marker == "10.");
    assert(As<Paragraph>(elements[1]).text == "-nospace");
}

void TestTables() {
    std::cout << "[Test] Tables..." << std::endl;
    auto elements = MarkdownParser::Parse(
        "| Name | Score |\n"
        "|:-----|------:|\n"
        "| Ana  | 10 |\n"
        "| Bo | 7 | extra |\n"
        "\n"
        "| not | a table |\n"
        "| no separator |");
    assert(elements.size() >= 2);
    const auto& table = As<Table>(elements[0]);
    assert(table.headers.size() == 2);
    assert(table.headers[0] == "Name");
    assert(table.headers[1] == "Score");
    assert(table.rows.size() == 2);
    assert(table.rows[0][0] == "Ana");
    assert(table.rows[0][1] == "10");
    assert(table.rows[1].size() == 3);
    assert(!std::holds_alternative<Table>(elements[1]));

    // A separator made only of pipes is not a separator.
    auto noDash = MarkdownParser::Parse("| a | b |\n| | |");
    for (const auto& e : noDash) assert(!std::holds_alternative<Table>(e));
}

void TestFencedBlocks() {
    std::cout << "[Test] Code and diagram fences..." << std::endl;
    auto elements = MarkdownParser::Parse(
        "```python\n"
        "def f():\n"
        "    return 1\n"
        "```\n"
        "```\n"
        "plain\n"
        "```\n"
        "```Mermaid\n"
        "graph TD\n"
        "  A-->B\n"
        "```\n");
    assert(elements.size() == 3);
    const auto& code = As<CodeBlock>(elements[0]);
    assert(code.language && *code.language == "python");
    assert(code.text == "def f():\n    return 1");
    assert(!As<CodeBlock>(elements[1]).language);
    assert(As<CodeBlock>(elements[1]).text == "plain");
    const auto& diagram = As<DiagramBlock>(elements[2]);
    assert(diagram.source == "graph TD\n  A-->B");

    assert(MarkdownParser::IsDiagramLanguage("diagram"));
    assert(MarkdownParser::IsDiagramLanguage("MERMAID"));
    assert(!MarkdownParser::IsDiagramLanguage("plantuml"));

    auto sources = MarkdownParser::ExtractDiagramSources("```mermaid\nA\n```\ntext\n```diagram\nB\n```");
    assert(sources.size() == 2);
    assert(sources[0] == "A");
    assert(sources[1] == "B");
}

void TestUnterminatedFence() {
    std::cout << "[Test] Unterminated fence drops the remainder..." << std::endl;
    auto elements = MarkdownParser::Parse("# Kept\n```js\nconsole.log(1)\n# never a header");
    assert(elements.size() == 1);
    assert(As<Header>(elements[0]).text == "Kept");
}

void TestImagesAndLinks() {
    std::cout << "[Test] Images and links..." << std::endl;
    auto elements = MarkdownParser::Parse(
        "![Chart](images/chart.png)\n"
        "\n"
        "See [the docs](https://example.com/docs) and ![icon](icon.png) here.");
    assert(elements.size() == 6);
    assert(As<Image>(elements[0]).url == "images/chart.png");
    assert(As<Image>(elements[0]).alt == "Chart");
    assert(As<PlainText>(elements[1]).text == "See");
    assert(As<Link>(elements[2]).url == "https://example.com/docs");
    assert(As<Link>(elements[2]).text == "the docs");
    assert(As<PlainText>(elements[3]).text == "and");
    assert(As<Image>(elements[4]).url == "icon.png");
    assert(As<PlainText>(elements[5]).text == "here.");

    auto images = MarkdownParser::ExtractImages("a ![](x.png) b\n![y](y.jpg)");
    assert(images.size() == 2);
    assert(images[0].alt.empty());
    assert(images[1].url == "y.jpg");
}

void TestHeaderLevels() {
    std::cout << "[Test] Header level equals the hash count..." << std::endl;
    for (int level = 1; level <= 6; ++level) {
        auto elements = MarkdownParser::Parse(std::string(static_cast<size_t>(level), '#') + " Heading");
        assert(elements.size() == 1);
        assert(As<Header>(elements[0]).level == level);
        assert(As<Header>(elements[0]).text == "Heading");
    }
}

void TestTableWithoutRows() {
    std::cout << "[Test] Header and separator without data rows..." << std::endl;
    auto elements = MarkdownParser::Parse("| A | B |\n|---|---|");
    assert(elements.size() == 1);
    const auto& table = As<Table>(elements[0]);
    assert(table.headers.size() == 2);
    assert(table.rows.empty());
}

void TestSingleImageLine() {
    std::cout << "[Test] A line holding one image yields one Image..." << std::endl;
    auto elements = MarkdownParser::Parse("![Logo](assets/logo.png)");
    assert(elements.size() == 1);
    assert(As<Image>(elements[0]).url == "assets/logo.png");
    assert(As<Image>(elements[0]).alt == "Logo");
}

void TestEndToEndSample() {
    std::cout << "[Test] Header, paragraph and table sample..." << std::endl;
    auto elements = MarkdownParser::Parse("# Title\n\nSome **bold** text.\n\n| A | B |\n|---|---|\n| 1 | 2 |\n");
    assert(elements.size() == 3);
    assert(As<Header>(elements[0]).level == 1);
    assert(As<Header>(elements[0]).text == "Title");
    assert(As<Paragraph>(elements[1]).text == "Some **bold** text.");
    const auto& table = As<Table>(elements[2]);
    assert((table.headers == std::vector<std::string>{"A", "B"}));
    assert(table.rows.size() == 1);
    assert((table.rows[0] == std::vector<std::string>{"1", "2"}));
    assert(MarkdownParser::Parse("").empty());
    assert(MarkdownParser::Parse("\n  \n\t\n").empty());
}

} // namespace

int main() {
    std::cout << "[Test] Starting MarkdownParser Test..." << std::endl;

    TestHeadersAndParagraphs();
    TestParagraphStopsAtConstruct();
    TestLists();
    TestTables();
    TestFencedBlocks();
    TestUnterminatedFence();
    TestImagesAndLinks();
    TestHeaderLevels();
    TestTableWithoutRows();
    TestSingleImageLine();
    TestEndToEndSample();

    std::cout << "[PASS] MarkdownParser Test Passed." << std::endl;
    return 0;
}
