#include <cassert>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <miniz.h>
#include <tinyxml2.h>

#include "application/TemplateRegistry.hpp"
#include "domain/MarkdownParser.hpp"
#include "infrastructure/FileUtils.hpp"
#include "infrastructure/docx/DocxPackage.hpp"
#include "infrastructure/docx/DocxRenderer.hpp"
#include "infrastructure/pdf/PdfRenderer.hpp"
#include "test/TestSupport.hpp"

using namespace docforge;
using infrastructure::FileUtils;
using infrastructure::docx::DocxPackage;
using infrastructure::docx::DocxRenderer;
using infrastructure::pdf::PdfRenderer;

namespace {

const char* kSample =
    "# Quarterly Report\n"
    "\n"
    "Revenue grew **strongly** this quarter.\n"
    "\n"
    "## Details\n"
    "\n"
    "- North region\n"
    "  - Subsidiary\n"
    "1. Ordered entry\n"
    "\n"
    "> Growth is expected to continue.\n"
    "\n"
    "| Region | Sales |\n"
    "|--------|-------|\n"
    "| North  | 120   |\n"
    "| South  | 95    |\n"
    "\n"
    "```mermaid\n"
    "graph TD\n"
    "  A-->B\n"
    "```\n"
    "\n"
    "See [the dashboard](https://example.com/dash).\n"
    "\n"
    "![Trend](trend.png)\n"
    "\n"
    "---\n"
    "\n"
    "```cpp\n"
    "int main() { return 0; }\n"
    "```\n";

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// Pulls one part out of a zip archive held in memory.
std::string ExtractPart(const std::string& archive, const char* name) {
    mz_zip_archive zip;
    std::memset(&zip, 0, sizeof(zip));
    bool opened = mz_zip_reader_init_mem(&zip, archive.data(), archive.size(), 0);
    assert(opened);
    size_t size = 0;
    void* data = mz_zip_reader_extract_file_to_heap(&zip, name, &size, 0);
    std::string out;
    if (data) {
        out.assign(static_cast<const char*>(data), size);
        mz_free(data);
    }
    mz_zip_reader_end(&zip);
    return out;
}

domain::TemplateConfig Template(const std::string& name) {
    application::TemplateRegistry registry(nullptr);
    auto config = registry.get(name);
    assert(config);
    return *config;
}

void TestPdf(const test::ScratchDir& dir, const std::vector<domain::MarkdownElement>& elements,
             const domain::DocumentAssets& assets) {
    std::cout << "[Test] PDF rendering..." << std::endl;
    PdfRenderer renderer("Generated by Test", false);
    assert(renderer.format() == domain::ExportFormat::Pdf);

    std::vector<double> progress;
    std::vector<std::string> errors;
    domain::RenderHooks hooks;
    hooks.onProgress = [&](double pct, const std::string&) { progress.push_back(pct); };
    hooks.onElementError = [&](const std::string& msg) { errors.push_back(msg); };

    const std::string out = dir.file("report.pdf");
    assert(renderer.render(elements, Template("technical_report"), assets, out, hooks));
    assert(errors.empty());
    assert(progress.size() == elements.size());
    assert(progress.back() == 100.0);

    std::string pdf = FileUtils::ReadFile(out).value_or("");
    assert(pdf.rfind("%PDF-", 0) == 0);
    assert(Contains(pdf, "%%EOF"));
    assert(Contains(pdf, "/Title (Quarterly Report)"));
    assert(Contains(pdf, "/Subject (Technical Report)"));
    assert(Contains(pdf, "(Generated by Test) Tj"));
    assert(Contains(pdf, "/Subtype /Image"));
    assert(Contains(pdf, "/URI (https://example.com/dash)"));
    // Without a rendered asset the diagram falls back to its source text.
    assert(Contains(pdf, "(graph TD) Tj"));

    // Once the diagram has a raster it is drawn as an image instead.
    domain::DocumentAssets withDiagram = assets;
    withDiagram.diagrams[domain::DiagramId(1)] = assets.images.at("trend.png");
    const std::string out2 = dir.file("report_diagram.pdf");
    assert(renderer.render(elements, Template("technical_report"), withDiagram, out2, {}));
    std::string pdf2 = FileUtils::ReadFile(out2).value_or("");
    assert(!Contains(pdf2, "(graph TD) Tj"));

    // An empty document still produces one footer-only page.
    const std::string empty = dir.file("empty.pdf");
    assert(renderer.render({}, Template("whitepaper"), {}, empty, {}));
    assert(Contains(FileUtils::ReadFile(empty).value_or(""), "/Count 1"));

    auto impossible = Template("whitepaper");
    impossible.pdf.margins.left = 5.0;
    impossible.pdf.margins.right = 5.0;
    assert(!renderer.render(elements, impossible, assets, dir.file("bad.pdf"), {}));

    assert(PdfRenderer::PageSize("Letter").first == 612.0);
    assert(PdfRenderer::PageSize("A4").second > 841.0);
    assert(PdfRenderer::PageSize("tabloid") == PdfRenderer::PageSize("A4"));
}

void TestPdfCompressed(const test::ScratchDir& dir, const std::vector<domain::MarkdownElement>& elements,
                       const domain::DocumentAssets& assets) {
    std::cout << "[Test] Compressed PDF..." << std::endl;
    PdfRenderer renderer("Footer");
    const std::string out = dir.file("compressed.pdf");
    assert(renderer.render(elements, Template("academic_paper"), assets, out, {}));
    std::string pdf = FileUtils::ReadFile(out).value_or("");
    assert(Contains(pdf, "/FlateDecode"));
    assert(!Contains(pdf, "(Footer) Tj"));
}

void TestDocx(const test::ScratchDir& dir, const std::vector<domain::MarkdownElement>& elements,
              const domain::DocumentAssets& assets) {
    std::cout << "[Test] Word rendering..." << std::endl;
    DocxRenderer renderer("Generated by Test");
    assert(renderer.format() == domain::ExportFormat::Word);

    int calls = 0;
    domain::RenderHooks hooks;
    hooks.onProgress = [&](double, const std::string&) { ++calls; };

    const std::string out = dir.file("report.docx");
    assert(renderer.render(elements, Template("business_report"), assets, out, hooks));
    assert(calls == static_cast<int>(elements.size()));

    std::string archive = FileUtils::ReadFile(out).value_or("");
    assert(archive.rfind("PK", 0) == 0);

    std::string document = ExtractPart(archive, "word/document.xml");
    assert(Contains(document, "Quarterly Report"));
    assert(Contains(document, "w:pStyle w:val=\"Title\""));
    assert(Contains(document, "w:pStyle w:val=\"Heading1\""));
    assert(Contains(document, "Revenue grew "));
    assert(Contains(document, "strongly"));
    assert(Contains(document, "w:numId"));
    assert(Contains(document, "w:tblHeader"));
    assert(Contains(document, "Region"));
    assert(Contains(document, "graph TD"));
    assert(Contains(document, "w:hyperlink"));
    assert(Contains(document, "wp:inline"));
    assert(Contains(document, "Trend"));
    assert(Contains(document, "Generated by Test"));
    assert(Contains(document, "w:pgSz"));

    std::string rels = ExtractPart(archive, "word/_rels/document.xml.rels");
    assert(Contains(rels, "https://example.com/dash"));
    assert(Contains(rels, "TargetMode=\"External\""));
    assert(Contains(rels, "media/image1.png"));

    assert(!ExtractPart(archive, "word/media/image1.png").empty());
    assert(Contains(ExtractPart(archive, "[Content_Types].xml"), "image/png"));
    assert(Contains(ExtractPart(archive, "word/styles.xml"), "ListBullet"));
    assert(Contains(ExtractPart(archive, "docProps/core.xml"), "Quarterly Report"));
    assert(!ExtractPart(archive, "word/numbering.xml").empty());

    // Letter templates change the section size.
    auto letter = Template("business_report");
    letter.pdf.pageSize = "letter";
    const std::string out2 = dir.file("letter.docx");
    assert(renderer.render(elements, letter, {}, out2, {}));
    std::string letterDoc = ExtractPart(FileUtils::ReadFile(out2).value_or(""), "word/document.xml");
    assert(Contains(letterDoc, "w:w=\"12240\""));
    // Unresolved images are omitted and nothing is embedded.
    assert(!Contains(letterDoc, "wp:inline"));

    assert(DocxRenderer::StyleId("List Bullet") == "ListBullet");
    assert(DocxRenderer::StyleId("Heading 1") == "Heading1");
    assert(DocxRenderer::HexColor("#34495e") == "34495E");
    assert(DocxRenderer::HexColor("#abc") == "AABBCC");
    assert(DocxRenderer::HexColor("blue").empty());
}

void TestFailedElementLeavesNoMarkup() {
    std::cout << "[Test] Failed element leaves the body untouched..." << std::endl;
    tinyxml2::XMLDocument doc;
    tinyxml2::XMLElement* body = doc.NewElement("w:body");
    doc.InsertEndChild(body);
    body->InsertEndChild(doc.NewElement("w:p"));

    bool threw = false;
    try {
        DocxRenderer::AppendTransactionally(body, [](tinyxml2::XMLElement* staging) {
            tinyxml2::XMLElement* tbl = staging->GetDocument()->NewElement("w:tbl");
            staging->InsertEndChild(tbl);
            tbl->InsertEndChild(staging->GetDocument()->NewElement("w:tc"));
            throw std::runtime_error("cell failed");
        });
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()) == "cell failed";
    }
    assert(threw);
    assert(body->FirstChildElement("w:tbl") == nullptr);
    assert(body->FirstChild() == body->LastChild());

    DocxRenderer::AppendTransactionally(body, [](tinyxml2::XMLElement* staging) {
        staging->InsertEndChild(staging->GetDocument()->NewElement("w:tbl"));
        staging->InsertEndChild(staging->GetDocument()->NewElement("w:p"));
    });
    assert(body->FirstChildElement("w:tbl") != nullptr);
    assert(std::string(body->LastChildElement()->Name()) == "w:p");
    int count = 0;
    for (auto* child = body->FirstChildElement(); child; child = child->NextSiblingElement()) ++count;
    assert(count == 3);
}

void TestPackage() {
    std::cout << "[Test] Zip package..." << std::endl;
    DocxPackage package;
    package.addPart("a.xml", "<a/>");
    package.addPart("b.xml", "<b/>");
    package.addPart("a.xml", "<a2/>");
    assert(package.partCount() == 2);
    assert(package.hasPart("b.xml"));
    assert(!package.hasPart("c.xml"));

    std::string archive;
    std::string error;
    assert(package.build(archive, error));
    assert(error.empty());
    assert(ExtractPart(archive, "a.xml") == "<a2/>");
    assert(ExtractPart(archive, "b.xml") == "<b/>");
}

} // namespace

int main() {
    std::cout << "[Test] Starting Renderers Test..." << std::endl;

    test::ScratchDir dir("docforge_renderers");
    const std::string trend = dir.file("trend.png");
    assert(FileUtils::WriteFileAtomically(trend, test::MakePng(40, 20, 6)));

    auto elements = domain::MarkdownParser::Parse(kSample);
    assert(elements.size() >= 10);

    domain::DocumentAssets assets;
    assets.images["trend.png"] = trend;

    TestPdf(dir, elements, assets);
    TestPdfCompressed(dir, elements, assets);
    TestDocx(dir, elements, assets);
    TestFailedElementLeavesNoMarkup();
    TestPackage();

    std::cout << "[PASS] Renderers Test Passed." << std::endl;
    return 0;
}
