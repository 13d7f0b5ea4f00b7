#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "infrastructure/FileUtils.hpp"
#include "infrastructure/MermaidCliRenderer.hpp"
#include "test/TestSupport.hpp"

using namespace docforge;
using infrastructure::DiagramSettings;
using infrastructure::MermaidCliRenderer;

namespace fs = std::filesystem;

namespace {

// Writes an executable shell script standing in for the diagram CLI.
std::string WriteTool(const test::ScratchDir& dir, const std::string& name, const std::string& body) {
    const std::string path = dir.file(name);
    std::ofstream out(path);
    out << "#!/bin/sh\n" << body;
    out.close();
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
    return path;
}

const char* kCopyTool =
    "in=''\n"
    "out=''\n"
    "while [ $# -gt 0 ]; do\n"
    "  case \"$1\" in\n"
    "    -i) in=\"$2\"; shift 2 ;;\n"
    "    -o) out=\"$2\"; shift 2 ;;\n"
    "    *) shift ;;\n"
    "  esac\n"
    "done\n"
    "cp \"$in\" \"$out\"\n";

size_t CountFiles(const std::string& dir) {
    size_t n = 0;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        (void)entry;
        ++n;
    }
    return n;
}

} // namespace

int main() {
    std::cout << "[Test] Starting MermaidCliRenderer Test..." << std::endl;

    test::ScratchDir tools("docforge_tools");
    test::ScratchDir scratch("docforge_diagrams");
    domain::DiagramRenderer::RenderOptions options;

    {
        std::cout << "[Test] Successful render..." << std::endl;
        DiagramSettings settings;
        settings.command = WriteTool(tools, "fake-mmdc", kCopyTool);
        settings.timeoutSeconds = 10;
        MermaidCliRenderer renderer(settings, scratch.path().string());
        assert(renderer.isAvailable());

        const std::string source = "graph TD\n  A-->B\n";
        auto first = renderer.render(source, "diagram_1", options);
        auto second = renderer.render(source, "diagram_1", options);
        assert(first && second);
        assert(*first != *second);
        assert(fs::path(*first).extension() == ".png");
        assert(fs::path(*first).filename().string().rfind("diagram_1_", 0) == 0);
        assert(infrastructure::FileUtils::ReadFile(*first).value_or("") == source);

        // Only the two outputs remain; the .mmd inputs are cleaned up.
        assert(CountFiles(scratch.path().string()) == 2);
        fs::remove(*first);
        fs::remove(*second);

        auto uri = renderer.renderDataUri("AB", "odd id/../x", options);
        assert(uri);
        assert(*uri == "data:image/png;base64,QUI=");
        assert(CountFiles(scratch.path().string()) == 0);
    }

    {
        std::cout << "[Test] Failing tool..." << std::endl;
        DiagramSettings settings;
        settings.command = WriteTool(tools, "broken-mmdc", "echo boom >&2\nexit 3\n");
        MermaidCliRenderer renderer(settings, scratch.path().string());
        assert(renderer.isAvailable());
        assert(!renderer.render("graph TD", "diagram_2", options));
        assert(CountFiles(scratch.path().string()) == 0);
    }

    {
        std::cout << "[Test] Tool without output..." << std::endl;
        DiagramSettings settings;
        settings.command = WriteTool(tools, "silent-mmdc", "exit 0\n");
        MermaidCliRenderer renderer(settings, scratch.path().string());
        assert(!renderer.render("graph TD", "diagram_3", options));
    }

    {
        std::cout << "[Test] Timeout..." << std::endl;
        DiagramSettings settings;
        settings.command = WriteTool(tools, "slow-mmdc", "sleep 5\n");
        settings.timeoutSeconds = 1;
        MermaidCliRenderer renderer(settings, scratch.path().string());
        assert(!renderer.render("graph TD", "diagram_4", options));
        assert(CountFiles(scratch.path().string()) == 0);
    }

    {
        std::cout << "[Test] Missing tool..." << std::endl;
        DiagramSettings settings;
        settings.command = "docforge-no-such-tool-" + infrastructure::FileUtils::RandomToken(6);
        MermaidCliRenderer renderer(settings, scratch.path().string());
        assert(!renderer.isAvailable());
        assert(!renderer.render("graph TD", "diagram_5", options));
        assert(!MermaidCliRenderer::HasTool(settings.command));
        assert(MermaidCliRenderer::HasTool("sh"));
    }

    {
        std::cout << "[Test] Helpers..." << std::endl;
        assert(MermaidCliRenderer::ShellQuote("it's") == "'it'\\''s'");
        assert(MermaidCliRenderer::Base64Encode("") == "");
        assert(MermaidCliRenderer::Base64Encode("f") == "Zg==");
        assert(MermaidCliRenderer::Base64Encode("foobar") == "Zm9vYmFy");
    }

    std::cout << "[PASS] MermaidCliRenderer Test Passed." << std::endl;
    return 0;
}
