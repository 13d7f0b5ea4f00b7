#include "infrastructure/MermaidCliRenderer.hpp"
#include "infrastructure/FileUtils.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <sys/wait.h>

namespace docforge::infrastructure {

namespace fs = std::filesystem;

namespace {
    constexpr int kTimeoutExitCode = 124; // coreutils timeout(1)

    void RemoveQuietly(const fs::path& path) {
        std::error_code ec;
        fs::remove(path, ec);
    }

    // Identifiers end up in file names; keep them to a safe alphabet.
    std::string SafeName(const std::string& id) {
        std::string out;
        for (char c : id) {
            bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
            out += ok ? c : '_';
        }
        return out.empty() ? "diagram" : out;
    }
}

MermaidCliRenderer::MermaidCliRenderer(DiagramSettings settings, std::string scratchDir)
    : m_settings(std::move(settings))
    , m_scratchDir(std::move(scratchDir))
{
    m_available = HasTool(m_settings.command);
    if (!m_available) {
        std::cerr << "[MermaidCli] '" << m_settings.command
                  << "' not found; diagrams will be rendered as source code." << std::endl;
    }
}

bool MermaidCliRenderer::HasTool(const std::string& tool) {
    std::string cmd = "command -v " + ShellQuote(tool) + " >/dev/null 2>&1";
    int result = std::system(cmd.c_str());
    return result == 0;
}

std::string MermaidCliRenderer::ShellQuote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::optional<std::string> MermaidCliRenderer::render(const std::string& source,
                                                      const std::string& id,
                                                      const RenderOptions& options) {
    if (!m_available) {
        return std::nullopt;
    }

    try {
        fs::create_directories(m_scratchDir);
    } catch (const std::exception& e) {
        std::cerr << "[MermaidCli] Cannot create scratch dir " << m_scratchDir << ": " << e.what() << std::endl;
        return std::nullopt;
    }

    // The scratch directory is shared between operations, so every file name carries a unique token.
    std::string stem = SafeName(id) + "_" + FileUtils::RandomToken(8);
    fs::path inputPath = fs::path(m_scratchDir) / (stem + ".mmd");
    fs::path outputPath = fs::path(m_scratchDir) / (stem + ".png");

    {
        std::ofstream out(inputPath);
        if (!out.is_open()) {
            std::cerr << "[MermaidCli] Failed to write scratch input: " << inputPath << std::endl;
            return std::nullopt;
        }
        out << source;
    }

    std::stringstream cmd;
    if (m_settings.timeoutSeconds > 0) {
        cmd << "timeout " << m_settings.timeoutSeconds << " ";
    }
    cmd << ShellQuote(m_settings.command)
        << " -i " << ShellQuote(inputPath.string())
        << " -o " << ShellQuote(outputPath.string())
        << " -w " << options.width
        << " -H " << options.height
        << " -t " << ShellQuote(options.theme)
        << " -b " << ShellQuote(m_settings.background)
        << " >/dev/null 2>&1";

    std::cout << "[MermaidCli] Rendering " << id << " (" << options.width << "x" << options.height << ")" << std::endl;

    int status = std::system(cmd.str().c_str());
    RemoveQuietly(inputPath);

    int exitCode = status;
    if (status != -1 && WIFEXITED(status)) {
        exitCode = WEXITSTATUS(status);
    }

    if (exitCode == kTimeoutExitCode && m_settings.timeoutSeconds > 0) {
        std::cerr << "[MermaidCli] " << id << " timed out after " << m_settings.timeoutSeconds << "s" << std::endl;
        RemoveQuietly(outputPath);
        return std::nullopt;
    }
    if (exitCode != 0) {
        std::cerr << "[MermaidCli] " << id << " failed with code: " << exitCode << std::endl;
        RemoveQuietly(outputPath);
        return std::nullopt;
    }

    std::error_code ec;
    if (!fs::exists(outputPath, ec) || fs::file_size(outputPath, ec) == 0 || ec) {
        std::cerr << "[MermaidCli] " << id << " produced no output at: " << outputPath << std::endl;
        RemoveQuietly(outputPath);
        return std::nullopt;
    }

    return outputPath.string();
}

std::optional<std::string> MermaidCliRenderer::renderBase64(const std::string& source,
                                                            const std::string& id,
                                                            const RenderOptions& options) {
    auto path = render(source, id, options);
    if (!path) {
        return std::nullopt;
    }

    auto bytes = FileUtils::ReadFile(*path);
    RemoveQuietly(*path);
    if (!bytes) {
        std::cerr << "[MermaidCli] Could not read rendered image: " << *path << std::endl;
        return std::nullopt;
    }
    return Base64Encode(*bytes);
}

std::optional<std::string> MermaidCliRenderer::renderDataUri(const std::string& source,
                                                             const std::string& id,
                                                             const RenderOptions& options) {
    auto encoded = renderBase64(source, id, options);
    if (!encoded) {
        return std::nullopt;
    }
    return "data:image/png;base64," + *encoded;
}

std::string MermaidCliRenderer::Base64Encode(const std::string& bytes) {
    static const char* tbl = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    size_t i = 0, n = bytes.size();
    out.reserve(((n + 2) / 3) * 4);
    auto at = [&](size_t k) { return static_cast<unsigned>(static_cast<unsigned char>(bytes[k])); };
    while (i + 2 < n) {
        unsigned v = (at(i) << 16) | (at(i + 1) << 8) | at(i + 2);
        out.push_back(tbl[(v >> 18) & 63]);
        out.push_back(tbl[(v >> 12) & 63]);
        out.push_back(tbl[(v >> 6) & 63]);
        out.push_back(tbl[v & 63]);
        i += 3;
    }
    if (i + 1 == n) {
        unsigned v = at(i) << 16;
        out.push_back(tbl[(v >> 18) & 63]);
        out.push_back(tbl[(v >> 12) & 63]);
        out += "==";
    } else if (i + 2 == n) {
        unsigned v = (at(i) << 16) | (at(i + 1) << 8);
        out.push_back(tbl[(v >> 18) & 63]);
        out.push_back(tbl[(v >> 12) & 63]);
        out.push_back(tbl[(v >> 6) & 63]);
        out.push_back('=');
    }
    return out;
}

} // namespace docforge::infrastructure
