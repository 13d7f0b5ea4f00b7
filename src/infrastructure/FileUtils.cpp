/**
 * @file FileUtils.cpp
 * @brief Implementation of FileUtils.
 */

#include "infrastructure/FileUtils.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>

namespace docforge::infrastructure {

namespace fs = std::filesystem;

bool FileUtils::WriteFileAtomically(const std::string& path, const std::string& content) {
    fs::path finalPath = path;

    // Create unique temp path: filename.<timestamp>.<token>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + "." + RandomToken(6) + ".tmp";

    // 1. Ensure directory exists
    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const std::exception& e) {
        std::cerr << "[FileUtils] Error creating directories: " << e.what() << std::endl;
        return false;
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary);
        if (!ofs.is_open()) {
            std::cerr << "[FileUtils] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[FileUtils] Write failed during output: " << tempPath << std::endl;
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    } // Close happens here automatically

    // 3. Atomic Rename
    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[FileUtils] Rename failed: " << ec.message() << std::endl;
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

std::optional<std::string> FileUtils::ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return ss.str();
}

std::string FileUtils::RandomToken(std::size_t length) {
    static const char alphanum[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(alphanum) - 2);

    std::string s;
    s.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        s += alphanum[pick(rng)];
    }
    return s;
}

} // namespace docforge::infrastructure
