/**
 * @file ExportResult.hpp
 * @brief Outcome records returned by the export orchestrator.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace docforge::application {

struct ExportResult {
    bool success = false;
    std::string operationId;
    std::optional<std::string> outputPath;
    std::optional<std::uintmax_t> fileSize;
    std::string message;
    std::optional<std::string> error;
};

/**
 * @struct DualExportResult
 * @brief Both formats rendered under one operation id. success requires both parts.
 */
struct DualExportResult {
    bool success = false;
    std::string operationId;
    ExportResult pdfResult;
    ExportResult wordResult;
    std::optional<std::string> error;
    std::string message;
};

nlohmann::json ToJson(const ExportResult& result);
nlohmann::json ToJson(const DualExportResult& result);

} // namespace docforge::application
