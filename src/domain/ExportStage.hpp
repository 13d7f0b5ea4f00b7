/**
 * @file ExportStage.hpp
 * @brief Value Object defining the ordered pipeline stages of an export operation.
 */

#pragma once

#include <string>

namespace docforge::domain {

/**
 * @enum ExportStage
 * @brief Pipeline stages in execution order. Each stage owns a fixed share of overall progress.
 */
enum class ExportStage {
    Initializing,       ///< Template resolution, output naming.
    ParsingMarkdown,    ///< Markdown -> element sequence.
    ConvertingDiagrams, ///< One external render per diagram block.
    ProcessingImages,   ///< Resolve local image references.
    GeneratingPdf,      ///< Print-layout renderer.
    GeneratingWord,     ///< Flow-document renderer.
    Finalizing,         ///< Stat output, remove scratch files.
    Completed,
    Failed
};

/**
 * @enum ExportFormat
 * @brief Output container selected for a single-format export.
 */
enum class ExportFormat {
    Pdf,
    Word
};

/**
 * @brief Helper to convert stage to string for display/logging.
 */
inline std::string StageToString(ExportStage stage) {
    switch (stage) {
        case ExportStage::Initializing: return "initializing";
        case ExportStage::ParsingMarkdown: return "parsing_markdown";
        case ExportStage::ConvertingDiagrams: return "converting_diagrams";
        case ExportStage::ProcessingImages: return "processing_images";
        case ExportStage::GeneratingPdf: return "generating_pdf";
        case ExportStage::GeneratingWord: return "generating_word";
        case ExportStage::Finalizing: return "finalizing";
        case ExportStage::Completed: return "completed";
        case ExportStage::Failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Share of overall progress attributed to a stage. All weights sum to 100.
 */
inline double StageWeight(ExportStage stage) {
    switch (stage) {
        case ExportStage::Initializing: return 5.0;
        case ExportStage::ParsingMarkdown: return 10.0;
        case ExportStage::ConvertingDiagrams: return 20.0;
        case ExportStage::ProcessingImages: return 10.0;
        case ExportStage::GeneratingPdf: return 25.0;
        case ExportStage::GeneratingWord: return 25.0;
        case ExportStage::Finalizing: return 5.0;
        default: return 0.0;
    }
}

/**
 * @brief Sum of the full weights of all stages strictly before the given one.
 */
inline double WeightBefore(ExportStage stage) {
    double total = 0.0;
    for (int s = 0; s < static_cast<int>(stage); ++s) {
        total += StageWeight(static_cast<ExportStage>(s));
    }
    return total;
}

inline bool IsTerminal(ExportStage stage) {
    return stage == ExportStage::Completed || stage == ExportStage::Failed;
}

inline std::string FormatToString(ExportFormat format) {
    return format == ExportFormat::Pdf ? "pdf" : "word";
}

inline std::string FormatExtension(ExportFormat format) {
    return format == ExportFormat::Pdf ? ".pdf" : ".docx";
}

inline ExportStage GeneratingStageFor(ExportFormat format) {
    return format == ExportFormat::Pdf ? ExportStage::GeneratingPdf : ExportStage::GeneratingWord;
}

} // namespace docforge::domain
