#include "application/ExportResult.hpp"

namespace docforge::application {

using json = nlohmann::json;

namespace {
    template<typename T>
    json OrNull(const std::optional<T>& value) {
        return value ? json(*value) : json(nullptr);
    }
}

json ToJson(const ExportResult& result) {
    return {
        {"success", result.success},
        {"operation_id", result.operationId},
        {"output_path", OrNull(result.outputPath)},
        {"file_size", OrNull(result.fileSize)},
        {"message", result.message},
        {"error", OrNull(result.error)}
    };
}

json ToJson(const DualExportResult& result) {
    return {
        {"success", result.success},
        {"operation_id", result.operationId},
        {"pdf_result", ToJson(result.pdfResult)},
        {"word_result", ToJson(result.wordResult)},
        {"message", result.message},
        {"error", OrNull(result.error)}
    };
}

} // namespace docforge::application
