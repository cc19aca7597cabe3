/**
 * @file diagnostics_writer.hpp
 * @brief Запись отчёта о прогоне в Markdown и JSON
 */

#pragma once

#include "model/diagnostics.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>

namespace geomech::io {

struct DiagnosticsWriteResult {
    std::filesystem::path json_path;
    std::filesystem::path markdown_path;
};

[[nodiscard]] nlohmann::json diagnosticsToJson(const geomech::model::DiagnosticsReport& report);
[[nodiscard]] std::string diagnosticsToMarkdown(const geomech::model::DiagnosticsReport& report);

/**
 * @brief Записать report.json и report.md в указанный каталог.
 */
DiagnosticsWriteResult writeDiagnosticsReports(
    const geomech::model::DiagnosticsReport& report,
    const std::filesystem::path& output_dir
);

} // namespace geomech::io
