/**
 * @file diagnostics_writer.cpp
 * @brief Запись отчёта о прогоне
 */

#include "diagnostics_writer.hpp"
#include "file_utils.hpp"
#include <sstream>

namespace geomech::io {
namespace {

using namespace geomech::model;

/// Символ '|' ломает строку таблицы Markdown
std::string escapeCell(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '|') out += '\\';
        if (c == '\n') {
            out += ' ';
            continue;
        }
        out += c;
    }
    return out;
}

} // namespace

std::string diagnosticsToMarkdown(const DiagnosticsReport& report) {
    std::ostringstream out;
    auto summary = report.summarize();

    out << "# Отчёт о прогоне Geomech\n\n";
    out << "- Входной файл: " << (report.meta.source_name.empty() ? "-" : report.meta.source_name) << "\n";
    out << "- Версия приложения: " << report.meta.app_version << "\n";
    out << "- Тип сборки: " << report.meta.build_type << "\n";
    out << "- Платформа: " << report.meta.platform << "\n";
    out << "- Схема отчёта: " << report.meta.schema_version << "\n";
    out << "- Время: " << report.meta.timestamp << "\n\n";

    out << "## Сводка\n";
    out << "- Статус: " << diagnosticStatusToString(summary.status) << "\n";
    out << "- OK: " << summary.ok << ", WARN: " << summary.warning
        << ", FAIL: " << summary.fail << ", SKIPPED: " << summary.skipped << "\n\n";

    out << "## Проверки\n";
    out << "| Проверка | Статус | Детали |\n";
    out << "|----------|--------|--------|\n";
    for (const auto& check : report.checks) {
        out << "| " << escapeCell(check.title) << " | " << diagnosticStatusToString(check.status)
            << " | " << escapeCell(check.details) << " |\n";
    }

    return out.str();
}

nlohmann::json diagnosticsToJson(const DiagnosticsReport& report) {
    nlohmann::json j;
    auto summary = report.summarize();

    j["schema_version"] = report.meta.schema_version;
    j["meta"] = {
        {"app_version", report.meta.app_version},
        {"build_type", report.meta.build_type},
        {"platform", report.meta.platform},
        {"timestamp", report.meta.timestamp},
        {"source_name", report.meta.source_name}
    };

    j["checks"] = nlohmann::json::array();
    for (const auto& check : report.checks) {
        j["checks"].push_back({
            {"id", check.id},
            {"title", check.title},
            {"status", diagnosticStatusToString(check.status)},
            {"details", check.details}
        });
    }

    j["summary"] = {
        {"status", diagnosticStatusToString(summary.status)},
        {"ok", summary.ok},
        {"warning", summary.warning},
        {"fail", summary.fail},
        {"skipped", summary.skipped}
    };

    return j;
}

DiagnosticsWriteResult writeDiagnosticsReports(
    const DiagnosticsReport& report,
    const std::filesystem::path& output_dir
) {
    DiagnosticsWriteResult result;
    result.json_path = output_dir / "report.json";
    result.markdown_path = output_dir / "report.md";

    atomicWrite(result.json_path, diagnosticsToJson(report).dump(2));
    atomicWrite(result.markdown_path, diagnosticsToMarkdown(report));

    return result;
}

} // namespace geomech::io
