/**
 * @file diagnostics.cpp
 * @brief Реализация отчёта о прогоне
 */

#include "diagnostics.hpp"
#include <chrono>
#include <ctime>
#include <sstream>

namespace geomech::core {
namespace {

using namespace geomech::model;

std::string isoTimestampNow() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return std::string(buf);
}

std::string detectPlatform() {
#if defined(_WIN32)
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

DiagnosticsMeta makeMeta(const DiagnosticsOptions& options) {
    DiagnosticsMeta meta;
    meta.app_version = GEOMECH_VERSION;
    meta.build_type = GEOMECH_BUILD_TYPE;
    meta.platform = detectPlatform();
    meta.timestamp = isoTimestampNow();
    meta.source_name = options.source_name;
    return meta;
}

DiagnosticCheck makeColumnsCheck(const PipelineResult& result) {
    DiagnosticCheck check;
    check.id = "columns";
    check.title = "Колонки входных данных";
    check.status = DiagnosticStatus::Ok;

    std::ostringstream oss;
    bool overridden = false;
    for (auto field : kCanonicalFields) {
        const auto& used = result.mapping.get(field);
        const auto& detected = result.detected_mapping.get(field);
        if (field != kCanonicalFields.front()) oss << ", ";
        oss << canonicalFieldName(field) << " = \"" << used.value_or("") << '"';
        if (used != detected) {
            oss << " (задано вручную)";
            overridden = true;
        }
    }
    check.details = oss.str();
    if (overridden) {
        check.status = DiagnosticStatus::Warning;
    }
    return check;
}

DiagnosticCheck makeUnitsCheck(const PipelineResult& result) {
    DiagnosticCheck check;
    check.id = "units";
    check.title = "Пересчёт единиц в СИ";
    check.status = DiagnosticStatus::Ok;

    std::ostringstream oss;
    for (auto field : kCanonicalFields) {
        if (field != kCanonicalFields.front()) oss << ", ";
        oss << canonicalFieldName(field) << " ×" << result.multipliers.get(field);
    }
    check.details = oss.str();
    return check;
}

DiagnosticCheck makeRowsCheck(const PipelineResult& result) {
    DiagnosticCheck check;
    check.id = "rows";
    check.title = "Проверка строк";

    const auto& stats = result.stats;
    std::ostringstream oss;
    oss << "Строк: " << stats.rows_scanned
        << ", принято: " << stats.rows_accepted
        << ", отброшено: " << stats.rows_discarded;
    check.details = oss.str();
    check.status = stats.rows_discarded > 0 ? DiagnosticStatus::Warning : DiagnosticStatus::Ok;
    return check;
}

DiagnosticCheck makeDepthOrderCheck(const PipelineResult& result) {
    DiagnosticCheck check;
    check.id = "depth_order";
    check.title = "Порядок глубин";
    check.status = DiagnosticStatus::Ok;

    size_t duplicates = 0;
    for (size_t i = 1; i < result.prepared.size(); ++i) {
        double step = result.prepared[i].depth - result.prepared[i - 1].depth;
        if (step < 0.0) {
            check.status = DiagnosticStatus::Fail;
            check.details = "Глубина убывает в точке " + std::to_string(i);
            return check;
        }
        if (step == 0.0) {
            ++duplicates;
        }
    }

    if (duplicates > 0) {
        check.status = DiagnosticStatus::Warning;
        check.details = "Повторяющихся глубин: " + std::to_string(duplicates);
    } else {
        check.details = "Глубина строго возрастает";
    }
    return check;
}

DiagnosticCheck makeSentinelCheck(const PipelineResult& result) {
    DiagnosticCheck check;
    check.id = "sentinels";
    check.title = "Вырожденные значения";
    check.status = DiagnosticStatus::Ok;

    std::ostringstream oss;
    bool any = false;
    for (auto field : kDerivedFieldOrder) {
        size_t count = result.stats.sentinelCount(field);
        if (count == 0) continue;
        if (any) oss << ", ";
        oss << derivedFieldName(field) << ": " << count;
        any = true;
    }

    if (any) {
        check.status = DiagnosticStatus::Warning;
        check.details = oss.str();
    } else {
        check.details = "Нет";
    }
    return check;
}

} // namespace

model::DiagnosticsReport buildRunReport(
    const PipelineResult& result,
    const DiagnosticsOptions& options
) {
    DiagnosticsReport report;
    report.meta = makeMeta(options);

    report.checks.push_back(makeColumnsCheck(result));
    report.checks.push_back(makeUnitsCheck(result));
    report.checks.push_back(makeRowsCheck(result));
    report.checks.push_back(makeDepthOrderCheck(result));
    report.checks.push_back(makeSentinelCheck(result));

    return report;
}

model::DiagnosticsReport buildFailureReport(
    const std::string& error_message,
    const DiagnosticsOptions& options
) {
    DiagnosticsReport report;
    report.meta = makeMeta(options);

    DiagnosticCheck check;
    check.id = "pipeline";
    check.title = "Прогон расчёта";
    check.status = DiagnosticStatus::Fail;
    check.details = error_message;
    report.checks.push_back(check);

    return report;
}

} // namespace geomech::core
