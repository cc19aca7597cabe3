/**
 * @file diagnostics.hpp
 * @brief Отчёт о прогоне расчёта (колонки, единицы, строки, вырожденные значения)
 */

#pragma once

#include "model/diagnostics.hpp"
#include "pipeline.hpp"
#include <string>

namespace geomech::core {

struct DiagnosticsOptions {
    std::string source_name;     ///< Имя входного файла
};

/**
 * @brief Построить отчёт по успешному прогону
 */
[[nodiscard]] model::DiagnosticsReport buildRunReport(
    const PipelineResult& result,
    const DiagnosticsOptions& options
);

/**
 * @brief Построить отчёт по прогону, завершившемуся ошибкой
 *
 * @param error_message Текст ошибки
 */
[[nodiscard]] model::DiagnosticsReport buildFailureReport(
    const std::string& error_message,
    const DiagnosticsOptions& options
);

} // namespace geomech::core
