/**
 * @file pipeline.hpp
 * @brief Полный прогон: заголовки → проверка строк → расчёт параметров
 *
 * Состояние прогона передаётся явно: таблица и опции на входе,
 * PipelineResult на выходе.
 */

#pragma once

#include "model/column_mapping.hpp"
#include "model/raw_table.hpp"
#include "model/sample.hpp"
#include "row_validator.hpp"
#include <array>

namespace geomech::core {

using namespace geomech::model;

/**
 * @brief Опции прогона
 */
struct PipelineOptions {
    ColumnMapping column_override;      ///< Заданные пользователем колонки (поверх автоопределения)
    bool auto_detect_columns = true;    ///< Автоопределение колонок по заголовкам
};

/**
 * @brief Статистика прогона
 */
struct PipelineStats {
    size_t rows_scanned = 0;
    size_t rows_accepted = 0;
    size_t rows_discarded = 0;
    std::array<size_t, kDerivedFieldCount> sentinel_counts{};  ///< Пустых значений по полям

    [[nodiscard]] size_t sentinelCount(DerivedField field) const noexcept {
        return sentinel_counts[static_cast<size_t>(field)];
    }
};

/**
 * @brief Результат прогона
 */
struct PipelineResult {
    ColumnMapping detected_mapping;     ///< Предложено автоопределением
    ColumnMapping mapping;              ///< Использовано для проверки строк
    UnitMultipliers multipliers;        ///< Множители пересчёта в СИ
    PreparedSampleList prepared;        ///< Проверенные точки
    DerivedSampleList samples;          ///< Рассчитанные точки
    PipelineStats stats;
};

/**
 * @brief Итоговый маппинг: автоопределение + переопределения пользователя
 */
[[nodiscard]] ColumnMapping resolveColumnMapping(
    const std::vector<std::string>& headers,
    const PipelineOptions& options
);

/**
 * @brief Подсчёт пустых (вырожденных) значений по полям
 */
[[nodiscard]] std::array<size_t, kDerivedFieldCount> countSentinels(const DerivedSampleList& samples);

/**
 * @brief Полный прогон расчёта
 *
 * @param table Входная таблица
 * @param options Опции прогона
 * @return Результат прогона
 * @throws MissingColumnsError Не заданы обязательные колонки
 * @throws NoValidRowsError Нет пригодных строк
 */
[[nodiscard]] PipelineResult runPipeline(
    const RawTable& table,
    const PipelineOptions& options = {}
);

} // namespace geomech::core
