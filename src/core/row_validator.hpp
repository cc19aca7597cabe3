/**
 * @file row_validator.hpp
 * @brief Проверка строк и приведение к СИ
 */

#pragma once

#include "model/column_mapping.hpp"
#include "model/raw_table.hpp"
#include "model/sample.hpp"
#include <cstddef>

namespace geomech::core {

using namespace geomech::model;

/**
 * @brief Множители пересчёта для выбранных колонок
 */
struct UnitMultipliers {
    double depth = 1.0;
    double density = 1.0;
    double vp = 1.0;
    double vs = 1.0;

    [[nodiscard]] double get(CanonicalField field) const noexcept {
        switch (field) {
            case CanonicalField::Depth: return depth;
            case CanonicalField::Density: return density;
            case CanonicalField::Vp: return vp;
            case CanonicalField::Vs:
            default:
                return vs;
        }
    }
};

/**
 * @brief Результат подготовки строк
 */
struct PreparationResult {
    PreparedSampleList samples;     ///< Точки по возрастанию глубины
    UnitMultipliers multipliers;    ///< Применённые множители
    size_t rows_scanned = 0;        ///< Всего строк на входе
    size_t rows_discarded = 0;      ///< Отброшено строк (нечисловые/пустые значения)
};

/**
 * @brief Множители для полного маппинга
 */
[[nodiscard]] UnitMultipliers multipliersFor(const ColumnMapping& mapping) noexcept;

/**
 * @brief Приведение значения ячейки к числу
 *
 * Число возвращается как есть, текст разбирается целиком (с обрезкой
 * пробелов). Пустое значение или нечисловой текст → NaN.
 */
[[nodiscard]] double coerceToNumber(const RawValue& value) noexcept;

/**
 * @brief Проверка и подготовка строк
 *
 * 1. Все четыре поля должны быть в маппинге, иначе MissingColumnsError
 *    (до обработки строк).
 * 2. Значения приводятся к числам и умножаются на множитель единиц.
 * 3. Строки с неконечным значением отбрасываются без ошибки.
 * 4. Если строк не осталось, NoValidRowsError.
 * 5. Устойчивая сортировка по глубине.
 *
 * @throws MissingColumnsError
 * @throws NoValidRowsError
 */
[[nodiscard]] PreparationResult prepareRows(
    const RawTable& table,
    const ColumnMapping& mapping
);

/**
 * @brief То же, только точки
 */
[[nodiscard]] PreparedSampleList prepareSamples(
    const RawTable& table,
    const ColumnMapping& mapping
);

} // namespace geomech::core
