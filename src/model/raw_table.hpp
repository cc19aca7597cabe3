/**
 * @file raw_table.hpp
 * @brief Сырые строки входного файла до проверки и пересчёта единиц
 */

#pragma once

#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace geomech::model {

/**
 * @brief Значение ячейки: пусто, число или текст
 *
 * Типизация выполняется декодером файла (CSV). Проверка на пригодность
 * значения к расчёту выполняет валидатор.
 */
using RawValue = std::variant<std::monostate, double, std::string>;

/**
 * @brief Строка входных данных: заголовок колонки → значение
 *
 * Отсутствующий ключ эквивалентен пустой ячейке.
 */
using RawRow = std::unordered_map<std::string, RawValue>;

/**
 * @brief Таблица входных данных в порядке файла
 */
struct RawTable {
    std::vector<std::string> headers;   ///< Заголовки в порядке колонок
    std::vector<RawRow> rows;           ///< Строки данных в порядке файла
    std::string source_name;            ///< Имя источника (для отчётов)

    [[nodiscard]] bool empty() const noexcept { return rows.empty(); }
};

/**
 * @brief Проверка, является ли значение пустым
 */
[[nodiscard]] inline bool isEmptyValue(const RawValue& value) noexcept {
    return std::holds_alternative<std::monostate>(value);
}

} // namespace geomech::model
