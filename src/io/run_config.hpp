/**
 * @file run_config.hpp
 * @brief Конфигурация прогона (JSON)
 *
 * Пример:
 * @code
 * {
 *   "columns": {"depth": "DEPT", "vp": "Vp_km/s"},
 *   "csv":     {"delimiter": "semicolon", "decimal_separator": ",", "encoding": "CP1251"},
 *   "export":  {"delimiter": ",", "significant_digits": 10, "include_header": true},
 *   "tracks":  {"fields": ["vp", "youngs_modulus"], "smoothing_window": 5, "normalize": true}
 * }
 * @endcode
 */

#pragma once

#include "core/log_tracks.hpp"
#include "csv_reader.hpp"
#include "csv_writer.hpp"
#include "model/column_mapping.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace geomech::io {

/**
 * @brief Ошибка конфигурации
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

struct RunConfig {
    ColumnMapping columns;              ///< Переопределение колонок
    CsvReadOptions csv;
    CsvExportOptions export_options;
    core::TrackOptions tracks;
};

/**
 * @brief Разделитель по имени или символу
 *
 * "tab", "comma", "semicolon", "pipe" или один символ.
 */
[[nodiscard]] std::optional<char> parseDelimiterName(std::string_view name) noexcept;

/**
 * @brief Конфигурация из JSON
 *
 * Отсутствующие ключи оставляют значения по умолчанию.
 * @throws ConfigError Неверный тип или значение
 */
[[nodiscard]] RunConfig runConfigFromJson(const nlohmann::json& j);

/**
 * @brief Загрузка конфигурации из файла
 * @throws ConfigError
 */
[[nodiscard]] RunConfig loadRunConfig(const std::filesystem::path& path);

} // namespace geomech::io
