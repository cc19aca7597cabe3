/**
 * @file csv_writer.hpp
 * @brief Экспорт результатов расчёта и треков в CSV
 */

#pragma once

#include "core/log_tracks.hpp"
#include "model/sample.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>

namespace geomech::io {

using namespace geomech::model;

/**
 * @brief Опции экспорта в CSV
 */
struct CsvExportOptions {
    char delimiter = ',';              ///< Разделитель полей
    char decimal_separator = '.';      ///< Десятичный разделитель
    int significant_digits = 12;       ///< Значащих цифр
    bool include_header = true;        ///< Включить заголовок
};

/**
 * @brief Ошибка записи CSV
 */
class CsvWriteError : public std::runtime_error {
public:
    explicit CsvWriteError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Форматирование значения ячейки
 *
 * Пустое или неконечное значение → пустая строка.
 */
[[nodiscard]] std::string formatCsvValue(DerivedValue value, const CsvExportOptions& options);

/**
 * @brief Результаты расчёта в CSV (все поля в каноническом порядке)
 */
[[nodiscard]] std::string buildCsvResults(
    const DerivedSampleList& samples,
    const CsvExportOptions& options = {}
);

/**
 * @brief Экспорт результатов расчёта в CSV
 *
 * @param samples Рассчитанные точки
 * @param path Путь к файлу
 * @param options Опции экспорта
 * @throws CsvWriteError При ошибке записи
 */
void writeCsvResults(
    const DerivedSampleList& samples,
    const std::filesystem::path& path,
    const CsvExportOptions& options = {}
);

/**
 * @brief Треки в CSV: depth + выбранные поля
 */
[[nodiscard]] std::string buildCsvTracks(
    const core::TrackSet& tracks,
    const CsvExportOptions& options = {}
);

/**
 * @brief Экспорт треков в CSV
 * @throws CsvWriteError При ошибке записи
 */
void writeCsvTracks(
    const core::TrackSet& tracks,
    const std::filesystem::path& path,
    const CsvExportOptions& options = {}
);

} // namespace geomech::io
