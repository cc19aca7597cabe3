/**
 * @file csv_reader.hpp
 * @brief Импорт каротажных данных из CSV файлов
 */

#pragma once

#include "model/column_mapping.hpp"
#include "model/raw_table.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace geomech::io {

using namespace geomech::model;

/**
 * @brief Опции чтения CSV
 *
 * Незаданные параметры определяются автоматически.
 */
struct CsvReadOptions {
    std::optional<char> delimiter;            ///< Разделитель полей
    std::optional<char> decimal_separator;    ///< Десятичный разделитель
    std::string encoding = "AUTO";            ///< UTF-8, CP1251 или AUTO
    size_t skip_lines = 0;                    ///< Пропустить строк перед заголовком
};

/**
 * @brief Результат автоопределения формата CSV
 */
struct CsvDetectionResult {
    char detected_delimiter = ',';
    char detected_decimal = '.';
    std::string detected_encoding = "UTF-8";
    std::vector<std::string> header_names;    ///< Названия колонок
    size_t column_count = 0;
    ColumnMapping suggested_mapping;          ///< Предложенный маппинг полей
    std::vector<std::string> diagnostics;     ///< Пояснения автоопределения
};

/**
 * @brief Ошибка чтения CSV
 */
class CsvReadError : public std::runtime_error {
public:
    CsvReadError(const std::string& message, size_t line = 0)
        : std::runtime_error(message)
        , line_(line) {}

    [[nodiscard]] size_t line() const noexcept { return line_; }

private:
    size_t line_;
};

/**
 * @brief Разбор содержимого CSV (первая строка — заголовок)
 *
 * Ячейки типизируются: пустая → пусто, число → double, иначе текст.
 * Повторяющиеся заголовки получают суффикс "_1", "_2", ...
 * Полностью пустые строки пропускаются.
 *
 * @param content Текст в UTF-8
 * @param options Опции чтения (кодировка не используется)
 * @throws CsvReadError Нет строки заголовка
 */
[[nodiscard]] RawTable parseCsvTable(
    std::string_view content,
    const CsvReadOptions& options = {}
);

/**
 * @brief Чтение CSV файла
 *
 * @param path Путь к файлу
 * @param options Опции чтения
 * @return Таблица с заголовками и строками
 * @throws CsvReadError При ошибке чтения
 */
[[nodiscard]] RawTable readCsvTable(
    const std::filesystem::path& path,
    const CsvReadOptions& options = {}
);

/**
 * @brief Автоопределение формата CSV файла
 *
 * Анализирует файл и определяет кодировку, разделители,
 * заголовки и предлагаемый маппинг колонок. Параметры, заданные
 * в options, не определяются, а берутся как есть.
 */
[[nodiscard]] CsvDetectionResult detectCsvFormat(
    const std::filesystem::path& path,
    const CsvReadOptions& options = {}
);

/**
 * @brief Конвертация кодировки Windows-1251 в UTF-8
 */
[[nodiscard]] std::string convertCp1251ToUtf8(const std::string& input);

/**
 * @brief Определение кодировки по содержимому
 * @return "UTF-8" или "CP1251"
 */
[[nodiscard]] std::string detectEncoding(std::string_view content);

} // namespace geomech::io
