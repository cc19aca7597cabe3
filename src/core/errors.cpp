/**
 * @file errors.cpp
 * @brief Формирование сообщений об ошибках конвейера
 */

#include "errors.hpp"
#include <sstream>
#include <utility>

namespace geomech::core {

namespace {

std::string missingColumnsMessage(const std::vector<CanonicalField>& missing) {
    std::ostringstream oss;
    oss << "Не найдены колонки: ";
    for (size_t i = 0; i < missing.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << canonicalFieldName(missing[i]);
    }
    return oss.str();
}

std::string noValidRowsMessage(size_t rows_scanned) {
    std::ostringstream oss;
    oss << "Нет ни одной строки с корректными числовыми значениями (просмотрено строк: "
        << rows_scanned << ")";
    return oss.str();
}

} // namespace

MissingColumnsError::MissingColumnsError(std::vector<CanonicalField> missing)
    : PipelineError(missingColumnsMessage(missing))
    , missing_(std::move(missing)) {}

NoValidRowsError::NoValidRowsError(size_t rows_scanned)
    : PipelineError(noValidRowsMessage(rows_scanned))
    , rows_scanned_(rows_scanned) {}

} // namespace geomech::core
