/**
 * @file errors.hpp
 * @brief Ошибки конвейера подготовки данных
 *
 * Фатальных ситуаций две: не найдены обязательные колонки и не осталось
 * ни одной пригодной строки. Вырожденные расчёты ошибками не являются.
 */

#pragma once

#include "model/types.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace geomech::core {

using namespace geomech::model;

/**
 * @brief Базовая ошибка конвейера
 */
class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Не заданы колонки для одного или нескольких полей
 */
class MissingColumnsError : public PipelineError {
public:
    explicit MissingColumnsError(std::vector<CanonicalField> missing);

    [[nodiscard]] const std::vector<CanonicalField>& missing() const noexcept { return missing_; }

private:
    std::vector<CanonicalField> missing_;
};

/**
 * @brief Все строки отброшены при проверке
 */
class NoValidRowsError : public PipelineError {
public:
    explicit NoValidRowsError(size_t rows_scanned);

    [[nodiscard]] size_t rowsScanned() const noexcept { return rows_scanned_; }

private:
    size_t rows_scanned_;
};

} // namespace geomech::core
