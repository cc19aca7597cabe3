/**
 * @file label_text.hpp
 * @brief Нормализация текста заголовков колонок (UTF-8, ASCII + кириллица)
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace geomech::core {

/**
 * @brief Перевод строки в нижний регистр (ASCII + базовая кириллица)
 */
[[nodiscard]] std::string utf8ToLower(std::string_view input);

/**
 * @brief Удаление пробельных символов по краям
 */
[[nodiscard]] std::string trim(std::string_view str);

/**
 * @brief Удаление UTF-8 BOM в начале строки
 */
[[nodiscard]] std::string stripBom(std::string_view str);

/**
 * @brief Нормализованная форма заголовка
 *
 * BOM и крайние пробелы удаляются, регистр понижается, любые серии
 * не буквенно-цифровых символов заменяются одним пробелом.
 * Буквами считаются только латиница и кириллица, прочие символы UTF-8
 * (неразрывный пробел, µ, ³) разделяют слова. Пример: "Vp_Km/s" → "vp km s".
 */
[[nodiscard]] std::string normalizeLabel(std::string_view label);

/**
 * @brief Разбиение нормализованного заголовка на слова
 */
[[nodiscard]] std::vector<std::string> labelTokens(std::string_view label);

/**
 * @brief Проверка наличия последовательности слов подряд
 *
 * @param tokens Слова заголовка
 * @param phrase Искомые слова (например {"km", "s"})
 */
[[nodiscard]] bool containsPhrase(
    const std::vector<std::string>& tokens,
    const std::vector<std::string_view>& phrase
) noexcept;

} // namespace geomech::core
