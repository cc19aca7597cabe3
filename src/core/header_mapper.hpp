/**
 * @file header_mapper.hpp
 * @brief Автоопределение колонок глубины, плотности, Vp и Vs по заголовкам
 *
 * Сопоставление задаётся упорядоченной таблицей правил (поле, шаблон,
 * приоритет), которую можно проверять отдельно от расчёта.
 */

#pragma once

#include "model/column_mapping.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace geomech::core {

using namespace geomech::model;

/**
 * @brief Вид шаблона заголовка
 */
enum class HeaderPatternKind {
    Phrase,     ///< Последовательность слов подряд в любом месте заголовка
    Prefix      ///< Нормализованный заголовок начинается с текста
};

/**
 * @brief Приоритет правила
 */
enum class HeaderRulePriority {
    Primary,    ///< Совпадение перезаписывает ранее найденную колонку
    Fallback    ///< Применяется, только если поле ещё не найдено
};

/**
 * @brief Правило сопоставления заголовка с полем
 */
struct HeaderRule {
    CanonicalField field;
    HeaderPatternKind kind = HeaderPatternKind::Phrase;
    std::vector<std::string_view> words;    ///< Слова шаблона (для Prefix — одно)
    HeaderRulePriority priority = HeaderRulePriority::Primary;
};

/**
 * @brief Таблица правил в порядке применения
 */
[[nodiscard]] const std::vector<HeaderRule>& headerRules();

/**
 * @brief Проверка одного правила на заголовке
 */
[[nodiscard]] bool ruleMatches(const HeaderRule& rule, std::string_view header);

/**
 * @brief Предложить маппинг колонок по списку заголовков
 *
 * Заголовки просматриваются по порядку; основное правило перезаписывает
 * поле, поэтому при нескольких подходящих колонках побеждает последняя.
 * Ошибок нет: ненайденные поля остаются пустыми.
 *
 * @param headers Заголовки в порядке файла
 * @return Маппинг (возможно, частичный)
 */
[[nodiscard]] ColumnMapping detectColumns(const std::vector<std::string>& headers);

} // namespace geomech::core
