/**
 * @file unit_normalizer.hpp
 * @brief Определение множителя пересчёта в СИ по заголовку колонки
 *
 * Заголовки вида "Vp_Km/s", "Depth km", "RHOB g/cc" несут единицы
 * измерения. Множитель приводит числа колонки к м, кг/м³ или м/с.
 */

#pragma once

#include "model/types.hpp"
#include <optional>
#include <string_view>

namespace geomech::core {

using namespace geomech::model;

/// км → м, км/с → м/с
constexpr double kKilometerFactor = 1000.0;

/// г/см³ → кг/м³
constexpr double kGramPerCcFactor = 1000.0;

/**
 * @brief Множитель пересчёта значения колонки в СИ
 *
 * Правила (по нормализованным словам заголовка):
 * - Velocity: слово "km" → 1000; "m s", "mps" → 1; иначе 1
 * - Depth: слово "km" → 1000; иначе 1
 * - Density: "g cc", "gcc", "g cm3", "gcm3", "g cm 3" → 1000; иначе 1
 *
 * @param label Заголовок колонки (nullopt → 1)
 * @param kind Род величины
 * @return Множитель
 */
[[nodiscard]] double unitMultiplier(
    std::optional<std::string_view> label,
    UnitKind kind
) noexcept;

} // namespace geomech::core
