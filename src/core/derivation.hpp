/**
 * @file derivation.hpp
 * @brief Расчёт упругих и геомеханических параметров по глубине
 *
 * Среда изотропная, линейно-упругая, все величины в СИ.
 */

#pragma once

#include "model/sample.hpp"

namespace geomech::core {

using namespace geomech::model;

/**
 * @brief Ускорение свободного падения, м/с²
 */
constexpr double kGravity = 9.81;

/**
 * @brief Порог для знаменателей коэффициента Пуассона
 */
constexpr double kSingularTolerance = 1e-12;

/**
 * @brief Вертикальное напряжение по трапециям
 *
 * σv[0] = 0 независимо от глубины первой точки,
 * σv[i] = σv[i−1] + g · ½(ρ[i] + ρ[i−1]) · (z[i] − z[i−1]).
 */
[[nodiscard]] std::vector<double> integrateVerticalStress(const PreparedSampleList& samples);

/**
 * @brief Коэффициент Пуассона по скоростям
 *
 * ν = (Vp² − 2Vs²) / (2(Vp² − Vs²)); nullopt при |знаменатель| < 1e-12.
 */
[[nodiscard]] DerivedValue poissonFromVelocities(double vp, double vs) noexcept;

/**
 * @brief Коэффициент Пуассона по модулям
 *
 * ν = (3K − 2G) / (2(3K + G)); nullopt при |знаменатель| < 1e-12.
 */
[[nodiscard]] DerivedValue poissonFromModuli(double bulk, double shear) noexcept;

/**
 * @brief Градиент акустического импеданса по глубине
 *
 * Внутри — центральная разность, на краях — односторонние.
 * nullopt при нулевом интервале глубин или при n < 2.
 */
[[nodiscard]] std::vector<DerivedValue> impedanceGradient(
    const std::vector<double>& depths,
    const std::vector<double>& impedance
);

/**
 * @brief Нормировка min-max по конечным значениям
 *
 * nullopt, если конечных значений нет, все они равны или своё значение пусто.
 */
[[nodiscard]] std::vector<DerivedValue> minMaxNormalize(const std::vector<DerivedValue>& values);

/**
 * @brief Полный расчёт параметров
 *
 * Вход должен быть упорядочен по глубине (см. prepareRows). Выход
 * выровнен с входом 1:1. Исключений для вырожденной математики нет —
 * соответствующее поле остаётся пустым.
 *
 * @param samples Подготовленные точки
 * @return Рассчитанные точки того же размера и порядка
 */
[[nodiscard]] DerivedSampleList deriveParameters(const PreparedSampleList& samples);

} // namespace geomech::core
