/**
 * @file types.hpp
 * @brief Базовые типы и перечисления
 */

#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace geomech::model {

/**
 * @brief Каноническое поле входных данных
 */
enum class CanonicalField {
    Depth,      ///< Глубина, м
    Density,    ///< Объёмная плотность, кг/м³
    Vp,         ///< Скорость продольной волны, м/с
    Vs          ///< Скорость поперечной волны, м/с
};

/// Все канонические поля в порядке вывода
constexpr std::array<CanonicalField, 4> kCanonicalFields = {
    CanonicalField::Depth,
    CanonicalField::Density,
    CanonicalField::Vp,
    CanonicalField::Vs
};

/**
 * @brief Род величины для пересчёта единиц
 */
enum class UnitKind {
    Depth,
    Density,
    Velocity
};

/**
 * @brief Опциональное расчётное значение
 *
 * ВАЖНО: std::nullopt означает вырожденный расчёт (деление на ноль,
 * знаменатель близок к нулю), а не отсутствие замера.
 */
using DerivedValue = std::optional<double>;

/**
 * @brief Имя канонического поля ("depth", "density", "vp", "vs")
 */
[[nodiscard]] std::string_view canonicalFieldName(CanonicalField field) noexcept;

/**
 * @brief Поиск канонического поля по имени
 */
[[nodiscard]] std::optional<CanonicalField> canonicalFieldFromName(std::string_view name) noexcept;

/**
 * @brief Род единиц, по которому пересчитывается поле
 */
[[nodiscard]] constexpr UnitKind unitKindFor(CanonicalField field) noexcept {
    switch (field) {
        case CanonicalField::Depth: return UnitKind::Depth;
        case CanonicalField::Density: return UnitKind::Density;
        case CanonicalField::Vp:
        case CanonicalField::Vs:
        default:
            return UnitKind::Velocity;
    }
}

/**
 * @brief Поле результата расчёта
 *
 * Порядок перечисления совпадает с каноническим порядком вывода
 * (CSV, JSON, отчёты).
 */
enum class DerivedField {
    Depth,
    Density,
    Vp,
    Vs,
    VerticalStress,         ///< Вертикальное (геостатическое) напряжение, Па
    ShearModulus,           ///< Модуль сдвига G, Па
    BulkModulus,            ///< Модуль объёмного сжатия K, Па
    LameLambda,             ///< Первый параметр Ламе λ, Па
    YoungsModulus,          ///< Модуль Юнга E, Па
    PoissonRatio,           ///< Коэффициент Пуассона
    AcousticImpedance,      ///< Акустический импеданс, кг/(м²·с)
    ShearImpedance,         ///< Сдвиговый импеданс, кг/(м²·с)
    PModulus,               ///< Модуль продольной волны M, Па
    VpVsRatio,              ///< Отношение Vp/Vs
    ImpedanceGradient,      ///< Градиент импеданса по глубине, 1/м
    DeltaImpedancePrev,     ///< Приращение импеданса к предыдущей точке
    LambdaOverMu,           ///< λ/G
    PoissonFromModuli,      ///< Коэффициент Пуассона через K и G
    BrittlenessE            ///< Индекс хрупкости по модулю Юнга [0;1]
};

/// Число полей результата
constexpr size_t kDerivedFieldCount = 19;

/// Все поля результата в каноническом порядке
constexpr std::array<DerivedField, kDerivedFieldCount> kDerivedFieldOrder = {
    DerivedField::Depth,
    DerivedField::Density,
    DerivedField::Vp,
    DerivedField::Vs,
    DerivedField::VerticalStress,
    DerivedField::ShearModulus,
    DerivedField::BulkModulus,
    DerivedField::LameLambda,
    DerivedField::YoungsModulus,
    DerivedField::PoissonRatio,
    DerivedField::AcousticImpedance,
    DerivedField::ShearImpedance,
    DerivedField::PModulus,
    DerivedField::VpVsRatio,
    DerivedField::ImpedanceGradient,
    DerivedField::DeltaImpedancePrev,
    DerivedField::LambdaOverMu,
    DerivedField::PoissonFromModuli,
    DerivedField::BrittlenessE
};

/**
 * @brief Имя поля результата ("vertical_stress", "brittleness_e", ...)
 */
[[nodiscard]] std::string_view derivedFieldName(DerivedField field) noexcept;

/**
 * @brief Поиск поля результата по имени (без учёта регистра)
 */
[[nodiscard]] std::optional<DerivedField> derivedFieldFromName(std::string_view name);

} // namespace geomech::model
