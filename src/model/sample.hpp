/**
 * @file sample.hpp
 * @brief Подготовленная и рассчитанная точка каротажа
 */

#pragma once

#include "types.hpp"
#include <vector>

namespace geomech::model {

/**
 * @brief Проверенная точка в единицах СИ
 *
 * Все значения конечны. В последовательности глубина не убывает.
 */
struct PreparedSample {
    double depth = 0.0;      ///< Глубина, м
    double density = 0.0;    ///< Плотность, кг/м³
    double vp = 0.0;         ///< Скорость P-волны, м/с
    double vs = 0.0;         ///< Скорость S-волны, м/с

    bool operator==(const PreparedSample&) const = default;
};

using PreparedSampleList = std::vector<PreparedSample>;

/**
 * @brief Результат расчёта для одной глубины
 *
 * Содержит исходные данные и производные упругие/геомеханические параметры.
 * Поля типа DerivedValue могут быть пустыми при вырожденном расчёте,
 * остальные поля всегда определены.
 */
struct DerivedSample {
    // === Исходные данные (копия из PreparedSample) ===
    double depth = 0.0;
    double density = 0.0;
    double vp = 0.0;
    double vs = 0.0;

    // === Напряжения и модули ===
    double vertical_stress = 0.0;       ///< σv = g·∫ρ dz, Па
    double shear_modulus = 0.0;         ///< G = ρ·Vs², Па
    double bulk_modulus = 0.0;          ///< K = ρ·(Vp² − 4/3·Vs²), Па
    double lame_lambda = 0.0;           ///< λ = ρ·(Vp² − 2·Vs²), Па
    DerivedValue youngs_modulus;        ///< E = 2G(1+ν), Па
    DerivedValue poisson_ratio;         ///< ν по скоростям

    // === Импедансы ===
    double acoustic_impedance = 0.0;    ///< AI = ρ·Vp
    double shear_impedance = 0.0;       ///< SI = ρ·Vs
    double p_modulus = 0.0;             ///< M = ρ·Vp², Па

    // === Дополнительные параметры ===
    DerivedValue vp_vs_ratio;           ///< Vp/Vs
    DerivedValue impedance_gradient;    ///< dAI/dz, конечные разности
    double delta_impedance_prev = 0.0;  ///< AI[i] − AI[i−1]
    DerivedValue lambda_over_mu;        ///< λ/G
    DerivedValue poisson_from_moduli;   ///< ν = (3K − 2G)/(2(3K + G))
    DerivedValue brittleness_e;         ///< Нормированный E (min-max)

    /**
     * @brief Значение поля по идентификатору (для экспорта)
     */
    [[nodiscard]] DerivedValue value(DerivedField field) const noexcept {
        switch (field) {
            case DerivedField::Depth: return depth;
            case DerivedField::Density: return density;
            case DerivedField::Vp: return vp;
            case DerivedField::Vs: return vs;
            case DerivedField::VerticalStress: return vertical_stress;
            case DerivedField::ShearModulus: return shear_modulus;
            case DerivedField::BulkModulus: return bulk_modulus;
            case DerivedField::LameLambda: return lame_lambda;
            case DerivedField::YoungsModulus: return youngs_modulus;
            case DerivedField::PoissonRatio: return poisson_ratio;
            case DerivedField::AcousticImpedance: return acoustic_impedance;
            case DerivedField::ShearImpedance: return shear_impedance;
            case DerivedField::PModulus: return p_modulus;
            case DerivedField::VpVsRatio: return vp_vs_ratio;
            case DerivedField::ImpedanceGradient: return impedance_gradient;
            case DerivedField::DeltaImpedancePrev: return delta_impedance_prev;
            case DerivedField::LambdaOverMu: return lambda_over_mu;
            case DerivedField::PoissonFromModuli: return poisson_from_moduli;
            case DerivedField::BrittlenessE: return brittleness_e;
            default: return std::nullopt;
        }
    }

    /**
     * @brief Записать значение поля по идентификатору (для импорта)
     *
     * @return false, если поле всегда определено, а значение пустое
     */
    bool setValue(DerivedField field, DerivedValue v) noexcept {
        auto assign = [&v](double& target) {
            if (!v.has_value()) return false;
            target = *v;
            return true;
        };
        switch (field) {
            case DerivedField::Depth: return assign(depth);
            case DerivedField::Density: return assign(density);
            case DerivedField::Vp: return assign(vp);
            case DerivedField::Vs: return assign(vs);
            case DerivedField::VerticalStress: return assign(vertical_stress);
            case DerivedField::ShearModulus: return assign(shear_modulus);
            case DerivedField::BulkModulus: return assign(bulk_modulus);
            case DerivedField::LameLambda: return assign(lame_lambda);
            case DerivedField::YoungsModulus: youngs_modulus = v; return true;
            case DerivedField::PoissonRatio: poisson_ratio = v; return true;
            case DerivedField::AcousticImpedance: return assign(acoustic_impedance);
            case DerivedField::ShearImpedance: return assign(shear_impedance);
            case DerivedField::PModulus: return assign(p_modulus);
            case DerivedField::VpVsRatio: vp_vs_ratio = v; return true;
            case DerivedField::ImpedanceGradient: impedance_gradient = v; return true;
            case DerivedField::DeltaImpedancePrev: return assign(delta_impedance_prev);
            case DerivedField::LambdaOverMu: lambda_over_mu = v; return true;
            case DerivedField::PoissonFromModuli: poisson_from_moduli = v; return true;
            case DerivedField::BrittlenessE: brittleness_e = v; return true;
            default: return false;
        }
    }

    /**
     * @brief Исходная точка
     */
    [[nodiscard]] PreparedSample source() const noexcept {
        return {depth, density, vp, vs};
    }
};

using DerivedSampleList = std::vector<DerivedSample>;

} // namespace geomech::model
