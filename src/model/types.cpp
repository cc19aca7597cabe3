/**
 * @file types.cpp
 * @brief Реализация базовых типов
 */

#include "types.hpp"
#include <algorithm>
#include <cctype>

namespace geomech::model {

std::string_view canonicalFieldName(CanonicalField field) noexcept {
    switch (field) {
        case CanonicalField::Depth: return "depth";
        case CanonicalField::Density: return "density";
        case CanonicalField::Vp: return "vp";
        case CanonicalField::Vs: return "vs";
        default: return "???";
    }
}

std::optional<CanonicalField> canonicalFieldFromName(std::string_view name) noexcept {
    for (auto field : kCanonicalFields) {
        if (canonicalFieldName(field) == name) {
            return field;
        }
    }
    return std::nullopt;
}

std::string_view derivedFieldName(DerivedField field) noexcept {
    switch (field) {
        case DerivedField::Depth: return "depth";
        case DerivedField::Density: return "density";
        case DerivedField::Vp: return "vp";
        case DerivedField::Vs: return "vs";
        case DerivedField::VerticalStress: return "vertical_stress";
        case DerivedField::ShearModulus: return "shear_modulus";
        case DerivedField::BulkModulus: return "bulk_modulus";
        case DerivedField::LameLambda: return "lame_lambda";
        case DerivedField::YoungsModulus: return "youngs_modulus";
        case DerivedField::PoissonRatio: return "poisson_ratio";
        case DerivedField::AcousticImpedance: return "acoustic_impedance";
        case DerivedField::ShearImpedance: return "shear_impedance";
        case DerivedField::PModulus: return "p_modulus";
        case DerivedField::VpVsRatio: return "vp_vs_ratio";
        case DerivedField::ImpedanceGradient: return "impedance_gradient";
        case DerivedField::DeltaImpedancePrev: return "delta_impedance_prev";
        case DerivedField::LambdaOverMu: return "lambda_over_mu";
        case DerivedField::PoissonFromModuli: return "poisson_from_moduli";
        case DerivedField::BrittlenessE: return "brittleness_e";
        default: return "???";
    }
}

std::optional<DerivedField> derivedFieldFromName(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (auto field : kDerivedFieldOrder) {
        if (derivedFieldName(field) == lowered) {
            return field;
        }
    }
    return std::nullopt;
}

} // namespace geomech::model
