/**
 * @file derivation.cpp
 * @brief Реализация расчёта параметров
 */

#include "derivation.hpp"
#include <algorithm>
#include <cmath>
#include <optional>

namespace geomech::core {

std::vector<double> integrateVerticalStress(const PreparedSampleList& samples) {
    std::vector<double> stress(samples.size(), 0.0);

    // Верхняя точка без нагрузки
    double integral = 0.0;
    for (size_t i = 1; i < samples.size(); ++i) {
        double dz = samples[i].depth - samples[i - 1].depth;
        integral += 0.5 * (samples[i].density + samples[i - 1].density) * dz;
        stress[i] = integral * kGravity;
    }

    return stress;
}

DerivedValue poissonFromVelocities(double vp, double vs) noexcept {
    const double vp2 = vp * vp;
    const double vs2 = vs * vs;
    const double denom = 2.0 * (vp2 - vs2);
    if (std::abs(denom) < kSingularTolerance) {
        return std::nullopt;
    }
    return (vp2 - 2.0 * vs2) / denom;
}

DerivedValue poissonFromModuli(double bulk, double shear) noexcept {
    const double denom = 2.0 * (3.0 * bulk + shear);
    if (std::abs(denom) < kSingularTolerance) {
        return std::nullopt;
    }
    return (3.0 * bulk - 2.0 * shear) / denom;
}

std::vector<DerivedValue> impedanceGradient(
    const std::vector<double>& depths,
    const std::vector<double>& impedance
) {
    const size_t n = std::min(depths.size(), impedance.size());
    std::vector<DerivedValue> gradient(n);
    if (n < 2) {
        return gradient;
    }

    auto difference = [&](size_t lo, size_t hi) -> DerivedValue {
        double dz = depths[hi] - depths[lo];
        if (dz == 0.0) {
            return std::nullopt;
        }
        return (impedance[hi] - impedance[lo]) / dz;
    };

    gradient[0] = difference(0, 1);
    for (size_t i = 1; i + 1 < n; ++i) {
        gradient[i] = difference(i - 1, i + 1);
    }
    gradient[n - 1] = difference(n - 2, n - 1);

    return gradient;
}

std::vector<DerivedValue> minMaxNormalize(const std::vector<DerivedValue>& values) {
    std::optional<double> lo;
    std::optional<double> hi;
    for (const auto& v : values) {
        if (!v.has_value() || !std::isfinite(*v)) continue;
        lo = lo.has_value() ? std::min(*lo, *v) : *v;
        hi = hi.has_value() ? std::max(*hi, *v) : *v;
    }

    std::vector<DerivedValue> normalized(values.size());
    if (!lo.has_value() || *hi == *lo) {
        return normalized;
    }

    const double range = *hi - *lo;
    for (size_t i = 0; i < values.size(); ++i) {
        const auto& v = values[i];
        if (v.has_value() && std::isfinite(*v)) {
            normalized[i] = (*v - *lo) / range;
        }
    }
    return normalized;
}

DerivedSampleList deriveParameters(const PreparedSampleList& samples) {
    const size_t n = samples.size();
    DerivedSampleList out(n);
    if (n == 0) {
        return out;
    }

    const auto stress = integrateVerticalStress(samples);

    std::vector<double> depths(n);
    std::vector<double> impedance(n);

    // Поточечные величины
    for (size_t i = 0; i < n; ++i) {
        const auto& s = samples[i];
        auto& d = out[i];

        d.depth = s.depth;
        d.density = s.density;
        d.vp = s.vp;
        d.vs = s.vs;
        d.vertical_stress = stress[i];

        const double vp2 = s.vp * s.vp;
        const double vs2 = s.vs * s.vs;

        d.shear_modulus = s.density * vs2;
        d.bulk_modulus = s.density * (vp2 - (4.0 / 3.0) * vs2);
        d.lame_lambda = s.density * (vp2 - 2.0 * vs2);
        d.p_modulus = s.density * vp2;

        d.poisson_ratio = poissonFromVelocities(s.vp, s.vs);
        if (d.poisson_ratio.has_value()) {
            d.youngs_modulus = 2.0 * d.shear_modulus * (1.0 + *d.poisson_ratio);
        }

        d.acoustic_impedance = s.density * s.vp;
        d.shear_impedance = s.density * s.vs;

        if (s.vs != 0.0) {
            d.vp_vs_ratio = s.vp / s.vs;
        }
        if (d.shear_modulus != 0.0) {
            d.lambda_over_mu = d.lame_lambda / d.shear_modulus;
        }
        d.poisson_from_moduli = poissonFromModuli(d.bulk_modulus, d.shear_modulus);

        depths[i] = s.depth;
        impedance[i] = d.acoustic_impedance;
    }

    // Разностные величины
    const auto gradient = impedanceGradient(depths, impedance);
    out[0].delta_impedance_prev = 0.0;
    for (size_t i = 0; i < n; ++i) {
        out[i].impedance_gradient = gradient[i];
        if (i > 0) {
            out[i].delta_impedance_prev = impedance[i] - impedance[i - 1];
        }
    }

    // Хрупкость: глобальный min/max модуля Юнга
    std::vector<DerivedValue> youngs(n);
    for (size_t i = 0; i < n; ++i) {
        youngs[i] = out[i].youngs_modulus;
    }
    const auto brittleness = minMaxNormalize(youngs);
    for (size_t i = 0; i < n; ++i) {
        out[i].brittleness_e = brittleness[i];
    }

    return out;
}

} // namespace geomech::core
