/**
 * @file test_derivation.cpp
 * @brief Расчёт упругих и геомеханических параметров
 */

#include <doctest/doctest.h>
#include "core/derivation.hpp"
#include <cmath>

using namespace geomech::core;
using namespace geomech::model;

namespace {

PreparedSampleList twoSamples() {
    return {
        {0.0, 2500.0, 3000.0, 1500.0},
        {10.0, 2600.0, 3200.0, 1600.0},
    };
}

} // namespace

TEST_CASE("Два образца: напряжение и модули") {
    auto out = deriveParameters(twoSamples());
    REQUIRE(out.size() == 2);

    CHECK(out[0].p_modulus == doctest::Approx(2.25e10));
    CHECK(out[0].vertical_stress == 0.0);
    CHECK(out[1].vertical_stress == doctest::Approx(250155.0));

    CHECK(out[0].shear_modulus == doctest::Approx(2500.0 * 1500.0 * 1500.0));
    CHECK(out[0].bulk_modulus == doctest::Approx(2500.0 * (9.0e6 - 4.0 / 3.0 * 2.25e6)));
    CHECK(out[0].lame_lambda == doctest::Approx(2500.0 * (9.0e6 - 2.0 * 2.25e6)));
    CHECK(out[0].acoustic_impedance == doctest::Approx(7.5e6));
    CHECK(out[0].shear_impedance == doctest::Approx(3.75e6));

    REQUIRE(out[0].vp_vs_ratio.has_value());
    CHECK(*out[0].vp_vs_ratio == doctest::Approx(2.0));

    // ν = (9 − 4.5) / (2·(9 − 2.25)) = 1/3
    REQUIRE(out[0].poisson_ratio.has_value());
    CHECK(*out[0].poisson_ratio == doctest::Approx(1.0 / 3.0));
    REQUIRE(out[0].youngs_modulus.has_value());
    CHECK(*out[0].youngs_modulus == doctest::Approx(2.0 * out[0].shear_modulus * (4.0 / 3.0)));

    REQUIRE(out[0].poisson_from_moduli.has_value());
    CHECK(*out[0].poisson_from_moduli == doctest::Approx(*out[0].poisson_ratio));

    REQUIRE(out[0].lambda_over_mu.has_value());
    CHECK(*out[0].lambda_over_mu == doctest::Approx(2.0));
}

TEST_CASE("Impedance gradient and delta") {
    PreparedSampleList samples = {
        {0.0, 2000.0, 3000.0, 1500.0},
        {10.0, 2000.0, 3100.0, 1500.0},
        {20.0, 2000.0, 3300.0, 1500.0},
    };
    auto out = deriveParameters(samples);

    // AI = 6.0e6, 6.2e6, 6.6e6
    REQUIRE(out[0].impedance_gradient.has_value());
    CHECK(*out[0].impedance_gradient == doctest::Approx(2.0e4));
    CHECK(*out[1].impedance_gradient == doctest::Approx(3.0e4));
    CHECK(*out[2].impedance_gradient == doctest::Approx(4.0e4));

    CHECK(out[0].delta_impedance_prev == 0.0);
    CHECK(out[1].delta_impedance_prev == doctest::Approx(2.0e5));
    CHECK(out[2].delta_impedance_prev == doctest::Approx(4.0e5));
}

TEST_CASE("Equal depths give an empty gradient") {
    PreparedSampleList samples = {
        {5.0, 2000.0, 3000.0, 1500.0},
        {5.0, 2100.0, 3000.0, 1500.0},
    };
    auto out = deriveParameters(samples);
    CHECK_FALSE(out[0].impedance_gradient.has_value());
    CHECK_FALSE(out[1].impedance_gradient.has_value());
    CHECK(out[1].vertical_stress == 0.0);
}

TEST_CASE("vp = vs makes Poisson and Young degenerate only") {
    PreparedSampleList samples = {{100.0, 2400.0, 2000.0, 2000.0}};
    auto out = deriveParameters(samples);
    REQUIRE(out.size() == 1);

    CHECK_FALSE(out[0].poisson_ratio.has_value());
    CHECK_FALSE(out[0].youngs_modulus.has_value());
    CHECK_FALSE(out[0].brittleness_e.has_value());

    CHECK(out[0].shear_modulus == doctest::Approx(2400.0 * 4.0e6));
    REQUIRE(out[0].vp_vs_ratio.has_value());
    CHECK(*out[0].vp_vs_ratio == doctest::Approx(1.0));
    REQUIRE(out[0].lambda_over_mu.has_value());
    CHECK(*out[0].lambda_over_mu == doctest::Approx(-1.0));
    CHECK(std::isfinite(out[0].bulk_modulus));
    CHECK(std::isfinite(out[0].lame_lambda));
    CHECK(std::isfinite(out[0].p_modulus));
    CHECK(std::isfinite(out[0].acoustic_impedance));
}

TEST_CASE("Single sample") {
    PreparedSampleList samples = {{50.0, 2500.0, 3000.0, 1500.0}};
    auto out = deriveParameters(samples);
    REQUIRE(out.size() == 1);

    CHECK(out[0].vertical_stress == 0.0);
    CHECK(out[0].delta_impedance_prev == 0.0);
    CHECK_FALSE(out[0].impedance_gradient.has_value());
    // Один модуль Юнга: max = min
    CHECK_FALSE(out[0].brittleness_e.has_value());
}

TEST_CASE("Zero shear velocity") {
    PreparedSampleList samples = {{0.0, 1000.0, 1500.0, 0.0}};
    auto out = deriveParameters(samples);

    CHECK_FALSE(out[0].vp_vs_ratio.has_value());
    CHECK_FALSE(out[0].lambda_over_mu.has_value());
    REQUIRE(out[0].poisson_ratio.has_value());
    CHECK(*out[0].poisson_ratio == doctest::Approx(0.5));
    REQUIRE(out[0].poisson_from_moduli.has_value());
    CHECK(*out[0].poisson_from_moduli == doctest::Approx(0.5));
}

TEST_CASE("Zero density makes moduli-based Poisson degenerate") {
    PreparedSampleList samples = {{0.0, 0.0, 3000.0, 1500.0}};
    auto out = deriveParameters(samples);
    CHECK_FALSE(out[0].poisson_from_moduli.has_value());
    CHECK_FALSE(out[0].lambda_over_mu.has_value());
    CHECK(out[0].poisson_ratio.has_value());
}

TEST_CASE("Brittleness spans [0;1] over Young's modulus") {
    PreparedSampleList samples = {
        {0.0, 2200.0, 2800.0, 1300.0},
        {10.0, 2500.0, 3500.0, 1900.0},
        {20.0, 2400.0, 3100.0, 1600.0},
        {30.0, 2300.0, 2500.0, 2500.0},
    };
    auto out = deriveParameters(samples);

    size_t min_idx = 0;
    size_t max_idx = 0;
    for (size_t i = 0; i < 3; ++i) {
        if (*out[i].youngs_modulus < *out[min_idx].youngs_modulus) min_idx = i;
        if (*out[i].youngs_modulus > *out[max_idx].youngs_modulus) max_idx = i;
    }

    CHECK(*out[min_idx].brittleness_e == doctest::Approx(0.0));
    CHECK(*out[max_idx].brittleness_e == doctest::Approx(1.0));
    for (size_t i = 0; i < 3; ++i) {
        CHECK(*out[i].brittleness_e >= 0.0);
        CHECK(*out[i].brittleness_e <= 1.0);
    }
    CHECK_FALSE(out[3].brittleness_e.has_value());
}

TEST_CASE("Output is index-aligned with the input") {
    auto input = twoSamples();
    auto out = deriveParameters(input);
    REQUIRE(out.size() == input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        CHECK(out[i].source() == input[i]);
    }
    CHECK(deriveParameters({}).empty());
}

TEST_CASE("Uniform accessor follows the typed fields") {
    auto out = deriveParameters(twoSamples());
    const auto& s = out[1];
    CHECK(s.value(DerivedField::Depth) == 10.0);
    CHECK(s.value(DerivedField::VerticalStress) == s.vertical_stress);
    CHECK(s.value(DerivedField::PoissonRatio) == s.poisson_ratio);
    CHECK(s.value(DerivedField::BrittlenessE) == s.brittleness_e);
}

TEST_CASE("minMaxNormalize") {
    CHECK(minMaxNormalize({}).empty());

    auto same = minMaxNormalize({1.0, 1.0, std::nullopt});
    for (const auto& v : same) CHECK_FALSE(v.has_value());

    auto n = minMaxNormalize({2.0, std::nullopt, 4.0, 3.0});
    CHECK(*n[0] == doctest::Approx(0.0));
    CHECK_FALSE(n[1].has_value());
    CHECK(*n[2] == doctest::Approx(1.0));
    CHECK(*n[3] == doctest::Approx(0.5));
}
