/**
 * @file test_unit_normalizer.cpp
 * @brief Множители пересчёта единиц по заголовку
 */

#include <doctest/doctest.h>
#include "core/unit_normalizer.hpp"

using namespace geomech::core;
using namespace geomech::model;

TEST_CASE("Velocity multipliers") {
    CHECK(unitMultiplier("Vp_Km/s", UnitKind::Velocity) == 1000.0);
    CHECK(unitMultiplier("vs km s", UnitKind::Velocity) == 1000.0);
    CHECK(unitMultiplier("Vp (m/s)", UnitKind::Velocity) == 1.0);
    CHECK(unitMultiplier("Vp mps", UnitKind::Velocity) == 1.0);
    CHECK(unitMultiplier("Vp", UnitKind::Velocity) == 1.0);
}

TEST_CASE("Depth multipliers") {
    CHECK(unitMultiplier("Depth_km", UnitKind::Depth) == 1000.0);
    CHECK(unitMultiplier("Depth_m", UnitKind::Depth) == 1.0);
}

TEST_CASE("Density multipliers") {
    CHECK(unitMultiplier("Density (g/cc)", UnitKind::Density) == 1000.0);
    CHECK(unitMultiplier("RHOB_gcc", UnitKind::Density) == 1000.0);
    CHECK(unitMultiplier("rho g/cm3", UnitKind::Density) == 1000.0);
    CHECK(unitMultiplier("rho gcm3", UnitKind::Density) == 1000.0);
    CHECK(unitMultiplier("rho g/cm^3", UnitKind::Density) == 1000.0);
    CHECK(unitMultiplier("Density kg/m3", UnitKind::Density) == 1.0);
}

TEST_CASE("Non-breaking space separates unit tokens") {
    CHECK(unitMultiplier("Vp\xC2\xA0km/s", UnitKind::Velocity) == 1000.0);
    CHECK(unitMultiplier("Depth\xC2\xA0km", UnitKind::Depth) == 1000.0);
    CHECK(unitMultiplier("Density\xC2\xA0g/cc", UnitKind::Density) == 1000.0);
}

TEST_CASE("Absent label gives unit multiplier") {
    CHECK(unitMultiplier(std::nullopt, UnitKind::Velocity) == 1.0);
    CHECK(unitMultiplier(std::nullopt, UnitKind::Density) == 1.0);
    CHECK(unitMultiplier(std::nullopt, UnitKind::Depth) == 1.0);
}

TEST_CASE("Kilometre token does not apply to density") {
    CHECK(unitMultiplier("density km", UnitKind::Density) == 1.0);
}
