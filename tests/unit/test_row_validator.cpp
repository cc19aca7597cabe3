/**
 * @file test_row_validator.cpp
 * @brief Проверка строк, пересчёт единиц и сортировка по глубине
 */

#include <doctest/doctest.h>
#include "core/errors.hpp"
#include "core/row_validator.hpp"
#include <cmath>
#include <limits>
#include <string>

using namespace geomech::core;
using namespace geomech::model;

namespace {

ColumnMapping siMapping() {
    ColumnMapping mapping;
    mapping.depth = "Depth";
    mapping.density = "Rho";
    mapping.vp = "Vp";
    mapping.vs = "Vs";
    return mapping;
}

RawRow makeRow(RawValue depth, RawValue rho, RawValue vp, RawValue vs) {
    return {{"Depth", std::move(depth)}, {"Rho", std::move(rho)}, {"Vp", std::move(vp)}, {"Vs", std::move(vs)}};
}

RawTable makeTable(std::vector<RawRow> rows) {
    RawTable table;
    table.headers = {"Depth", "Rho", "Vp", "Vs"};
    table.rows = std::move(rows);
    return table;
}

} // namespace

TEST_CASE("coerceToNumber accepts numbers and fully numeric text") {
    CHECK(coerceToNumber(RawValue{2.5}) == 2.5);
    CHECK(coerceToNumber(RawValue{std::string(" 3000 ")}) == 3000.0);
    CHECK(coerceToNumber(RawValue{std::string("1e3")}) == 1000.0);
    CHECK(std::isnan(coerceToNumber(RawValue{std::string("12abc")})));
    CHECK(std::isnan(coerceToNumber(RawValue{std::string("")})));
    CHECK(std::isnan(coerceToNumber(RawValue{})));
}

TEST_CASE("Rows are sorted by depth with a stable order") {
    auto table = makeTable({
        makeRow(20.0, 2500.0, 3000.0, 1500.0),
        makeRow(10.0, 2400.0, 2900.0, 1400.0),
        makeRow(10.0, 2450.0, 2950.0, 1450.0),
        makeRow(0.0, 2300.0, 2800.0, 1300.0),
    });

    auto samples = prepareSamples(table, siMapping());
    REQUIRE(samples.size() == 4);
    for (size_t i = 1; i < samples.size(); ++i) {
        CHECK(samples[i - 1].depth <= samples[i].depth);
    }
    CHECK(samples[1].density == 2400.0);
    CHECK(samples[2].density == 2450.0);
}

TEST_CASE("Unit multipliers are applied from the header labels") {
    ColumnMapping mapping;
    mapping.depth = "Depth_m";
    mapping.density = "Density (g/cc)";
    mapping.vp = "Vp_Km/s";
    mapping.vs = "Vs_km/s";

    RawTable table;
    table.headers = {"Depth_m", "Density (g/cc)", "Vp_Km/s", "Vs_km/s"};
    table.rows.push_back({{"Depth_m", 100.0}, {"Density (g/cc)", 2.5},
                          {"Vp_Km/s", 3.0}, {"Vs_km/s", 1.5}});

    auto result = prepareRows(table, mapping);
    REQUIRE(result.samples.size() == 1);
    CHECK(result.samples[0].depth == doctest::Approx(100.0));
    CHECK(result.samples[0].density == doctest::Approx(2500.0));
    CHECK(result.samples[0].vp == doctest::Approx(3000.0));
    CHECK(result.samples[0].vs == doctest::Approx(1500.0));
    CHECK(result.multipliers.vp == 1000.0);
    CHECK(result.multipliers.depth == 1.0);
}

TEST_CASE("Invalid rows are discarded silently") {
    auto table = makeTable({
        makeRow(0.0, 2500.0, 3000.0, 1500.0),
        makeRow(std::string("n/a"), 2500.0, 3000.0, 1500.0),
        makeRow(5.0, RawValue{}, 3000.0, 1500.0),
        makeRow(10.0, 2600.0, std::string("3200"), 1600.0),
        makeRow(15.0, 2600.0, 3200.0, std::numeric_limits<double>::infinity()),
    });
    table.rows.push_back({{"Depth", 20.0}, {"Rho", 2600.0}, {"Vp", 3200.0}});

    auto result = prepareRows(table, siMapping());
    CHECK(result.rows_scanned == 6);
    CHECK(result.rows_discarded == 4);
    REQUIRE(result.samples.size() == 2);
    CHECK(result.samples[1].vp == 3200.0);
}

TEST_CASE("Missing columns are reported before rows are touched") {
    auto mapping = siMapping();
    mapping.density.reset();
    mapping.vs = "";

    RawTable table;

    try {
        (void)prepareSamples(table, mapping);
        FAIL("MissingColumnsError expected");
    } catch (const MissingColumnsError& e) {
        REQUIRE(e.missing().size() == 2);
        CHECK(e.missing()[0] == CanonicalField::Density);
        CHECK(e.missing()[1] == CanonicalField::Vs);
        CHECK(std::string(e.what()).find("density") != std::string::npos);
    }
}

TEST_CASE("All rows invalid raises NoValidRowsError") {
    auto table = makeTable({
        makeRow(std::string("abc"), 2500.0, 3000.0, 1500.0),
        makeRow(RawValue{}, RawValue{}, RawValue{}, RawValue{}),
    });

    try {
        (void)prepareSamples(table, siMapping());
        FAIL("NoValidRowsError expected");
    } catch (const NoValidRowsError& e) {
        CHECK(e.rowsScanned() == 2);
    }

    CHECK_THROWS_AS((void)prepareSamples(makeTable({}), siMapping()), PipelineError);
}
