/**
 * @file test_csv_writer.cpp
 * @brief Экспорт результатов и треков в CSV
 */

#include <doctest/doctest.h>
#include "core/derivation.hpp"
#include "io/csv_writer.hpp"
#include "io/file_utils.hpp"
#include <filesystem>
#include <sstream>
#include <vector>

using namespace geomech::io;
using namespace geomech::model;

namespace {

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> splitCells(const std::string& line, char delimiter) {
    std::vector<std::string> cells;
    std::string current;
    for (char c : line) {
        if (c == delimiter) {
            cells.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    cells.push_back(current);
    return cells;
}

DerivedSampleList sampleResults() {
    return geomech::core::deriveParameters(PreparedSampleList{
        {0.0, 2500.0, 3000.0, 1500.0},
        {10.0, 2600.0, 3200.0, 1600.0},
    });
}

} // namespace

TEST_CASE("Results CSV follows the canonical field order") {
    auto lines = splitLines(buildCsvResults(sampleResults()));
    REQUIRE(lines.size() == 3);

    auto header = splitCells(lines[0], ',');
    REQUIRE(header.size() == kDerivedFieldCount);
    CHECK(header.front() == "depth");
    CHECK(header[4] == "vertical_stress");
    CHECK(header.back() == "brittleness_e");

    auto row1 = splitCells(lines[2], ',');
    CHECK(row1[0] == "10");
    CHECK(row1[4] == "250155");
}

TEST_CASE("Empty values are written as empty cells") {
    // Одна точка: градиент и хрупкость не определены
    auto samples = geomech::core::deriveParameters(PreparedSampleList{{0.0, 2500.0, 3000.0, 1500.0}});
    auto lines = splitLines(buildCsvResults(samples));
    REQUIRE(lines.size() == 2);

    auto cells = splitCells(lines[1], ',');
    REQUIRE(cells.size() == kDerivedFieldCount);
    CHECK(cells[static_cast<size_t>(DerivedField::ImpedanceGradient)].empty());
    CHECK(cells[static_cast<size_t>(DerivedField::BrittlenessE)].empty());
    CHECK(cells[static_cast<size_t>(DerivedField::PModulus)] == "22500000000");
}

TEST_CASE("Delimiter, decimal separator and precision options") {
    CsvExportOptions options;
    options.delimiter = ';';
    options.decimal_separator = ',';
    options.significant_digits = 4;
    options.include_header = false;

    CHECK(formatCsvValue(1.23456, options) == "1,235");
    CHECK(formatCsvValue(std::nullopt, options).empty());

    auto lines = splitLines(buildCsvResults(sampleResults(), options));
    REQUIRE(lines.size() == 2);
    CHECK(splitCells(lines[0], ';').size() == kDerivedFieldCount);
}

TEST_CASE("Tracks CSV has depth plus selected fields") {
    geomech::core::TrackSet set;
    set.depths = {0.0, 10.0};
    set.tracks.push_back({DerivedField::Vp, {3000.0, std::nullopt}});

    auto lines = splitLines(buildCsvTracks(set));
    REQUIRE(lines.size() == 3);
    CHECK(lines[0] == "depth,vp");
    CHECK(lines[1] == "0,3000");
    CHECK(lines[2] == "10,");
}

TEST_CASE("writeCsvResults writes the file atomically") {
    namespace fs = std::filesystem;
    auto dir = fs::temp_directory_path() / "geomech_csv_writer";
    std::error_code ec;
    fs::remove_all(dir, ec);

    auto path = dir / "results.csv";
    writeCsvResults(sampleResults(), path);

    CHECK(fs::exists(path));
    CHECK_FALSE(fs::exists(dir / "results.csv.tmp"));
    CHECK(readTextFile(path) == buildCsvResults(sampleResults()));

    fs::remove_all(dir, ec);
}
