/**
 * @file test_csv_detection.cpp
 * @brief Юнит-тесты разбора и автоопределения CSV
 */

#include <doctest/doctest.h>
#include "io/csv_reader.hpp"
#include <filesystem>
#include <fstream>
#include <variant>

using namespace geomech::io;
using namespace geomech::model;

namespace {

std::filesystem::path makeSourcePath(const std::string& relative) {
    return std::filesystem::path(GEOMECH_SOURCE_DIR) / relative;
}

const RawValue& cell(const RawTable& table, size_t row, const std::string& header) {
    return table.rows.at(row).at(header);
}

} // namespace

TEST_CASE("Cells are typed as empty, number or text") {
    auto table = parseCsvTable("Depth,Vp,Note\n100,3000,ok\n101,,\"a, b\"\n");

    REQUIRE(table.headers.size() == 3);
    REQUIRE(table.rows.size() == 2);

    CHECK(std::get<double>(cell(table, 0, "Depth")) == 100.0);
    CHECK(std::get<std::string>(cell(table, 0, "Note")) == "ok");
    CHECK(isEmptyValue(cell(table, 1, "Vp")));
    CHECK(std::get<std::string>(cell(table, 1, "Note")) == "a, b");
}

TEST_CASE("Doubled quotes inside a quoted field") {
    auto table = parseCsvTable("Name,Depth\n\"say \"\"hi\"\"\",5\n");
    CHECK(std::get<std::string>(cell(table, 0, "Name")) == "say \"hi\"");
}

TEST_CASE("Duplicate headers get numeric suffixes") {
    auto table = parseCsvTable("Vp,Vp,Vs\n1,2,3\n");
    REQUIRE(table.headers.size() == 3);
    CHECK(table.headers[0] == "Vp");
    CHECK(table.headers[1] == "Vp_1");
    CHECK(std::get<double>(cell(table, 0, "Vp_1")) == 2.0);
}

TEST_CASE("Blank lines are skipped and short rows leave keys absent") {
    auto table = parseCsvTable("A;B;C\n\n1;2\n;;\n4;5;6\n");
    REQUIRE(table.rows.size() == 2);
    CHECK(table.rows[0].count("C") == 0);
    CHECK(std::get<double>(cell(table, 1, "C")) == 6.0);
}

TEST_CASE("Semicolon delimiter with decimal comma") {
    auto table = parseCsvTable("Depth;Vp\n10,5;3000,25\n11;3010\n");
    CHECK(std::get<double>(cell(table, 0, "Depth")) == doctest::Approx(10.5));
    CHECK(std::get<double>(cell(table, 0, "Vp")) == doctest::Approx(3000.25));
}

TEST_CASE("Explicit options override detection") {
    CsvReadOptions options;
    options.delimiter = '|';
    options.skip_lines = 1;
    auto table = parseCsvTable("# comment, with commas\nDepth|Vp\n1|2\n", options);
    REQUIRE(table.headers.size() == 2);
    CHECK(table.headers[1] == "Vp");
}

TEST_CASE("Empty content is a read error") {
    CHECK_THROWS_AS((void)parseCsvTable("\n\n"), CsvReadError);
    CHECK_THROWS_AS((void)readCsvTable(makeSourcePath("tests/fixtures/does_not_exist.csv")), CsvReadError);
}

TEST_CASE("Encoding detection and CP1251 conversion") {
    const std::string cp1251 = "\xC3\xEB\xF3\xE1\xE8\xED\xE0";  // "Глубина"
    CHECK(detectEncoding(cp1251) == "CP1251");
    CHECK(detectEncoding("Глубина") == "UTF-8");
    CHECK(detectEncoding("Depth") == "UTF-8");
    CHECK(convertCp1251ToUtf8(cp1251) == "Глубина");
}

TEST_CASE("CP1251 file is decoded before parsing") {
    auto path = std::filesystem::temp_directory_path() / "geomech_csv_cp1251.csv";
    {
        std::ofstream ofs(path, std::ios::binary);
        ofs << "\xC3\xEB\xF3\xE1\xE8\xED\xE0;Vp\n1;2\n";
    }

    auto table = readCsvTable(path);
    std::error_code ec;
    std::filesystem::remove(path, ec);

    REQUIRE(table.headers.size() == 2);
    CHECK(table.headers[0] == "Глубина");
    CHECK(table.source_name == "geomech_csv_cp1251.csv");
}

TEST_CASE("CSV detection suggests a complete mapping") {
    auto detection = detectCsvFormat(makeSourcePath("tests/fixtures/well_logs_km.csv"));

    CHECK(detection.detected_delimiter == ',');
    CHECK(detection.detected_decimal == '.');
    CHECK(detection.detected_encoding == "UTF-8");
    CHECK(detection.column_count == 5);
    REQUIRE(detection.suggested_mapping.isComplete());
    CHECK(*detection.suggested_mapping.vp == "Vp_Km/s");
    CHECK(detection.diagnostics.empty());
}

TEST_CASE("CSV detection reports fields it cannot map") {
    auto path = std::filesystem::temp_directory_path() / "geomech_csv_detect_partial.csv";
    {
        std::ofstream ofs(path);
        ofs << "Depth;GR;Vp\n";
        ofs << "0;10;3000\n";
    }

    auto detection = detectCsvFormat(path);
    std::error_code ec;
    std::filesystem::remove(path, ec);

    CHECK(detection.detected_delimiter == ';');
    CHECK(detection.suggested_mapping.missingFields().size() == 2);
    CHECK(detection.diagnostics.size() == 2);
}

TEST_CASE("CSV detection honours explicit read options") {
    auto path = std::filesystem::temp_directory_path() / "geomech_csv_detect_options.csv";
    {
        std::ofstream ofs(path);
        ofs << "# export header\n";
        ofs << "Depth|Rho|Vp|Vs\n";
        ofs << "10|2,3|3000|1500\n";
    }

    CsvReadOptions options;
    options.skip_lines = 1;
    options.delimiter = '|';
    options.decimal_separator = ',';
    options.encoding = "UTF-8";
    auto detection = detectCsvFormat(path, options);
    std::error_code ec;
    std::filesystem::remove(path, ec);

    CHECK(detection.detected_delimiter == '|');
    CHECK(detection.detected_decimal == ',');
    CHECK(detection.detected_encoding == "UTF-8");
    REQUIRE(detection.column_count == 4);
    CHECK(detection.header_names.front() == "Depth");
    CHECK(detection.suggested_mapping.isComplete());
}
