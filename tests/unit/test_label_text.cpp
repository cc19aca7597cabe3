/**
 * @file test_label_text.cpp
 * @brief Нормализация заголовков колонок
 */

#include <doctest/doctest.h>
#include "core/label_text.hpp"

using namespace geomech::core;

TEST_CASE("normalizeLabel collapses separators and lowercases") {
    CHECK(normalizeLabel("Vp_Km/s") == "vp km s");
    CHECK(normalizeLabel("  Density (g/cc) ") == "density g cc");
    CHECK(normalizeLabel("P-Wave") == "p wave");
    CHECK(normalizeLabel("\xEF\xBB\xBF" "DEPTH") == "depth");
    CHECK(normalizeLabel("---").empty());
}

TEST_CASE("normalizeLabel keeps Cyrillic letters") {
    CHECK(normalizeLabel("Глубина, М") == "глубина м");
    CHECK(utf8ToLower("ЁЛКА") == "ёлка");
}

TEST_CASE("normalizeLabel splits on non-letter UTF-8 characters") {
    CHECK(normalizeLabel("Depth\xC2\xA0m") == "depth m");
    CHECK(normalizeLabel("Vp\xC2\xA0km/s") == "vp km s");
    CHECK(normalizeLabel("Rho, g/cm\xC2\xB3") == "rho g cm");
    CHECK(normalizeLabel("Vs \xC2\xB5s") == "vs s");
    CHECK(normalizeLabel("\xC2\xA0Vp\xC2\xA0") == "vp");
    CHECK(labelTokens("Depth\xC2\xA0km").size() == 2);
}

TEST_CASE("labelTokens and containsPhrase") {
    auto tokens = labelTokens("Vs [km/s]");
    REQUIRE(tokens.size() == 3);
    CHECK(tokens[0] == "vs");
    CHECK(tokens[1] == "km");
    CHECK(tokens[2] == "s");

    CHECK(containsPhrase(tokens, {"km", "s"}));
    CHECK_FALSE(containsPhrase(tokens, {"vs", "s"}));
    CHECK_FALSE(containsPhrase(tokens, {}));
}
