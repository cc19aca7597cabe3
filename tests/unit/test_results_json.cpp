/**
 * @file test_results_json.cpp
 * @brief JSON-конверт результатов
 */

#include <doctest/doctest.h>
#include "core/derivation.hpp"
#include "io/results_json.hpp"

using namespace geomech::io;
using namespace geomech::model;

TEST_CASE("Results envelope keeps field order and writes null for empty values") {
    auto samples = geomech::core::deriveParameters(PreparedSampleList{{0.0, 2500.0, 3000.0, 1500.0}});
    auto envelope = resultsEnvelope(samples);

    REQUIRE(envelope.contains("results"));
    REQUIRE(envelope["results"].size() == 1);
    const auto& item = envelope["results"][0];

    size_t k = 0;
    for (auto it = item.begin(); it != item.end(); ++it, ++k) {
        CHECK(it.key() == derivedFieldName(kDerivedFieldOrder[k]));
    }
    CHECK(k == kDerivedFieldCount);

    CHECK(item["impedance_gradient"].is_null());
    CHECK(item["brittleness_e"].is_null());
    CHECK(item["p_modulus"].get<double>() == doctest::Approx(2.25e10));
}

TEST_CASE("Envelope text parses back into samples") {
    auto samples = geomech::core::deriveParameters(PreparedSampleList{
        {0.0, 2500.0, 3000.0, 1500.0},
        {10.0, 2600.0, 3200.0, 1600.0},
    });

    auto parsed = parseResultsEnvelope(resultsEnvelope(samples).dump());
    REQUIRE(parsed.ok());
    REQUIRE(parsed.results.size() == 2);
    CHECK(parsed.results[1].vertical_stress == doctest::Approx(250155.0));
    CHECK(parsed.results[0].brittleness_e == samples[0].brittleness_e);
}

TEST_CASE("Error envelope") {
    auto text = errorEnvelope("Не найдены колонки: density").dump();
    CHECK(text == "{\"error\":\"Не найдены колонки: density\"}");

    auto parsed = parseResultsEnvelope(text);
    CHECK_FALSE(parsed.ok());
    CHECK(*parsed.error == "Не найдены колонки: density");
    CHECK(parsed.results.empty());
}

TEST_CASE("Malformed envelopes are rejected") {
    CHECK_THROWS_AS((void)parseResultsEnvelope("{"), ResultsEnvelopeError);
    CHECK_THROWS_AS((void)parseResultsEnvelope("[]"), ResultsEnvelopeError);
    CHECK_THROWS_AS((void)parseResultsEnvelope("{\"results\": 5}"), ResultsEnvelopeError);
    CHECK_THROWS_AS((void)parseResultsEnvelope("{\"results\": [{\"depth\": 1}]}"), ResultsEnvelopeError);

    // null допустим только для полей с вырожденным случаем
    auto j = sampleToJson(DerivedSample{});
    j["depth"] = nullptr;
    CHECK_THROWS_AS((void)sampleFromJson(j), ResultsEnvelopeError);

    j["depth"] = "deep";
    CHECK_THROWS_AS((void)sampleFromJson(j), ResultsEnvelopeError);
}
