/**
 * @file results_json.cpp
 * @brief Сериализация JSON-конверта результатов
 */

#include "results_json.hpp"
#include <cmath>
#include <utility>

namespace geomech::io {

using json = nlohmann::ordered_json;

namespace {

json valueToJson(DerivedValue value) {
    if (value.has_value() && std::isfinite(*value)) {
        return *value;
    }
    return nullptr;
}

DerivedValue valueFromJson(const json& j, std::string_view name) {
    if (j.is_null()) {
        return std::nullopt;
    }
    if (!j.is_number()) {
        throw ResultsEnvelopeError("Поле " + std::string(name) + " должно быть числом или null");
    }
    return j.get<double>();
}

} // namespace

json sampleToJson(const DerivedSample& sample) {
    json j = json::object();
    for (auto field : kDerivedFieldOrder) {
        j[std::string(derivedFieldName(field))] = valueToJson(sample.value(field));
    }
    return j;
}

DerivedSample sampleFromJson(const json& j) {
    if (!j.is_object()) {
        throw ResultsEnvelopeError("Элемент results должен быть объектом");
    }

    DerivedSample sample;
    for (auto field : kDerivedFieldOrder) {
        const std::string name(derivedFieldName(field));
        auto it = j.find(name);
        if (it == j.end()) {
            throw ResultsEnvelopeError("Нет поля " + name);
        }
        if (!sample.setValue(field, valueFromJson(*it, name))) {
            throw ResultsEnvelopeError("Поле " + name + " не может быть null");
        }
    }
    return sample;
}

json resultsEnvelope(const DerivedSampleList& samples) {
    json results = json::array();
    for (const auto& sample : samples) {
        results.push_back(sampleToJson(sample));
    }
    return json{{"results", std::move(results)}};
}

json errorEnvelope(std::string_view message) {
    return json{{"error", std::string(message)}};
}

ResultsEnvelope parseResultsEnvelope(std::string_view text) {
    json j;
    try {
        j = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        throw ResultsEnvelopeError(std::string("Некорректный JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw ResultsEnvelopeError("Конверт должен быть объектом");
    }

    ResultsEnvelope envelope;
    if (auto err = j.find("error"); err != j.end()) {
        if (!err->is_string()) {
            throw ResultsEnvelopeError("Поле error должно быть строкой");
        }
        envelope.error = err->get<std::string>();
        return envelope;
    }

    auto results = j.find("results");
    if (results == j.end() || !results->is_array()) {
        throw ResultsEnvelopeError("Нет массива results");
    }
    envelope.results.reserve(results->size());
    for (const auto& item : *results) {
        envelope.results.push_back(sampleFromJson(item));
    }
    return envelope;
}

} // namespace geomech::io
