/**
 * @file results_json.hpp
 * @brief JSON-конверт результатов: {"results": [...]} или {"error": "..."}
 *
 * Поля точки идут в каноническом порядке, пустые значения пишутся как null.
 */

#pragma once

#include "model/sample.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace geomech::io {

using namespace geomech::model;

/**
 * @brief Ошибка разбора конверта
 */
class ResultsEnvelopeError : public std::runtime_error {
public:
    explicit ResultsEnvelopeError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Разобранный конверт
 */
struct ResultsEnvelope {
    DerivedSampleList results;
    std::optional<std::string> error;   ///< Задано, если расчёт завершился ошибкой

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

[[nodiscard]] nlohmann::ordered_json sampleToJson(const DerivedSample& sample);

/**
 * @throws ResultsEnvelopeError Нет поля, неверный тип или null в обязательном поле
 */
[[nodiscard]] DerivedSample sampleFromJson(const nlohmann::ordered_json& j);

[[nodiscard]] nlohmann::ordered_json resultsEnvelope(const DerivedSampleList& samples);
[[nodiscard]] nlohmann::ordered_json errorEnvelope(std::string_view message);

/**
 * @brief Разбор текста конверта
 * @throws ResultsEnvelopeError
 */
[[nodiscard]] ResultsEnvelope parseResultsEnvelope(std::string_view text);

} // namespace geomech::io
