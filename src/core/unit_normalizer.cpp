/**
 * @file unit_normalizer.cpp
 * @brief Реализация определения единиц измерения по заголовку
 */

#include "unit_normalizer.hpp"
#include "label_text.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace geomech::core {

namespace {

using Phrase = std::vector<std::string_view>;

bool hasToken(const std::vector<std::string>& tokens, std::string_view token) {
    return std::find(tokens.begin(), tokens.end(), token) != tokens.end();
}

bool hasAnyPhrase(const std::vector<std::string>& tokens, const std::vector<Phrase>& phrases) {
    return std::any_of(phrases.begin(), phrases.end(), [&tokens](const Phrase& phrase) {
        return containsPhrase(tokens, phrase);
    });
}

// Варианты записи г/см³ после нормализации ("g/cc" → "g cc")
const std::vector<Phrase> kGramPerCcPhrases = {
    {"g", "cc"}, {"gcc"}, {"g", "cm3"}, {"gcm3"}, {"g", "cm", "3"}
};

// Явное указание м/с ("m/s" → "m s")
const std::vector<Phrase> kMetersPerSecondPhrases = {
    {"m", "s"}, {"mps"}, {"mpersec"}
};

double velocityMultiplier(const std::vector<std::string>& tokens) {
    // "km/s", "Km/s", "km s" нормализуются в слово "km"
    if (hasToken(tokens, "km")) {
        return kKilometerFactor;
    }
    if (hasAnyPhrase(tokens, kMetersPerSecondPhrases)) {
        return 1.0;
    }
    return 1.0;
}

double depthMultiplier(const std::vector<std::string>& tokens) {
    return hasToken(tokens, "km") ? kKilometerFactor : 1.0;
}

double densityMultiplier(const std::vector<std::string>& tokens) {
    // По умолчанию считаем, что плотность уже в кг/м³
    return hasAnyPhrase(tokens, kGramPerCcPhrases) ? kGramPerCcFactor : 1.0;
}

} // namespace

double unitMultiplier(
    std::optional<std::string_view> label,
    UnitKind kind
) noexcept {
    if (!label.has_value()) {
        return 1.0;
    }

    const auto tokens = labelTokens(*label);

    switch (kind) {
        case UnitKind::Velocity: return velocityMultiplier(tokens);
        case UnitKind::Depth: return depthMultiplier(tokens);
        case UnitKind::Density: return densityMultiplier(tokens);
        default: return 1.0;
    }
}

} // namespace geomech::core
