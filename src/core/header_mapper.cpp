/**
 * @file header_mapper.cpp
 * @brief Реализация автоопределения колонок
 */

#include "header_mapper.hpp"
#include "label_text.hpp"
#include <algorithm>

namespace geomech::core {

namespace {

using F = CanonicalField;
using K = HeaderPatternKind;
using P = HeaderRulePriority;

bool matchesTokens(const HeaderRule& rule, const std::vector<std::string>& tokens,
                   std::string_view normalized) {
    switch (rule.kind) {
        case K::Phrase:
            return containsPhrase(tokens, rule.words);
        case K::Prefix:
            return !rule.words.empty() && normalized.starts_with(rule.words.front());
        default:
            return false;
    }
}

} // namespace

const std::vector<HeaderRule>& headerRules() {
    static const std::vector<HeaderRule> kRules = {
        // Глубина: "depth", "Depth_m", "DEPTH km", "depthm"
        {F::Depth, K::Phrase, {"depth"}, P::Primary},
        {F::Depth, K::Phrase, {"depthm"}, P::Primary},

        // Плотность
        {F::Density, K::Phrase, {"dens"}, P::Primary},
        {F::Density, K::Phrase, {"density"}, P::Primary},
        {F::Density, K::Phrase, {"rho"}, P::Primary},
        {F::Density, K::Phrase, {"kg", "m"}, P::Primary},

        // Продольная волна ("p-wave" после нормализации — "p wave")
        {F::Vp, K::Phrase, {"vp"}, P::Primary},
        {F::Vp, K::Phrase, {"p", "vel"}, P::Primary},
        {F::Vp, K::Phrase, {"p", "velocity"}, P::Primary},
        {F::Vp, K::Phrase, {"pwave"}, P::Primary},
        {F::Vp, K::Phrase, {"p", "wave"}, P::Primary},
        {F::Vp, K::Prefix, {"vp"}, P::Fallback},

        // Поперечная волна
        {F::Vs, K::Phrase, {"vs"}, P::Primary},
        {F::Vs, K::Phrase, {"s", "vel"}, P::Primary},
        {F::Vs, K::Phrase, {"s", "velocity"}, P::Primary},
        {F::Vs, K::Phrase, {"shear"}, P::Primary},
        {F::Vs, K::Prefix, {"vs"}, P::Fallback},
    };
    return kRules;
}

bool ruleMatches(const HeaderRule& rule, std::string_view header) {
    const auto normalized = normalizeLabel(header);
    return matchesTokens(rule, labelTokens(normalized), normalized);
}

ColumnMapping detectColumns(const std::vector<std::string>& headers) {
    ColumnMapping mapping;
    const auto& rules = headerRules();

    for (const auto& header : headers) {
        const auto normalized = normalizeLabel(header);
        if (normalized.empty()) continue;
        const auto tokens = labelTokens(normalized);

        for (auto field : kCanonicalFields) {
            auto ruleHits = [&](HeaderRulePriority priority) {
                return std::any_of(rules.begin(), rules.end(), [&](const HeaderRule& rule) {
                    return rule.field == field && rule.priority == priority &&
                           matchesTokens(rule, tokens, normalized);
                });
            };

            auto& slot = mapping.get(field);
            if (ruleHits(P::Primary)) {
                slot = header;
            } else if (!slot.has_value() && ruleHits(P::Fallback)) {
                slot = header;
            }
        }
    }

    return mapping;
}

} // namespace geomech::core
