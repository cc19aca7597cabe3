/**
 * @file row_validator.cpp
 * @brief Реализация проверки строк и приведения к СИ
 */

#include "row_validator.hpp"
#include "errors.hpp"
#include "label_text.hpp"
#include "unit_normalizer.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace geomech::core {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

double parseNumber(const std::string& text) noexcept {
    const std::string cleaned = trim(text);
    if (cleaned.empty()) {
        return kNaN;
    }

    const char* begin = cleaned.c_str();
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);
    // Строка должна быть разобрана целиком
    if (end == begin || static_cast<size_t>(end - begin) != cleaned.size()) {
        return kNaN;
    }
    if (errno == ERANGE && std::isinf(value)) {
        return kNaN;
    }
    return value;
}

double lookup(const RawRow& row, const std::string& header) noexcept {
    auto it = row.find(header);
    if (it == row.end()) {
        return kNaN;
    }
    return coerceToNumber(it->second);
}

} // namespace

double coerceToNumber(const RawValue& value) noexcept {
    if (const auto* number = std::get_if<double>(&value)) {
        return *number;
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return parseNumber(*text);
    }
    return kNaN;
}

UnitMultipliers multipliersFor(const ColumnMapping& mapping) noexcept {
    auto multiplierOf = [&mapping](CanonicalField field) {
        const auto& header = mapping.get(field);
        if (!header.has_value()) {
            return 1.0;
        }
        return unitMultiplier(std::string_view{*header}, unitKindFor(field));
    };

    UnitMultipliers m;
    m.depth = multiplierOf(CanonicalField::Depth);
    m.density = multiplierOf(CanonicalField::Density);
    m.vp = multiplierOf(CanonicalField::Vp);
    m.vs = multiplierOf(CanonicalField::Vs);
    return m;
}

PreparationResult prepareRows(
    const RawTable& table,
    const ColumnMapping& mapping
) {
    // Проверка маппинга до обработки строк
    auto missing = mapping.missingFields();
    if (!missing.empty()) {
        throw MissingColumnsError(std::move(missing));
    }

    PreparationResult result;
    result.multipliers = multipliersFor(mapping);
    result.rows_scanned = table.rows.size();
    result.samples.reserve(table.rows.size());

    const auto& m = result.multipliers;

    for (const auto& row : table.rows) {
        PreparedSample sample;
        sample.depth = lookup(row, *mapping.depth) * m.depth;
        sample.density = lookup(row, *mapping.density) * m.density;
        sample.vp = lookup(row, *mapping.vp) * m.vp;
        sample.vs = lookup(row, *mapping.vs) * m.vs;

        if (!std::isfinite(sample.depth) || !std::isfinite(sample.density) ||
            !std::isfinite(sample.vp) || !std::isfinite(sample.vs)) {
            ++result.rows_discarded;
            continue;
        }

        result.samples.push_back(sample);
    }

    if (result.samples.empty()) {
        throw NoValidRowsError(result.rows_scanned);
    }

    // Равные глубины сохраняют порядок файла
    std::stable_sort(result.samples.begin(), result.samples.end(),
        [](const PreparedSample& a, const PreparedSample& b) {
            return a.depth < b.depth;
        });

    return result;
}

PreparedSampleList prepareSamples(
    const RawTable& table,
    const ColumnMapping& mapping
) {
    return prepareRows(table, mapping).samples;
}

} // namespace geomech::core
