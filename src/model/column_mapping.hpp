/**
 * @file column_mapping.hpp
 * @brief Соответствие канонических полей заголовкам колонок файла
 */

#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace geomech::model {

/**
 * @brief Маппинг канонических полей на заголовки колонок
 *
 * Формируется автоопределением заголовков, может быть переопределён
 * пользователем до проверки строк.
 */
struct ColumnMapping {
    std::optional<std::string> depth;     ///< Глубина
    std::optional<std::string> density;   ///< Плотность
    std::optional<std::string> vp;        ///< Vp
    std::optional<std::string> vs;        ///< Vs

    [[nodiscard]] const std::optional<std::string>& get(CanonicalField field) const noexcept {
        switch (field) {
            case CanonicalField::Depth: return depth;
            case CanonicalField::Density: return density;
            case CanonicalField::Vp: return vp;
            case CanonicalField::Vs:
            default:
                return vs;
        }
    }

    [[nodiscard]] std::optional<std::string>& get(CanonicalField field) noexcept {
        switch (field) {
            case CanonicalField::Depth: return depth;
            case CanonicalField::Density: return density;
            case CanonicalField::Vp: return vp;
            case CanonicalField::Vs:
            default:
                return vs;
        }
    }

    /**
     * @brief Поля, для которых колонка не задана (в каноническом порядке)
     */
    [[nodiscard]] std::vector<CanonicalField> missingFields() const {
        std::vector<CanonicalField> missing;
        for (auto field : kCanonicalFields) {
            const auto& header = get(field);
            if (!header.has_value() || header->empty()) {
                missing.push_back(field);
            }
        }
        return missing;
    }

    /**
     * @brief Все четыре поля заданы
     */
    [[nodiscard]] bool isComplete() const {
        return missingFields().empty();
    }

    /**
     * @brief Наложить заданные поля другого маппинга поверх текущего
     */
    void overrideWith(const ColumnMapping& other) {
        for (auto field : kCanonicalFields) {
            const auto& header = other.get(field);
            if (header.has_value() && !header->empty()) {
                get(field) = header;
            }
        }
    }

    bool operator==(const ColumnMapping&) const = default;
};

} // namespace geomech::model
