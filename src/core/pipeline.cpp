/**
 * @file pipeline.cpp
 * @brief Реализация полного прогона
 */

#include "pipeline.hpp"
#include "derivation.hpp"
#include "header_mapper.hpp"
#include <utility>

namespace geomech::core {

ColumnMapping resolveColumnMapping(
    const std::vector<std::string>& headers,
    const PipelineOptions& options
) {
    ColumnMapping mapping;
    if (options.auto_detect_columns) {
        mapping = detectColumns(headers);
    }
    mapping.overrideWith(options.column_override);
    return mapping;
}

std::array<size_t, kDerivedFieldCount> countSentinels(const DerivedSampleList& samples) {
    std::array<size_t, kDerivedFieldCount> counts{};
    for (const auto& sample : samples) {
        for (size_t k = 0; k < kDerivedFieldOrder.size(); ++k) {
            if (!sample.value(kDerivedFieldOrder[k]).has_value()) {
                ++counts[k];
            }
        }
    }
    return counts;
}

PipelineResult runPipeline(
    const RawTable& table,
    const PipelineOptions& options
) {
    PipelineResult result;

    if (options.auto_detect_columns) {
        result.detected_mapping = detectColumns(table.headers);
    }
    result.mapping = resolveColumnMapping(table.headers, options);

    auto prepared = prepareRows(table, result.mapping);
    result.multipliers = prepared.multipliers;
    result.prepared = std::move(prepared.samples);

    result.samples = deriveParameters(result.prepared);

    result.stats.rows_scanned = prepared.rows_scanned;
    result.stats.rows_discarded = prepared.rows_discarded;
    result.stats.rows_accepted = result.prepared.size();
    result.stats.sentinel_counts = countSentinels(result.samples);

    return result;
}

} // namespace geomech::core
