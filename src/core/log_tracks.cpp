/**
 * @file log_tracks.cpp
 * @brief Реализация подготовки каротажных треков
 */

#include "log_tracks.hpp"
#include "derivation.hpp"
#include <cmath>
#include <cstddef>
#include <utility>

namespace geomech::core {

std::vector<DerivedField> defaultTrackFields() {
    return {
        DerivedField::Density,
        DerivedField::Vp,
        DerivedField::Vs,
        DerivedField::AcousticImpedance,
        DerivedField::ShearModulus,
        DerivedField::YoungsModulus
    };
}

Series fieldSeries(const DerivedSampleList& samples, DerivedField field) {
    Series series;
    series.reserve(samples.size());
    for (const auto& sample : samples) {
        series.push_back(sample.value(field));
    }
    return series;
}

Series smoothSeries(const Series& series, int window) {
    if (window <= 1) {
        return series;
    }

    const auto half = static_cast<std::ptrdiff_t>(window / 2);
    const auto n = static_cast<std::ptrdiff_t>(series.size());
    Series smoothed(series.size());

    for (std::ptrdiff_t i = 0; i < n; ++i) {
        double sum = 0.0;
        int count = 0;
        for (std::ptrdiff_t j = i - half; j <= i + half; ++j) {
            if (j < 0 || j >= n) continue;
            const auto& v = series[static_cast<size_t>(j)];
            if (v.has_value() && std::isfinite(*v)) {
                sum += *v;
                ++count;
            }
        }
        if (count > 0) {
            smoothed[static_cast<size_t>(i)] = sum / count;
        }
    }

    return smoothed;
}

Series normalizeSeries(const Series& series) {
    return minMaxNormalize(series);
}

TrackSet buildTracks(const DerivedSampleList& samples, const TrackOptions& options) {
    TrackSet set;
    set.depths.reserve(samples.size());
    for (const auto& sample : samples) {
        set.depths.push_back(sample.depth);
    }

    const auto fields = options.fields.empty() ? defaultTrackFields() : options.fields;
    for (auto field : fields) {
        LogTrack track;
        track.field = field;
        track.values = fieldSeries(samples, field);
        if (options.smoothing_window > 1) {
            track.values = smoothSeries(track.values, options.smoothing_window);
        }
        if (options.normalize) {
            track.values = normalizeSeries(track.values);
        }
        set.tracks.push_back(std::move(track));
    }

    return set;
}

} // namespace geomech::core
