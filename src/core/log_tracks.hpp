/**
 * @file log_tracks.hpp
 * @brief Подготовка каротажных треков (ряд значений по глубине)
 *
 * Сглаживание скользящим средним и нормировка к [0;1] для
 * выбранных полей результата. Визуализация — вне библиотеки.
 */

#pragma once

#include "model/sample.hpp"
#include <vector>

namespace geomech::core {

using namespace geomech::model;

using Series = std::vector<DerivedValue>;

/**
 * @brief Опции подготовки треков
 */
struct TrackOptions {
    std::vector<DerivedField> fields;   ///< Поля треков (пусто → набор по умолчанию)
    int smoothing_window = 0;           ///< Окно скользящего среднего, точек (≤ 1 — без сглаживания)
    bool normalize = false;             ///< Нормировать каждый трек к [0;1]
};

/**
 * @brief Трек одного поля
 */
struct LogTrack {
    DerivedField field = DerivedField::Depth;
    Series values;
};

/**
 * @brief Набор треков с общей осью глубин
 */
struct TrackSet {
    std::vector<double> depths;
    std::vector<LogTrack> tracks;
};

/**
 * @brief Поля треков по умолчанию
 *
 * density, vp, vs, acoustic_impedance, shear_modulus, youngs_modulus
 */
[[nodiscard]] std::vector<DerivedField> defaultTrackFields();

/**
 * @brief Значения поля по всем точкам
 */
[[nodiscard]] Series fieldSeries(const DerivedSampleList& samples, DerivedField field);

/**
 * @brief Скользящее среднее
 *
 * Окно floor(window) точек с центром в точке, полуширина floor(window/2).
 * Пустые значения пропускаются; если в окне нет значений — пусто.
 */
[[nodiscard]] Series smoothSeries(const Series& series, int window);

/**
 * @brief Нормировка min-max
 *
 * Если значений нет или все равны — весь ряд пустой.
 */
[[nodiscard]] Series normalizeSeries(const Series& series);

/**
 * @brief Построение набора треков
 */
[[nodiscard]] TrackSet buildTracks(const DerivedSampleList& samples, const TrackOptions& options);

} // namespace geomech::core
