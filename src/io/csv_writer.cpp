/**
 * @file csv_writer.cpp
 * @brief Реализация экспорта в CSV
 */

#include "csv_writer.hpp"
#include "file_utils.hpp"
#include <cmath>
#include <iomanip>
#include <string_view>
#include <sstream>

namespace geomech::io {

namespace {

/// Экранирование текстового поля, содержащего разделитель или кавычки
std::string quoteField(std::string_view text, char delimiter) {
    if (text.find(delimiter) == std::string_view::npos &&
        text.find('"') == std::string_view::npos) {
        return std::string(text);
    }

    std::string quoted = "\"";
    for (char c : text) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void writeOrThrow(const std::filesystem::path& path, const std::string& content) {
    try {
        atomicWrite(path, content);
    } catch (const FileIoError& e) {
        throw CsvWriteError(e.what());
    }
}

} // anonymous namespace

std::string formatCsvValue(DerivedValue value, const CsvExportOptions& options) {
    if (!value.has_value() || !std::isfinite(*value)) {
        return "";
    }

    std::ostringstream ss;
    ss << std::setprecision(options.significant_digits) << *value;
    std::string result = ss.str();

    if (options.decimal_separator != '.') {
        for (char& c : result) {
            if (c == '.') c = options.decimal_separator;
        }
    }

    return result;
}

std::string buildCsvResults(const DerivedSampleList& samples, const CsvExportOptions& options) {
    std::ostringstream out;

    if (options.include_header) {
        for (size_t i = 0; i < kDerivedFieldOrder.size(); ++i) {
            if (i > 0) out << options.delimiter;
            out << quoteField(derivedFieldName(kDerivedFieldOrder[i]), options.delimiter);
        }
        out << '\n';
    }

    for (const auto& sample : samples) {
        for (size_t i = 0; i < kDerivedFieldOrder.size(); ++i) {
            if (i > 0) out << options.delimiter;
            out << formatCsvValue(sample.value(kDerivedFieldOrder[i]), options);
        }
        out << '\n';
    }

    return out.str();
}

void writeCsvResults(
    const DerivedSampleList& samples,
    const std::filesystem::path& path,
    const CsvExportOptions& options
) {
    writeOrThrow(path, buildCsvResults(samples, options));
}

std::string buildCsvTracks(const core::TrackSet& tracks, const CsvExportOptions& options) {
    std::ostringstream out;

    if (options.include_header) {
        out << "depth";
        for (const auto& track : tracks.tracks) {
            out << options.delimiter << quoteField(derivedFieldName(track.field), options.delimiter);
        }
        out << '\n';
    }

    for (size_t row = 0; row < tracks.depths.size(); ++row) {
        out << formatCsvValue(tracks.depths[row], options);
        for (const auto& track : tracks.tracks) {
            out << options.delimiter;
            if (row < track.values.size()) {
                out << formatCsvValue(track.values[row], options);
            }
        }
        out << '\n';
    }

    return out.str();
}

void writeCsvTracks(
    const core::TrackSet& tracks,
    const std::filesystem::path& path,
    const CsvExportOptions& options
) {
    writeOrThrow(path, buildCsvTracks(tracks, options));
}

} // namespace geomech::io
