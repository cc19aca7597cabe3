/**
 * @file run_config.cpp
 * @brief Чтение конфигурации прогона
 */

#include "run_config.hpp"
#include "file_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <vector>

namespace geomech::io {

using json = nlohmann::json;

namespace {

const json* section(const json& root, const char* key) {
    auto it = root.find(key);
    if (it == root.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw ConfigError(std::string("Раздел \"") + key + "\" должен быть объектом");
    }
    return &*it;
}

template <typename T>
std::optional<T> optionalValue(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    try {
        return it->get<T>();
    } catch (const json::type_error&) {
        throw ConfigError(std::string("Неверный тип параметра \"") + key + "\"");
    }
}

char charValue(const json& obj, const char* key, char fallback, bool allow_names) {
    auto text = optionalValue<std::string>(obj, key);
    if (!text) {
        return fallback;
    }
    if (allow_names) {
        if (auto c = parseDelimiterName(*text)) {
            return *c;
        }
    } else if (text->size() == 1) {
        return text->front();
    }
    throw ConfigError(std::string("Неверное значение параметра \"") + key + "\": " + *text);
}

void readColumns(const json& obj, ColumnMapping& mapping) {
    for (const auto& item : obj.items()) {
        const auto& key = item.key();
        auto field = canonicalFieldFromName(key);
        if (!field) {
            throw ConfigError("Неизвестное поле колонки: " + key);
        }
        if (auto header = optionalValue<std::string>(obj, key.c_str())) {
            mapping.get(*field) = *header;
        }
    }
}

void readCsv(const json& obj, CsvReadOptions& csv) {
    if (obj.contains("delimiter")) {
        csv.delimiter = charValue(obj, "delimiter", ',', true);
    }
    if (obj.contains("decimal_separator")) {
        csv.decimal_separator = charValue(obj, "decimal_separator", '.', false);
    }
    csv.encoding = optionalValue<std::string>(obj, "encoding").value_or(csv.encoding);
    if (auto it = obj.find("skip_lines"); it != obj.end() && !it->is_null()) {
        if (!it->is_number_integer() ||
            (!it->is_number_unsigned() && it->get<std::int64_t>() < 0)) {
            throw ConfigError("skip_lines должно быть неотрицательным целым числом");
        }
        csv.skip_lines = it->get<size_t>();
    }
}

void readExport(const json& obj, CsvExportOptions& options) {
    options.delimiter = charValue(obj, "delimiter", options.delimiter, true);
    options.decimal_separator = charValue(obj, "decimal_separator", options.decimal_separator, false);
    options.significant_digits =
        optionalValue<int>(obj, "significant_digits").value_or(options.significant_digits);
    options.include_header =
        optionalValue<bool>(obj, "include_header").value_or(options.include_header);

    if (options.significant_digits < 1 || options.significant_digits > 17) {
        throw ConfigError("significant_digits должно быть от 1 до 17");
    }
    if (options.delimiter == options.decimal_separator) {
        throw ConfigError("Разделитель полей совпадает с десятичным разделителем");
    }
}

void readTracks(const json& obj, core::TrackOptions& tracks) {
    if (auto fields = optionalValue<std::vector<std::string>>(obj, "fields")) {
        tracks.fields.clear();
        for (const auto& name : *fields) {
            auto field = derivedFieldFromName(name);
            if (!field) {
                throw ConfigError("Неизвестное поле трека: " + name);
            }
            tracks.fields.push_back(*field);
        }
    }
    tracks.smoothing_window =
        optionalValue<int>(obj, "smoothing_window").value_or(tracks.smoothing_window);
    tracks.normalize = optionalValue<bool>(obj, "normalize").value_or(tracks.normalize);

    if (tracks.smoothing_window < 0) {
        throw ConfigError("smoothing_window не может быть отрицательным");
    }
}

} // namespace

std::optional<char> parseDelimiterName(std::string_view name) noexcept {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "tab" || lower == "\\t") return '\t';
    if (lower == "comma") return ',';
    if (lower == "semicolon") return ';';
    if (lower == "pipe") return '|';
    if (name.size() == 1) return name.front();
    return std::nullopt;
}

RunConfig runConfigFromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Конфигурация должна быть JSON-объектом");
    }

    RunConfig config;
    if (const auto* obj = section(j, "columns")) readColumns(*obj, config.columns);
    if (const auto* obj = section(j, "csv")) readCsv(*obj, config.csv);
    if (const auto* obj = section(j, "export")) readExport(*obj, config.export_options);
    if (const auto* obj = section(j, "tracks")) readTracks(*obj, config.tracks);
    return config;
}

RunConfig loadRunConfig(const std::filesystem::path& path) {
    std::string text;
    try {
        text = readTextFile(path);
    } catch (const FileIoError& e) {
        throw ConfigError(e.what());
    }

    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError("Ошибка разбора " + path.string() + ": " + e.what());
    }
    return runConfigFromJson(j);
}

} // namespace geomech::io
