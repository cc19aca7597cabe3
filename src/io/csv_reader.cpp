/**
 * @file csv_reader.cpp
 * @brief Реализация импорта каротажных данных из CSV
 */

#include "csv_reader.hpp"
#include "core/header_mapper.hpp"
#include "core/label_text.hpp"
#include "core/row_validator.hpp"
#include "file_utils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <unordered_map>

namespace geomech::io {

namespace {

using core::trim;
using core::stripBom;

std::vector<std::string> splitLines(std::string_view content) {
    std::vector<std::string> lines;
    std::string current;
    for (char c : content) {
        if (c == '\n') {
            if (!current.empty() && current.back() == '\r') {
                current.pop_back();
            }
            lines.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        if (current.back() == '\r') {
            current.pop_back();
        }
        lines.push_back(current);
    }
    return lines;
}

std::vector<std::string> splitLine(std::string_view line, char delimiter) {
    std::vector<std::string> result;
    std::string current;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (c == '"') {
            // Удвоенная кавычка внутри кавычек — литерал
            if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
                current += '"';
                ++i;
            } else {
                in_quotes = !in_quotes;
            }
        } else if (c == delimiter && !in_quotes) {
            result.push_back(trim(current));
            current.clear();
        } else {
            current += c;
        }
    }

    result.push_back(trim(current));
    return result;
}

char detectDelimiter(const std::vector<std::string>& lines) {
    std::array<char, 4> candidates = {';', ',', '\t', '|'};
    std::array<int, 4> scores = {0, 0, 0, 0};
    std::array<int, 4> counts = {0, 0, 0, 0};

    // Подсчитываем количество каждого разделителя
    for (const auto& line : lines) {
        for (size_t i = 0; i < candidates.size(); ++i) {
            int count = static_cast<int>(std::count(line.begin(), line.end(), candidates[i]));
            if (count > 0) {
                ++scores[i];
                counts[i] += count;
            }
        }
    }

    // Проверяем консистентность (одинаковое количество в каждой строке)
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (scores[i] == 0) continue;

        int expected_count = 0;
        bool consistent = true;
        for (const auto& line : lines) {
            int count = static_cast<int>(std::count(line.begin(), line.end(), candidates[i]));
            if (expected_count == 0) {
                expected_count = count;
            } else if (count != expected_count && count > 0) {
                consistent = false;
                break;
            }
        }

        if (consistent && expected_count > 0) {
            return candidates[i];
        }
    }

    // Самый частый; без разделителей остаётся запятая (одна колонка)
    size_t best = 1;
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (counts[i] > counts[best]) {
            best = i;
        }
    }

    return candidates[best];
}

char detectDecimal(const std::vector<std::vector<std::string>>& data_rows, char delimiter) {
    if (delimiter == ',') {
        return '.';
    }

    int dot_count = 0;
    int comma_count = 0;
    for (size_t i = 0; i < data_rows.size() && i < 10; ++i) {
        for (const auto& f : data_rows[i]) {
            if (f.find('.') != std::string::npos) {
                ++dot_count;
            }
            if (f.find(',') != std::string::npos) {
                ++comma_count;
            }
        }
    }

    return comma_count > dot_count ? ',' : '.';
}

RawValue typeCell(const std::string& cell, char decimal_sep) {
    if (cell.empty()) {
        return std::monostate{};
    }

    std::string normalized = cell;
    if (decimal_sep == ',') {
        std::replace(normalized.begin(), normalized.end(), ',', '.');
    }

    double value = core::coerceToNumber(RawValue{normalized});
    if (std::isnan(value)) {
        return cell;
    }
    return value;
}

std::vector<std::string> uniqueHeaders(const std::vector<std::string>& fields) {
    std::vector<std::string> headers;
    headers.reserve(fields.size());
    std::unordered_map<std::string, size_t> seen;

    for (const auto& field : fields) {
        std::string name = field;
        auto it = seen.find(name);
        if (it != seen.end()) {
            size_t suffix = it->second;
            do {
                name = field + "_" + std::to_string(suffix++);
            } while (seen.count(name) > 0);
            it->second = suffix;
        }
        seen.emplace(name, 1);
        headers.push_back(name);
    }
    return headers;
}

std::string readFileBytes(const std::filesystem::path& path) {
    try {
        return readTextFile(path);
    } catch (const FileIoError& e) {
        throw CsvReadError(e.what());
    }
}

/// Итоговое имя кодировки: AUTO и пустое значение заменяются определённой
std::string decodeEncodingName(const std::string& bytes, const std::string& encoding_option) {
    std::string encoding = encoding_option;
    std::transform(encoding.begin(), encoding.end(), encoding.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (encoding.empty() || encoding == "AUTO") {
        return detectEncoding(bytes);
    }
    if (encoding == "WINDOWS-1251") {
        return "CP1251";
    }
    if (encoding == "UTF8") {
        return "UTF-8";
    }
    return encoding;
}

std::string decodeContent(const std::string& bytes, const std::string& encoding_option) {
    if (decodeEncodingName(bytes, encoding_option) == "CP1251") {
        return convertCp1251ToUtf8(bytes);
    }
    return bytes;
}

/// Непустые строки после пропуска skip_lines
std::vector<std::string> contentLines(std::string_view content, size_t skip_lines) {
    auto lines = splitLines(content);
    std::vector<std::string> result;
    result.reserve(lines.size());
    for (size_t i = skip_lines; i < lines.size(); ++i) {
        auto cleaned = trim(i == 0 ? stripBom(lines[i]) : lines[i]);
        if (!cleaned.empty()) {
            result.push_back(i == 0 ? stripBom(lines[i]) : lines[i]);
        }
    }
    return result;
}

bool allEmpty(const std::vector<std::string>& fields) {
    return std::all_of(fields.begin(), fields.end(),
                       [](const std::string& f) { return f.empty(); });
}

} // anonymous namespace

std::string convertCp1251ToUtf8(const std::string& input) {
    std::string result;
    result.reserve(input.size() * 2);

    // Таблица конвертации CP1251 -> UTF-8 для символов 0x80-0xBF
    static const char* cp1251_to_utf8[] = {
        "\xD0\x82", "\xD0\x83", "\xE2\x80\x9A", "\xD1\x93", "\xE2\x80\x9E", "\xE2\x80\xA6", "\xE2\x80\xA0", "\xE2\x80\xA1",
        "\xE2\x82\xAC", "\xE2\x80\xB0", "\xD0\x89", "\xE2\x80\xB9", "\xD0\x8A", "\xD0\x8C", "\xD0\x8B", "\xD0\x8F",
        "\xD1\x92", "\xE2\x80\x98", "\xE2\x80\x99", "\xE2\x80\x9C", "\xE2\x80\x9D", "\xE2\x80\xA2", "\xE2\x80\x93", "\xE2\x80\x94",
        nullptr, "\xE2\x84\xA2", "\xD1\x99", "\xE2\x80\xBA", "\xD1\x9A", "\xD1\x9C", "\xD1\x9B", "\xD1\x9F",
        "\xC2\xA0", "\xD0\x8E", "\xD1\x9E", "\xD0\x88", "\xC2\xA4", "\xD2\x90", "\xC2\xA6", "\xC2\xA7",
        "\xD0\x81", "\xC2\xA9", "\xD0\x84", "\xC2\xAB", "\xC2\xAC", "\xC2\xAD", "\xC2\xAE", "\xD0\x87",
        "\xC2\xB0", "\xC2\xB1", "\xD0\x86", "\xD1\x96", "\xD2\x91", "\xC2\xB5", "\xC2\xB6", "\xC2\xB7",
        "\xD1\x91", "\xE2\x84\x96", "\xD1\x94", "\xC2\xBB", "\xD1\x98", "\xD0\x85", "\xD1\x95", "\xD1\x97"
    };

    for (char ch : input) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            result += ch;
        } else if (c >= 0xC0) {
            // А-п → D0 90..D0 BF, р-я → D1 80..D1 8F
            unsigned int cp = 0x410 + (c - 0xC0);
            result += static_cast<char>(0xC0 | (cp >> 6));
            result += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            const char* utf8 = cp1251_to_utf8[c - 0x80];
            result += utf8 ? utf8 : "?";
        }
    }

    return result;
}

std::string detectEncoding(std::string_view content) {
    // Проверка BOM
    if (content.size() >= 3 &&
        static_cast<unsigned char>(content[0]) == 0xEF &&
        static_cast<unsigned char>(content[1]) == 0xBB &&
        static_cast<unsigned char>(content[2]) == 0xBF) {
        return "UTF-8";
    }

    const size_t limit = std::min<size_t>(content.size(), 4096);
    int utf8_sequences = 0;
    int cp1251_chars = 0;
    int invalid_utf8 = 0;

    for (size_t i = 0; i < limit; ++i) {
        auto c = static_cast<unsigned char>(content[i]);
        if (c < 0x80) continue;

        auto next = [&](size_t k) {
            return static_cast<unsigned char>(content[i + k]);
        };

        if ((c & 0xE0) == 0xC0 && i + 1 < limit && (next(1) & 0xC0) == 0x80) {
            ++utf8_sequences;
            ++i;
            continue;
        }
        if ((c & 0xF0) == 0xE0 && i + 2 < limit &&
            (next(1) & 0xC0) == 0x80 && (next(2) & 0xC0) == 0x80) {
            ++utf8_sequences;
            i += 2;
            continue;
        }

        if (c >= 0xC0) {
            ++cp1251_chars;
        } else {
            ++invalid_utf8;
        }
    }

    if (utf8_sequences > 0 && invalid_utf8 == 0 && cp1251_chars == 0) {
        return "UTF-8";
    }
    if (cp1251_chars > utf8_sequences) {
        return "CP1251";
    }
    return "UTF-8";
}

RawTable parseCsvTable(std::string_view content, const CsvReadOptions& options) {
    const auto lines = contentLines(content, options.skip_lines);
    if (lines.empty()) {
        throw CsvReadError("Файл пуст или содержит только пустые строки");
    }

    std::vector<std::string> sample_lines(
        lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(std::min<size_t>(lines.size(), 50)));
    const char delimiter = options.delimiter.value_or(detectDelimiter(sample_lines));

    std::vector<std::vector<std::string>> data_fields;
    data_fields.reserve(lines.size() - 1);
    for (size_t i = 1; i < lines.size(); ++i) {
        data_fields.push_back(splitLine(lines[i], delimiter));
    }
    const char decimal = options.decimal_separator.value_or(detectDecimal(data_fields, delimiter));

    RawTable table;
    table.headers = uniqueHeaders(splitLine(lines.front(), delimiter));
    table.rows.reserve(data_fields.size());

    for (const auto& fields : data_fields) {
        if (allEmpty(fields)) continue;

        RawRow row;
        const size_t count = std::min(fields.size(), table.headers.size());
        for (size_t col = 0; col < count; ++col) {
            row.emplace(table.headers[col], typeCell(fields[col], decimal));
        }
        table.rows.push_back(std::move(row));
    }

    return table;
}

RawTable readCsvTable(
    const std::filesystem::path& path,
    const CsvReadOptions& options
) {
    const auto content = decodeContent(readFileBytes(path), options.encoding);
    auto table = parseCsvTable(content, options);
    table.source_name = path.filename().string();
    return table;
}

CsvDetectionResult detectCsvFormat(
    const std::filesystem::path& path,
    const CsvReadOptions& options
) {
    CsvDetectionResult result;

    std::string bytes;
    try {
        bytes = readFileBytes(path);
    } catch (const CsvReadError& e) {
        result.diagnostics.push_back(e.what());
        return result;
    }

    result.detected_encoding = decodeEncodingName(bytes, options.encoding);
    const auto content = decodeContent(bytes, result.detected_encoding);
    const auto lines = contentLines(content, options.skip_lines);
    if (lines.empty()) {
        result.diagnostics.push_back("Файл пуст или содержит только пустые строки");
        return result;
    }

    std::vector<std::string> sample_lines(
        lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(std::min<size_t>(lines.size(), 50)));
    result.detected_delimiter = options.delimiter.value_or(detectDelimiter(sample_lines));

    std::vector<std::vector<std::string>> data_fields;
    for (size_t i = 1; i < sample_lines.size(); ++i) {
        data_fields.push_back(splitLine(sample_lines[i], result.detected_delimiter));
    }
    result.detected_decimal =
        options.decimal_separator.value_or(detectDecimal(data_fields, result.detected_delimiter));

    result.header_names = uniqueHeaders(splitLine(lines.front(), result.detected_delimiter));
    result.column_count = result.header_names.size();
    result.suggested_mapping = core::detectColumns(result.header_names);

    for (auto field : result.suggested_mapping.missingFields()) {
        result.diagnostics.push_back(
            "Колонка для поля " + std::string(canonicalFieldName(field)) + " не найдена");
    }

    return result;
}

} // namespace geomech::io
