/**
 * @file label_text.cpp
 * @brief Нормализация текста заголовков колонок (UTF-8, ASCII + кириллица)
 */

#include "label_text.hpp"
#include <cctype>
#include <sstream>

namespace geomech::core {

namespace {

void appendUtf8(char32_t cp, std::string& out) {
    if (cp <= 0x7F) {
        out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

struct DecodedRune {
    char32_t codepoint = 0;
    size_t length = 1;
};

DecodedRune decodeUtf8(std::string_view input, size_t offset) {
    DecodedRune rune{};
    if (offset >= input.size()) {
        return rune;
    }

    unsigned char c0 = static_cast<unsigned char>(input[offset]);
    if (c0 < 0x80) {
        rune.codepoint = c0;
        return rune;
    }

    // 2-байтовая последовательность
    if ((c0 & 0xE0) == 0xC0 && offset + 1 < input.size()) {
        unsigned char c1 = static_cast<unsigned char>(input[offset + 1]);
        if ((c1 & 0xC0) == 0x80) {
            rune.codepoint = static_cast<char32_t>(((c0 & 0x1F) << 6) | (c1 & 0x3F));
            rune.length = 2;
            return rune;
        }
    }

    // 3-байтовая последовательность
    if ((c0 & 0xF0) == 0xE0 && offset + 2 < input.size()) {
        unsigned char c1 = static_cast<unsigned char>(input[offset + 1]);
        unsigned char c2 = static_cast<unsigned char>(input[offset + 2]);
        if ((c1 & 0xC0) == 0x80 && (c2 & 0xC0) == 0x80) {
            rune.codepoint = static_cast<char32_t>(((c0 & 0x0F) << 12) |
                                                   ((c1 & 0x3F) << 6) |
                                                   (c2 & 0x3F));
            rune.length = 3;
            return rune;
        }
    }

    // Некорректная или 4-байтовая последовательность — байт как есть
    rune.codepoint = c0;
    rune.length = 1;
    return rune;
}

char32_t toLowerCp(char32_t cp) {
    if (cp >= U'A' && cp <= U'Z') {
        return cp + 32;
    }
    if (cp >= 0x410 && cp <= 0x42F) { // А-Я
        return cp + 0x20;
    }
    if (cp == 0x401) { // Ё
        return 0x451;
    }
    return cp;
}

/// Буква или цифра заголовка: латиница, кириллица (в нижнем регистре), 0-9
bool isLabelChar(char32_t cp) noexcept {
    if ((cp >= U'a' && cp <= U'z') || (cp >= U'0' && cp <= U'9')) {
        return true;
    }
    return (cp >= 0x430 && cp <= 0x44F) || cp == 0x451;
}

} // namespace

std::string utf8ToLower(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    for (size_t i = 0; i < input.size();) {
        auto rune = decodeUtf8(input, i);
        if (rune.length == 1 && rune.codepoint >= 0x80) {
            // Одиночный байт вне ASCII переносим без перекодирования
            out.push_back(input[i]);
        } else {
            appendUtf8(toLowerCp(rune.codepoint), out);
        }
        i += rune.length;
    }

    return out;
}

std::string trim(std::string_view str) {
    size_t start = 0;
    while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }
    size_t end = str.size();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }
    return std::string(str.substr(start, end - start));
}

std::string stripBom(std::string_view str) {
    if (str.size() >= 3 &&
        static_cast<unsigned char>(str[0]) == 0xEF &&
        static_cast<unsigned char>(str[1]) == 0xBB &&
        static_cast<unsigned char>(str[2]) == 0xBF) {
        return std::string(str.substr(3));
    }
    return std::string(str);
}

std::string normalizeLabel(std::string_view label) {
    const auto lowered = utf8ToLower(trim(stripBom(label)));

    std::string normalized;
    normalized.reserve(lowered.size());
    bool pending_space = false;

    // Разделителем считается любой символ, кроме букв и цифр: U+00A0, µ, ³ и т.п.
    for (size_t i = 0; i < lowered.size();) {
        const auto rune = decodeUtf8(lowered, i);
        const bool single_high_byte = rune.length == 1 && rune.codepoint >= 0x80;
        if (!single_high_byte && isLabelChar(rune.codepoint)) {
            if (pending_space && !normalized.empty()) {
                normalized += ' ';
            }
            pending_space = false;
            normalized.append(lowered, i, rune.length);
        } else {
            pending_space = true;
        }
        i += rune.length;
    }

    return normalized;
}

std::vector<std::string> labelTokens(std::string_view label) {
    std::vector<std::string> tokens;
    std::istringstream ss{normalizeLabel(label)};
    std::string token;
    while (ss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

bool containsPhrase(
    const std::vector<std::string>& tokens,
    const std::vector<std::string_view>& phrase
) noexcept {
    if (phrase.empty() || phrase.size() > tokens.size()) {
        return false;
    }

    for (size_t start = 0; start + phrase.size() <= tokens.size(); ++start) {
        bool matched = true;
        for (size_t k = 0; k < phrase.size(); ++k) {
            if (tokens[start + k] != phrase[k]) {
                matched = false;
                break;
            }
        }
        if (matched) {
            return true;
        }
    }
    return false;
}

} // namespace geomech::core
