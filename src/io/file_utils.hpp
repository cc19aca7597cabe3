/**
 * @file file_utils.hpp
 * @brief Чтение и атомарная запись текстовых файлов
 */

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace geomech::io {

/**
 * @brief Ошибка файловой операции
 */
class FileIoError : public std::runtime_error {
public:
    FileIoError(const std::string& message, std::filesystem::path path)
        : std::runtime_error(message)
        , path_(std::move(path)) {}

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Прочитать файл целиком
 * @throws FileIoError Файл не открывается
 */
[[nodiscard]] std::string readTextFile(const std::filesystem::path& path);

/**
 * @brief Атомарная запись (временный файл рядом + rename)
 *
 * Каталог назначения создаётся при необходимости.
 * @throws FileIoError
 */
void atomicWrite(const std::filesystem::path& path, const std::string& content);

} // namespace geomech::io
