/**
 * @file file_utils.cpp
 * @brief Чтение и атомарная запись текстовых файлов
 */

#include "file_utils.hpp"
#include <fstream>
#include <iterator>

namespace geomech::io {

std::string readTextFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileIoError("Не удалось открыть файл: " + path.string(), path);
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void atomicWrite(const std::filesystem::path& path, const std::string& content) {
    std::error_code ec;
    auto dir = path.parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw FileIoError("Не удалось создать каталог: " + dir.string(), dir);
        }
    }

    auto tmp = path;
    tmp += ".tmp";

    {
        std::ofstream ofs(tmp, std::ios::binary);
        if (!ofs) {
            throw FileIoError("Не удалось открыть временный файл для записи: " + tmp.string(), tmp);
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!ofs) {
            throw FileIoError("Ошибка записи во временный файл: " + tmp.string(), tmp);
        }
    }

    std::filesystem::remove(path, ec);
    ec.clear();
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw FileIoError("Не удалось атомарно сохранить файл: " + path.string(), path);
    }
}

} // namespace geomech::io
