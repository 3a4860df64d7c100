#include "file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <stdexcept>

#include "field_splitter.hpp"

namespace {
// Сравнение расширений файлов без учёта регистра
bool hasExtension(const std::filesystem::path& path, const std::string& ext) {
    std::string pathExt = path.extension().string();
    if (pathExt.size() != ext.size()) {
        return false;
    }
    return std::equal(pathExt.begin(), pathExt.end(), ext.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    });
}
}

std::vector<ExpressionLine> readExpressionLines(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть файл: " + path.string());
    }

    std::vector<ExpressionLine> lines;
    std::string text;
    std::size_t number = 0;
    while (std::getline(input, text)) {
        ++number;
        // Windows-переводы строк
        if (!text.empty() && text.back() == '\r') {
            text.pop_back();
        }
        if (dice::trim(text).empty()) {
            continue;
        }
        lines.push_back({number, text});
    }
    return lines;
}

std::filesystem::path findProjectRoot() {
    std::error_code ec;
    std::filesystem::path current = std::filesystem::current_path(ec);
    if (ec) {
        return std::filesystem::path(".");
    }
    const std::filesystem::path start = current;

    // Поднимаемся вверх, пока не найдем папку tests или CMakeLists.txt
    while (!current.empty()) {
        if (std::filesystem::is_directory(current / "tests", ec) ||
            std::filesystem::is_regular_file(current / "CMakeLists.txt", ec)) {
            return current;
        }

        std::filesystem::path parent = current.parent_path();
        if (parent == current) {
            break; // Корень файловой системы
        }
        current = parent;
    }
    return start;
}

std::vector<std::filesystem::path> findTxtFiles(const std::filesystem::path& directory) {
    std::vector<std::filesystem::path> txtFiles;

    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return txtFiles;
    }

    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        return txtFiles; // Нет доступа к директории
    }
    for (const auto& entry : it) {
        if (entry.is_regular_file(ec) && hasExtension(entry.path(), ".txt")) {
            txtFiles.push_back(entry.path());
        }
    }

    std::sort(txtFiles.begin(), txtFiles.end());
    return txtFiles;
}

std::string formatTimestamp(std::time_t time) {
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &time);
#else
    localtime_r(&time, &local);
#endif

    // ГГГГММДД_ЧЧММСС
    char text[16];
    if (std::strftime(text, sizeof(text), "%Y%m%d_%H%M%S", &local) == 0) {
        throw std::runtime_error("Не удалось отформатировать время");
    }
    return text;
}

std::string getCurrentTimeString() {
    return formatTimestamp(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}
