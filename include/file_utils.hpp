#pragma once

#include <cstddef>
#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

// Строка входного файла вместе с её номером (нумерация с 1)
struct ExpressionLine {
    std::size_t number;
    std::string text;
};

// Чтение всех непустых строк файла с выражениями.
// Строки из одних пробелов пропускаются, но нумерация их учитывает.
std::vector<ExpressionLine> readExpressionLines(const std::filesystem::path& path);

// Поиск корневой директории проекта (ищет папку tests или файл CMakeLists.txt)
std::filesystem::path findProjectRoot();

// Поиск всех .txt файлов в директории (без учёта регистра расширения)
std::vector<std::filesystem::path> findTxtFiles(const std::filesystem::path& directory);

// Местное время в формате для имени файла: 20261019_203015
std::string formatTimestamp(std::time_t time);

// Текущее время в формате для имени файла
std::string getCurrentTimeString();
