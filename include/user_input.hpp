#pragma once

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <string>

// Безопасный парсинг положительного числа из строки
std::size_t parseNumber(const std::string& value);

// Вывод приглашения и чтение строки без пробелов по краям
std::string promptLine(const std::string& prompt, std::istream& in = std::cin,
                       std::ostream& out = std::cout);

// Интерактивный выбор входного файла с выражениями
std::filesystem::path selectInputFile(std::istream& in = std::cin, std::ostream& out = std::cout);

// Интерактивный выбор выходного CSV файла
std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath,
                                       std::istream& in = std::cin, std::ostream& out = std::cout);

// Запрос продолжения работы с другим файлом
bool askContinue(std::istream& in = std::cin, std::ostream& out = std::cout);
