#include "user_input.hpp"
#include "console.hpp"
#include "field_splitter.hpp"
#include "file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace {
bool isAllDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}
}

std::size_t parseNumber(const std::string& value) {
    std::size_t result = 0;
    try {
        if (!isAllDigits(value)) {
            throw std::invalid_argument(value);
        }
        result = std::stoul(value);
    }
    catch (const std::exception&) {
        throw std::runtime_error("Некорректное числовое значение: '" + value + "'");
    }
    if (result == 0) {
        throw std::runtime_error("Число должно быть положительным");
    }
    return result;
}

std::string promptLine(const std::string& prompt, std::istream& in, std::ostream& out) {
    out << Color::BOLD << prompt << Color::RESET;
    std::string input;
    if (!std::getline(in, input)) {
        throw std::runtime_error("Ввод прерван");
    }
    return dice::trim(input);
}

std::filesystem::path selectInputFile(std::istream& in, std::ostream& out) {
    std::filesystem::path testsDir = findProjectRoot() / "tests";
    std::vector<std::filesystem::path> txtFiles = findTxtFiles(testsDir);

    if (txtFiles.empty()) {
        out << Color::YELLOW << "Внимание: " << Color::RESET
            << "не найдено .txt файлов в папке tests.\n";
        out << "Директория: " << Color::CYAN << testsDir << Color::RESET << "\n\n";
    }
    else {
        out << Color::BOLD << "Найденные файлы с выражениями:\n" << Color::RESET;
        for (std::size_t i = 0; i < txtFiles.size(); ++i) {
            out << "  " << Color::CYAN << (i + 1) << Color::RESET << ". "
                << Color::YELLOW << txtFiles[i].filename().string() << Color::RESET << "\n";
        }
        out << "\n";
    }

    std::string input = promptLine("Введите номер файла или путь до входного файла: ", in, out);
    if (input.empty()) {
        throw std::runtime_error("Пустой ввод");
    }

    if (isAllDigits(input) && !txtFiles.empty()) {
        std::size_t index = parseNumber(input);
        if (index > txtFiles.size()) {
            throw std::runtime_error("Номер файла вне допустимого диапазона");
        }
        return txtFiles[index - 1];
    }

    // Пользователь ввел путь
    std::filesystem::path inputPath = input;
    if (!std::filesystem::exists(inputPath)) {
        throw std::runtime_error("Файл не найден: " + inputPath.string());
    }
    return inputPath;
}

std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath,
                                       std::istream& in, std::ostream& out) {
    out << Color::BOLD << "Выберите способ задания выходного файла:\n" << Color::RESET;
    out << "  " << Color::CYAN << "1" << Color::RESET
        << ". Название по умолчанию (имя входного файла + _results_ + время)\n";
    out << "  " << Color::CYAN << "2" << Color::RESET << ". Кастомное название\n\n";

    std::string choice = promptLine("Ваш выбор (1 или 2): ", in, out);

    if (choice == "1") {
        std::string name = inputPath.stem().string() + "_results_" + getCurrentTimeString() + ".csv";
        return inputPath.parent_path() / name;
    }
    if (choice != "2") {
        throw std::runtime_error("Некорректный выбор. Используйте 1 или 2");
    }

    std::string customName = promptLine(
        "Введите название выходного файла (расширение .csv добавится автоматически): ", in, out);
    if (customName.empty()) {
        throw std::runtime_error("Пустое название файла");
    }

    // Относительный путь отсчитывается от директории входного файла
    std::filesystem::path outputPath(customName);
    if (!outputPath.is_absolute()) {
        outputPath = inputPath.parent_path() / outputPath;
    }
    if (outputPath.extension() != ".csv") {
        outputPath.replace_extension(".csv");
    }
    return outputPath;
}

bool askContinue(std::istream& in, std::ostream& out) {
    std::string input;
    try {
        input = promptLine("Обработать еще один файл? (y/n): ", in, out);
    }
    catch (const std::runtime_error&) {
        return false; // Конец ввода
    }
    std::transform(input.begin(), input.end(), input.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    return input == "y" || input == "yes" || input == "д" || input == "да";
}
