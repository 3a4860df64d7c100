#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include "batch_roller.hpp"
#include "cli_options.hpp"
#include "console.hpp"
#include "csv_writer.hpp"
#include "evaluator.hpp"
#include "random_source.hpp"
#include "session.hpp"
#include "user_input.hpp"

namespace {

    // Обработка одного файла: выбор файлов, броски, статистика
    void processFile(const dice::DiceEvaluator& evaluator) {
        std::filesystem::path inputPath = selectInputFile();
        std::filesystem::path outputPath = selectOutputFile(inputPath);

        std::cout << "\n";
        std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
        std::cout << "  Входной файл:  " << Color::YELLOW << inputPath << Color::RESET << "\n";
        std::cout << "  Выходной файл: " << Color::YELLOW << outputPath << Color::RESET << "\n\n";

        std::cout << Color::BOLD << "Броски по выражениям..." << Color::RESET << std::flush;
        auto start = std::chrono::steady_clock::now();

        dice::CsvWriter writer(outputPath);
        dice::BatchSummary summary = dice::rollFile(inputPath, writer, evaluator);

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        std::cout << " " << Color::GREEN << "✓" << Color::RESET << "\n\n";

        std::cout << Color::BOLD << "Статистика:\n" << Color::RESET;
        std::cout << "  Всего выражений:  " << Color::CYAN << summary.total << Color::RESET << "\n";
        std::cout << "  Успешно:          " << Color::GREEN << summary.succeeded << Color::RESET << "\n";
        if (summary.failed > 0) {
            std::cout << "  Ошибок:           " << Color::RED << summary.failed << Color::RESET << "\n";
        }
        std::cout << "  Время обработки:  " << Color::MAGENTA << duration.count()
            << " мс" << Color::RESET << "\n\n";

        std::cout << Color::GREEN << "Результаты сохранены в: " << outputPath << Color::RESET << "\n\n";
    }

    // Пакетный режим: файл за файлом, пока пользователь не откажется
    void runBatchMode(const dice::DiceEvaluator& evaluator) {
        bool continueProcessing = true;
        while (continueProcessing) {
            try {
                processFile(evaluator);
            }
            catch (const std::exception& ex) {
                std::cerr << "\n";
                printError(std::cerr, ex.what());
            }

            continueProcessing = askContinue();
            if (continueProcessing) {
                std::cout << "\n";
            }
        }
    }

} // namespace

// Точка входа в программу
int main(int argc, char** argv) {
    dice::CliOptions options;
    try {
        options = dice::parseCliOptions(argc, argv);
    }
    catch (const std::exception& ex) {
        printError(std::cerr, ex.what());
        std::cerr << dice::usage(argv[0]);
        return 1;
    }

    if (options.help) {
        std::cout << dice::usage(argv[0]);
        return 0;
    }

    if (options.seed) {
        dice::defaultRandomSource().reseed(*options.seed);
    }
    dice::DiceEvaluator evaluator;

    printHeader();

    if (options.mode == dice::RunMode::Batch) {
        runBatchMode(evaluator);
    } else {
        dice::SessionOptions sessionOptions;
        sessionOptions.showTree = options.showTree;
        dice::runSession(std::cin, std::cout, std::cerr, evaluator, sessionOptions);
    }

    std::cout << Color::CYAN << "Работа завершена. До свидания!" << Color::RESET << "\n\n";
    return 0;
}
