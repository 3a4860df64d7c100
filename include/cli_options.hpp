#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace dice {

enum class RunMode {
    Interactive, // Бросок по строкам, введённым с клавиатуры
    Batch        // Бросок по строкам файла с записью в CSV
};

// Параметры командной строки
struct CliOptions {
    RunMode mode = RunMode::Interactive;
    std::optional<std::uint32_t> seed; // Зерно генератора для воспроизводимых бросков
    bool showTree = false;             // --tree: печать структуры дерева
    bool help = false;                 // --help
};

// Разбор аргументов: [batch] [--seed N] [--tree] [--help]
// Выбрасывает std::runtime_error при неизвестном или некорректном аргументе
CliOptions parseCliOptions(int argc, const char* const* argv);

// Текст справки по аргументам
std::string usage(const std::string& programName);

} // namespace dice
