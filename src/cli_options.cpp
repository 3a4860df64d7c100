#include "cli_options.hpp"

#include <limits>
#include <stdexcept>

#include "user_input.hpp"

namespace dice {

CliOptions parseCliOptions(int argc, const char* const* argv) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "batch") {
            options.mode = RunMode::Batch;
        } else if (arg == "--seed") {
            if (i + 1 >= argc) {
                throw std::runtime_error("После --seed ожидалось число");
            }
            std::size_t seed = parseNumber(argv[++i]);
            if (seed > std::numeric_limits<std::uint32_t>::max()) {
                throw std::runtime_error("Зерно генератора слишком большое");
            }
            options.seed = static_cast<std::uint32_t>(seed);
        } else if (arg == "--tree") {
            options.showTree = true;
        } else if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else {
            throw std::runtime_error("Неизвестный аргумент: " + arg);
        }
    }
    return options;
}

std::string usage(const std::string& programName) {
    return "Использование: " + programName + " [batch] [--seed N] [--tree]\n"
           "  batch      бросок по каждой строке файла с записью результатов в CSV\n"
           "  --seed N   зерно генератора (положительное число) для повторяемых бросков\n"
           "  --tree     печатать структуру дерева броска\n";
}

} // namespace dice
