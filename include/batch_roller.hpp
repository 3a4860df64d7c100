#pragma once

#include <cstddef>
#include <filesystem>

#include "csv_writer.hpp"
#include "evaluator.hpp"
#include "file_utils.hpp"

namespace dice {

// Итоги обработки файла
struct BatchSummary {
    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
};

// Бросок по одной строке файла.
// Ошибка разбора не выбрасывается, а попадает в запись со статусом error.
RollRecord rollLine(const ExpressionLine& line, const DiceEvaluator& evaluator);

// Бросок по каждой непустой строке входного файла с записью результатов в CSV.
// Строки обрабатываются по порядку, результат каждой сразу дописывается в файл.
BatchSummary rollFile(const std::filesystem::path& inputPath, const CsvWriter& writer,
                      const DiceEvaluator& evaluator);

} // namespace dice
