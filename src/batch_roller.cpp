#include "batch_roller.hpp"

#include "dice_error.hpp"

namespace dice {

RollRecord rollLine(const ExpressionLine& line, const DiceEvaluator& evaluator) {
    RollRecord record;
    record.lineNumber = line.number;
    record.expression = line.text;
    try {
        RollResult result = evaluator.evaluate(line.text);
        record.status = "success";
        record.rendered = std::move(result.rendered);
        record.total = result.total;
    }
    catch (const DiceError& ex) {
        record.status = "error";
        record.total.reset();
        record.message = std::string(errorKindName(ex.kind())) + ": " + ex.what();
    }
    catch (const std::exception& ex) {
        record.status = "error";
        record.rendered.clear();
        record.total.reset();
        record.message = ex.what();
    }
    return record;
}

BatchSummary rollFile(const std::filesystem::path& inputPath, const CsvWriter& writer,
                      const DiceEvaluator& evaluator) {
    BatchSummary summary;
    for (const auto& line : readExpressionLines(inputPath)) {
        RollRecord record = rollLine(line, evaluator);
        writer.writeRecord(record);

        ++summary.total;
        if (record.status == "success") {
            ++summary.succeeded;
        } else {
            ++summary.failed;
        }
    }
    return summary;
}

} // namespace dice
