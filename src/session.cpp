#include "session.hpp"

#include <exception>
#include <string>

#include "console.hpp"
#include "field_splitter.hpp"

namespace dice {

std::size_t runSession(std::istream& in, std::ostream& out, std::ostream& err,
                       const DiceEvaluator& evaluator, const SessionOptions& options) {
    std::size_t rolls = 0;
    std::string line;
    while (true) {
        if (options.useColor) {
            out << Color::BOLD << "Что бросаем?" << Color::RESET << "\n";
        } else {
            out << "Что бросаем?\n";
        }

        if (!std::getline(in, line) || trim(line).empty()) {
            break;
        }

        try {
            auto tree = evaluator.build(line);
            if (options.showTree) {
                out << describeTree(*tree) << "\n";
            }
            out << tree->toString() << " = " << tree->value() << "\n\n";
            ++rolls;
        }
        catch (const std::exception& ex) {
            printError(err, ex.what());
        }
    }
    return rolls;
}

} // namespace dice
