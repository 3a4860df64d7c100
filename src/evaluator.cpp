#include "evaluator.hpp"

#include "field_splitter.hpp"
#include "parser.hpp"
#include "random_source.hpp"
#include "term.hpp"

namespace dice {

DiceEvaluator::DiceEvaluator() : random(defaultRandomSource()) {}

DiceEvaluator::DiceEvaluator(RandomSource& random) : random(random) {}

// Полный цикл обработки выражения:
// 1. Разбиение на поля (FieldSplitter)
// 2. Классификация полей на операторы, кубики и числа
// 3. Построение дерева (Parser), броски происходят здесь же
std::unique_ptr<AstNode> DiceEvaluator::build(const std::string& expression) const {
    FieldSplitter splitter(expression);
    auto fields = splitter.split();

    auto terms = classifyFields(fields);

    Parser parser(std::move(terms), random);
    return parser.parse();
}

RollResult DiceEvaluator::evaluate(const std::string& expression) const {
    auto tree = build(expression);
    return {tree->value(), tree->toString()};
}

} // namespace dice
