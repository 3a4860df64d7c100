#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "ast.hpp"
#include "term.hpp"

namespace dice {

class RandomSource;

// Построитель дерева броска.
// Рекурсивно выбирает корневой оператор на отрезке термов и строит поддеревья
// слева и справа от него. Кубики бросаются сразу при создании листьев.
class Parser {
public:
    // Термы не копируются при разборе: рекурсия работает с отрезками [begin, end)
    Parser(std::vector<Term> terms, RandomSource& random);

    // Построение всего дерева.
    // Выбрасывает DiceError при некорректной расстановке операторов и операндов,
    // а также если полей больше kMaxTerms.
    std::unique_ptr<AstNode> parse();

private:
    const std::vector<Term> terms;
    RandomSource& random;

    // Построение поддерева по отрезку термов
    std::unique_ptr<AstNode> parseRange(std::size_t begin, std::size_t end);

    // Лист: один кубик или число
    std::unique_ptr<AstNode> parseOperand(const Term& term);

    // Замена "NdF" на сумму N отдельных кубиков "1dF"
    std::unique_ptr<AstNode> expandDice(const Term& term, const DieTerm& die);
};

// Поиск корневого поля на отрезке [begin, end):
// последний "-", иначе первый "+", иначе единственный операнд.
// Выбрасывает DiceError(AmbiguousOrMissingOperand), если отрезок пуст
// или содержит несколько операндов без оператора.
std::size_t findRoot(const std::vector<Term>& terms, std::size_t begin, std::size_t end);

} // namespace dice
