#include "parser.hpp"

#include <string>

#include "dice_error.hpp"

namespace dice {

namespace {
bool isOperator(const Term& term, Operator op) {
    const auto* termOp = std::get_if<Operator>(&term.value);
    return termOp != nullptr && *termOp == op;
}
}

std::size_t findRoot(const std::vector<Term>& terms, std::size_t begin, std::size_t end) {
    if (begin >= end) {
        std::size_t position = begin < terms.size() ? terms[begin].position : 0;
        throw DiceError(ErrorKind::AmbiguousOrMissingOperand, "Пустое выражение", position);
    }

    // Вычитание имеет приоритет: берём самый правый минус
    for (std::size_t i = end; i > begin; --i) {
        if (isOperator(terms[i - 1], Operator::Sub)) {
            return i - 1;
        }
    }
    for (std::size_t i = begin; i < end; ++i) {
        if (isOperator(terms[i], Operator::Add)) {
            return i;
        }
    }

    if (end - begin != 1) {
        throw DiceError(ErrorKind::AmbiguousOrMissingOperand,
                        "Несколько операндов без оператора между ними",
                        terms[begin + 1].position);
    }
    return begin;
}

Parser::Parser(std::vector<Term> terms, RandomSource& random)
    : terms(std::move(terms)), random(random) {}

std::unique_ptr<AstNode> Parser::parse() {
    // Глубина рекурсии растёт с числом полей
    if (terms.size() > kMaxTerms) {
        throw DiceError(ErrorKind::AmbiguousOrMissingOperand,
                        "Слишком длинное выражение (максимум " + std::to_string(kMaxTerms) +
                            " полей)",
                        terms[kMaxTerms].position);
    }
    return parseRange(0, terms.size());
}

std::unique_ptr<AstNode> Parser::parseRange(std::size_t begin, std::size_t end) {
    std::size_t root = findRoot(terms, begin, end);
    const Term& rootTerm = terms[root];

    if (const auto* op = std::get_if<Operator>(&rootTerm.value)) {
        if (root == begin) {
            throw DiceError(ErrorKind::MalformedOperatorPlacement,
                            std::string("Нет левого операнда у оператора '") +
                                operatorSymbol(*op) + "'",
                            rootTerm.position);
        }
        if (root + 1 == end) {
            throw DiceError(ErrorKind::MalformedOperatorPlacement,
                            std::string("Нет правого операнда у оператора '") +
                                operatorSymbol(*op) + "'",
                            rootTerm.position);
        }

        // Левое поддерево строится первым, поэтому кубики бросаются слева направо
        auto left = parseRange(begin, root);
        auto right = parseRange(root + 1, end);
        return std::make_unique<OperationNode>(*op, std::move(left), std::move(right));
    }

    return parseOperand(rootTerm);
}

std::unique_ptr<AstNode> Parser::parseOperand(const Term& term) {
    if (const auto* die = std::get_if<DieTerm>(&term.value)) {
        if (die->multiplier > 1) {
            return expandDice(term, *die);
        }
        return std::make_unique<ValueNode>(term.text, die->faces, random);
    }
    return std::make_unique<ValueNode>(term.text, std::get<LiteralTerm>(term.value).value);
}

// "3d6" -> "1d6 + 1d6 + 1d6", каждый кубик бросается отдельно
std::unique_ptr<AstNode> Parser::expandDice(const Term& term, const DieTerm& die) {
    const std::string single = "1d" + std::to_string(die.faces);

    std::vector<Term> expanded;
    expanded.reserve(static_cast<std::size_t>(die.multiplier) * 2 - 1);
    for (int i = 0; i < die.multiplier; ++i) {
        if (i > 0) {
            expanded.push_back({Operator::Add, "+", term.position});
        }
        expanded.push_back({DieTerm{1, die.faces}, single, term.position});
    }

    Parser nested(std::move(expanded), random);
    return nested.parse();
}

} // namespace dice
