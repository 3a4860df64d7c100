#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

#include "field.hpp"

namespace dice {

// Максимальное количество кубиков в одной записи вида "NdF"
constexpr int kMaxDiceMultiplier = 1000;

// Максимальное количество полей в одном выражении.
// Ровно столько получается при раскрытии самого длинного "NdF".
constexpr std::size_t kMaxTerms = 2 * static_cast<std::size_t>(kMaxDiceMultiplier) - 1;

// Арифметический оператор между термами
enum class Operator {
    Add,
    Sub
};

// Кубик: "3d6" -> multiplier = 3, faces = 6; "d20" -> multiplier = 1
struct DieTerm {
    int multiplier;
    int faces;
};

// Целое число, возможно отрицательное после разбиения ("5--3" -> -3)
struct LiteralTerm {
    int value;
};

// Классифицированное поле выражения
struct Term {
    std::variant<Operator, DieTerm, LiteralTerm> value;
    std::string text;     // Исходный текст поля
    std::size_t position; // Позиция во входной строке

    bool isOperator() const { return std::holds_alternative<Operator>(value); }
    bool isDie() const { return std::holds_alternative<DieTerm>(value); }
};

// Символ оператора для вывода
char operatorSymbol(Operator op);

// Является ли текст операнда записью кубика (содержит 'd')
bool looksLikeDie(const std::string& text);

// Разбор записи кубика "[N]dF"
// Выбрасывает DiceError(MalformedDieTerm), если запись некорректна
DieTerm parseDieTerm(const std::string& text, std::size_t position);

// Разбор целого числа со знаком
// Выбрасывает DiceError(InvalidLiteral), если текст не является числом
int parseLiteral(const std::string& text, std::size_t position);

// Классификация одного поля: оператор, кубик или число
Term classify(const Field& field);

// Классификация всей последовательности полей
std::vector<Term> classifyFields(const std::vector<Field>& fields);

} // namespace dice
