#pragma once

#include <memory>
#include <string>

#include "ast.hpp"

namespace dice {

class RandomSource;

// Результат одного броска
struct RollResult {
    long long total;      // Итоговая сумма
    std::string rendered; // Расшифровка: "3(d6) + !*6*!(d6) + 2"
};

// Класс-фасад для бросков по выражению.
// Объединяет разбиение на поля, классификацию термов и построение дерева.
class DiceEvaluator {
public:
    // Броски берутся из общего для процесса источника
    DiceEvaluator();

    // Броски берутся из переданного источника (должен жить дольше оценщика)
    explicit DiceEvaluator(RandomSource& random);

    // Строит дерево броска для выражения.
    // Пример: "2d6+3" -> дерево из трёх листьев: два d6 и число 3
    // Выбрасывает DiceError для некорректного выражения.
    std::unique_ptr<AstNode> build(const std::string& expression) const;

    // Бросок по выражению: итог и расшифровка
    RollResult evaluate(const std::string& expression) const;

private:
    RandomSource& random;
};

} // namespace dice
