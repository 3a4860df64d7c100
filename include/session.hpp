#pragma once

#include <cstddef>
#include <iostream>

#include "evaluator.hpp"

namespace dice {

// Настройки интерактивного режима
struct SessionOptions {
    bool showTree = false; // Печатать отладочную структуру дерева
    bool useColor = true;  // Раскрашивать приглашение
};

// Интерактивный цикл бросков.
// Читает строки из in, пока не встретится пустая строка или конец ввода.
// Для каждой строки печатает "<расшифровка> = <итог>" и пустую строку.
// Ошибки печатаются в err, после чего цикл продолжается.
// Возвращает количество успешных бросков.
std::size_t runSession(std::istream& in, std::ostream& out, std::ostream& err,
                       const DiceEvaluator& evaluator, const SessionOptions& options = {});

} // namespace dice
