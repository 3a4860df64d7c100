#pragma once

#include <cstddef>
#include <string>

namespace dice {

// Тип поля, выделенного из строки выражения
enum class FieldType {
    Plus,   // Оператор "+"
    Minus,  // Оператор "-"
    Operand // Операнд: кубик или число
};

// Поле выражения: оператор или операнд (уже без окружающих пробелов)
struct Field {
    FieldType type;
    std::string text;     // "+", "-" или текст операнда
    std::size_t position; // Позиция начала поля во входной строке
};

} // namespace dice
