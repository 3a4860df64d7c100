#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace dice {

// Виды ошибок разбора выражения броска.
// Любая из них прерывает обработку всей строки.
enum class ErrorKind {
    MalformedOperatorPlacement, // Оператор на границе или без операнда рядом
    AmbiguousOrMissingOperand,  // Несколько полей без оператора или ни одного поля
    MalformedDieTerm,           // Некорректная запись кубика (например, "d" или "2d")
    InvalidLiteral              // Операнд не является ни кубиком, ни целым числом
};

// Имя вида ошибки (для CSV и диагностики)
const char* errorKindName(ErrorKind kind);

// Исключение, выбрасываемое при разборе некорректного выражения
class DiceError : public std::runtime_error {
public:
    DiceError(ErrorKind kind, const std::string& message, std::size_t position);

    ErrorKind kind() const noexcept { return errorKind; }

    // Позиция символа во входной строке, к которому относится ошибка
    std::size_t position() const noexcept { return errorPosition; }

private:
    ErrorKind errorKind;
    std::size_t errorPosition;
};

} // namespace dice
