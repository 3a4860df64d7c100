#pragma once

#include <string>
#include <vector>

#include "field.hpp"

namespace dice {

// Разделитель выражения на поля.
// Проходит строку слева направо и выделяет операнды и операторы "+"/"-".
// Пробелы вокруг операндов отбрасываются.
class FieldSplitter {
public:
    // Конструктор принимает исходную строку выражения
    explicit FieldSplitter(std::string sourceText);

    // Основной метод разбиения.
    // Операторы и операнды идут в порядке появления в строке.
    // Минус сразу после минуса делает следующий операнд отрицательным числом.
    // Выбрасывает DiceError, если у оператора нет левого операнда.
    std::vector<Field> split();

private:
    const std::string source;     // Исходная строка
    std::size_t index = 0;        // Текущая позиция чтения
    std::string buffer;           // Накопленный текст текущего операнда
    std::size_t bufferStart = 0;  // Позиция первого символа буфера
    bool negateNext = false;      // Следующий операнд получает знак минус
    std::size_t signPosition = 0; // Позиция поглощённого минуса

    bool isAtEnd() const;
    char advance();

    // Проверка, что в буфере нет ничего, кроме пробелов
    bool isBufferBlank() const;

    // Переносит операнд из буфера в список полей
    void flushOperand(std::vector<Field>& fields);

    // Добавляет операнд слева от оператора и сам оператор
    void pushOperator(std::vector<Field>& fields, FieldType type, std::size_t position);
};

// Удаляет пробельные символы по краям строки
std::string trim(const std::string& text);

} // namespace dice
