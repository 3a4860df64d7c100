#include "field_splitter.hpp"

#include <cctype>

#include "dice_error.hpp"

namespace dice {

namespace {
bool isSpace(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}
}

std::string trim(const std::string& text) {
    std::size_t first = 0;
    while (first < text.size() && isSpace(text[first])) {
        ++first;
    }
    std::size_t last = text.size();
    while (last > first && isSpace(text[last - 1])) {
        --last;
    }
    return text.substr(first, last - first);
}

FieldSplitter::FieldSplitter(std::string sourceText) : source(std::move(sourceText)) {}

// Основной цикл: операторы закрывают текущий операнд, остальные символы копятся в буфере
std::vector<Field> FieldSplitter::split() {
    std::vector<Field> fields;
    while (!isAtEnd()) {
        std::size_t position = index;
        char ch = advance();
        switch (ch) {
        case '+':
            pushOperator(fields, FieldType::Plus, position);
            break;
        case '-':
            // Минус сразу после минуса: знак следующего числа, а не новый оператор
            if (isBufferBlank() && !fields.empty() && fields.back().type == FieldType::Minus) {
                if (negateNext) {
                    throw DiceError(ErrorKind::MalformedOperatorPlacement,
                                    "Слишком много минусов подряд", position);
                }
                negateNext = true;
                signPosition = position;
                buffer.clear();
                break;
            }
            pushOperator(fields, FieldType::Minus, position);
            break;
        default:
            if (buffer.empty()) {
                bufferStart = position;
            }
            buffer += ch;
            break;
        }
    }

    if (!isBufferBlank()) {
        flushOperand(fields);
    }
    return fields;
}

bool FieldSplitter::isAtEnd() const {
    return index >= source.size();
}

char FieldSplitter::advance() {
    return source[index++];
}

bool FieldSplitter::isBufferBlank() const {
    for (char ch : buffer) {
        if (!isSpace(ch)) {
            return false;
        }
    }
    return true;
}

void FieldSplitter::flushOperand(std::vector<Field>& fields) {
    std::size_t offset = 0;
    while (offset < buffer.size() && isSpace(buffer[offset])) {
        ++offset;
    }

    std::string text = trim(buffer);
    std::size_t position = bufferStart + offset;
    if (negateNext) {
        text.insert(text.begin(), '-');
        position = signPosition;
        negateNext = false;
    }

    fields.push_back({FieldType::Operand, std::move(text), position});
    buffer.clear();
}

void FieldSplitter::pushOperator(std::vector<Field>& fields, FieldType type, std::size_t position) {
    if (isBufferBlank()) {
        if (fields.empty()) {
            throw DiceError(ErrorKind::MalformedOperatorPlacement,
                            "Выражение не может начинаться с оператора", position);
        }
        throw DiceError(ErrorKind::MalformedOperatorPlacement,
                        "Перед оператором отсутствует операнд", position);
    }

    flushOperand(fields);
    fields.push_back({type, type == FieldType::Plus ? "+" : "-", position});
}

} // namespace dice
