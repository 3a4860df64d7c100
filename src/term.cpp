#include "term.hpp"

#include <cctype>
#include <charconv>
#include <system_error>

#include "dice_error.hpp"

namespace dice {

namespace {
bool isAllDigits(const std::string& text) {
    for (char ch : text) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    return true;
}

// Разбор неотрицательного числа из цифр; false при переполнении int
bool parseDigits(const std::string& digits, int& result) {
    const char* begin = digits.data();
    const char* end = begin + digits.size();
    auto [ptr, ec] = std::from_chars(begin, end, result);
    return ec == std::errc() && ptr == end;
}
}

char operatorSymbol(Operator op) {
    return op == Operator::Add ? '+' : '-';
}

bool looksLikeDie(const std::string& text) {
    return text.find('d') != std::string::npos;
}

// Формат: необязательный множитель из цифр, 'd', число граней из цифр
DieTerm parseDieTerm(const std::string& text, std::size_t position) {
    std::size_t dPos = text.find('d');
    if (dPos == std::string::npos) {
        throw DiceError(ErrorKind::MalformedDieTerm,
                        "Ожидалась запись кубика: '" + text + "'", position);
    }

    std::string multiplierText = text.substr(0, dPos);
    std::string facesText = text.substr(dPos + 1);

    if (facesText.empty() || !std::isdigit(static_cast<unsigned char>(facesText.front()))) {
        throw DiceError(ErrorKind::MalformedDieTerm,
                        "Не указано число граней кубика: '" + text + "'", position);
    }
    if (!isAllDigits(facesText) || !isAllDigits(multiplierText)) {
        throw DiceError(ErrorKind::MalformedDieTerm,
                        "Некорректная запись кубика: '" + text + "'", position);
    }

    DieTerm die{1, 0};
    if (!parseDigits(facesText, die.faces)) {
        throw DiceError(ErrorKind::MalformedDieTerm,
                        "Слишком большое число граней: '" + text + "'", position);
    }
    if (die.faces < 1) {
        throw DiceError(ErrorKind::MalformedDieTerm,
                        "У кубика должна быть хотя бы одна грань: '" + text + "'", position);
    }

    // Без цифр перед 'd' бросается один кубик
    if (!multiplierText.empty()) {
        if (!parseDigits(multiplierText, die.multiplier) || die.multiplier > kMaxDiceMultiplier) {
            throw DiceError(ErrorKind::MalformedDieTerm,
                            "Слишком много кубиков (максимум " +
                                std::to_string(kMaxDiceMultiplier) + "): '" + text + "'",
                            position);
        }
        if (die.multiplier < 1) {
            throw DiceError(ErrorKind::MalformedDieTerm,
                            "Количество кубиков должно быть положительным: '" + text + "'",
                            position);
        }
    }
    return die;
}

int parseLiteral(const std::string& text, std::size_t position) {
    int value = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec == std::errc::result_out_of_range) {
        throw DiceError(ErrorKind::InvalidLiteral,
                        "Слишком большое число: '" + text + "'", position);
    }
    if (ec != std::errc() || ptr != end) {
        throw DiceError(ErrorKind::InvalidLiteral,
                        "Ожидалось целое число или кубик: '" + text + "'", position);
    }
    return value;
}

Term classify(const Field& field) {
    switch (field.type) {
    case FieldType::Plus:
        return {Operator::Add, field.text, field.position};
    case FieldType::Minus:
        return {Operator::Sub, field.text, field.position};
    case FieldType::Operand:
        break;
    }

    if (looksLikeDie(field.text)) {
        return {parseDieTerm(field.text, field.position), field.text, field.position};
    }
    return {LiteralTerm{parseLiteral(field.text, field.position)}, field.text, field.position};
}

std::vector<Term> classifyFields(const std::vector<Field>& fields) {
    std::vector<Term> terms;
    terms.reserve(fields.size());
    for (const auto& field : fields) {
        terms.push_back(classify(field));
    }
    return terms;
}

} // namespace dice
