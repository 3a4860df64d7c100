#include "dice_error.hpp"

namespace dice {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::MalformedOperatorPlacement:
        return "MalformedOperatorPlacement";
    case ErrorKind::AmbiguousOrMissingOperand:
        return "AmbiguousOrMissingOperand";
    case ErrorKind::MalformedDieTerm:
        return "MalformedDieTerm";
    case ErrorKind::InvalidLiteral:
        return "InvalidLiteral";
    }
    return "Unknown";
}

DiceError::DiceError(ErrorKind kind, const std::string& message, std::size_t position)
    : std::runtime_error(message + " (позиция " + std::to_string(position) + ")"),
      errorKind(kind),
      errorPosition(position) {}

} // namespace dice
