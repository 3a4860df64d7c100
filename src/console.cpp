#include "console.hpp"

void printHeader(std::ostream& out) {
    out << Color::BOLD << Color::CYAN;
    out << "\n╔═══════════════════════════════════════════════════════════╗\n";
    out << "║          Бросок кубиков по выражению v1.0                 ║\n";
    out << "╚═══════════════════════════════════════════════════════════╝\n";
    out << Color::RESET << "\n";
}

void printError(std::ostream& err, const std::string& message) {
    err << Color::RED << Color::BOLD << "✗ Ошибка: "
        << Color::RESET << Color::RED << message << Color::RESET << "\n\n";
}
