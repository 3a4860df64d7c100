#include "csv_writer.hpp"

#include <fstream>
#include <stdexcept>

namespace dice {

namespace {
// Текстовое поле в кавычках; двойные кавычки внутри заменяются одинарными
std::string quoted(std::string text) {
    for (char& ch : text) {
        if (ch == '"') {
            ch = '\'';
        }
    }
    return '"' + text + '"';
}
}

CsvWriter::CsvWriter(std::filesystem::path targetPath) : path(std::move(targetPath)) {
    std::ofstream stream(path, std::ios::trunc);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    stream << "line,expression,status,rendered,total,message\n";
}

void CsvWriter::writeRecord(const RollRecord& record) const {
    std::ofstream stream(path, std::ios::app);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }

    stream << record.lineNumber << ','
           << quoted(record.expression) << ','
           << record.status << ','
           << quoted(record.rendered) << ',';
    if (record.total.has_value()) {
        stream << *record.total;
    }
    stream << ',' << quoted(record.message) << '\n';
}

} // namespace dice
