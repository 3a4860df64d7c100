#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace dice {

// Результат броска по одной строке входного файла
struct RollRecord {
    std::size_t lineNumber;        // Номер строки в исходном файле
    std::string expression;        // Исходный текст выражения
    std::string status;            // success или error
    std::string rendered;          // Расшифровка броска (если успешно)
    std::optional<long long> total; // Итог (если успешно)
    std::string message;           // Сообщение об ошибке (если есть)
};

// Запись результатов бросков в CSV.
// Формат: line,expression,status,rendered,total,message
class CsvWriter {
public:
    // Конструктор создаёт (перезаписывает) файл и пишет заголовок
    explicit CsvWriter(std::filesystem::path targetPath);

    // Дописывает одну строку результата в конец файла
    void writeRecord(const RollRecord& record) const;

    const std::filesystem::path& target() const { return path; }

private:
    std::filesystem::path path; // Путь к выходному файлу
};

} // namespace dice
