#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace calc {

// Результат вычисления одной строки скрипта
struct EvaluationRecord {
    std::size_t lineNumber = 0;        // Номер строки в исходном файле
    std::string expression;            // Исходный текст выражения
    std::optional<std::string> result; // Отформатированный результат (если вычисление успешно)
    std::string status;                // "success" или "error"
    std::string message;               // Вид и текст ошибки (если есть)
};

// Запись результатов в формате CSV: line,expression,status,result,message
// Двойные кавычки внутри полей заменяются одинарными.
class CsvWriter {
public:
    // Открывает файл для записи (перезаписывая его) и записывает заголовок
    explicit CsvWriter(std::filesystem::path targetPath);

    // Дописывает пакет результатов в файл
    void write(const std::vector<EvaluationRecord>& records) const;

    // Дописывает один результат
    void writeRecord(const EvaluationRecord& record) const;

    const std::filesystem::path& target() const { return path; }

private:
    std::filesystem::path path;

    void initialize() const;
};

} // namespace calc
