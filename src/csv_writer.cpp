#include "csv_writer.hpp"

#include <fstream>
#include <stdexcept>

namespace calc {

namespace {
// Поле в кавычках; двойные кавычки внутри заменяются одинарными
std::string quoted(std::string text) {
    for (char& ch : text) {
        if (ch == '"') {
            ch = '\'';
        }
    }
    return '"' + text + '"';
}

void writeLine(std::ofstream& stream, const EvaluationRecord& record) {
    stream << record.lineNumber << ','
        << quoted(record.expression) << ','
        << record.status << ',';
    if (record.result.has_value()) {
        stream << quoted(*record.result);
    }
    stream << ',' << quoted(record.message) << '\n';
}

std::ofstream openForAppend(const std::filesystem::path& path) {
    std::ofstream stream(path, std::ios::app);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    return stream;
}
}

CsvWriter::CsvWriter(std::filesystem::path targetPath) : path(std::move(targetPath)) {
    initialize();
}

void CsvWriter::initialize() const {
    std::ofstream stream(path, std::ios::trunc);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    stream << "line,expression,status,result,message\n";
}

void CsvWriter::writeRecord(const EvaluationRecord& record) const {
    std::ofstream stream = openForAppend(path);
    writeLine(stream, record);
}

void CsvWriter::write(const std::vector<EvaluationRecord>& records) const {
    std::ofstream stream = openForAppend(path);
    for (const auto& record : records) {
        writeLine(stream, record);
    }
}

} // namespace calc
