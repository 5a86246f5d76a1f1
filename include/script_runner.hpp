#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "csv_writer.hpp"
#include "evaluator.hpp"
#include "thread_pool.hpp"

namespace calc {

// Строка скрипта с её номером в файле
struct ScriptLine {
    std::size_t number;
    std::string text;
};

// Скрипт: последовательность выражений одной сессии
struct Script {
    std::filesystem::path path;
    std::vector<ScriptLine> lines; // Только непустые строки
};

// Итог выполнения одного скрипта
struct ScriptReport {
    std::filesystem::path path;
    std::vector<EvaluationRecord> records; // В порядке строк файла
    std::size_t successCount = 0;
    std::size_t errorCount = 0;
};

// Разбивает текст на строки; пустые строки и строки из пробелов пропускаются,
// завершающий '\r' отбрасывается. Нумерация строк с 1.
std::vector<ScriptLine> splitScript(const std::string& text);

// Читает скрипт с диска.
// Выбрасывает std::runtime_error, если файл не удалось открыть.
Script loadScript(const std::filesystem::path& path);

// Вычисляет одну строку в сессии evaluator.
// Ошибка вычисления не прерывает сессию, а попадает в запись со статусом "error".
EvaluationRecord evaluateLine(ExpressionEvaluator& evaluator, const ScriptLine& line);

// Выполняет все строки скрипта по порядку в новой сессии.
// completed увеличивается после каждой строки.
ScriptReport runScript(const Script& script, std::atomic<std::size_t>& completed);

// Выполняет скрипты параллельно в пуле, у каждого собственный контекст.
// Отчёты возвращаются в порядке scripts.
std::vector<ScriptReport> runScripts(const std::vector<Script>& scripts, ThreadPool& pool,
                                     std::atomic<std::size_t>& completed);

} // namespace calc
