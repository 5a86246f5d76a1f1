#include "script_runner.hpp"

#include "errors.hpp"
#include "number_format.hpp"

#include <fstream>
#include <future>
#include <sstream>
#include <stdexcept>

namespace calc {

std::vector<ScriptLine> splitScript(const std::string& text) {
    std::vector<ScriptLine> lines;
    std::istringstream input(text);
    std::string buffer;
    std::size_t lineNumber = 0;

    while (std::getline(input, buffer)) {
        ++lineNumber;
        if (!buffer.empty() && buffer.back() == '\r') {
            buffer.pop_back();
        }
        if (buffer.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        lines.push_back({ lineNumber, std::move(buffer) });
    }
    return lines;
}

Script loadScript(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть входной файл: " + path.string());
    }
    std::ostringstream content;
    content << input.rdbuf();
    return Script{ path, splitScript(content.str()) };
}

EvaluationRecord evaluateLine(ExpressionEvaluator& evaluator, const ScriptLine& line) {
    EvaluationRecord record;
    record.lineNumber = line.number;
    record.expression = line.text;
    try {
        NumberPtr value = evaluator.evaluate(line.text);
        record.result = formatNumber(*value);
        record.status = "success";
    }
    catch (const EngineError& ex) {
        record.status = "error";
        record.message = std::string(errorKindName(ex.kind())) + ": " + ex.what();
    }
    catch (const std::exception& ex) {
        record.status = "error";
        record.message = ex.what();
    }
    return record;
}

ScriptReport runScript(const Script& script, std::atomic<std::size_t>& completed) {
    ScriptReport report;
    report.path = script.path;
    report.records.reserve(script.lines.size());

    ExpressionEvaluator evaluator;
    for (const auto& line : script.lines) {
        EvaluationRecord record = evaluateLine(evaluator, line);
        if (record.status == "success") {
            ++report.successCount;
        }
        else {
            ++report.errorCount;
        }
        report.records.push_back(std::move(record));
        completed.fetch_add(1);
    }
    return report;
}

std::vector<ScriptReport> runScripts(const std::vector<Script>& scripts, ThreadPool& pool,
                                     std::atomic<std::size_t>& completed) {
    std::vector<std::future<ScriptReport>> futures;
    futures.reserve(scripts.size());
    for (const auto& script : scripts) {
        futures.emplace_back(pool.enqueue([&script, &completed]() {
            return runScript(script, completed);
        }));
    }

    // Задачи ссылаются на scripts и completed: дожидаемся всех до первого get
    pool.waitIdle();

    std::vector<ScriptReport> reports;
    reports.reserve(futures.size());
    for (auto& future : futures) {
        reports.push_back(future.get());
    }
    return reports;
}

} // namespace calc
