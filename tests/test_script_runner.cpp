#include <gtest/gtest.h>

#include "csv_writer.hpp"
#include "file_utils.hpp"
#include "script_generator.hpp"
#include "script_runner.hpp"
#include "thread_pool.hpp"
#include "user_input.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace calc;

namespace {
Script scriptOf(const std::string& name, const std::string& text) {
    return Script{ name, splitScript(text) };
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    std::ostringstream content;
    content << input.rdbuf();
    return content.str();
}

std::string joined(const std::vector<std::string>& lines) {
    std::string text;
    for (const auto& line : lines) {
        text += line + "\n";
    }
    return text;
}
}

TEST(ScriptRunnerTest, SplitSkipsBlankLinesAndKeepsNumbers) {
    auto lines = splitScript("x = 1\r\n\n   \nx + 1\r\n\ty = 2");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].number, 1u);
    EXPECT_EQ(lines[0].text, "x = 1");
    EXPECT_EQ(lines[1].number, 4u);
    EXPECT_EQ(lines[1].text, "x + 1");
    EXPECT_EQ(lines[2].number, 5u);
    EXPECT_EQ(lines[2].text, "\ty = 2");
}

TEST(ScriptRunnerTest, EvaluateLineReportsSuccess) {
    ExpressionEvaluator evaluator;
    EvaluationRecord record = evaluateLine(evaluator, { 3, "1/3 + 1/6" });
    EXPECT_EQ(record.lineNumber, 3u);
    EXPECT_EQ(record.expression, "1/3 + 1/6");
    EXPECT_EQ(record.status, "success");
    ASSERT_TRUE(record.result.has_value());
    EXPECT_EQ(*record.result, "1/2");
    EXPECT_TRUE(record.message.empty());
}

TEST(ScriptRunnerTest, EvaluateLineReportsErrorKind) {
    ExpressionEvaluator evaluator;
    EvaluationRecord record = evaluateLine(evaluator, { 1, "missing * 2" });
    EXPECT_EQ(record.status, "error");
    EXPECT_FALSE(record.result.has_value());
    EXPECT_EQ(record.message.rfind("UndefinedVariable: ", 0), 0u);

    EvaluationRecord syntax = evaluateLine(evaluator, { 2, "(1 +" });
    EXPECT_EQ(syntax.message.rfind("ParserError: ", 0), 0u);
}

TEST(ScriptRunnerTest, SessionPersistsAcrossLines) {
    Script script = scriptOf("session.txt",
        "x = 10\n"
        "f(a) = a * x\n"
        "f(2)\n"
        "broken(\n"
        "x = x + 1\n"
        "f(2)\n");

    std::atomic<std::size_t> completed{ 0 };
    ScriptReport report = runScript(script, completed);

    ASSERT_EQ(report.records.size(), 6u);
    EXPECT_EQ(completed.load(), 6u);
    EXPECT_EQ(report.successCount, 5u);
    EXPECT_EQ(report.errorCount, 1u);
    EXPECT_EQ(*report.records[2].result, "20");
    EXPECT_EQ(report.records[3].status, "error");
    EXPECT_EQ(*report.records[5].result, "22");
}

TEST(ScriptRunnerTest, ParallelScriptsHaveIndependentContexts) {
    std::vector<Script> scripts;
    for (int i = 0; i < 8; ++i) {
        std::string value = std::to_string(i);
        scripts.push_back(scriptOf("s" + value + ".txt",
            "x = " + value + "\n"
            "sq(v) = v * v\n"
            "sq(x) + 2^100 - 2^100\n"));
    }

    ThreadPool pool(4);
    std::atomic<std::size_t> completed{ 0 };
    auto reports = runScripts(scripts, pool, completed);

    ASSERT_EQ(reports.size(), scripts.size());
    EXPECT_EQ(completed.load(), 24u);
    for (int i = 0; i < 8; ++i) {
        EXPECT_EQ(reports[i].path, scripts[i].path);
        EXPECT_EQ(reports[i].errorCount, 0u);
        EXPECT_EQ(*reports[i].records[2].result, std::to_string(i * i));
    }
}

TEST(ScriptRunnerTest, LoadScriptFailsForMissingFile) {
    EXPECT_THROW(loadScript("/nonexistent/dir/script.txt"), std::runtime_error);
}

TEST(ScriptRunnerTest, SampleScriptsRunWithoutCrashing) {
    auto files = findTxtFiles(CALC_SCRIPTS_DIR);
    ASSERT_FALSE(files.empty());

    for (const auto& file : files) {
        Script script = loadScript(file);
        EXPECT_FALSE(script.lines.empty()) << file;

        std::atomic<std::size_t> completed{ 0 };
        ScriptReport report = runScript(script, completed);
        EXPECT_EQ(report.successCount + report.errorCount, script.lines.size());
    }
}

TEST(ScriptRunnerTest, BasicsSampleIsErrorFree) {
    Script script = loadScript(std::filesystem::path(CALC_SCRIPTS_DIR) / "basics.txt");
    std::atomic<std::size_t> completed{ 0 };
    ScriptReport report = runScript(script, completed);
    EXPECT_EQ(report.errorCount, 0u);
}

TEST(CsvWriterTest, WritesHeaderAndQuotedFields) {
    auto path = std::filesystem::temp_directory_path() / "calc_csv_writer_test.csv";

    EvaluationRecord success{ 1, "f(\"a\")", std::string("1/2"), "success", "" };
    EvaluationRecord failure{ 2, "y", std::nullopt, "error", "UndefinedVariable: y" };
    {
        CsvWriter writer(path);
        EXPECT_EQ(writer.target(), path);
        writer.write({ success });
        writer.writeRecord(failure);
    }

    EXPECT_EQ(readFile(path),
        "line,expression,status,result,message\n"
        "1,\"f('a')\",success,\"1/2\",\"\"\n"
        "2,\"y\",error,,\"UndefinedVariable: y\"\n");

    // Повторное открытие перезаписывает файл
    CsvWriter again(path);
    EXPECT_EQ(readFile(path), "line,expression,status,result,message\n");

    std::filesystem::remove(path);
}

TEST(FileUtilsTest, DefaultOutputPath) {
    auto output = defaultOutputPath("/data/scripts/basics.txt", "20260101_120000");
    EXPECT_EQ(output, std::filesystem::path("/data/scripts/basics_results_20260101_120000.csv"));
}

TEST(UserInputTest, FileSelection) {
    EXPECT_EQ(parseFileSelection("all", 3), (std::vector<std::size_t>{ 0, 1, 2 }));
    EXPECT_EQ(parseFileSelection(" * ", 2), (std::vector<std::size_t>{ 0, 1 }));
    EXPECT_EQ(parseFileSelection("3, 1 3", 3), (std::vector<std::size_t>{ 2, 0 }));

    EXPECT_THROW(parseFileSelection("4", 3), std::runtime_error);
    EXPECT_THROW(parseFileSelection("0", 3), std::runtime_error);
    EXPECT_THROW(parseFileSelection("1, x", 3), std::runtime_error);
    EXPECT_THROW(parseFileSelection("  ", 3), std::runtime_error);
}

TEST(ScriptGeneratorTest, SameSeedSameScript) {
    ScriptGenerator first(42);
    ScriptGenerator second(42);
    EXPECT_EQ(first.generate(50), second.generate(50));
}

TEST(ScriptGeneratorTest, GeneratedScriptRuns) {
    ScriptGenerator generator(7);
    auto lines = generator.generate(200);
    ASSERT_EQ(lines.size(), 200u);

    Script script = scriptOf("generated.txt", joined(lines));
    ASSERT_EQ(script.lines.size(), 200u);

    std::atomic<std::size_t> completed{ 0 };
    ScriptReport report = runScript(script, completed);
    EXPECT_EQ(completed.load(), 200u);
    EXPECT_EQ(report.records.size(), 200u);
    // Ошибки вносятся с вероятностью 5%, большинство строк вычисляется
    EXPECT_GT(report.successCount, report.errorCount);
}

TEST(ThreadPoolTest, ZeroMeansHardwareConcurrency) {
    ThreadPool pool(0);
    EXPECT_GE(pool.size(), 1u);
}

TEST(ThreadPoolTest, WaitIdleDrainsQueue) {
    ThreadPool pool(3);
    std::atomic<int> done{ 0 };
    for (int i = 0; i < 50; ++i) {
        pool.enqueue([&done](int step) { done.fetch_add(step); }, 1);
    }
    pool.waitIdle();
    EXPECT_EQ(done.load(), 50);
    EXPECT_EQ(pool.pending(), 0u);
}

TEST(ThreadPoolTest, ExceptionTravelsThroughFuture) {
    ThreadPool pool(2);
    auto failing = pool.enqueue([]() -> int { throw std::runtime_error("сбой"); });
    auto working = pool.enqueue([](int a, int b) { return a * b; }, 6, 7);
    EXPECT_THROW(failing.get(), std::runtime_error);
    EXPECT_EQ(working.get(), 42);
}
