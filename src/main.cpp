#include <atomic>
#include <chrono>
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "console.hpp"
#include "csv_writer.hpp"
#include "evaluator.hpp"
#include "file_utils.hpp"
#include "generate_mode.hpp"
#include "number_format.hpp"
#include "progress_bar.hpp"
#include "script_runner.hpp"
#include "thread_pool.hpp"
#include "user_input.hpp"

namespace {

using namespace calc;

void printUsage() {
    std::cout << Color::BOLD << "Использование:\n" << Color::RESET;
    std::cout << "  calc [repl]            интерактивная сессия\n";
    std::cout << "  calc eval <выражение>  вычисление одного выражения\n";
    std::cout << "  calc run               пакетная обработка скриптов из tests/scripts\n";
    std::cout << "  calc generate          генерация случайного скрипта\n\n";
}

// Интерактивная сессия: переменные и функции сохраняются между строками
int runRepl() {
    printHeader();
    std::cout << Color::GRAY << "Команды: exit/quit - выход, reset - новая сессия, "
        << "fractions - дроби/десятичные,\n"
        << "hex/bin/oct - последний целый результат в другой системе счисления\n\n" << Color::RESET;

    ExpressionEvaluator evaluator;
    bool showFractions = true;
    NumberPtr lastResult;
    std::string line;

    while (true) {
        std::cout << Color::CYAN << "> " << Color::RESET << std::flush;
        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            break;
        }

        std::size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) {
            continue;
        }
        std::string command = line.substr(first, line.find_last_not_of(" \t\r") - first + 1);

        if (command == "exit" || command == "quit") {
            break;
        }
        if (command == "reset") {
            evaluator.reset();
            lastResult.reset();
            std::cout << Color::GRAY << "Сессия начата заново\n" << Color::RESET;
            continue;
        }
        if (command == "fractions") {
            showFractions = !showFractions;
            std::cout << Color::GRAY << (showFractions ? "Вывод дробями\n" : "Вывод десятичными\n")
                << Color::RESET;
            continue;
        }

        if (command == "hex" || command == "bin" || command == "oct") {
            if (!lastResult || !lastResult->isInteger()) {
                printError("Результат не является целым числом");
                continue;
            }
            int base = command == "hex" ? 16 : (command == "bin" ? 2 : 8);
            std::cout << Color::GREEN << "= " << Color::BOLD
                << formatInteger(lastResult->asInteger(), base) << Color::RESET << "\n";
            continue;
        }

        try {
            NumberPtr value = evaluator.evaluate(command);
            lastResult = value;
            std::cout << Color::GREEN << "= " << Color::BOLD
                << (showFractions ? formatNumber(*value) : formatNumberDecimal(*value))
                << Color::RESET << Color::GRAY << "  [" << value->typeName() << "]"
                << Color::RESET << "\n";
        }
        catch (const std::exception& ex) {
            printError(ex.what());
        }
    }

    std::cout << Color::CYAN << "Работа завершена. До свидания!" << Color::RESET << "\n\n";
    return 0;
}

// Однократное вычисление: аргументы командной строки склеиваются через пробел
int runEval(int argc, char** argv) {
    std::string expression;
    for (int i = 2; i < argc; ++i) {
        if (!expression.empty()) {
            expression += ' ';
        }
        expression += argv[i];
    }
    if (expression.empty()) {
        printError("Не задано выражение");
        return 1;
    }

    try {
        ExpressionEvaluator evaluator;
        std::cout << formatNumber(*evaluator.evaluate(expression)) << "\n";
        return 0;
    }
    catch (const std::exception& ex) {
        printError(ex.what());
        return 1;
    }
}

// Одна итерация пакетной обработки: выбор скриптов, параллельное выполнение, CSV
void processScripts() {
    std::vector<std::filesystem::path> inputPaths = selectInputFiles();

    // Для одного файла имя результата задаётся интерактивно, для нескольких по умолчанию
    std::vector<std::filesystem::path> outputPaths;
    if (inputPaths.size() == 1) {
        outputPaths.push_back(selectOutputFile(inputPaths.front()));
    }
    else {
        std::string timestamp = getCurrentTimeString();
        for (const auto& inputPath : inputPaths) {
            outputPaths.push_back(defaultOutputPath(inputPath, timestamp));
        }
    }

    std::size_t threadCount = selectThreadCount();
    std::cout << "\n";

    std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    for (std::size_t i = 0; i < inputPaths.size(); ++i) {
        std::cout << "  " << Color::YELLOW << inputPaths[i].filename().string() << Color::RESET
            << " -> " << Color::YELLOW << outputPaths[i] << Color::RESET << "\n";
    }
    std::cout << "  Потоков: " << Color::CYAN << threadCount << Color::RESET << "\n\n";

    std::cout << Color::BOLD << "Чтение скриптов..." << Color::RESET << std::flush;
    std::vector<Script> scripts;
    std::size_t totalLines = 0;
    for (const auto& inputPath : inputPaths) {
        scripts.push_back(loadScript(inputPath));
        totalLines += scripts.back().lines.size();
    }
    std::cout << " " << Color::GREEN << "✓" << Color::RESET << " ("
        << totalLines << " выражений)\n\n";

    std::cout << Color::BOLD << "Обработка выражений:\n" << Color::RESET;
    auto startProcess = std::chrono::high_resolution_clock::now();

    std::atomic<std::size_t> completed{ 0 };
    std::thread progressThread(displayProgress, std::cref(completed), totalLines);

    std::vector<ScriptReport> reports;
    try {
        ThreadPool pool(threadCount);
        reports = runScripts(scripts, pool, completed);
    }
    catch (...) {
        // Прогресс-бар ждёт completed == total: завершаем его и пробрасываем ошибку дальше
        completed.store(totalLines);
        progressThread.join();
        throw;
    }
    progressThread.join();

    auto endProcess = std::chrono::high_resolution_clock::now();
    auto processDuration = std::chrono::duration_cast<std::chrono::milliseconds>(endProcess - startProcess);

    std::cout << "\n" << Color::BOLD << "Запись результатов..." << Color::RESET << std::flush;
    std::size_t successCount = 0;
    std::size_t errorCount = 0;
    for (std::size_t i = 0; i < reports.size(); ++i) {
        CsvWriter writer(outputPaths[i]);
        writer.write(reports[i].records);
        successCount += reports[i].successCount;
        errorCount += reports[i].errorCount;
    }
    std::cout << " " << Color::GREEN << "✓" << Color::RESET << "\n\n";

    std::cout << Color::BOLD << "Статистика:\n" << Color::RESET;
    std::cout << "  Скриптов:         " << Color::CYAN << reports.size() << Color::RESET << "\n";
    std::cout << "  Всего выражений:  " << Color::CYAN << totalLines << Color::RESET << "\n";
    std::cout << "  Успешно:          " << Color::GREEN << successCount << Color::RESET << "\n";
    if (errorCount > 0) {
        std::cout << "  Ошибок:           " << Color::RED << errorCount << Color::RESET << "\n";
    }
    std::cout << "  Время обработки:  " << Color::MAGENTA << processDuration.count()
        << " мс" << Color::RESET << "\n";

    if (processDuration.count() > 0) {
        std::cout << "  Производительность: " << Color::YELLOW
            << static_cast<long long>(totalLines * 1000.0 / processDuration.count())
            << " выр/сек" << Color::RESET << "\n\n";
    }

    for (const auto& outputPath : outputPaths) {
        std::cout << Color::GREEN << "Результаты сохранены в: " << outputPath << Color::RESET << "\n";
    }
    std::cout << "\n";
}

int runBatchMode() {
    printHeader();

    bool continueProcessing = true;
    while (continueProcessing) {
        try {
            processScripts();
        }
        catch (const std::exception& ex) {
            std::cerr << "\n";
            printError(ex.what());
            std::cerr << "\n";
        }

        continueProcessing = askContinue();
        if (continueProcessing) {
            std::cout << "\n";
        }
    }

    std::cout << Color::CYAN << "Работа завершена. До свидания!" << Color::RESET << "\n\n";
    return 0;
}

} // namespace

// Точка входа в программу
int main(int argc, char** argv) {
    std::string mode = argc >= 2 ? argv[1] : "repl";

    if (mode == "repl") {
        return runRepl();
    }
    if (mode == "eval") {
        return runEval(argc, argv);
    }
    if (mode == "run") {
        return runBatchMode();
    }
    if (mode == "generate") {
        try {
            runGenerateMode();
            return 0;
        }
        catch (const std::exception& ex) {
            std::cerr << "\n";
            printError(ex.what());
            std::cerr << "\n";
            return 1;
        }
    }

    printError("Неизвестный режим: " + mode);
    printUsage();
    return 1;
}
