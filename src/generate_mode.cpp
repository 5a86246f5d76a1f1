#include "generate_mode.hpp"
#include "console.hpp"
#include "file_utils.hpp"
#include "script_generator.hpp"
#include "user_input.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>

namespace calc {

void writeGeneratedScript(const std::filesystem::path& outputPath, std::size_t lineCount, unsigned seed) {
    std::ofstream output(outputPath);
    if (!output.is_open()) {
        throw std::runtime_error("Не удалось создать файл: " + outputPath.string());
    }

    ScriptGenerator generator(seed);
    for (std::size_t i = 0; i < lineCount; ++i) {
        output << generator.nextLine() << "\n";

        // Показываем прогресс для больших файлов
        if ((i + 1) % 10000 == 0) {
            std::cout << "\r  " << Color::CYAN << (i + 1) << "/" << lineCount
                << " строк сгенерировано..." << Color::RESET << std::flush;
        }
    }

    if (!output) {
        throw std::runtime_error("Ошибка записи в файл: " + outputPath.string());
    }
}

void runGenerateMode() {
    printHeader();

    std::cout << Color::BOLD << Color::CYAN << "Режим генерации скриптов\n" << Color::RESET << "\n";

    std::size_t lineCount = askLineCount();
    std::filesystem::path fileName = selectGeneratedFileName(lineCount);

    std::filesystem::path scriptsDir = scriptsDirectory(findProjectRoot());
    std::filesystem::create_directories(scriptsDir);
    std::filesystem::path outputPath = scriptsDir / fileName;

    std::cout << "\n";
    std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Количество строк: " << Color::CYAN << lineCount << Color::RESET << "\n";
    std::cout << "  Выходной файл:    " << Color::YELLOW << outputPath << Color::RESET << "\n\n";

    std::cout << Color::BOLD << "Генерация скрипта..." << Color::RESET << std::flush;
    auto startGen = std::chrono::high_resolution_clock::now();

    writeGeneratedScript(outputPath, lineCount, std::random_device{}());

    auto endGen = std::chrono::high_resolution_clock::now();
    auto genDuration = std::chrono::duration_cast<std::chrono::milliseconds>(endGen - startGen);

    std::cout << "\r  " << Color::GREEN << "✓" << Color::RESET << " ("
        << lineCount << " строк, "
        << genDuration.count() << " мс)\n\n";

    std::cout << Color::GREEN << "Файл успешно создан: " << outputPath << Color::RESET << "\n\n";
}

} // namespace calc
