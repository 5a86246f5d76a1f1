#include "user_input.hpp"
#include "console.hpp"
#include "file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace calc {

namespace {
// Удаление пробелов по краям
std::string trim(std::string text) {
    text.erase(0, text.find_first_not_of(" \t"));
    text.erase(text.find_last_not_of(" \t") + 1);
    return text;
}

std::string prompt(const std::string& question) {
    std::cout << Color::BOLD << question << Color::RESET;
    std::string input;
    if (!std::getline(std::cin, input)) {
        throw std::runtime_error("Ввод прерван");
    }
    return trim(input);
}

bool isAllDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(),
        [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

// Выбор между названием по умолчанию (1) и своим (2)
bool askDefaultName(const std::string& defaultDescription) {
    std::cout << Color::BOLD << "Выберите способ задания имени файла:\n" << Color::RESET;
    std::cout << "  " << Color::CYAN << "1" << Color::RESET << ". " << defaultDescription << "\n";
    std::cout << "  " << Color::CYAN << "2" << Color::RESET << ". Кастомное название\n\n";

    std::string choice = prompt("Ваш выбор (1 или 2): ");
    if (choice == "1") {
        return true;
    }
    if (choice == "2") {
        return false;
    }
    throw std::runtime_error("Некорректный выбор. Используйте 1 или 2");
}

std::filesystem::path withExtension(std::filesystem::path path, const char* extension) {
    if (path.extension() != extension) {
        path.replace_extension(extension);
    }
    return path;
}
}

std::size_t parseNumber(const std::string& value) {
    std::size_t result = 0;
    try {
        result = std::stoul(value);
    }
    catch (const std::exception&) {
        throw std::runtime_error("Некорректное числовое значение: " + value);
    }
    if (result == 0) {
        throw std::runtime_error("Число должно быть положительным");
    }
    return result;
}

std::vector<std::size_t> parseFileSelection(const std::string& input, std::size_t available) {
    std::vector<std::size_t> indices;
    std::string text = trim(input);
    if (text == "all" || text == "*") {
        for (std::size_t i = 0; i < available; ++i) {
            indices.push_back(i);
        }
        return indices;
    }

    std::replace(text.begin(), text.end(), ',', ' ');
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t start = text.find_first_not_of(' ', pos);
        if (start == std::string::npos) {
            break;
        }
        std::size_t end = text.find(' ', start);
        std::string item = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
        pos = end == std::string::npos ? text.size() : end;

        if (!isAllDigits(item)) {
            throw std::runtime_error("Некорректный номер файла: " + item);
        }
        std::size_t number = parseNumber(item);
        if (number > available) {
            throw std::runtime_error("Номер файла вне допустимого диапазона: " + item);
        }
        if (std::find(indices.begin(), indices.end(), number - 1) == indices.end()) {
            indices.push_back(number - 1);
        }
    }

    if (indices.empty()) {
        throw std::runtime_error("Пустой ввод");
    }
    return indices;
}

std::vector<std::filesystem::path> selectInputFiles() {
    std::filesystem::path scriptsDir = scriptsDirectory(findProjectRoot());
    auto txtFiles = findTxtFiles(scriptsDir);

    if (txtFiles.empty()) {
        std::cout << Color::YELLOW << "Внимание: " << Color::RESET
            << "не найдено .txt файлов в папке tests/scripts.\n";
        std::cout << "Директория: " << Color::CYAN << scriptsDir << Color::RESET << "\n\n";
    }
    else {
        std::cout << Color::BOLD << "Найденные скрипты в папке tests/scripts:\n" << Color::RESET;
        for (std::size_t i = 0; i < txtFiles.size(); ++i) {
            std::cout << "  " << Color::CYAN << (i + 1) << Color::RESET << ". "
                << Color::YELLOW << txtFiles[i].filename().string() << Color::RESET << "\n";
        }
        std::cout << "\n";
    }

    std::string input = prompt("Введите номера файлов (через пробел или запятую, all для всех) или путь до файла: ");
    if (input.empty()) {
        throw std::runtime_error("Пустой ввод");
    }

    // Путь к файлу вне списка
    std::filesystem::path inputPath = input;
    if (txtFiles.empty() || std::filesystem::is_regular_file(inputPath)) {
        if (!std::filesystem::exists(inputPath)) {
            throw std::runtime_error("Файл не найден: " + inputPath.string());
        }
        return { inputPath };
    }

    std::vector<std::filesystem::path> selected;
    for (std::size_t index : parseFileSelection(input, txtFiles.size())) {
        selected.push_back(txtFiles[index]);
    }
    return selected;
}

std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath) {
    if (askDefaultName("Название по умолчанию (имя входного файла + _results_ + время)")) {
        return defaultOutputPath(inputPath, getCurrentTimeString());
    }

    std::string customName = prompt("Введите название выходного файла (можно с путем, расширение .csv добавится автоматически): ");
    if (customName.empty()) {
        throw std::runtime_error("Пустое название файла");
    }

    std::filesystem::path customPath(customName);
    // Относительный путь отсчитывается от папки входного файла
    if (!customPath.is_absolute()) {
        customPath = inputPath.parent_path() / customPath;
    }
    return withExtension(customPath, ".csv");
}

std::size_t selectThreadCount() {
    std::size_t defaultThreads = std::thread::hardware_concurrency();
    if (defaultThreads == 0) {
        defaultThreads = 2; // Резервное значение
    }

    std::cout << Color::BOLD << "Введите количество потоков" << Color::RESET
        << " (по умолчанию: " << Color::CYAN << defaultThreads << Color::RESET << "): ";

    std::string input;
    if (!std::getline(std::cin, input)) {
        throw std::runtime_error("Ввод прерван");
    }
    input = trim(input);
    if (input.empty()) {
        return defaultThreads;
    }
    return parseNumber(input);
}

bool askContinue() {
    std::cout << Color::BOLD << "Обработать еще файлы? (y/n): " << Color::RESET;
    std::string input;
    if (!std::getline(std::cin, input)) {
        return false;
    }
    input = trim(input);
    std::transform(input.begin(), input.end(), input.begin(),
        [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    return (input == "y" || input == "yes" || input == "д" || input == "да");
}

std::size_t askLineCount() {
    std::string input = prompt("Введите количество строк скрипта для генерации: ");
    if (input.empty()) {
        throw std::runtime_error("Пустой ввод");
    }
    return parseNumber(input);
}

std::filesystem::path selectGeneratedFileName(std::size_t lineCount) {
    if (askDefaultName("Автоматическое название (generate_" + std::to_string(lineCount) + ".txt)")) {
        return std::filesystem::path("generate_" + std::to_string(lineCount) + ".txt");
    }

    std::string customName = prompt("Введите название файла (расширение .txt добавится автоматически): ");
    if (customName.empty()) {
        throw std::runtime_error("Пустое название файла");
    }
    return withExtension(std::filesystem::path(customName), ".txt");
}

} // namespace calc
