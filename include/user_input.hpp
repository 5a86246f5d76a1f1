#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace calc {

// Безопасный парсинг положительного числа из строки.
// Выбрасывает std::runtime_error для нуля и некорректного ввода.
std::size_t parseNumber(const std::string& value);

// Разбор выбора файлов из списка размера available:
// "all" или "*" выбирает все, иначе номера через пробел или запятую (с 1).
// Возвращает индексы с 0 без повторов, в порядке ввода.
std::vector<std::size_t> parseFileSelection(const std::string& input, std::size_t available);

// Интерактивный выбор одного или нескольких скриптов
std::vector<std::filesystem::path> selectInputFiles();

// Интерактивный выбор выходного файла для одного скрипта
std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath);

// Интерактивный ввод количества потоков
std::size_t selectThreadCount();

// Запрос продолжения работы
bool askContinue();

// Интерактивный ввод количества строк для генерации
std::size_t askLineCount();

// Интерактивный выбор имени файла для генерации
std::filesystem::path selectGeneratedFileName(std::size_t lineCount);

} // namespace calc
