#pragma once

#include <cstddef>
#include <filesystem>

namespace calc {

// Записывает lineCount случайных строк скрипта в outputPath.
// Выбрасывает std::runtime_error, если файл не удалось создать.
void writeGeneratedScript(const std::filesystem::path& outputPath, std::size_t lineCount, unsigned seed);

// Режим генерации скриптов (интерактивный)
void runGenerateMode();

} // namespace calc
