#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace calc {

// Поиск корневой директории проекта (ищет папку tests или файл CMakeLists.txt)
std::filesystem::path findProjectRoot();

// Папка со скриптами: <корень проекта>/tests/scripts
std::filesystem::path scriptsDirectory(const std::filesystem::path& projectRoot);

// Поиск всех .txt файлов в директории (без рекурсии), отсортированных по имени
std::vector<std::filesystem::path> findTxtFiles(const std::filesystem::path& directory);

// Получение текущего времени в формате для имени файла
std::string getCurrentTimeString();

// <папка входного файла>/<имя>_results_<время>.csv
std::filesystem::path defaultOutputPath(const std::filesystem::path& inputPath, const std::string& timestamp);

} // namespace calc
