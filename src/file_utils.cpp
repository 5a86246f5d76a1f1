#include "file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace calc {

std::filesystem::path findProjectRoot() {
    try {
        std::filesystem::path current = std::filesystem::current_path();

        // Поднимаемся вверх по директориям, пока не найдем папку tests или CMakeLists.txt
        while (!current.empty()) {
            try {
                std::filesystem::path testsDir = current / "tests";
                std::filesystem::path cmakeFile = current / "CMakeLists.txt";

                if (std::filesystem::is_directory(testsDir) || std::filesystem::is_regular_file(cmakeFile)) {
                    return current;
                }
            }
            catch (const std::filesystem::filesystem_error&) {
                // Директория без доступа: идём выше
            }

            std::filesystem::path parent = current.parent_path();
            if (parent == current) {
                break;
            }
            current = parent;
        }
    }
    catch (const std::filesystem::filesystem_error&) {
        // current_path недоступен: ниже будет повторная попытка
    }

    return std::filesystem::current_path();
}

std::filesystem::path scriptsDirectory(const std::filesystem::path& projectRoot) {
    return projectRoot / "tests" / "scripts";
}

namespace {
// Сравнение расширений без учёта регистра
bool hasExtension(const std::filesystem::path& path, std::string ext) {
    std::string pathExt = path.extension().string();
    if (pathExt.empty()) {
        return false;
    }
    auto lower = [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); };
    std::transform(pathExt.begin(), pathExt.end(), pathExt.begin(), lower);
    std::transform(ext.begin(), ext.end(), ext.begin(), lower);
    return pathExt == ext;
}
}

std::vector<std::filesystem::path> findTxtFiles(const std::filesystem::path& directory) {
    std::vector<std::filesystem::path> txtFiles;

    std::error_code error;
    if (!std::filesystem::is_directory(directory, error)) {
        return txtFiles;
    }

    try {
        for (const auto& entry : std::filesystem::directory_iterator(directory)) {
            if (entry.is_regular_file(error) && hasExtension(entry.path(), ".txt")) {
                txtFiles.push_back(entry.path());
            }
        }
    }
    catch (const std::filesystem::filesystem_error&) {
        // Директория изменилась во время обхода: возвращаем то, что успели найти
    }

    std::sort(txtFiles.begin(), txtFiles.end());
    return txtFiles;
}

std::string getCurrentTimeString() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;

#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
    return oss.str();
}

std::filesystem::path defaultOutputPath(const std::filesystem::path& inputPath, const std::string& timestamp) {
    return inputPath.parent_path() / (inputPath.stem().string() + "_results_" + timestamp + ".csv");
}

} // namespace calc
