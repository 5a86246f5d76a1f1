// Генератор случайных скриптов для режима generate и нагрузочных тестов.
// Строки скрипта: присваивания, определения и вызовы функций, литералы
// (десятичные, 0x, 0b, вещественные), ^, !, неявное умножение.
// С малой вероятностью вносит синтаксические ошибки (незакрытые скобки, лишние символы).

#pragma once

#include <cstddef>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace calc {

// Вероятность генерации ошибки в строке (5%)
constexpr double kErrorProbability = 0.05;

class ScriptGenerator {
public:
    explicit ScriptGenerator(unsigned seed = std::random_device{}());

    // Следующая строка скрипта.
    // Ссылается только на уже определённые переменные и функции.
    std::string nextLine();

    std::vector<std::string> generate(std::size_t count);

private:
    std::mt19937 gen;
    std::vector<std::string> variables;                         // Уже присвоенные переменные
    std::vector<std::pair<std::string, std::size_t>> functions; // Имя и арность

    int uniform(int low, int high);
    bool chance(double probability);

    std::string literal();
    std::string operand(const std::vector<std::string>& names);
    std::string expression(int depth, const std::vector<std::string>& names);

    std::string assignment();
    std::string definition();
    std::string call(int depth);

    std::string introduceError(std::string line);
};

} // namespace calc
