#include "script_generator.hpp"

#include <algorithm>
#include <cstdio>

namespace calc {

namespace {
const std::vector<std::string> kVariableNames = { "a", "c", "x", "y", "z", "total", "acc", "k" };
const std::vector<std::string> kFunctionNames = { "f", "g", "h", "sq", "poly" };
const std::vector<std::string> kParameterNames = { "p", "q", "r" };
const std::vector<std::string> kOperators = { "+", "-", "*", "/", "%" };
const std::vector<std::string> kPrimitives = { "sqrt", "abs", "ln", "sin", "cos" };
}

ScriptGenerator::ScriptGenerator(unsigned seed) : gen(seed) {}

int ScriptGenerator::uniform(int low, int high) {
    return std::uniform_int_distribution<int>(low, high)(gen);
}

bool ScriptGenerator::chance(double probability) {
    return std::uniform_real_distribution<double>(0.0, 1.0)(gen) < probability;
}

// Литерал в одной из форм: целое, 0x.., 0b.., вещественное
std::string ScriptGenerator::literal() {
    char buffer[32];
    switch (uniform(0, 9)) {
    case 0:
        std::snprintf(buffer, sizeof(buffer), "0x%X", uniform(1, 255));
        return buffer;
    case 1: {
        std::string bits = "0b";
        int value = uniform(1, 63);
        std::string digits;
        while (value > 0) {
            digits.push_back(static_cast<char>('0' + value % 2));
            value /= 2;
        }
        std::reverse(digits.begin(), digits.end());
        return bits + digits;
    }
    case 2:
    case 3:
        std::snprintf(buffer, sizeof(buffer), "%.2f", std::uniform_real_distribution<double>(0.0, 100.0)(gen));
        return buffer;
    default:
        return std::to_string(uniform(1, 99));
    }
}

std::string ScriptGenerator::operand(const std::vector<std::string>& names) {
    int roll = uniform(0, 9);
    if (!names.empty() && roll < 4) {
        const std::string& name = names[uniform(0, static_cast<int>(names.size()) - 1)];
        // Неявное умножение: 3x
        if (roll == 0) {
            return std::to_string(uniform(2, 9)) + name;
        }
        return name;
    }
    if (roll == 4) {
        return "(" + std::to_string(uniform(0, 10)) + ")!";
    }
    return literal();
}

// Выражение над литералами и именами names
std::string ScriptGenerator::expression(int depth, const std::vector<std::string>& names) {
    if (depth <= 0) {
        return operand(names);
    }

    int roll = uniform(0, 19);
    if (roll < 12) {
        const std::string& op = kOperators[uniform(0, static_cast<int>(kOperators.size()) - 1)];
        return expression(depth - 1, names) + " " + op + " " + expression(depth - 1, names);
    }
    if (roll < 14) {
        // Основание без переменных и маленький показатель, чтобы целые не разрастались
        return "(" + expression(depth - 1, {}) + ")^" + std::to_string(uniform(0, 3));
    }
    if (roll < 16) {
        return std::to_string(uniform(2, 9)) + "(" + expression(depth - 1, names) + ")";
    }
    if (roll < 18) {
        const std::string& primitive = kPrimitives[uniform(0, static_cast<int>(kPrimitives.size()) - 1)];
        return primitive + "(" + expression(depth - 1, names) + ")";
    }
    if (roll == 18) {
        return "-" + operand(names);
    }
    return operand(names);
}

// Присваивается выражение из литералов: значения переменных не накапливаются от строки к строке
std::string ScriptGenerator::assignment() {
    std::string name = kVariableNames[uniform(0, static_cast<int>(kVariableNames.size()) - 1)];
    std::string line = name + " = " + expression(uniform(1, 3), {});
    if (std::find(variables.begin(), variables.end(), name) == variables.end()) {
        variables.push_back(name);
    }
    return line;
}

// Тело функции ссылается только на свои параметры
std::string ScriptGenerator::definition() {
    std::string name = kFunctionNames[uniform(0, static_cast<int>(kFunctionNames.size()) - 1)];
    std::size_t arity = static_cast<std::size_t>(uniform(1, static_cast<int>(kParameterNames.size())));
    std::vector<std::string> parameters(kParameterNames.begin(), kParameterNames.begin() + arity);

    std::string line = name + "(";
    for (std::size_t i = 0; i < arity; ++i) {
        line += (i > 0 ? ", " : "") + parameters[i];
    }
    line += ") = " + expression(uniform(1, 3), parameters);

    auto existing = std::find_if(functions.begin(), functions.end(),
        [&name](const auto& function) { return function.first == name; });
    if (existing != functions.end()) {
        existing->second = arity;
    }
    else {
        functions.emplace_back(name, arity);
    }
    return line;
}

std::string ScriptGenerator::call(int depth) {
    const auto& [name, arity] = functions[uniform(0, static_cast<int>(functions.size()) - 1)];
    std::string line = name + "(";
    for (std::size_t i = 0; i < arity; ++i) {
        line += (i > 0 ? ", " : "") + expression(depth, variables);
    }
    return line + ")";
}

std::string ScriptGenerator::nextLine() {
    int roll = uniform(0, 9);
    std::string line;
    if (variables.empty() || roll < 3) {
        line = assignment();
    }
    else if (functions.empty() || roll < 5) {
        line = definition();
    }
    else if (roll < 8) {
        line = call(uniform(0, 2));
    }
    else {
        line = expression(uniform(2, 4), variables);
    }
    return introduceError(std::move(line));
}

std::vector<std::string> ScriptGenerator::generate(std::size_t count) {
    std::vector<std::string> lines;
    lines.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        lines.push_back(nextLine());
    }
    return lines;
}

// Вносит ошибку в строку с малой вероятностью
std::string ScriptGenerator::introduceError(std::string line) {
    if (!chance(kErrorProbability) || line.size() < 2) {
        return line;
    }

    switch (uniform(0, 2)) {
    case 0: {
        // Незакрытая скобка
        std::size_t pos = static_cast<std::size_t>(uniform(0, static_cast<int>(line.size()) - 1));
        line.insert(pos, "(");
        return line;
    }
    case 1:
        // Недопустимый символ в середине
        line.insert(line.size() / 2, 1, "$#@?"[uniform(0, 3)]);
        return line;
    default:
        // Оборванный хвост
        return line + " +";
    }
}

} // namespace calc
