#include "function_registry.hpp"

#include <cmath>
#include <complex>

namespace calc {

namespace {
using ComplexFunction = Complex (*)(const Complex&);

// Примитив одного аргумента, вычисляемый в комплексной плоскости
void addComplexFunction(FunctionRegistry& registry, const std::string& name, ComplexFunction function) {
    registry.add(name, [name, function](const Arguments& arguments) {
        expectArity(arguments, 1, name);
        return Number(function(arguments[0].toComplex()));
    });
}
}

// Тригонометрические и гиперболические функции
void registerTrigonometryFunctions(FunctionRegistry& registry) {
    addComplexFunction(registry, "sin", [](const Complex& z) { return std::sin(z); });
    addComplexFunction(registry, "cos", [](const Complex& z) { return std::cos(z); });
    addComplexFunction(registry, "tan", [](const Complex& z) { return std::tan(z); });
    addComplexFunction(registry, "asin", [](const Complex& z) { return std::asin(z); });
    addComplexFunction(registry, "acos", [](const Complex& z) { return std::acos(z); });
    addComplexFunction(registry, "atan", [](const Complex& z) { return std::atan(z); });

    addComplexFunction(registry, "sinh", [](const Complex& z) { return std::sinh(z); });
    addComplexFunction(registry, "cosh", [](const Complex& z) { return std::cosh(z); });
    addComplexFunction(registry, "tanh", [](const Complex& z) { return std::tanh(z); });
}

} // namespace calc
