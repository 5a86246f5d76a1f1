#pragma once

#include <ostream>
#include <string>

#include "number.hpp"

namespace calc {

// Точность, с которой дробная и мнимая части считаются нулевыми
constexpr double kFormatEpsilon = 1e-10;

// Вещественное число: целые значения без дробной части,
// остальные кратчайшей записью, восстанавливающей значение
std::string formatFloat(double value);

// Комплексное число: "a + bi", "a - bi", "bi" или только вещественная часть
std::string formatComplex(const Complex& value);

// Integer: десятичная запись, Rational: "n/d" (или целое при d = 1)
std::string formatNumber(const Number& number);

// Как formatNumber, но нецелая дробь выводится десятичным приближением
std::string formatNumberDecimal(const Number& number);

// Целое в системе счисления base (2..36). Для 16, 2 и 8 добавляется префикс
// 0x, 0b или 0o, шестнадцатеричные цифры заглавные, знак ставится перед префиксом
std::string formatInteger(const Integer& value, int base);

std::ostream& operator<<(std::ostream& stream, const Number& number);

} // namespace calc
