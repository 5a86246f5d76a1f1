#pragma once

#include <gmpxx.h>

#include <compare>
#include <complex>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace calc {

using Integer = mpz_class;            // Целое произвольной точности
using Rational = mpq_class;           // Дробь произвольной точности
using Complex = std::complex<double>; // Комплексное число двойной точности

// Числовые домены в порядке продвижения:
// Integer < Rational < Float < Complex
enum class NumberKind { Integer, Rational, Float, Complex };

// Неизменяемое числовое значение: закрытый вариант над четырьмя доменами.
class Number {
public:
    // Целый ноль
    Number() : value(Integer(0)) {}

    explicit Number(Integer integer) : value(std::move(integer)) {}
    explicit Number(Rational rational);
    explicit Number(double real) : value(real) {}
    explicit Number(Complex complex) : value(complex) {}

    static Number integer(long value) { return Number(Integer(value)); }
    static Number rational(long numerator, long denominator);
    static Number real(double value) { return Number(value); }
    static Number complex(double re, double im) { return Number(Complex(re, im)); }

    NumberKind kind() const { return static_cast<NumberKind>(value.index()); }

    bool isInteger() const { return kind() == NumberKind::Integer; }
    bool isRational() const { return kind() == NumberKind::Rational; }
    bool isFloat() const { return kind() == NumberKind::Float; }
    bool isComplex() const { return kind() == NumberKind::Complex; }

    // Доступ к значению конкретного домена.
    // Выбрасывает std::bad_variant_access при несовпадении домена.
    const Integer& asInteger() const { return std::get<Integer>(value); }
    const Rational& asRational() const { return std::get<Rational>(value); }
    double asFloat() const { return std::get<double>(value); }
    const Complex& asComplex() const { return std::get<Complex>(value); }

    // Вещественное значение; пусто для комплексного числа с ненулевой мнимой частью
    std::optional<double> toReal() const;

    // Точное представление дробью (только Integer и Rational)
    Rational toRational() const;

    Complex toComplex() const;

    bool isZero() const;

    // Имя домена: "Integer", "Rational", "Float", "Complex"
    const char* typeName() const;

    // Структурное равенство: тот же домен и то же значение
    friend bool operator==(const Number& lhs, const Number& rhs) { return lhs.value == rhs.value; }

private:
    std::variant<Integer, Rational, double, Complex> value;
};

// Значения разделяются между областями видимости без копирования
using NumberPtr = std::shared_ptr<const Number>;

inline NumberPtr makeNumber(Number number) {
    return std::make_shared<const Number>(std::move(number));
}

// Арифметика с попарным продвижением типов. Никогда не бросает исключений:
// деление и остаток на ноль дают Float (inf или NaN).
Number operator+(const Number& lhs, const Number& rhs);
Number operator-(const Number& lhs, const Number& rhs);
Number operator*(const Number& lhs, const Number& rhs);
Number operator/(const Number& lhs, const Number& rhs);
Number operator%(const Number& lhs, const Number& rhs);
Number operator-(const Number& operand);

// Возведение в степень (оператор ^)
Number power(const Number& base, const Number& exponent);

// Факториал неотрицательного целого.
// Выбрасывает EngineError (DomainError) для любого другого аргумента.
Number factorial(const Number& operand);

// Сравнение через продвижение к общему домену.
// Комплексные значения несравнимы: результат std::partial_ordering::unordered.
std::partial_ordering compare(const Number& lhs, const Number& rhs);

// Преобразование целого в double с насыщением до бесконечности
double integerToDouble(const Integer& value);

} // namespace calc
