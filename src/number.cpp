#include "number.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace calc {

namespace {
// Порог, после которого целое уже не представимо в double
constexpr std::size_t kMaxDoubleBits = 1024;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kInfinity = std::numeric_limits<double>::infinity();

double rationalToDouble(const Rational& value) {
    const long numeratorBits = static_cast<long>(mpz_sizeinbase(value.get_num_mpz_t(), 2));
    const long denominatorBits = static_cast<long>(mpz_sizeinbase(value.get_den_mpz_t(), 2));
    if (numeratorBits - denominatorBits > static_cast<long>(kMaxDoubleBits)) {
        return sgn(value) < 0 ? -kInfinity : kInfinity;
    }
    return value.get_d();
}

// Вещественное значение для продвижения к Float.
// Комплексное число с ненулевой мнимой частью даёт NaN.
double toFloat(const Number& number) {
    std::optional<double> real = number.toReal();
    return real ? *real : kNaN;
}

NumberKind commonKind(const Number& lhs, const Number& rhs) {
    return std::max(lhs.kind(), rhs.kind());
}

// Применяет операцию к паре, предварительно приведённой к общему домену
template <typename Operation>
Number applyPromoted(const Number& lhs, const Number& rhs, Operation operation) {
    switch (commonKind(lhs, rhs)) {
    case NumberKind::Integer:
        return Number(Integer(operation(lhs.asInteger(), rhs.asInteger())));
    case NumberKind::Rational:
        return Number(Rational(operation(lhs.toRational(), rhs.toRational())));
    case NumberKind::Float:
        return Number(static_cast<double>(operation(toFloat(lhs), toFloat(rhs))));
    case NumberKind::Complex:
        return Number(Complex(operation(lhs.toComplex(), rhs.toComplex())));
    }
    return Number(kNaN);
}

// Целая часть частного с отбрасыванием дробной части (к нулю)
Integer truncate(const Rational& value) {
    Integer result;
    mpz_tdiv_q(result.get_mpz_t(), value.get_num_mpz_t(), value.get_den_mpz_t());
    return result;
}
} // namespace

Number::Number(Rational rational) : value(std::move(rational)) {
    std::get<Rational>(value).canonicalize();
}

Number Number::rational(long numerator, long denominator) {
    return Number(Rational(Integer(numerator), Integer(denominator)));
}

std::optional<double> Number::toReal() const {
    switch (kind()) {
    case NumberKind::Integer:
        return integerToDouble(asInteger());
    case NumberKind::Rational:
        return rationalToDouble(asRational());
    case NumberKind::Float:
        return asFloat();
    case NumberKind::Complex:
        if (asComplex().imag() == 0.0) {
            return asComplex().real();
        }
        return std::nullopt;
    }
    return std::nullopt;
}

Rational Number::toRational() const {
    if (isInteger()) {
        return Rational(asInteger());
    }
    return asRational();
}

Complex Number::toComplex() const {
    switch (kind()) {
    case NumberKind::Integer:
        return Complex(integerToDouble(asInteger()), 0.0);
    case NumberKind::Rational:
        return Complex(rationalToDouble(asRational()), 0.0);
    case NumberKind::Float:
        return Complex(asFloat(), 0.0);
    case NumberKind::Complex:
        return asComplex();
    }
    return Complex(kNaN, 0.0);
}

bool Number::isZero() const {
    switch (kind()) {
    case NumberKind::Integer:
        return sgn(asInteger()) == 0;
    case NumberKind::Rational:
        return sgn(asRational()) == 0;
    case NumberKind::Float:
        return asFloat() == 0.0;
    case NumberKind::Complex:
        return asComplex() == Complex(0.0, 0.0);
    }
    return false;
}

const char* Number::typeName() const {
    switch (kind()) {
    case NumberKind::Integer:
        return "Integer";
    case NumberKind::Rational:
        return "Rational";
    case NumberKind::Float:
        return "Float";
    case NumberKind::Complex:
        return "Complex";
    }
    return "Unknown";
}

double integerToDouble(const Integer& value) {
    if (mpz_sizeinbase(value.get_mpz_t(), 2) > kMaxDoubleBits) {
        return sgn(value) < 0 ? -kInfinity : kInfinity;
    }
    return value.get_d();
}

Number operator+(const Number& lhs, const Number& rhs) {
    return applyPromoted(lhs, rhs, [](const auto& l, const auto& r) { return l + r; });
}

Number operator-(const Number& lhs, const Number& rhs) {
    return applyPromoted(lhs, rhs, [](const auto& l, const auto& r) { return l - r; });
}

Number operator*(const Number& lhs, const Number& rhs) {
    return applyPromoted(lhs, rhs, [](const auto& l, const auto& r) { return l * r; });
}

// Integer / Integer всегда даёт точную дробь.
// Нулевой делитель для Integer и Rational даёт Float x / 0.0 вместо ошибки.
Number operator/(const Number& lhs, const Number& rhs) {
    switch (commonKind(lhs, rhs)) {
    case NumberKind::Integer:
    case NumberKind::Rational: {
        if (rhs.isZero()) {
            return Number(toFloat(lhs) / 0.0);
        }
        return Number(Rational(lhs.toRational() / rhs.toRational()));
    }
    case NumberKind::Float:
        return Number(toFloat(lhs) / toFloat(rhs));
    case NumberKind::Complex:
        return Number(lhs.toComplex() / rhs.toComplex());
    }
    return Number(kNaN);
}

// Остаток с отбрасыванием к нулю (знак делимого).
// Нулевой делитель даёт NaN, для комплексных чисел остаток не определён.
Number operator%(const Number& lhs, const Number& rhs) {
    switch (commonKind(lhs, rhs)) {
    case NumberKind::Integer:
        if (rhs.isZero()) {
            return Number(std::fmod(toFloat(lhs), 0.0));
        }
        return Number(Integer(lhs.asInteger() % rhs.asInteger()));
    case NumberKind::Rational: {
        if (rhs.isZero()) {
            return Number(std::fmod(toFloat(lhs), 0.0));
        }
        Rational left = lhs.toRational();
        Rational right = rhs.toRational();
        Rational quotient = left / right;
        return Number(Rational(left - right * Rational(truncate(quotient))));
    }
    case NumberKind::Float:
        return Number(std::fmod(toFloat(lhs), toFloat(rhs)));
    case NumberKind::Complex:
        return Number(kNaN);
    }
    return Number(kNaN);
}

Number operator-(const Number& operand) {
    switch (operand.kind()) {
    case NumberKind::Integer:
        return Number(Integer(-operand.asInteger()));
    case NumberKind::Rational:
        return Number(Rational(-operand.asRational()));
    case NumberKind::Float:
        return Number(-operand.asFloat());
    case NumberKind::Complex:
        return Number(-operand.asComplex());
    }
    return operand;
}

Number power(const Number& base, const Number& exponent) {
    if (!base.isInteger() || !exponent.isInteger()) {
        return Number(std::pow(base.toComplex(), exponent.toComplex()));
    }

    const Integer& b = base.asInteger();
    const Integer& e = exponent.asInteger();
    const Integer limit(std::numeric_limits<std::uint32_t>::max());

    if (sgn(e) >= 0) {
        if (e <= limit) {
            Integer result;
            mpz_pow_ui(result.get_mpz_t(), b.get_mpz_t(), e.get_ui());
            return Number(std::move(result));
        }
    } else {
        Integer magnitude = -e;
        if (magnitude <= limit) {
            Integer denominator;
            mpz_pow_ui(denominator.get_mpz_t(), b.get_mpz_t(), magnitude.get_ui());
            if (sgn(denominator) == 0) {
                return Number(kInfinity); // 0^-n
            }
            return Number(Rational(Integer(1), denominator));
        }
    }

    // Показатель вне диапазона: вычисление в double
    return Number(std::pow(integerToDouble(b), integerToDouble(e)));
}

Number factorial(const Number& operand) {
    if (!operand.isInteger()) {
        throw EngineError::domainError("Факториал определён только для целых чисел");
    }
    const Integer& n = operand.asInteger();
    if (sgn(n) < 0) {
        throw EngineError::domainError("Факториал отрицательного числа");
    }

    Integer accumulator(1);
    for (Integer k(1); k <= n; ++k) {
        accumulator *= k;
    }
    return Number(std::move(accumulator));
}

std::partial_ordering compare(const Number& lhs, const Number& rhs) {
    switch (commonKind(lhs, rhs)) {
    case NumberKind::Integer:
        return cmp(lhs.asInteger(), rhs.asInteger()) <=> 0;
    case NumberKind::Rational:
        return cmp(lhs.toRational(), rhs.toRational()) <=> 0;
    case NumberKind::Float:
        return toFloat(lhs) <=> toFloat(rhs);
    case NumberKind::Complex:
        return std::partial_ordering::unordered;
    }
    return std::partial_ordering::unordered;
}

} // namespace calc
