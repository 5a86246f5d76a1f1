#include "number_format.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>

namespace calc {

namespace {
// Граница, за которой целое значение double уже не помещается в int64
constexpr double kInt64Limit = 9.2e18;
}

std::string formatFloat(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-inf" : "inf";
    }

    double integral = 0.0;
    double fraction = std::modf(value, &integral);
    if (std::abs(fraction) < kFormatEpsilon && std::abs(value) < kInt64Limit) {
        return std::to_string(static_cast<std::int64_t>(std::llround(value)));
    }

    char buffer[64];
    auto [end, error] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (error != std::errc()) {
        return std::to_string(value);
    }
    return std::string(buffer, end);
}

std::string formatComplex(const Complex& value) {
    const double re = value.real();
    const double im = value.imag();

    if (std::abs(im) < kFormatEpsilon) {
        return formatFloat(re);
    }

    std::string imaginary = formatFloat(std::abs(im)) + "i";
    if (std::abs(re) < kFormatEpsilon) {
        return im < 0.0 ? "-" + imaginary : imaginary;
    }
    return formatFloat(re) + (im < 0.0 ? " - " : " + ") + imaginary;
}

std::string formatNumber(const Number& number) {
    switch (number.kind()) {
    case NumberKind::Integer:
        return number.asInteger().get_str();
    case NumberKind::Rational: {
        const Rational& rational = number.asRational();
        if (rational.get_den() == 1) {
            return rational.get_num().get_str();
        }
        return rational.get_num().get_str() + "/" + rational.get_den().get_str();
    }
    case NumberKind::Float:
        return formatFloat(number.asFloat());
    case NumberKind::Complex:
        return formatComplex(number.asComplex());
    }
    return "?";
}

std::string formatNumberDecimal(const Number& number) {
    if (number.isRational() && number.asRational().get_den() != 1) {
        return formatFloat(*number.toReal());
    }
    return formatNumber(number);
}

std::string formatInteger(const Integer& value, int base) {
    Integer magnitude = abs(value);
    std::string digits = magnitude.get_str(base);
    if (base == 16) {
        std::transform(digits.begin(), digits.end(), digits.begin(),
            [](unsigned char symbol) { return static_cast<char>(std::toupper(symbol)); });
    }

    std::string prefix;
    switch (base) {
    case 16:
        prefix = "0x";
        break;
    case 2:
        prefix = "0b";
        break;
    case 8:
        prefix = "0o";
        break;
    default:
        break;
    }
    return (sgn(value) < 0 ? "-" : "") + prefix + digits;
}

std::ostream& operator<<(std::ostream& stream, const Number& number) {
    return stream << formatNumber(number) << " [" << number.typeName() << "]";
}

} // namespace calc
