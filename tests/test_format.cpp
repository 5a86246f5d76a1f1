#include <gtest/gtest.h>

#include "number_format.hpp"

#include <cmath>
#include <limits>
#include <sstream>

using namespace calc;

TEST(FormatTest, IntegerIsFullDecimal) {
    EXPECT_EQ(formatNumber(Number(Integer("123456789012345678901234567890"))),
              "123456789012345678901234567890");
    EXPECT_EQ(formatNumber(Number::integer(-42)), "-42");
}

TEST(FormatTest, RationalAsFraction) {
    EXPECT_EQ(formatNumber(Number::rational(1, 3)), "1/3");
    EXPECT_EQ(formatNumber(Number::rational(-6, 4)), "-3/2");
    EXPECT_EQ(formatNumber(Number::rational(4, 2)), "2");
}

TEST(FormatTest, RationalAsDecimal) {
    EXPECT_EQ(formatNumberDecimal(Number::rational(1, 4)), "0.25");
    EXPECT_EQ(formatNumberDecimal(Number::rational(6, 3)), "2");
    EXPECT_EQ(formatNumberDecimal(Number::integer(7)), "7");
}

TEST(FormatTest, Float) {
    EXPECT_EQ(formatFloat(1.5), "1.5");
    EXPECT_EQ(formatFloat(2.0), "2");
    EXPECT_EQ(formatFloat(-2.0), "-2");
    EXPECT_EQ(formatFloat(0.1), "0.1");
    EXPECT_EQ(formatFloat(1e20), "1e+20");
}

TEST(FormatTest, FloatSpecialValues) {
    EXPECT_EQ(formatFloat(std::numeric_limits<double>::quiet_NaN()), "NaN");
    EXPECT_EQ(formatFloat(std::numeric_limits<double>::infinity()), "inf");
    EXPECT_EQ(formatFloat(-std::numeric_limits<double>::infinity()), "-inf");
}

TEST(FormatTest, Complex) {
    EXPECT_EQ(formatComplex(Complex(1.0, 2.0)), "1 + 2i");
    EXPECT_EQ(formatComplex(Complex(1.0, -2.5)), "1 - 2.5i");
    EXPECT_EQ(formatComplex(Complex(0.0, -1.0)), "-1i");
    EXPECT_EQ(formatComplex(Complex(0.0, 3.0)), "3i");
    EXPECT_EQ(formatComplex(Complex(3.0, 0.0)), "3");
    EXPECT_EQ(formatComplex(Complex(3.0, 1e-12)), "3");
}

TEST(FormatTest, IntegerInOtherBases) {
    EXPECT_EQ(formatInteger(Integer(255), 16), "0xFF");
    EXPECT_EQ(formatInteger(Integer(5), 2), "0b101");
    EXPECT_EQ(formatInteger(Integer(8), 8), "0o10");
    EXPECT_EQ(formatInteger(Integer(0), 16), "0x0");
    EXPECT_EQ(formatInteger(Integer(-255), 16), "-0xFF");
    EXPECT_EQ(formatInteger(Integer(-5), 2), "-0b101");

    Integer large;
    mpz_ui_pow_ui(large.get_mpz_t(), 2, 100);
    EXPECT_EQ(formatInteger(large, 16), "0x10000000000000000000000000");
    EXPECT_EQ(formatInteger(Integer(35), 36), "z");
}

TEST(FormatTest, StreamShowsType) {
    std::ostringstream stream;
    stream << Number::rational(1, 3);
    EXPECT_EQ(stream.str(), "1/3 [Rational]");

    std::ostringstream real;
    real << Number::real(0.5);
    EXPECT_EQ(real.str(), "0.5 [Float]");
}
