#include <gtest/gtest.h>

#include "tokenizer.hpp"

#include <clocale>
#include <cmath>
#include <vector>

using namespace calc;

namespace {
std::vector<TokenType> typesOf(const std::string& text) {
    std::vector<TokenType> types;
    for (const auto& token : Tokenizer(text).tokenize()) {
        types.push_back(token.type);
    }
    return types;
}
}

TEST(LexerTest, OperatorsAndPunctuation) {
    std::vector<TokenType> expected = {
        TokenType::Plus, TokenType::Minus, TokenType::Star, TokenType::Slash, TokenType::Caret,
        TokenType::Percent, TokenType::Bang, TokenType::LParen, TokenType::RParen,
        TokenType::Comma, TokenType::Equals, TokenType::End
    };
    EXPECT_EQ(typesOf("+ - * / ^ % ! ( ) , ="), expected);
}

TEST(LexerTest, SkipsWhitespace) {
    auto tokens = Tokenizer(" \t1\n+\r 2 ").tokenize();
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].type, TokenType::Integer);
    EXPECT_EQ(tokens[1].type, TokenType::Plus);
    EXPECT_EQ(tokens[2].type, TokenType::Integer);
    EXPECT_EQ(tokens[3].type, TokenType::End);
}

TEST(LexerTest, DecimalIntegerIsArbitraryPrecision) {
    auto tokens = Tokenizer("123456789012345678901234567890").tokenize();
    ASSERT_EQ(tokens[0].type, TokenType::Integer);
    ASSERT_TRUE(tokens[0].value.isInteger());
    EXPECT_EQ(tokens[0].value.asInteger(), Integer("123456789012345678901234567890"));
}

TEST(LexerTest, HexAndBinaryLiterals) {
    auto tokens = Tokenizer("0x1F 0b101 0xff").tokenize();
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].type, TokenType::Integer);
    EXPECT_EQ(tokens[0].value, Number::integer(31));
    EXPECT_EQ(tokens[0].text, "0x1F");
    EXPECT_EQ(tokens[1].value, Number::integer(5));
    EXPECT_EQ(tokens[2].value, Number::integer(255));
}

TEST(LexerTest, PrefixWithoutDigitsIsNotRadix) {
    // "0x" без шестнадцатеричной цифры: ноль и идентификатор
    auto tokens = Tokenizer("0x").tokenize();
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, TokenType::Integer);
    EXPECT_EQ(tokens[0].value, Number::integer(0));
    EXPECT_EQ(tokens[1].type, TokenType::Identifier);
    EXPECT_EQ(tokens[1].text, "x");

    auto binary = Tokenizer("0b2").tokenize();
    EXPECT_EQ(binary[0].value, Number::integer(0));
    EXPECT_EQ(binary[1].type, TokenType::Identifier);
    EXPECT_EQ(binary[1].text, "b2");
}

TEST(LexerTest, FloatLiterals) {
    auto tokens = Tokenizer("2.5 7. 1e3 2.5E-2 3e+1").tokenize();
    ASSERT_EQ(tokens.size(), 6u);
    for (std::size_t i = 0; i < 5; ++i) {
        EXPECT_EQ(tokens[i].type, TokenType::Float) << tokens[i].text;
    }
    EXPECT_DOUBLE_EQ(tokens[0].value.asFloat(), 2.5);
    EXPECT_DOUBLE_EQ(tokens[1].value.asFloat(), 7.0);
    EXPECT_DOUBLE_EQ(tokens[2].value.asFloat(), 1000.0);
    EXPECT_DOUBLE_EQ(tokens[3].value.asFloat(), 0.025);
    EXPECT_DOUBLE_EQ(tokens[4].value.asFloat(), 30.0);
}

TEST(LexerTest, FloatLiteralsOutsideDoubleRange) {
    auto tokens = Tokenizer("1e400 1e-400 0.0e99999999999999999999 12.5e99999999999999999999").tokenize();
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_TRUE(std::isinf(tokens[0].value.asFloat()));
    EXPECT_EQ(tokens[1].value.asFloat(), 0.0);
    EXPECT_EQ(tokens[2].value.asFloat(), 0.0);
    EXPECT_TRUE(std::isinf(tokens[3].value.asFloat()));
}

TEST(LexerTest, FloatLiteralIgnoresNumericLocale) {
    // В этих локалях десятичный разделитель - запятая
    if (!std::setlocale(LC_NUMERIC, "de_DE.UTF-8") && !std::setlocale(LC_NUMERIC, "ru_RU.UTF-8")) {
        GTEST_SKIP() << "нет локали с десятичной запятой";
    }
    auto tokens = Tokenizer("1.5 2.25e1").tokenize();
    std::setlocale(LC_NUMERIC, "C");

    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_DOUBLE_EQ(tokens[0].value.asFloat(), 1.5);
    EXPECT_DOUBLE_EQ(tokens[1].value.asFloat(), 22.5);
}

TEST(LexerTest, IncompleteExponentIsNotPartOfNumber) {
    std::vector<TokenType> expected = { TokenType::Integer, TokenType::Identifier, TokenType::End };
    EXPECT_EQ(typesOf("2e"), expected);

    std::vector<TokenType> withSign = {
        TokenType::Float, TokenType::Identifier, TokenType::Plus, TokenType::End
    };
    EXPECT_EQ(typesOf("1.5e+"), withSign);
}

TEST(LexerTest, IdentifiersKeepCase) {
    auto tokens = Tokenizer("ABS var_1 x2").tokenize();
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].text, "ABS");
    EXPECT_EQ(tokens[1].text, "var_1");
    EXPECT_EQ(tokens[2].text, "x2");
}

TEST(LexerTest, UnknownCharacterIsErrorToken) {
    auto tokens = Tokenizer("1 $ 2").tokenize();
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[1].type, TokenType::Error);
    EXPECT_EQ(tokens[1].text, "$");
    EXPECT_EQ(tokens[1].position, 2u);
}

TEST(LexerTest, NextAfterEndKeepsReturningEnd) {
    Tokenizer tokenizer("7");
    EXPECT_EQ(tokenizer.next().type, TokenType::Integer);
    EXPECT_EQ(tokenizer.next().type, TokenType::End);
    EXPECT_EQ(tokenizer.next().type, TokenType::End);
}

TEST(LexerTest, RelexingYieldsSameSequence) {
    Tokenizer tokenizer("f(x) = 0x10 * x^2 + 1.5");
    auto first = tokenizer.tokenize();
    auto second = tokenizer.tokenize();
    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].type, second[i].type);
        EXPECT_EQ(first[i].text, second[i].text);
        EXPECT_EQ(first[i].position, second[i].position);
        EXPECT_EQ(first[i].value, second[i].value);
    }
}
