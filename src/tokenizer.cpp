#include "tokenizer.hpp"

#include <cctype>
#include <charconv>
#include <climits>
#include <limits>
#include <system_error>

namespace calc {

namespace {
bool isDigit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

bool isHexDigit(char ch) {
    return std::isxdigit(static_cast<unsigned char>(ch)) != 0;
}

bool isBinaryDigit(char ch) {
    return ch == '0' || ch == '1';
}

// Значение литерала вне диапазона double: inf при переполнении, 0 при потере порядка.
// Знак порядка старшей значащей цифры решает, что именно произошло.
double outOfRangeValue(const std::string& text) {
    std::size_t mark = text.find_first_of("eE");
    std::string mantissa = text.substr(0, mark);

    long long exponent = 0;
    if (mark != std::string::npos) {
        const char* first = text.data() + mark + 1;
        const char* last = text.data() + text.size();
        if (*first == '+') {
            ++first;
        }
        auto [end, error] = std::from_chars(first, last, exponent);
        if (error == std::errc::result_out_of_range) {
            exponent = (*first == '-') ? LLONG_MIN / 2 : LLONG_MAX / 2;
        }
    }

    std::size_t point = mantissa.find('.');
    std::string digits = mantissa;
    if (point != std::string::npos) {
        digits.erase(point, 1);
    }
    else {
        point = mantissa.size();
    }
    std::size_t leading = digits.find_first_not_of('0');
    if (leading == std::string::npos) {
        return 0.0;
    }

    long long magnitude = static_cast<long long>(point) - static_cast<long long>(leading) + exponent;
    return magnitude > 0 ? std::numeric_limits<double>::infinity() : 0.0;
}

// Разбор вещественного литерала, не зависящий от локали
double parseFloatLiteral(const std::string& text) {
    double value = 0.0;
    auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (error == std::errc::result_out_of_range) {
        return outOfRangeValue(text);
    }
    return value;
}
}

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {}

// Выделяет один токен начиная с текущей позиции
Token Tokenizer::next() {
    skipWhitespace();
    if (isAtEnd()) {
        return {TokenType::End, "", index, Number()};
    }

    char ch = peek();
    switch (ch) {
    // Односимвольные токены
    case '+':
        return makeSymbol(TokenType::Plus);
    case '-':
        return makeSymbol(TokenType::Minus);
    case '*':
        return makeSymbol(TokenType::Star);
    case '/':
        return makeSymbol(TokenType::Slash);
    case '^':
        return makeSymbol(TokenType::Caret);
    case '%':
        return makeSymbol(TokenType::Percent);
    case '!':
        return makeSymbol(TokenType::Bang);
    case '(':
        return makeSymbol(TokenType::LParen);
    case ')':
        return makeSymbol(TokenType::RParen);
    case ',':
        return makeSymbol(TokenType::Comma);
    case '=':
        return makeSymbol(TokenType::Equals);
    default:
        // Многосимвольные токены (числа и идентификаторы)
        if (isDigit(ch)) {
            return makeNumber();
        }
        if (std::isalpha(static_cast<unsigned char>(ch))) {
            return makeIdentifier();
        }
        // Ошибку отклонит парсер
        return makeSymbol(TokenType::Error);
    }
}

std::vector<Token> Tokenizer::tokenize() {
    index = 0;
    std::vector<Token> tokens;
    while (true) {
        tokens.push_back(next());
        if (tokens.back().type == TokenType::End) {
            break;
        }
    }
    return tokens;
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek(std::size_t offset) const {
    if (index + offset >= source.size()) {
        return '\0';
    }
    return source[index + offset];
}

char Tokenizer::advance() {
    return source[index++];
}

// Пропуск всех незначащих символов
void Tokenizer::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        advance();
    }
}

Token Tokenizer::makeSymbol(TokenType type) {
    std::size_t start = index;
    char ch = advance();
    return {type, std::string(1, ch), start, Number()};
}

// Разбор числового литерала
// [0-9]+\.[0-9]*(exp)? и [0-9]+exp: вещественные, [0-9]+: целое
Token Tokenizer::makeNumber() {
    if (peek() == '0' && peek(1) == 'x' && isHexDigit(peek(2))) {
        return makeRadixInteger(16);
    }
    if (peek() == '0' && peek(1) == 'b' && isBinaryDigit(peek(2))) {
        return makeRadixInteger(2);
    }

    std::size_t start = index;
    while (isDigit(peek())) {
        advance();
    }

    bool isFloat = false;
    if (peek() == '.') {
        isFloat = true;
        advance();
        while (isDigit(peek())) {
            advance();
        }
    }

    // Неполный показатель ("2e", "1.5e+") не входит в число
    std::size_t exponent = exponentLength(0);
    if (exponent > 0) {
        isFloat = true;
        index += exponent;
    }

    std::string text = source.substr(start, index - start);
    if (isFloat) {
        return {TokenType::Float, text, start, Number(parseFloatLiteral(text))};
    }
    return {TokenType::Integer, text, start, Number(Integer(text, 10))};
}

Token Tokenizer::makeRadixInteger(int base) {
    std::size_t start = index;
    index += 2; // префикс 0x или 0b
    std::size_t digitsStart = index;
    while (base == 16 ? isHexDigit(peek()) : isBinaryDigit(peek())) {
        advance();
    }

    std::string digits = source.substr(digitsStart, index - digitsStart);
    return {TokenType::Integer, source.substr(start, index - start), start,
            Number(Integer(digits, base))};
}

// Разбор идентификатора: [A-Za-z][A-Za-z0-9_]*
// Регистр сохраняется: имена чувствительны к регистру
Token Tokenizer::makeIdentifier() {
    std::size_t start = index;
    while (!isAtEnd()) {
        char ch = peek();
        if (std::isalnum(static_cast<unsigned char>(ch)) || ch == '_') {
            advance();
        } else {
            break;
        }
    }

    return {TokenType::Identifier, source.substr(start, index - start), start, Number()};
}

std::size_t Tokenizer::exponentLength(std::size_t offset) const {
    char marker = peek(offset);
    if (marker != 'e' && marker != 'E') {
        return 0;
    }
    std::size_t length = 1;
    char sign = peek(offset + length);
    if (sign == '+' || sign == '-') {
        ++length;
    }
    if (!isDigit(peek(offset + length))) {
        return 0;
    }
    while (isDigit(peek(offset + length))) {
        ++length;
    }
    return length;
}

const char* tokenTypeName(TokenType type) {
    switch (type) {
    case TokenType::Plus:
        return "'+'";
    case TokenType::Minus:
        return "'-'";
    case TokenType::Star:
        return "'*'";
    case TokenType::Slash:
        return "'/'";
    case TokenType::Caret:
        return "'^'";
    case TokenType::Percent:
        return "'%'";
    case TokenType::Bang:
        return "'!'";
    case TokenType::LParen:
        return "'('";
    case TokenType::RParen:
        return "')'";
    case TokenType::Comma:
        return "','";
    case TokenType::Equals:
        return "'='";
    case TokenType::Float:
        return "вещественное число";
    case TokenType::Integer:
        return "целое число";
    case TokenType::Identifier:
        return "идентификатор";
    case TokenType::End:
        return "конец выражения";
    case TokenType::Error:
        return "недопустимый символ";
    }
    return "?";
}

} // namespace calc
