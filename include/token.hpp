#pragma once

#include <cstddef>
#include <string>

#include "number.hpp"

namespace calc {

// Типы лексем
enum class TokenType {
    Plus,       // +
    Minus,      // -
    Star,       // *
    Slash,      // /
    Caret,      // ^
    Percent,    // % (остаток)
    Bang,       // ! (факториал)
    LParen,     // (
    RParen,     // )
    Comma,      // ,
    Equals,     // =
    Float,      // вещественный литерал
    Integer,    // целый литерал (десятичный, 0x, 0b)
    Identifier, // имя переменной или функции
    End,        // конец ввода
    Error       // нераспознанный символ
};

struct Token {
    TokenType type = TokenType::End;
    std::string text;       // Исходный текст лексемы
    std::size_t position = 0; // Смещение в исходной строке
    Number value;           // Значение для Float и Integer
};

// Имя типа лексемы для сообщений об ошибках
const char* tokenTypeName(TokenType type);

} // namespace calc
