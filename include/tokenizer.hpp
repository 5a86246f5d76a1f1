#pragma once

#include <string>
#include <vector>

#include "token.hpp"

namespace calc {

// Класс лексического анализатора (лексера)
// Преобразует входную строку с выражением в последовательность токенов.
// Токены выдаются по одному по запросу; пробельные символы ASCII пропускаются.
class Tokenizer {
public:
    // Конструктор принимает исходную строку выражения
    explicit Tokenizer(std::string sourceText);

    // Возвращает следующий токен.
    // После конца ввода бесконечно возвращает токен End.
    // Нераспознанный символ возвращается как токен Error, исключений нет.
    Token next();

    // Разбирает всю строку с начала.
    // Возвращает вектор токенов, заканчивающийся токеном End
    std::vector<Token> tokenize();

private:
    const std::string source; // Исходная строка
    std::size_t index = 0;    // Текущая позиция чтения

    // Проверка достижения конца строки
    bool isAtEnd() const;

    // Возвращает символ со смещением от текущей позиции ('\0' за концом строки)
    char peek(std::size_t offset = 0) const;

    // Возвращает текущий символ и сдвигает указатель вперед
    char advance();

    // Пропускает пробелы, табуляции и переводы строк
    void skipWhitespace();

    // Односимвольный токен
    Token makeSymbol(TokenType type);

    // Считывает число: целое, вещественное, 0x.., 0b..
    Token makeNumber();

    // Считывает целое в системе счисления 16 или 2 (префикс уже проверен)
    Token makeRadixInteger(int base);

    // Считывает идентификатор (имя переменной или функции)
    Token makeIdentifier();

    // Длина показателя степени [eE][+-]?[0-9]+ начиная с offset, 0 если его нет
    std::size_t exponentLength(std::size_t offset) const;
};

} // namespace calc
