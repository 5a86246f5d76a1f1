#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ast.hpp"
#include "token.hpp"
#include "tokenizer.hpp"

namespace calc {

// Класс синтаксического анализатора (парсера)
// Строит Абстрактное Синтаксическое Дерево (AST) из потока токенов.
// Реализует алгоритм Пратта (разбор по силе связывания операторов)
// с одним токеном предпросмотра.
//
// Сила связывания (левая, правая):
//   + -          1, 2   левоассоциативные
//   * / %        3, 4   левоассоциативные
//   неявное *    3, 4   значение, за которым сразу идёт '(' или идентификатор
//   ^            6, 5   правоассоциативный
//   унарный -    нет, 9
//   постфиксный! 11, нет
class Parser {
public:
    // Конструктор принимает исходную строку выражения
    explicit Parser(std::string sourceText);

    // Основной метод запуска парсинга
    // Возвращает указатель на корневой узел AST
    // Выбрасывает EngineError (ParserError) при синтаксических ошибках;
    // частичное дерево при ошибке не возвращается.
    AstPtr parse();

private:
    Tokenizer tokenizer; // Источник токенов
    Token current;       // Текущий токен (предпросмотр)

    // Возвращает текущий токен и считывает следующий
    Token advance();

    // Проверяет тип текущего токена
    bool check(TokenType type) const;

    // Если текущий токен имеет ожидаемый тип, сдвигает указатель и возвращает true
    bool match(TokenType type);

    // Разбор выражения с минимальной силой связывания minBindingPower
    AstPtr parseExpression(int minBindingPower);

    // Разбор префиксной части: числа, идентификаторы, скобки, унарный минус
    AstPtr parsePrefix();

    // Разбор формы, начинающейся с идентификатора:
    // переменная, присваивание, вызов или определение функции
    AstPtr parseIdentifier(const Token& identifier);

    // Разбор списка аргументов после '(' до ')' включительно
    std::vector<AstPtr> parseArguments();

    // Ошибка с указанием позиции токена
    [[noreturn]] void fail(const std::string& message, const Token& token) const;
};

// Разбор строки в AST
AstPtr parse(const std::string& text);

} // namespace calc
