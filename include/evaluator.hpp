#pragma once

#include <memory>
#include <string>

#include "ast.hpp"
#include "context.hpp"
#include "number.hpp"

namespace calc {

// Вычисляет AST в контексте. Может изменять контекст.
// Выбрасывает EngineError при первой ошибке.
NumberPtr eval(const AstNode& expression, Context& context);

// parse + eval
NumberPtr evaluate(const std::string& text, Context& context);

// Класс-фасад сессии вычислений.
// Объединяет этапы токенизации, парсинга и вычисления AST
// и хранит собственный контекст: переменные и функции сохраняются
// между вызовами evaluate. Один экземпляр на сессию, без разделения между потоками.
class ExpressionEvaluator {
public:
    ExpressionEvaluator() = default;
    explicit ExpressionEvaluator(std::shared_ptr<const FunctionRegistry> registry);

    // Вычисляет значение выражения, заданного строкой.
    // Пример: "2 + 2 * 2" -> 6, "f(x) = x^2" -> 0, "f(3)" -> 9
    // Выбрасывает EngineError в случае ошибок синтаксиса или вычисления.
    NumberPtr evaluate(const std::string& expression);

    Context& context() { return sessionContext; }
    const Context& context() const { return sessionContext; }

    // Начинает сессию заново с пустым контекстом
    void reset();

private:
    std::shared_ptr<const FunctionRegistry> primitives = FunctionRegistry::builtin();
    Context sessionContext{primitives};
};

} // namespace calc
