#include "evaluator.hpp"

#include "parser.hpp"

namespace calc {

NumberPtr eval(const AstNode& expression, Context& context) {
    return expression.evaluate(context);
}

// Полный цикл обработки выражения:
// 1. Токенизация и парсинг (Parser) -> построение AST
// 2. Вычисление (evaluate) -> получение числового результата
NumberPtr evaluate(const std::string& text, Context& context) {
    AstPtr ast = parse(text);
    return eval(*ast, context);
}

ExpressionEvaluator::ExpressionEvaluator(std::shared_ptr<const FunctionRegistry> registry)
    : primitives(std::move(registry)), sessionContext(primitives) {}

NumberPtr ExpressionEvaluator::evaluate(const std::string& expression) {
    return calc::evaluate(expression, sessionContext);
}

void ExpressionEvaluator::reset() {
    sessionContext = Context(primitives);
}

} // namespace calc
