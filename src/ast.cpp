#include "ast.hpp"

#include "context.hpp"
#include "errors.hpp"
#include "number_format.hpp"

#include <vector>

namespace calc {

Number applyBinary(BinaryOp op, const Number& lhs, const Number& rhs) {
    switch (op) {
    case BinaryOp::Add:
        return lhs + rhs;
    case BinaryOp::Sub:
        return lhs - rhs;
    case BinaryOp::Mul:
        return lhs * rhs;
    case BinaryOp::Div:
        return lhs / rhs;
    case BinaryOp::Mod:
        return lhs % rhs;
    case BinaryOp::Pow:
        return power(lhs, rhs);
    }
    throw EngineError::generic("Неизвестная бинарная операция");
}

const char* binaryOpSymbol(BinaryOp op) {
    switch (op) {
    case BinaryOp::Add:
        return "+";
    case BinaryOp::Sub:
        return "-";
    case BinaryOp::Mul:
        return "*";
    case BinaryOp::Div:
        return "/";
    case BinaryOp::Mod:
        return "%";
    case BinaryOp::Pow:
        return "^";
    }
    return "?";
}

AstPtr NumberNode::clone() const {
    return std::make_unique<NumberNode>(*value);
}

std::string NumberNode::toString() const {
    return formatNumber(*value);
}

// Поиск переменной во всей цепочке областей видимости
NumberPtr VariableNode::evaluate(Context& context) const {
    NumberPtr value = context.lookup(variableName);
    if (!value) {
        throw EngineError::undefinedVariable(variableName);
    }
    return value;
}

AstPtr VariableNode::clone() const {
    return std::make_unique<VariableNode>(variableName);
}

std::string VariableNode::toString() const {
    return variableName;
}

// Вычисление цепочки бинарных операций.
// Сначала итеративно спускаемся по левому краю, собирая узлы,
// затем вычисляем самый левый операнд и применяем операции в обратном порядке
// сбора, то есть слева направо. Глубина стека вызовов не зависит от длины цепочки.
// Правые операнды вычисляются обычной рекурсией.
NumberPtr BinaryNode::evaluate(Context& context) const {
    std::vector<const BinaryNode*> chain;
    const AstNode* current = this;
    while (const auto* binary = dynamic_cast<const BinaryNode*>(current)) {
        chain.push_back(binary);
        current = binary->leftOperand.get();
    }

    NumberPtr result = current->evaluate(context);

    for (auto node = chain.rbegin(); node != chain.rend(); ++node) {
        NumberPtr right = (*node)->rightOperand->evaluate(context);
        result = makeNumber(applyBinary((*node)->operation, *result, *right));
    }
    return result;
}

// Левый край цепочки освобождается в цикле: каждый снимаемый узел уже без левого потомка
BinaryNode::~BinaryNode() {
    while (auto* binary = dynamic_cast<BinaryNode*>(leftOperand.get())) {
        AstPtr next = std::move(binary->leftOperand);
        leftOperand = std::move(next);
    }
}

AstPtr BinaryNode::clone() const {
    std::vector<const BinaryNode*> chain;
    const AstNode* current = this;
    while (const auto* binary = dynamic_cast<const BinaryNode*>(current)) {
        chain.push_back(binary);
        current = binary->leftOperand.get();
    }

    AstPtr result = current->clone();
    for (auto node = chain.rbegin(); node != chain.rend(); ++node) {
        result = std::make_unique<BinaryNode>((*node)->operation, std::move(result),
                                              (*node)->rightOperand->clone());
    }
    return result;
}

std::string BinaryNode::toString() const {
    std::vector<const BinaryNode*> chain;
    std::string text;
    const AstNode* current = this;
    while (const auto* binary = dynamic_cast<const BinaryNode*>(current)) {
        chain.push_back(binary);
        text += std::string("(") + binaryOpSymbol(binary->operation) + " ";
        current = binary->leftOperand.get();
    }

    text += current->toString();
    for (auto node = chain.rbegin(); node != chain.rend(); ++node) {
        text += " " + (*node)->rightOperand->toString() + ")";
    }
    return text;
}

// Вычисление унарной операции
NumberPtr UnaryNode::evaluate(Context& context) const {
    NumberPtr value = operand->evaluate(context);
    switch (operation) {
    case UnaryOp::Negate:
        return makeNumber(-*value); // Унарный минус сохраняет домен
    case UnaryOp::Factorial:
        return makeNumber(factorial(*value));
    }
    throw EngineError::generic("Неизвестная унарная операция");
}

AstPtr UnaryNode::clone() const {
    return std::make_unique<UnaryNode>(operation, operand->clone());
}

std::string UnaryNode::toString() const {
    const char* name = operation == UnaryOp::Negate ? "neg" : "!";
    return std::string("(") + name + " " + operand->toString() + ")";
}

// Протокол вызова:
// 1. аргументы вычисляются в области вызывающего, слева направо;
// 2. пользовательская функция: проверка арности, новая область,
//    параметры определяются в ней принудительно, вычисление тела,
//    удаление области (ScopeGuard, в том числе при исключении);
// 3. иначе вызов примитива из реестра.
NumberPtr FunctionCallNode::evaluate(Context& context) const {
    std::vector<NumberPtr> values;
    values.reserve(argumentList.size());
    for (const auto& argument : argumentList) {
        values.push_back(argument->evaluate(context));
    }

    // Копия указателя удерживает функцию, даже если тело её переопределит
    if (std::shared_ptr<const UserFunction> function = context.findFunction(functionName)) {
        if (values.size() != function->arity()) {
            throw EngineError::argumentMismatch(functionName, function->arity());
        }

        Context::ScopeGuard scope(context);
        for (std::size_t i = 0; i < values.size(); ++i) {
            context.define(function->parameters[i], values[i]);
        }
        return function->body->evaluate(context);
    }

    Arguments arguments;
    arguments.reserve(values.size());
    for (const auto& value : values) {
        arguments.push_back(*value);
    }
    return makeNumber(context.registry().call(functionName, arguments));
}

AstPtr FunctionCallNode::clone() const {
    std::vector<AstPtr> arguments;
    arguments.reserve(argumentList.size());
    for (const auto& argument : argumentList) {
        arguments.push_back(argument->clone());
    }
    return std::make_unique<FunctionCallNode>(functionName, std::move(arguments));
}

std::string FunctionCallNode::toString() const {
    std::string result = "(call " + functionName;
    for (const auto& argument : argumentList) {
        result += " " + argument->toString();
    }
    return result + ")";
}

NumberPtr AssignmentNode::evaluate(Context& context) const {
    NumberPtr value = valueExpression->evaluate(context);
    context.assign(variableName, value);
    return value;
}

AstPtr AssignmentNode::clone() const {
    return std::make_unique<AssignmentNode>(variableName, valueExpression->clone());
}

std::string AssignmentNode::toString() const {
    return "(= " + variableName + " " + valueExpression->toString() + ")";
}

NumberPtr FunctionDefNode::evaluate(Context& context) const {
    auto function = std::make_shared<UserFunction>();
    function->parameters = parameterNames;
    function->body = bodyExpression->clone();
    context.defineFunction(functionName, std::move(function));
    return makeNumber(Number());
}

AstPtr FunctionDefNode::clone() const {
    return std::make_unique<FunctionDefNode>(functionName, parameterNames, bodyExpression->clone());
}

std::string FunctionDefNode::toString() const {
    std::string result = "(def " + functionName + " (";
    for (std::size_t i = 0; i < parameterNames.size(); ++i) {
        if (i > 0) {
            result += " ";
        }
        result += parameterNames[i];
    }
    return result + ") " + bodyExpression->toString() + ")";
}

} // namespace calc
