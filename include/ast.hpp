#pragma once

#include <memory>
#include <string>
#include <vector>

#include "number.hpp"

namespace calc {

class Context;

// Бинарные операции
enum class BinaryOp { Add, Sub, Mul, Div, Mod, Pow };

// Унарные операции
enum class UnaryOp { Negate, Factorial };

// Применяет бинарную операцию к двум уже вычисленным значениям
Number applyBinary(BinaryOp op, const Number& lhs, const Number& rhs);

// Символ операции: "+", "-", "*", "/", "%", "^"
const char* binaryOpSymbol(BinaryOp op);

// Базовый класс для узла абстрактного синтаксического дерева (AST).
// Узел владеет своими потомками единолично: дерево без разделения и циклов.
class AstNode {
public:
    virtual ~AstNode() = default;

    // Вычисляет значение поддерева в заданном контексте.
    // Может изменять контекст (присваивания, определения функций).
    // Выбрасывает EngineError при первой ошибке.
    virtual NumberPtr evaluate(Context& context) const = 0;

    // Глубокая копия поддерева
    virtual std::unique_ptr<AstNode> clone() const = 0;

    // Текстовое представление в префиксной скобочной форме, например "(+ 1 (* 2 x))"
    virtual std::string toString() const = 0;
};

using AstPtr = std::unique_ptr<AstNode>;

// Узел, представляющий числовую константу (лист дерева)
class NumberNode final : public AstNode {
public:
    explicit NumberNode(Number value) : value(makeNumber(std::move(value))) {}

    // Возвращает само число
    NumberPtr evaluate(Context&) const override { return value; }
    AstPtr clone() const override;
    std::string toString() const override;

    const Number& number() const { return *value; }

private:
    NumberPtr value;
};

// Ссылка на переменную по имени
class VariableNode final : public AstNode {
public:
    explicit VariableNode(std::string name) : variableName(std::move(name)) {}

    NumberPtr evaluate(Context& context) const override;
    AstPtr clone() const override;
    std::string toString() const override;

    const std::string& name() const { return variableName; }

private:
    std::string variableName;
};

// Узел бинарной арифметической операции (+, -, *, /, %, ^)
class BinaryNode final : public AstNode {
public:
    BinaryNode(BinaryOp op, AstPtr left, AstPtr right)
        : operation(op), leftOperand(std::move(left)), rightOperand(std::move(right)) {}
    ~BinaryNode() override;

    // Цепочка левоассоциативных операций вычисляется без рекурсии по левому краю
    NumberPtr evaluate(Context& context) const override;
    AstPtr clone() const override;
    std::string toString() const override;

    BinaryOp op() const { return operation; }
    const AstNode& left() const { return *leftOperand; }
    const AstNode& right() const { return *rightOperand; }

private:
    BinaryOp operation;        // Операция
    AstPtr leftOperand;        // Левый операнд
    AstPtr rightOperand;       // Правый операнд
};

// Узел унарной операции (унарный минус или факториал)
class UnaryNode final : public AstNode {
public:
    UnaryNode(UnaryOp op, AstPtr child) : operation(op), operand(std::move(child)) {}

    NumberPtr evaluate(Context& context) const override;
    AstPtr clone() const override;
    std::string toString() const override;

    UnaryOp op() const { return operation; }
    const AstNode& child() const { return *operand; }

private:
    UnaryOp operation;
    AstPtr operand;
};

// Вызов функции: пользовательской или примитива из реестра
class FunctionCallNode final : public AstNode {
public:
    FunctionCallNode(std::string name, std::vector<AstPtr> arguments)
        : functionName(std::move(name)), argumentList(std::move(arguments)) {}

    NumberPtr evaluate(Context& context) const override;
    AstPtr clone() const override;
    std::string toString() const override;

    const std::string& name() const { return functionName; }
    const std::vector<AstPtr>& arguments() const { return argumentList; }

private:
    std::string functionName;         // Имя функции
    std::vector<AstPtr> argumentList; // Выражения аргументов
};

// Присваивание: name = value
class AssignmentNode final : public AstNode {
public:
    AssignmentNode(std::string name, AstPtr value)
        : variableName(std::move(name)), valueExpression(std::move(value)) {}

    NumberPtr evaluate(Context& context) const override;
    AstPtr clone() const override;
    std::string toString() const override;

    const std::string& name() const { return variableName; }
    const AstNode& value() const { return *valueExpression; }

private:
    std::string variableName;
    AstPtr valueExpression;
};

// Определение функции: name(p1, p2, ...) = body
class FunctionDefNode final : public AstNode {
public:
    FunctionDefNode(std::string name, std::vector<std::string> parameters, AstPtr body)
        : functionName(std::move(name)), parameterNames(std::move(parameters)),
          bodyExpression(std::move(body)) {}

    // Записывает функцию в таблицу контекста и возвращает целый ноль
    NumberPtr evaluate(Context& context) const override;
    AstPtr clone() const override;
    std::string toString() const override;

    const std::string& name() const { return functionName; }
    const std::vector<std::string>& parameters() const { return parameterNames; }
    const AstNode& body() const { return *bodyExpression; }

private:
    std::string functionName;
    std::vector<std::string> parameterNames;
    AstPtr bodyExpression;
};

} // namespace calc
