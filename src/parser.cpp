#include "parser.hpp"

#include "errors.hpp"

#include <optional>

namespace calc {

namespace {
// Сила связывания префиксного минуса и постфиксного факториала
constexpr int kNegateBindingPower = 9;
constexpr int kFactorialBindingPower = 11;

struct BindingPower {
    int left;
    int right;
    BinaryOp op;
};

// Неявное умножение: 2(3+4), 2x
constexpr BindingPower kImplicitMultiplication{3, 4, BinaryOp::Mul};

std::optional<BindingPower> infixBindingPower(TokenType type) {
    switch (type) {
    case TokenType::Plus:
        return BindingPower{1, 2, BinaryOp::Add};
    case TokenType::Minus:
        return BindingPower{1, 2, BinaryOp::Sub};
    case TokenType::Star:
        return BindingPower{3, 4, BinaryOp::Mul};
    case TokenType::Slash:
        return BindingPower{3, 4, BinaryOp::Div};
    case TokenType::Percent:
        return BindingPower{3, 4, BinaryOp::Mod};
    case TokenType::Caret:
        // Левая сила больше правой: правая ассоциативность: 2^3^4 = 2^(3^4)
        return BindingPower{6, 5, BinaryOp::Pow};
    default:
        return std::nullopt;
    }
}
}

Parser::Parser(std::string sourceText) : tokenizer(std::move(sourceText)) {
    current = tokenizer.next();
}

// Запуск процесса парсинга
// Ожидает, что всё выражение будет полностью разобрано
AstPtr Parser::parse() {
    AstPtr node = parseExpression(0);
    if (!check(TokenType::End)) {
        fail(std::string("Неожиданный хвост выражения: ") + tokenTypeName(current.type) + " '" +
                 current.text + "'",
             current);
    }
    return node;
}

Token Parser::advance() {
    Token token = std::move(current);
    current = tokenizer.next();
    return token;
}

bool Parser::check(TokenType type) const {
    return current.type == type;
}

bool Parser::match(TokenType type) {
    if (check(type)) {
        advance();
        return true;
    }
    return false;
}

// Цикл Пратта: префиксный терм, затем инфиксные и постфиксные операторы,
// пока их левая сила связывания не меньше minBindingPower
AstPtr Parser::parseExpression(int minBindingPower) {
    AstPtr lhs = parsePrefix();

    while (!check(TokenType::End)) {
        // Постфиксный факториал
        if (check(TokenType::Bang)) {
            if (kFactorialBindingPower < minBindingPower) {
                break;
            }
            advance();
            lhs = std::make_unique<UnaryNode>(UnaryOp::Factorial, std::move(lhs));
            continue;
        }

        std::optional<BindingPower> infix = infixBindingPower(current.type);
        bool isExplicit = infix.has_value();
        BindingPower power = kImplicitMultiplication;
        if (isExplicit) {
            power = *infix;
        } else if (!check(TokenType::LParen) && !check(TokenType::Identifier)) {
            break;
        }

        if (power.left < minBindingPower) {
            break;
        }

        // Неявное умножение не потребляет токен
        if (isExplicit) {
            advance();
        }

        AstPtr rhs = parseExpression(power.right);
        lhs = std::make_unique<BinaryNode>(power.op, std::move(lhs), std::move(rhs));
    }

    return lhs;
}

AstPtr Parser::parsePrefix() {
    Token token = advance();

    switch (token.type) {
    // Число
    case TokenType::Float:
    case TokenType::Integer:
        return std::make_unique<NumberNode>(token.value);

    // Переменная, присваивание, вызов или определение функции
    case TokenType::Identifier:
        return parseIdentifier(token);

    // Группировка скобками
    case TokenType::LParen: {
        AstPtr node = parseExpression(0);
        if (!match(TokenType::RParen)) {
            fail("Ожидалась закрывающая скобка", current);
        }
        return node;
    }

    // Унарный минус
    case TokenType::Minus:
        return std::make_unique<UnaryNode>(UnaryOp::Negate, parseExpression(kNegateBindingPower));

    case TokenType::End:
        fail("Неожиданный конец выражения", token);

    default:
        fail(std::string("Неожиданный токен: ") + tokenTypeName(token.type) + " '" + token.text + "'",
             token);
    }
}

// name(args) = body: определение, name(args): вызов,
// name = expr: присваивание, иначе ссылка на переменную
AstPtr Parser::parseIdentifier(const Token& identifier) {
    if (match(TokenType::LParen)) {
        std::vector<AstPtr> arguments = parseArguments();

        if (match(TokenType::Equals)) {
            std::vector<std::string> parameters;
            parameters.reserve(arguments.size());
            for (const auto& argument : arguments) {
                const auto* variable = dynamic_cast<const VariableNode*>(argument.get());
                if (variable == nullptr) {
                    fail("Параметры функции '" + identifier.text + "' должны быть идентификаторами",
                         identifier);
                }
                parameters.push_back(variable->name());
            }
            AstPtr body = parseExpression(0);
            return std::make_unique<FunctionDefNode>(identifier.text, std::move(parameters),
                                                     std::move(body));
        }

        return std::make_unique<FunctionCallNode>(identifier.text, std::move(arguments));
    }

    if (match(TokenType::Equals)) {
        AstPtr value = parseExpression(0);
        return std::make_unique<AssignmentNode>(identifier.text, std::move(value));
    }

    return std::make_unique<VariableNode>(identifier.text);
}

std::vector<AstPtr> Parser::parseArguments() {
    std::vector<AstPtr> arguments;
    if (match(TokenType::RParen)) {
        return arguments;
    }

    while (true) {
        arguments.push_back(parseExpression(0));
        if (match(TokenType::Comma)) {
            continue;
        }
        if (match(TokenType::RParen)) {
            break;
        }
        fail("Ожидалась ',' или ')' в списке аргументов", current);
    }
    return arguments;
}

void Parser::fail(const std::string& message, const Token& token) const {
    throw EngineError::parserError(message + " (позиция " + std::to_string(token.position) + ")");
}

AstPtr parse(const std::string& text) {
    Parser parser(text);
    return parser.parse();
}

} // namespace calc
