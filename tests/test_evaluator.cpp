#include <gtest/gtest.h>

#include "errors.hpp"
#include "evaluator.hpp"
#include "number_format.hpp"
#include "parser.hpp"

#include <cmath>
#include <string>

using namespace calc;

namespace {
class EvaluatorTest : public ::testing::Test {
protected:
    ExpressionEvaluator evaluator;

    Number run(const std::string& text) {
        return *evaluator.evaluate(text);
    }

    // Вид ошибки или Generic, если ошибки не было
    ErrorKind errorOf(const std::string& text) {
        try {
            evaluator.evaluate(text);
        }
        catch (const EngineError& error) {
            return error.kind();
        }
        ADD_FAILURE() << "Нет ошибки для: " << text;
        return ErrorKind::Generic;
    }
};

std::string chain(const std::string& op, int terms) {
    std::string text = "1";
    for (int i = 1; i < terms; ++i) {
        text += " " + op + " 1";
    }
    return text;
}
}

TEST_F(EvaluatorTest, BasicArithmetic) {
    EXPECT_EQ(run("2 + 2 * 2"), Number::integer(6));
    EXPECT_EQ(run("(2 + 2) * 2"), Number::integer(8));
    EXPECT_EQ(run("10 - 4 - 3"), Number::integer(3));
    EXPECT_EQ(run("-3 + 5"), Number::integer(2));
    EXPECT_EQ(run("7 % 4"), Number::integer(3));
}

TEST_F(EvaluatorTest, BigIntegerArithmeticIsExact) {
    EXPECT_EQ(formatNumber(run("2^100")), "1267650600228229401496703205376");
    EXPECT_EQ(formatNumber(run("2^64 - 1")), "18446744073709551615");
    EXPECT_EQ(formatNumber(run("2^100 - 2^100 + 1")), "1");
}

TEST_F(EvaluatorTest, DivisionIsExact) {
    Number third = run("1 / 3");
    ASSERT_TRUE(third.isRational());
    EXPECT_EQ(formatNumber(third), "1/3");

    Number whole = run("(1/3) * 3");
    ASSERT_TRUE(whole.isRational());
    EXPECT_EQ(formatNumber(whole), "1");
}

TEST_F(EvaluatorTest, DivisionByZeroDoesNotThrow) {
    Number result = run("1 / 0");
    ASSERT_TRUE(result.isFloat());
    EXPECT_TRUE(std::isinf(result.asFloat()));

    Number rational = run("(1/2) / 0");
    ASSERT_TRUE(rational.isFloat());
    EXPECT_TRUE(std::isinf(rational.asFloat()));
}

TEST_F(EvaluatorTest, Promotion) {
    Number mixed = run("1 + 0.5");
    ASSERT_TRUE(mixed.isFloat());
    EXPECT_DOUBLE_EQ(mixed.asFloat(), 1.5);

    Number lossy = run("(1/2) + 0.5");
    ASSERT_TRUE(lossy.isFloat());
    EXPECT_DOUBLE_EQ(lossy.asFloat(), 1.0);
}

TEST_F(EvaluatorTest, PowerIsRightAssociative) {
    EXPECT_EQ(run("2^3^2"), Number::integer(512));
    EXPECT_EQ(formatNumber(run("2^3^4")), formatNumber(run("2^81")));
    EXPECT_NE(formatNumber(run("2^3^4")), formatNumber(run("(2^3)^4")));
}

TEST_F(EvaluatorTest, Factorial) {
    EXPECT_EQ(run("5!"), Number::integer(120));
    EXPECT_EQ(run("-3!"), Number::integer(-6));
    EXPECT_EQ(run("3!!"), Number::integer(720));

    Number big = run("50!");
    ASSERT_TRUE(big.isInteger());
    EXPECT_GT(big.asInteger(), Integer(0));
    EXPECT_EQ(formatNumber(big).size(), 65u);

    EXPECT_EQ(errorOf("(-1)!"), ErrorKind::DomainError);
    EXPECT_EQ(errorOf("2.5!"), ErrorKind::DomainError);
    EXPECT_EQ(errorOf("(1/2)!"), ErrorKind::DomainError);
}

TEST_F(EvaluatorTest, ImplicitMultiplication) {
    EXPECT_EQ(run("2(3 + 4)"), Number::integer(14));
    run("x = 3");
    EXPECT_EQ(run("2x"), Number::integer(6));
    EXPECT_EQ(run("2x + 1"), Number::integer(7));
}

TEST_F(EvaluatorTest, LiteralForms) {
    EXPECT_EQ(run("0x10 + 0b11"), Number::integer(19));
    Number real = run("1.5e1");
    ASSERT_TRUE(real.isFloat());
    EXPECT_DOUBLE_EQ(real.asFloat(), 15.0);
}

TEST_F(EvaluatorTest, AssignmentReturnsValueAndPersists) {
    EXPECT_EQ(run("x = 7"), Number::integer(7));
    EXPECT_EQ(run("x * 2"), Number::integer(14));
    EXPECT_EQ(run("y = x = 3"), Number::integer(3));
    EXPECT_EQ(run("x + y"), Number::integer(6));
}

TEST_F(EvaluatorTest, UndefinedVariable) {
    try {
        run("missing + 1");
        FAIL() << "Ожидалась ошибка";
    }
    catch (const EngineError& error) {
        EXPECT_EQ(error.kind(), ErrorKind::UndefinedVariable);
        EXPECT_EQ(error.name(), "missing");
    }
}

TEST_F(EvaluatorTest, UserFunctions) {
    EXPECT_EQ(run("sq(x) = x * x"), Number::integer(0));
    EXPECT_EQ(run("sq(7)"), Number::integer(49));
    EXPECT_EQ(run("add(a, b) = a + b"), Number::integer(0));
    EXPECT_EQ(run("add(sq(2), 1/2)"), Number::rational(9, 2));
    EXPECT_EQ(run("three() = 3"), Number::integer(0));
    EXPECT_EQ(run("three()"), Number::integer(3));
}

TEST_F(EvaluatorTest, RedefinitionOverwrites) {
    run("f(x) = x + 1");
    EXPECT_EQ(run("f(1)"), Number::integer(2));
    run("f(x, y) = x * y");
    EXPECT_EQ(run("f(3, 4)"), Number::integer(12));
    EXPECT_EQ(evaluator.context().functionCount(), 1u);
}

TEST_F(EvaluatorTest, UserFunctionShadowsPrimitive) {
    run("sin(x) = 42");
    EXPECT_EQ(run("sin(0)"), Number::integer(42));
}

TEST_F(EvaluatorTest, FunctionsSeeLaterDefinitions) {
    run("outer(x) = inner(x) + 1");
    EXPECT_EQ(errorOf("outer(1)"), ErrorKind::UnknownFunction);
    run("inner(x) = 10x");
    EXPECT_EQ(run("outer(2)"), Number::integer(21));
}

TEST_F(EvaluatorTest, ArityMismatch) {
    run("f(a, b) = a + b");
    try {
        run("f(1)");
        FAIL() << "Ожидалась ошибка";
    }
    catch (const EngineError& error) {
        EXPECT_EQ(error.kind(), ErrorKind::ArgumentMismatch);
        EXPECT_EQ(error.name(), "f");
        EXPECT_EQ(error.expectedArity(), 2u);
    }
    EXPECT_EQ(evaluator.context().scopeDepth(), 1u);
}

TEST_F(EvaluatorTest, UnknownFunction) {
    try {
        run("g(x)");
        FAIL() << "Ожидалась ошибка";
    }
    catch (const EngineError& error) {
        // Аргументы вычисляются до поиска функции
        EXPECT_EQ(error.kind(), ErrorKind::UndefinedVariable);
    }

    run("x = 1");
    try {
        run("g(x)");
        FAIL() << "Ожидалась ошибка";
    }
    catch (const EngineError& error) {
        EXPECT_EQ(error.kind(), ErrorKind::UnknownFunction);
        EXPECT_EQ(error.name(), "g");
    }
}

TEST_F(EvaluatorTest, ParseErrorLeavesContextUntouched) {
    EXPECT_EQ(errorOf("x = (1"), ErrorKind::ParserError);
    EXPECT_EQ(evaluator.context().lookup("x"), nullptr);
}

TEST_F(EvaluatorTest, ResetStartsNewSession) {
    run("x = 1");
    run("f(a) = a");
    evaluator.reset();
    EXPECT_EQ(evaluator.context().lookup("x"), nullptr);
    EXPECT_EQ(evaluator.context().functionCount(), 0u);
    EXPECT_TRUE(evaluator.context().registry().contains("sqrt"));
}

TEST_F(EvaluatorTest, CustomRegistry) {
    auto registry = std::make_shared<FunctionRegistry>();
    registry->add("twice", [](const Arguments& arguments) {
        expectArity(arguments, 1, "twice");
        return arguments[0] + arguments[0];
    });

    ExpressionEvaluator custom(registry);
    EXPECT_EQ(*custom.evaluate("twice(21)"), Number::integer(42));
    EXPECT_THROW(custom.evaluate("sin(0)"), EngineError);

    custom.reset();
    EXPECT_EQ(*custom.evaluate("twice(2)"), Number::integer(4));
}

TEST_F(EvaluatorTest, FreeFunctionsShareContext) {
    Context context;
    evaluate("x = 5", context);
    AstPtr ast = parse("x * 2");
    EXPECT_EQ(*eval(*ast, context), Number::integer(10));
}

// Динамическая область видимости

TEST_F(EvaluatorTest, FunctionAssignsToGlobal) {
    run("x = 10");
    run("f() = x = 20");
    run("f()");
    EXPECT_EQ(run("x"), Number::integer(20));
}

TEST_F(EvaluatorTest, ParameterShadowsGlobal) {
    run("x = 10");
    run("g(x) = x = 20");
    EXPECT_EQ(run("g(5)"), Number::integer(20));
    EXPECT_EQ(run("x"), Number::integer(10));
}

TEST_F(EvaluatorTest, NewNameInsideFunctionStaysLocal) {
    run("h() = y = 5");
    EXPECT_EQ(run("h()"), Number::integer(5));
    EXPECT_EQ(errorOf("y"), ErrorKind::UndefinedVariable);
}

TEST_F(EvaluatorTest, CalleeSeesCallerLocals) {
    run("show() = p");
    run("wrap(p) = show() + 1");
    EXPECT_EQ(run("wrap(41)"), Number::integer(42));
    EXPECT_EQ(errorOf("show()"), ErrorKind::UndefinedVariable);
}

TEST_F(EvaluatorTest, ArgumentsEvaluatedInCallerScope) {
    run("x = 1");
    run("f(x) = x + 100");
    EXPECT_EQ(run("f(x + 1)"), Number::integer(102));
}

TEST_F(EvaluatorTest, ScopeIsPoppedAfterError) {
    run("bad(a) = a + nothing");
    EXPECT_EQ(errorOf("bad(1)"), ErrorKind::UndefinedVariable);
    EXPECT_EQ(evaluator.context().scopeDepth(), 1u);
    EXPECT_EQ(errorOf("a"), ErrorKind::UndefinedVariable);

    run("nested(b) = bad(b)");
    EXPECT_EQ(errorOf("nested(2)"), ErrorKind::UndefinedVariable);
    EXPECT_EQ(evaluator.context().scopeDepth(), 1u);
}

// Длинные цепочки

TEST_F(EvaluatorTest, LongAdditionChain) {
    EXPECT_EQ(run(chain("+", 2000)), Number::integer(2000));
}

TEST_F(EvaluatorTest, LongMixedChainKeepsLeftToRightOrder) {
    std::string text = "0";
    for (int i = 0; i < 3000; ++i) {
        text += (i % 2 == 0) ? " + 3" : " - 1";
    }
    EXPECT_EQ(run(text), Number::integer(1500 * 3 - 1500));

    EXPECT_EQ(run(chain("*", 5000)), Number::integer(1));
    EXPECT_EQ(run("100 - 10 - 1"), Number::integer(89));
    EXPECT_EQ(run("64 / 4 / 2"), Number::rational(8, 1));
}

TEST_F(EvaluatorTest, ChainWithFunctionCallsInOperands) {
    run("one() = 1");
    std::string text = "one()";
    for (int i = 1; i < 2000; ++i) {
        text += " + one()";
    }
    EXPECT_EQ(run(text), Number::integer(2000));
    EXPECT_EQ(evaluator.context().scopeDepth(), 1u);
}

TEST_F(EvaluatorTest, MillionTermChainIsEvaluatedCopiedAndReleased) {
    const int terms = 1000000;
    AstPtr tree = parse(chain("+", terms));
    EXPECT_EQ(*eval(*tree, evaluator.context()), Number::integer(terms));

    AstPtr copy = tree->clone();
    tree.reset();
    EXPECT_EQ(*eval(*copy, evaluator.context()), Number::integer(terms));

    std::string text = copy->toString();
    EXPECT_EQ(text.size(), 6u * (terms - 1) + 1);
    EXPECT_EQ(text.rfind("(+ (+ (+ ", 0), 0u);
    EXPECT_EQ(text.substr(text.size() - 6), " 1) 1)");
    copy.reset();
}

TEST_F(EvaluatorTest, FunctionWithLongBodyIsDefinedAndCalled) {
    // Тело функции копируется при определении и освобождается при сбросе
    run("f() = " + chain("+", 300000));
    EXPECT_EQ(run("f()"), Number::integer(300000));
    evaluator.reset();
    EXPECT_EQ(evaluator.context().scopeDepth(), 1u);
}
