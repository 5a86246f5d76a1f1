#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace calc {

// Вид ошибки движка.
// DivisionByZero зарезервирован: деление целых и дробей на ноль
// возвращает Float (inf/NaN), а не исключение.
enum class ErrorKind {
    DivisionByZero,
    UndefinedVariable,
    ArgumentMismatch,
    UnknownFunction,
    TypeMismatch,
    ParserError,
    DomainError,
    Generic
};

// Единый тип исключения для лексера, парсера, вычислителя и примитивов.
// Помимо текста сообщения хранит вид ошибки и её структурные поля.
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message);

    static EngineError divisionByZero();
    static EngineError undefinedVariable(const std::string& name);
    static EngineError argumentMismatch(const std::string& function, std::size_t expected);
    static EngineError unknownFunction(const std::string& name);
    static EngineError typeMismatch(const std::string& expected, const std::string& actual);
    static EngineError parserError(const std::string& message);
    static EngineError domainError(const std::string& message);
    static EngineError generic(const std::string& message);

    ErrorKind kind() const noexcept { return errorKind; }

    // Имя переменной или функции (UndefinedVariable, ArgumentMismatch, UnknownFunction)
    const std::string& name() const noexcept { return subject; }

    // Ожидаемое число аргументов (ArgumentMismatch)
    std::size_t expectedArity() const noexcept { return arity; }

    // Ожидаемый и фактический тип (TypeMismatch)
    const std::string& expected() const noexcept { return subject; }
    const std::string& actual() const noexcept { return actualType; }

private:
    ErrorKind errorKind;
    std::string subject;
    std::string actualType;
    std::size_t arity = 0;
};

// Ошибка синтаксического анализа
using ParseError = EngineError;

// Текстовое имя вида ошибки (для CSV и диагностики)
const char* errorKindName(ErrorKind kind) noexcept;

} // namespace calc
