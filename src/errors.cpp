#include "errors.hpp"

namespace calc {

EngineError::EngineError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), errorKind(kind) {}

EngineError EngineError::divisionByZero() {
    return EngineError(ErrorKind::DivisionByZero, "Деление на ноль");
}

EngineError EngineError::undefinedVariable(const std::string& name) {
    EngineError error(ErrorKind::UndefinedVariable, "Неопределённая переменная: " + name);
    error.subject = name;
    return error;
}

EngineError EngineError::argumentMismatch(const std::string& function, std::size_t expected) {
    EngineError error(ErrorKind::ArgumentMismatch,
                      "Функция '" + function + "' требует ровно " +
                          std::to_string(expected) + " аргумент(а/ов)");
    error.subject = function;
    error.arity = expected;
    return error;
}

EngineError EngineError::unknownFunction(const std::string& name) {
    EngineError error(ErrorKind::UnknownFunction, "Неизвестная функция: '" + name + "'");
    error.subject = name;
    return error;
}

EngineError EngineError::typeMismatch(const std::string& expected, const std::string& actual) {
    EngineError error(ErrorKind::TypeMismatch,
                      "Несовпадение типов: ожидалось " + expected + ", получено " + actual);
    error.subject = expected;
    error.actualType = actual;
    return error;
}

EngineError EngineError::parserError(const std::string& message) {
    return EngineError(ErrorKind::ParserError, "Ошибка разбора: " + message);
}

EngineError EngineError::domainError(const std::string& message) {
    return EngineError(ErrorKind::DomainError, message);
}

EngineError EngineError::generic(const std::string& message) {
    return EngineError(ErrorKind::Generic, message);
}

const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::DivisionByZero:
        return "DivisionByZero";
    case ErrorKind::UndefinedVariable:
        return "UndefinedVariable";
    case ErrorKind::ArgumentMismatch:
        return "ArgumentMismatch";
    case ErrorKind::UnknownFunction:
        return "UnknownFunction";
    case ErrorKind::TypeMismatch:
        return "TypeMismatch";
    case ErrorKind::ParserError:
        return "ParserError";
    case ErrorKind::DomainError:
        return "DomainError";
    case ErrorKind::Generic:
        return "Generic";
    }
    return "Generic";
}

} // namespace calc
