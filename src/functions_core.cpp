#include "function_registry.hpp"

#include "errors.hpp"

#include <cmath>
#include <optional>
#include <utility>

namespace calc {

namespace {
Complex singleComplex(const Arguments& arguments, const std::string& name) {
    expectArity(arguments, 1, name);
    return arguments[0].toComplex();
}

double requireReal(const Number& number) {
    std::optional<double> real = number.toReal();
    if (!real) {
        throw EngineError::generic("Невозможно преобразовать в вещественное число");
    }
    return *real;
}

// Значение и необязательный второй аргумент (число знаков), по умолчанию 0
std::pair<double, int> valueWithDigits(const Arguments& arguments, const std::string& name) {
    if (arguments.empty() || arguments.size() > 2) {
        throw EngineError::argumentMismatch(name, 1);
    }
    int digits = 0;
    if (arguments.size() == 2) {
        std::optional<double> requested = arguments[1].toReal();
        if (requested) {
            digits = saturatingInt(*requested);
        }
    }
    return {requireReal(arguments[0]), digits};
}

// Модуль: для комплексного числа его абсолютная величина
Number absolute(const Arguments& arguments) {
    expectArity(arguments, 1, "abs");
    const Number& value = arguments[0];
    switch (value.kind()) {
    case NumberKind::Integer:
        return Number(Integer(abs(value.asInteger())));
    case NumberKind::Rational:
        return Number(Rational(abs(value.asRational())));
    case NumberKind::Float:
        return Number(std::abs(value.asFloat()));
    case NumberKind::Complex:
        return Number(std::abs(value.asComplex()));
    }
    return value;
}

Number roundTo(const Arguments& arguments) {
    auto [value, digits] = valueWithDigits(arguments, "round");
    double multiplier = std::pow(10.0, digits);
    return Number(std::round(value * multiplier) / multiplier);
}

Number factorialOf(const Arguments& arguments) {
    expectArity(arguments, 1, "fact");
    return factorial(arguments[0]);
}
}

void registerCoreFunctions(FunctionRegistry& registry) {
    registry.add("log", [](const Arguments& arguments) {
        return Number(std::log10(singleComplex(arguments, "log")));
    });
    registry.add("ln", [](const Arguments& arguments) {
        return Number(std::log(singleComplex(arguments, "ln")));
    });
    registry.add("sqrt", [](const Arguments& arguments) {
        return Number(std::sqrt(singleComplex(arguments, "sqrt")));
    });

    registry.add("abs", absolute);
    registry.add("ABS", absolute);
    registry.add("fact", factorialOf);
    registry.add("FACT", factorialOf);
    registry.add("round", roundTo);
    registry.add("ROUND", roundTo);

    auto floorOf = [](const Arguments& arguments) {
        return Number(std::floor(valueWithDigits(arguments, "floor").first));
    };
    auto ceilingOf = [](const Arguments& arguments) {
        return Number(std::ceil(valueWithDigits(arguments, "ceil").first));
    };
    auto truncateOf = [](const Arguments& arguments) {
        return Number(std::trunc(valueWithDigits(arguments, "trunc").first));
    };
    registry.add("floor", floorOf);
    registry.add("FLOOR", floorOf);
    registry.add("ceil", ceilingOf);
    registry.add("CEILING", ceilingOf);
    registry.add("trunc", truncateOf);
    registry.add("TRUNC", truncateOf);
}

} // namespace calc
