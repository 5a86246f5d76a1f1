#include "function_registry.hpp"

namespace calc {

namespace {
Number imaginaryPart(const Arguments& arguments) {
    expectArity(arguments, 1, "im");
    const Number& value = arguments[0];
    switch (value.kind()) {
    case NumberKind::Complex:
        return Number(value.asComplex().imag());
    case NumberKind::Float:
        return Number(0.0);
    default:
        return Number::integer(0);
    }
}
}

void registerComplexFunctions(FunctionRegistry& registry) {
    // Вещественное число сопряжено само себе
    registry.add("conj", [](const Arguments& arguments) {
        expectArity(arguments, 1, "conj");
        if (arguments[0].isComplex()) {
            return Number(std::conj(arguments[0].asComplex()));
        }
        return arguments[0];
    });

    // Части комплексного числа возвращаются как Float
    registry.add("re", [](const Arguments& arguments) {
        expectArity(arguments, 1, "re");
        if (arguments[0].isComplex()) {
            return Number(arguments[0].asComplex().real());
        }
        return arguments[0];
    });

    registry.add("im", imaginaryPart);
    registry.add("lm", imaginaryPart);
}

} // namespace calc
