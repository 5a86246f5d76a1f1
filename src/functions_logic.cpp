#include "function_registry.hpp"

namespace calc {

namespace {
// Ноль считается ложью, любое другое значение истиной
bool isTruthy(const Number& number) {
    return !number.isZero();
}

Number fromBool(bool value) {
    return Number::integer(value ? 1 : 0);
}

Number notOf(const Arguments& arguments) {
    expectArity(arguments, 1, "not");
    return fromBool(!isTruthy(arguments[0]));
}

Number allOf(const Arguments& arguments) {
    for (const auto& argument : arguments) {
        if (!isTruthy(argument)) {
            return fromBool(false);
        }
    }
    return fromBool(true);
}

Number anyOf(const Arguments& arguments) {
    for (const auto& argument : arguments) {
        if (isTruthy(argument)) {
            return fromBool(true);
        }
    }
    return fromBool(false);
}

// Истина при нечётном количестве истинных аргументов
Number oddOf(const Arguments& arguments) {
    std::size_t trueCount = 0;
    for (const auto& argument : arguments) {
        if (isTruthy(argument)) {
            ++trueCount;
        }
    }
    return fromBool(trueCount % 2 != 0);
}

// Обе ветви уже вычислены вызывающей стороной
Number choose(const Arguments& arguments) {
    expectArity(arguments, 3, "if");
    return isTruthy(arguments[0]) ? arguments[1] : arguments[2];
}
}

void registerLogicFunctions(FunctionRegistry& registry) {
    auto trueValue = [](const Arguments&) { return fromBool(true); };
    auto falseValue = [](const Arguments&) { return fromBool(false); };

    registry.add("TRUE", trueValue);
    registry.add("FALSE", falseValue);
    registry.add("NOT", notOf);
    registry.add("AND", allOf);
    registry.add("OR", anyOf);
    registry.add("XOR", oddOf);
    registry.add("IF", choose);

    registry.add("true", trueValue);
    registry.add("false", falseValue);
    registry.add("not", notOf);
    registry.add("and", allOf);
    registry.add("or", anyOf);
    registry.add("xor", oddOf);
    registry.add("if", choose);
}

} // namespace calc
