#include "function_registry.hpp"

#include "errors.hpp"

#include <algorithm>
#include <compare>
#include <complex>

namespace calc {

namespace {
// Среднее: для целых и дробей результат точный
Number mean(const Arguments& arguments) {
    if (arguments.empty()) {
        throw EngineError::argumentMismatch("mean", 1);
    }
    Number sum;
    for (const auto& argument : arguments) {
        sum = sum + argument;
    }
    return sum / Number(Integer(static_cast<unsigned long>(arguments.size())));
}

Number median(const Arguments& arguments) {
    if (arguments.empty()) {
        throw EngineError::argumentMismatch("median", 1);
    }
    for (const auto& argument : arguments) {
        if (argument.isComplex()) {
            throw EngineError::typeMismatch("вещественное число", argument.typeName());
        }
    }

    // Сортируем указатели, чтобы не копировать большие целые
    std::vector<const Number*> sorted;
    sorted.reserve(arguments.size());
    for (const auto& argument : arguments) {
        sorted.push_back(&argument);
    }
    std::stable_sort(sorted.begin(), sorted.end(), [](const Number* lhs, const Number* rhs) {
        return std::is_lt(compare(*lhs, *rhs));
    });

    std::size_t middle = sorted.size() / 2;
    if (sorted.size() % 2 == 1) {
        return *sorted[middle];
    }
    return (*sorted[middle - 1] + *sorted[middle]) / Number::integer(2);
}

// Выборочная дисперсия (делитель n - 1)
Number variance(const Arguments& arguments) {
    if (arguments.size() < 2) {
        throw EngineError::argumentMismatch("var", 2);
    }
    Number average = mean(arguments);
    Number sumOfSquares;
    for (const auto& argument : arguments) {
        Number difference = argument - average;
        sumOfSquares = sumOfSquares + difference * difference;
    }
    return sumOfSquares / Number(Integer(static_cast<unsigned long>(arguments.size() - 1)));
}

Number standardDeviation(const Arguments& arguments) {
    return Number(std::sqrt(variance(arguments).toComplex()));
}
}

void registerStatisticsFunctions(FunctionRegistry& registry) {
    registry.add("mean", mean);
    registry.add("median", median);
    registry.add("var", variance);
    registry.add("std", standardDeviation);
}

} // namespace calc
