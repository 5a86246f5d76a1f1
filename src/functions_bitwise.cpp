#include "function_registry.hpp"

#include "errors.hpp"

#include <bit>
#include <cstdint>
#include <limits>

namespace calc {

namespace {
// Побитовые операции определены только для целых
const Integer& requireInteger(const Number& number) {
    if (!number.isInteger()) {
        throw EngineError::typeMismatch("Integer", number.typeName());
    }
    return number.asInteger();
}

unsigned long shiftCount(const Integer& count) {
    if (sgn(count) < 0 || !count.fits_ulong_p()) {
        throw EngineError::generic("Величина сдвига слишком велика или отрицательна");
    }
    return count.get_ui();
}

template <typename Operation>
void addBinary(FunctionRegistry& registry, const std::string& name, Operation operation) {
    registry.add(name, [name, operation](const Arguments& arguments) {
        expectArity(arguments, 2, name);
        const Integer& a = requireInteger(arguments[0]);
        const Integer& b = requireInteger(arguments[1]);
        return Number(Integer(operation(a, b)));
    });
}

// Циклический сдвиг 64-битного значения
Integer rotate(const Integer& value, const Integer& count, bool left) {
    const Integer maxCount(std::numeric_limits<std::uint32_t>::max());
    if (!value.fits_slong_p() || sgn(count) < 0 || count > maxCount) {
        throw EngineError::generic("Аргументы циклического сдвига слишком велики");
    }
    auto bits = static_cast<std::uint64_t>(static_cast<std::int64_t>(value.get_si()));
    int shift = static_cast<int>(count.get_ui() % 64);
    std::uint64_t rotated = left ? std::rotl(bits, shift) : std::rotr(bits, shift);
    return Integer(static_cast<long>(static_cast<std::int64_t>(rotated)));
}
}

void registerBitwiseFunctions(FunctionRegistry& registry) {
    addBinary(registry, "band", [](const Integer& a, const Integer& b) { return Integer(a & b); });
    addBinary(registry, "bor", [](const Integer& a, const Integer& b) { return Integer(a | b); });
    addBinary(registry, "bxor", [](const Integer& a, const Integer& b) { return Integer(a ^ b); });

    // Дополнение в бесконечном дополнительном коде: ~a = -a - 1
    registry.add("bnot", [](const Arguments& arguments) {
        expectArity(arguments, 1, "bnot");
        return Number(Integer(~requireInteger(arguments[0])));
    });

    addBinary(registry, "lsh", [](const Integer& a, const Integer& b) {
        return Integer(a << shiftCount(b));
    });
    // Арифметический сдвиг с округлением к минус бесконечности
    addBinary(registry, "rsh", [](const Integer& a, const Integer& b) {
        return Integer(a >> shiftCount(b));
    });

    addBinary(registry, "rol", [](const Integer& a, const Integer& b) { return rotate(a, b, true); });
    addBinary(registry, "ror", [](const Integer& a, const Integer& b) { return rotate(a, b, false); });
}

} // namespace calc
