#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "number.hpp"

namespace calc {

using Arguments = std::vector<Number>;

// Примитив: чистая функция без доступа к контексту.
// Получает полностью вычисленные аргументы, ошибки сообщает через EngineError.
using PrimitiveFunction = std::function<Number(const Arguments&)>;

// Реестр именованных примитивов (имена чувствительны к регистру).
// Консультируется только после неудачного поиска пользовательской функции.
class FunctionRegistry {
public:
    FunctionRegistry() = default;

    // Добавляет или заменяет примитив
    void add(const std::string& name, PrimitiveFunction function);

    bool contains(const std::string& name) const;

    // Вызывает примитив.
    // Выбрасывает EngineError (UnknownFunction), если имени нет в реестре.
    Number call(const std::string& name, const Arguments& arguments) const;

    // Имена всех примитивов в алфавитном порядке
    std::vector<std::string> names() const;

    std::size_t size() const { return functions.size(); }

    // Общий реестр со встроенной библиотекой примитивов
    static std::shared_ptr<const FunctionRegistry> builtin();

private:
    std::unordered_map<std::string, PrimitiveFunction> functions;
};

// Регистрация групп встроенных примитивов
void registerCoreFunctions(FunctionRegistry& registry);
void registerTrigonometryFunctions(FunctionRegistry& registry);
void registerComplexFunctions(FunctionRegistry& registry);
void registerBitwiseFunctions(FunctionRegistry& registry);
void registerLogicFunctions(FunctionRegistry& registry);
void registerStatisticsFunctions(FunctionRegistry& registry);
void registerFinancialFunctions(FunctionRegistry& registry);

// Проверка числа аргументов.
// Выбрасывает EngineError (ArgumentMismatch) с именем функции.
void expectArity(const Arguments& arguments, std::size_t count, const std::string& name);

// Целочисленный параметр примитива (число знаков, тип платежа):
// дробная часть отбрасывается, значения вне диапазона int насыщаются, NaN даёт 0
int saturatingInt(double value);

} // namespace calc
