#include "function_registry.hpp"

#include "errors.hpp"

#include <algorithm>
#include <climits>
#include <cmath>

namespace calc {

void FunctionRegistry::add(const std::string& name, PrimitiveFunction function) {
    functions[name] = std::move(function);
}

bool FunctionRegistry::contains(const std::string& name) const {
    return functions.contains(name);
}

Number FunctionRegistry::call(const std::string& name, const Arguments& arguments) const {
    auto found = functions.find(name);
    if (found == functions.end()) {
        throw EngineError::unknownFunction(name);
    }
    return found->second(arguments);
}

std::vector<std::string> FunctionRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(functions.size());
    for (const auto& [name, function] : functions) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

// Реестр создаётся один раз и далее только читается, поэтому
// его можно разделять между сессиями в разных потоках
std::shared_ptr<const FunctionRegistry> FunctionRegistry::builtin() {
    static const std::shared_ptr<const FunctionRegistry> instance = [] {
        auto registry = std::make_shared<FunctionRegistry>();
        registerCoreFunctions(*registry);
        registerTrigonometryFunctions(*registry);
        registerComplexFunctions(*registry);
        registerBitwiseFunctions(*registry);
        registerLogicFunctions(*registry);
        registerStatisticsFunctions(*registry);
        registerFinancialFunctions(*registry);
        return std::shared_ptr<const FunctionRegistry>(std::move(registry));
    }();
    return instance;
}

void expectArity(const Arguments& arguments, std::size_t count, const std::string& name) {
    if (arguments.size() != count) {
        throw EngineError::argumentMismatch(name, count);
    }
}

int saturatingInt(double value) {
    if (std::isnan(value)) {
        return 0;
    }
    return static_cast<int>(std::clamp(value, static_cast<double>(INT_MIN), static_cast<double>(INT_MAX)));
}

} // namespace calc
