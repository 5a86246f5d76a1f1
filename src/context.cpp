#include "context.hpp"

namespace calc {

Context::Context() : Context(FunctionRegistry::builtin()) {}

Context::Context(std::shared_ptr<const FunctionRegistry> registry)
    : scopes(1), primitives(std::move(registry)) {
    if (!primitives) {
        primitives = std::make_shared<const FunctionRegistry>();
    }
}

NumberPtr Context::lookup(const std::string& name) const {
    // Поиск от внутренней области к глобальной
    for (auto scope = scopes.rbegin(); scope != scopes.rend(); ++scope) {
        auto found = scope->find(name);
        if (found != scope->end()) {
            return found->second;
        }
    }
    return nullptr;
}

void Context::assign(const std::string& name, NumberPtr value) {
    for (auto scope = scopes.rbegin(); scope != scopes.rend(); ++scope) {
        auto found = scope->find(name);
        if (found != scope->end()) {
            found->second = std::move(value);
            return;
        }
    }
    // Не найдено ни в одной области, определяем во внутренней
    scopes.back()[name] = std::move(value);
}

void Context::define(const std::string& name, NumberPtr value) {
    scopes.back()[name] = std::move(value);
}

void Context::pushScope() {
    scopes.emplace_back();
}

void Context::popScope() {
    if (scopes.size() > 1) {
        scopes.pop_back();
    }
}

void Context::defineFunction(const std::string& name, std::shared_ptr<const UserFunction> function) {
    functions[name] = std::move(function);
}

std::shared_ptr<const UserFunction> Context::findFunction(const std::string& name) const {
    auto found = functions.find(name);
    if (found == functions.end()) {
        return nullptr;
    }
    return found->second;
}

Context::ScopeGuard::ScopeGuard(Context& context) : owner(context) {
    owner.pushScope();
}

Context::ScopeGuard::~ScopeGuard() {
    owner.popScope();
}

} // namespace calc
