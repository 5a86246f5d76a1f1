#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "ast.hpp"
#include "function_registry.hpp"
#include "number.hpp"

namespace calc {

// Пользовательская функция. Неизменяема после сохранения в таблице.
struct UserFunction {
    std::vector<std::string> parameters; // Имена параметров по порядку
    AstPtr body;                         // Собственная копия тела

    std::size_t arity() const { return parameters.size(); }
};

// Контекст вычисления: стек областей видимости и таблица функций.
// Области видимости динамические: поиск идёт от внутренней к глобальной.
// Стек всегда содержит глобальную область, которая не удаляется.
// Контекст не потокобезопасен: один контекст на сессию.
class Context {
public:
    // Пустой контекст со встроенным реестром примитивов
    Context();

    // Пустой контекст с реестром, переданным вызывающей стороной
    explicit Context(std::shared_ptr<const FunctionRegistry> registry);

    // Поиск переменной от внутренней области к глобальной.
    // Возвращает nullptr, если имя не определено.
    NumberPtr lookup(const std::string& name) const;

    // Перезаписывает первую найденную привязку в любой области,
    // иначе создаёт новую во внутренней области.
    void assign(const std::string& name, NumberPtr value);

    // Принудительно определяет имя во внутренней области (параметры функций)
    void define(const std::string& name, NumberPtr value);

    void pushScope();

    // Удаляет внутреннюю область; глобальная область не удаляется
    void popScope();

    std::size_t scopeDepth() const { return scopes.size(); }

    // Определяет или переопределяет функцию (таблица всегда глобальная)
    void defineFunction(const std::string& name, std::shared_ptr<const UserFunction> function);

    // Возвращает nullptr, если функция не определена пользователем
    std::shared_ptr<const UserFunction> findFunction(const std::string& name) const;

    std::size_t functionCount() const { return functions.size(); }

    const FunctionRegistry& registry() const { return *primitives; }

    // RAII-охранник области видимости: pop выполняется и при исключении
    class ScopeGuard {
    public:
        explicit ScopeGuard(Context& context);
        ~ScopeGuard();

        ScopeGuard(const ScopeGuard&) = delete;
        ScopeGuard& operator=(const ScopeGuard&) = delete;

    private:
        Context& owner;
    };

private:
    using Scope = std::unordered_map<std::string, NumberPtr>;

    std::vector<Scope> scopes;
    std::unordered_map<std::string, std::shared_ptr<const UserFunction>> functions;
    std::shared_ptr<const FunctionRegistry> primitives;
};

} // namespace calc
