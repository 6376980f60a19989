#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "evaluator.hpp"

#include <ast/combination.hpp>
#include <ast/decimal_literal.hpp>
#include <ast/expression.hpp>
#include <ast/identifier.hpp>
#include <ast/integer_literal.hpp>
#include <builtin/builtin.hpp>
#include <error.hpp>
#include <overloaded.hpp>

#include "environment.hpp"
#include "object.hpp"

namespace
{
constexpr std::string_view assign_keyword = ":=";
constexpr std::string_view function_keyword = "function";

struct depth_guard final
{
    explicit depth_guard(std::size_t& depth)
        : m_depth {depth}
    {
        ++m_depth;
    }

    ~depth_guard() { --m_depth; }

    depth_guard(const depth_guard&) = delete;
    depth_guard(depth_guard&&) = delete;
    auto operator=(const depth_guard&) -> depth_guard& = delete;
    auto operator=(depth_guard&&) -> depth_guard& = delete;

  private:
    std::size_t& m_depth;
};

auto parameter_names(std::span<const expression_ptr> params, const combination& form) -> std::vector<std::string>
{
    std::vector<std::string> names;
    for (const auto& param : params) {
        const auto* name = dynamic_cast<const identifier*>(param.get());
        if (name == nullptr) {
            throw make_error<evaluation_error>(
                "malformed `{}` at {}: parameter `{}` is not a symbol", form.string(), form.loc(), param->string());
        }
        names.push_back(name->value);
    }
    return names;
}

}  // namespace

evaluator::evaluator(environment_ptr env, std::size_t max_depth, std::size_t depth)
    : m_env {std::move(env)}
    , m_max_depth {max_depth}
    , m_depth {depth}
{
}

auto evaluator::evaluate(const expression& expr) -> object
{
    if (m_depth >= m_max_depth) {
        throw make_error<recursion_error>("maximum recursion depth of {} exceeded at {}", m_max_depth, expr.loc());
    }
    const depth_guard guard {m_depth};
    expr.accept(*this);
    return m_result;
}

void evaluator::visit(const integer_literal& expr)
{
    m_result = object {expr.value};
}

void evaluator::visit(const decimal_literal& expr)
{
    m_result = object {expr.value};
}

void evaluator::visit(const identifier& expr)
{
    const auto val = m_env->find(expr.value);
    if (!val.has_value()) {
        throw make_error<name_error>("identifier not found: {} at {}", expr.value, expr.loc());
    }
    m_result = *val;
}

void evaluator::visit(const combination& expr)
{
    if (expr.elements.empty()) {
        m_result = object {};
        return;
    }
    if (const auto* keyword = dynamic_cast<const identifier*>(expr.elements.front().get()); keyword != nullptr) {
        if (keyword->value == assign_keyword) {
            m_result = evaluate_assignment(expr);
            return;
        }
        if (keyword->value == function_keyword) {
            m_result = evaluate_function(expr);
            return;
        }
    }
    auto values = evaluate_expressions(expr.elements);
    if (values.size() == 1) {
        m_result = std::move(values.front());
        return;
    }
    const auto callee = std::move(values.front());
    values.erase(values.begin());
    m_result = apply_function(expr, callee, std::move(values));
}

// (:= name expression) or the shorthand (:= (name parameters...) body)
auto evaluator::evaluate_assignment(const combination& expr) -> object
{
    if (expr.elements.size() != 3) {
        throw make_error<evaluation_error>(
            "malformed assignment `{}` at {}: expected (:= name expression)", expr.string(), expr.loc());
    }
    const auto& target = expr.elements[1];
    const auto& value = expr.elements[2];
    if (const auto* signature = dynamic_cast<const combination*>(target.get()); signature != nullptr) {
        const auto* name = signature->elements.empty()
            ? nullptr
            : dynamic_cast<const identifier*>(signature->elements.front().get());
        if (name == nullptr) {
            throw make_error<evaluation_error>(
                "malformed assignment `{}` at {}: expected (:= (name parameters...) body)", expr.string(), expr.loc());
        }
        auto params = parameter_names(std::span {signature->elements}.subspan(1), expr);
        auto func = object {closure_value {std::make_shared<closure>(std::move(params), value, m_env)}};
        m_env->set(name->value, func);
        return func;
    }
    const auto* name = dynamic_cast<const identifier*>(target.get());
    if (name == nullptr) {
        throw make_error<evaluation_error>(
            "malformed assignment `{}` at {}: cannot assign to `{}`", expr.string(), expr.loc(), target->string());
    }
    auto result = evaluate(*value);
    m_env->set(name->value, result);
    return result;
}

// (function (parameters...) body)
auto evaluator::evaluate_function(const combination& expr) const -> object
{
    const auto* params =
        expr.elements.size() == 3 ? dynamic_cast<const combination*>(expr.elements[1].get()) : nullptr;
    if (params == nullptr) {
        throw make_error<evaluation_error>(
            "malformed function `{}` at {}: expected (function (parameters...) body)", expr.string(), expr.loc());
    }
    return object {
        closure_value {std::make_shared<closure>(parameter_names(params->elements, expr), expr.elements[2], m_env)}};
}

auto evaluator::apply_function(const combination& expr,
                               const object& function_or_builtin,
                               std::vector<object>&& args) const -> object
{
    return std::visit(
        overloaded {
            [&](const closure_value& func) -> object
            {
                if (func->parameters.size() != args.size()) {
                    throw make_error<evaluation_error>("wrong number of arguments to {} at {}: expected={}, got={}",
                                                       function_or_builtin.inspect(),
                                                       expr.loc(),
                                                       func->parameters.size(),
                                                       args.size());
                }
                auto locals = make_frame(func->env);
                for (auto arg_itr = args.begin(); const auto& parameter : func->parameters) {
                    locals->set(parameter, std::move(*(arg_itr++)));
                }
                evaluator local {locals, m_max_depth, m_depth};
                return local.evaluate(*func->body);
            },
            [&](const builtin_value& func) -> object { return func->body(args); },
            [&](const auto&) -> object
            {
                throw make_error<evaluation_error>("not a function at {}: {} {}",
                                                   expr.loc(),
                                                   function_or_builtin.type_name(),
                                                   function_or_builtin.inspect());
            },
        },
        function_or_builtin.value);
}

auto evaluator::evaluate_expressions(const expressions& exprs) -> std::vector<object>
{
    std::vector<object> result;
    result.reserve(exprs.size());
    for (const auto& expr : exprs) {
        result.push_back(evaluate(*expr));
    }
    return result;
}

auto evaluate(const expression& expr, const environment_ptr& env) -> object
{
    return evaluator {env}.evaluate(expr);
}
