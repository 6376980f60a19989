#pragma once

#include <cstddef>
#include <vector>

#include <ast/expression.hpp>
#include <ast/visitor.hpp>

#include "environment.hpp"
#include "object.hpp"

constexpr std::size_t max_recursion_depth = 1000;

struct evaluator final : visitor
{
    explicit evaluator(environment_ptr env, std::size_t max_depth = max_recursion_depth, std::size_t depth = 0);
    auto evaluate(const expression& expr) -> object;

  protected:
    void visit(const combination& expr) final;
    void visit(const decimal_literal& expr) final;
    void visit(const identifier& expr) final;
    void visit(const integer_literal& expr) final;

  private:
    auto evaluate_assignment(const combination& expr) -> object;
    auto evaluate_function(const combination& expr) const -> object;
    auto apply_function(const combination& expr,
                        const object& function_or_builtin,
                        std::vector<object>&& args) const -> object;
    auto evaluate_expressions(const expressions& exprs) -> std::vector<object>;

    object m_result {};
    environment_ptr m_env;
    std::size_t m_max_depth;
    std::size_t m_depth;
};

auto evaluate(const expression& expr, const environment_ptr& env) -> object;
