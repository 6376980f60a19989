#pragma once

#include <ast/combination.hpp>
#include <ast/decimal_literal.hpp>
#include <ast/identifier.hpp>
#include <ast/integer_literal.hpp>

#include "expression.hpp"

struct visitor
{
    visitor(const visitor&) = delete;
    visitor(visitor&&) = delete;
    auto operator=(const visitor&) -> visitor& = delete;
    auto operator=(visitor&&) -> visitor& = delete;
    visitor() = default;
    virtual ~visitor() = default;

    virtual void visit(const combination& expr) = 0;
    virtual void visit(const decimal_literal& expr) = 0;
    virtual void visit(const identifier& expr) = 0;
    virtual void visit(const integer_literal& expr) = 0;
};
