#pragma once

#include <utility>

#include <lexer/location.hpp>

#include "expression.hpp"

// a parenthesized sequence of expressions, either a special form or an application
struct combination final : expression
{
    combination(expressions elems, location loc)
        : expression {loc}
        , elements {std::move(elems)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expressions elements;
};
