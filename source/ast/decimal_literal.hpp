#pragma once

#include <lexer/location.hpp>

#include "expression.hpp"

struct decimal_literal final : expression
{
    decimal_literal(double val, location loc)
        : expression {loc}
        , value {val}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    double value {};
};
