#pragma once
#include <cstdint>

#include <lexer/location.hpp>

#include "expression.hpp"

struct integer_literal final : expression
{
    integer_literal(std::int64_t val, location loc)
        : expression {loc}
        , value {val}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    std::int64_t value {};
};
