#include <string>

#include "integer_literal.hpp"

#include <fmt/format.h>

#include "visitor.hpp"

auto integer_literal::string() const -> std::string
{
    return fmt::format("{}", value);
}

void integer_literal::accept(visitor& vstr) const
{
    vstr.visit(*this);
}
