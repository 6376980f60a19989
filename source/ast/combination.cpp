#include <string>

#include "combination.hpp"

#include <fmt/format.h>

#include "util.hpp"
#include "visitor.hpp"

auto combination::string() const -> std::string
{
    return fmt::format("({})", join(elements, " "));
}

void combination::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
