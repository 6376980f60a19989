#include <string>

#include "identifier.hpp"

#include "visitor.hpp"

// symbols print exactly as spelled in the source, keywords included
auto identifier::string() const -> std::string
{
    return value;
}

void identifier::accept(visitor& vstr) const
{
    vstr.visit(*this);
}
