#include <ostream>

#include "location.hpp"

// file:line:column, both counted from 1
auto operator<<(std::ostream& ostrm, const location& loc) -> std::ostream&
{
    return ostrm << loc.filename << ':' << loc.line << ':' << loc.column;
}
