#include <ostream>
#include <stdexcept>

#include "token_type.hpp"

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&
{
    using enum token_type;
    switch (type) {
        case eof:
            return ostream << "<eof>";
        case lparen:
            return ostream << "(";
        case rparen:
            return ostream << ")";
        case atom:
            return ostream << "atom";
        case assign:
            return ostream << ":=";
        case function:
            return ostream << "function";
    }
    throw std::invalid_argument("invalid token_type");
}
