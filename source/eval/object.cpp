#include <ostream>
#include <string>
#include <variant>

#include "object.hpp"

#include <ast/util.hpp>
#include <builtin/builtin.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <overloaded.hpp>

auto object::type_name() const -> std::string
{
    return std::visit(
        overloaded {
            [](const nil_type&) { return "nil"; },
            [](const integer_value) { return "integer"; },
            [](const decimal_value) { return "decimal"; },
            [](const builtin_value) { return "builtin"; },
            [](const closure_value&) { return "function"; },
        },
        value);
}

auto object::inspect() const -> std::string
{
    return std::visit(
        overloaded {
            [](const nil_type&) -> std::string { return "()"; },
            [](const integer_value val) -> std::string { return std::to_string(val); },
            [](const decimal_value val) -> std::string { return decimal_to_string(val); },
            [](const builtin_value val) -> std::string
            { return val != nullptr ? fmt::format("builtin({})", val->name) : "builtin(?)"; },
            [](const closure_value& val) -> std::string
            { return val ? fmt::format("function({})", fmt::join(val->parameters, ", ")) : "function(?)"; },
        },
        value);
}

auto operator==(const object& lhs, const object& rhs) -> bool
{
    return std::visit(overloaded {[](const nil_type&, const nil_type&) { return true; },
                                  [](const integer_value val1, const integer_value val2) { return val1 == val2; },
                                  [](const decimal_value val1, const decimal_value val2) { return val1 == val2; },
                                  [](const builtin_value val1, const builtin_value val2) { return val1 == val2; },
                                  [](const closure_value& val1, const closure_value& val2) { return val1 == val2; },
                                  [](const auto&, const auto&) { return false; }},
                      lhs.value,
                      rhs.value);
}

auto operator<<(std::ostream& ostrm, const object& obj) -> std::ostream&
{
    return ostrm << obj.inspect();
}
