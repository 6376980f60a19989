#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "builtin.hpp"

#include <error.hpp>
#include <eval/object.hpp>
#include <overloaded.hpp>

builtin::builtin(std::string name, std::function<object(const std::vector<object>& arguments)> bod)
    : name {std::move(name)}
    , body {std::move(bod)}
{
}

namespace
{
using operands = std::span<const object>;

// integer arithmetic wraps around instead of overflowing
auto wrapping_add(integer_value lhs, integer_value rhs) -> integer_value
{
    return static_cast<integer_value>(static_cast<std::uint64_t>(lhs) + static_cast<std::uint64_t>(rhs));
}

auto wrapping_sub(integer_value lhs, integer_value rhs) -> integer_value
{
    return static_cast<integer_value>(static_cast<std::uint64_t>(lhs) - static_cast<std::uint64_t>(rhs));
}

auto wrapping_mul(integer_value lhs, integer_value rhs) -> integer_value
{
    return static_cast<integer_value>(static_cast<std::uint64_t>(lhs) * static_cast<std::uint64_t>(rhs));
}

auto integer_div(integer_value lhs, integer_value rhs) -> integer_value
{
    if (rhs == 0) {
        throw make_error<evaluation_error>("division by zero");
    }
    if (rhs == -1) {
        return wrapping_sub(0, lhs);
    }
    return lhs / rhs;
}

auto decimal_div(decimal_value lhs, decimal_value rhs) -> decimal_value
{
    if (rhs == 0.0) {
        throw make_error<evaluation_error>("division by zero");
    }
    return lhs / rhs;
}

auto require_number(const object& operand, std::string_view name) -> void
{
    if (!operand.is_number()) {
        throw make_error<evaluation_error>(
            "unsupported operand type for {}: {} {}", name, operand.type_name(), operand.inspect());
    }
}

auto require_operands(operands arguments, std::string_view name) -> void
{
    if (arguments.empty()) {
        throw make_error<evaluation_error>("wrong number of arguments to {}: expected at least 1, got 0", name);
    }
}

auto to_decimal(const object& operand) -> decimal_value
{
    return std::visit(overloaded {
                          [](const integer_value val) { return static_cast<decimal_value>(val); },
                          [](const decimal_value val) { return val; },
                          [](const auto&) -> decimal_value { throw make_error<evaluation_error>("not a number"); },
                      },
                      operand.value);
}

// Folds the operands into `init` from left to right, staying integer until a decimal shows up.
template<typename IntegerOp, typename DecimalOp>
auto fold(std::string_view name, object init, operands rest, IntegerOp integer_op, DecimalOp decimal_op) -> object
{
    require_number(init, name);
    auto result = std::move(init);
    for (const auto& operand : rest) {
        require_number(operand, name);
        if (result.is<integer_value>() && operand.is<integer_value>()) {
            result = object {integer_op(result.as<integer_value>(), operand.as<integer_value>())};
        } else {
            result = object {decimal_op(to_decimal(result), to_decimal(operand))};
        }
    }
    return result;
}

auto negate(const object& operand) -> object
{
    require_number(operand, "-");
    if (operand.is<integer_value>()) {
        return object {wrapping_sub(0, operand.as<integer_value>())};
    }
    return object {-operand.as<decimal_value>()};
}

const builtin plus {"+",
                    [](const std::vector<object>& arguments) -> object
                    {
                        return fold("+", object {integer_value {0}}, arguments, wrapping_add, std::plus<> {});
                    }};

const builtin minus {"-",
                     [](const std::vector<object>& arguments) -> object
                     {
                         require_operands(arguments, "-");
                         if (arguments.size() == 1) {
                             return negate(arguments.front());
                         }
                         return fold("-", arguments.front(), operands {arguments}.subspan(1), wrapping_sub, std::minus<> {});
                     }};

const builtin asterisk {"*",
                        [](const std::vector<object>& arguments) -> object
                        {
                            return fold("*", object {integer_value {1}}, arguments, wrapping_mul, std::multiplies<> {});
                        }};

const builtin slash {"/",
                     [](const std::vector<object>& arguments) -> object
                     {
                         require_operands(arguments, "/");
                         return fold("/", arguments.front(), operands {arguments}.subspan(1), integer_div, decimal_div);
                     }};

}  // namespace

auto builtin::builtins() -> const std::vector<const builtin*>&
{
    static const std::vector<const builtin*> bltns {
        &plus,
        &minus,
        &asterisk,
        &slash,
    };
    return bltns;
}
