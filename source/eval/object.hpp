#pragma once

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <ast/expression.hpp>
#include <error.hpp>
#include <fmt/ostream.h>

#include "environment_fwd.hpp"

struct builtin;
struct closure;

// the empty list, `()`
using nil_type = std::monostate;
using integer_value = std::int64_t;
using decimal_value = double;
using builtin_value = const builtin*;
using closure_value = std::shared_ptr<const closure>;

using value_type = std::variant<nil_type, integer_value, decimal_value, builtin_value, closure_value>;

struct object
{
    template<typename T>
    [[nodiscard]] constexpr auto is() const -> bool
    {
        return std::holds_alternative<T>(value);
    }

    [[nodiscard]] constexpr auto is_nil() const -> bool { return is<nil_type>(); }

    [[nodiscard]] constexpr auto is_number() const -> bool { return is<integer_value>() || is<decimal_value>(); }

    template<typename T>
    [[nodiscard]] auto as() const -> const T&
    {
        if (!is<T>()) {
            throw make_error<evaluation_error>("expected {}, got {} {}", object {T {}}.type_name(), type_name(), inspect());
        }
        return std::get<T>(value);
    }

    [[nodiscard]] auto type_name() const -> std::string;
    [[nodiscard]] auto inspect() const -> std::string;

    value_type value {};
};

auto operator==(const object& lhs, const object& rhs) -> bool;
auto operator<<(std::ostream& ostrm, const object& obj) -> std::ostream&;

template<>
struct fmt::formatter<object> : ostream_formatter
{
};

// A user defined function. Calls bind the parameters in a fresh child of `env`, the environment
// the function was created in.
struct closure final
{
    closure(std::vector<std::string> params, expression_ptr bod, environment_ptr closure_env)
        : parameters {std::move(params)}
        , body {std::move(bod)}
        , env {std::move(closure_env)}
    {
    }

    std::vector<std::string> parameters;
    expression_ptr body;
    environment_ptr env;
};
