#pragma once

#include <stdexcept>
#include <string_view>
#include <utility>

#include <fmt/core.h>

struct carlae_error : std::runtime_error
{
    using std::runtime_error::runtime_error;

    [[nodiscard]] virtual auto kind() const -> std::string_view = 0;
};

// malformed parenthesization, a lone paren or an empty program
struct syntax_error final : carlae_error
{
    using carlae_error::carlae_error;

    [[nodiscard]] auto kind() const -> std::string_view override { return "syntax error"; }
};

// a symbol without a binding anywhere in the environment chain
struct name_error final : carlae_error
{
    using carlae_error::carlae_error;

    [[nodiscard]] auto kind() const -> std::string_view override { return "name error"; }
};

struct evaluation_error final : carlae_error
{
    using carlae_error::carlae_error;

    [[nodiscard]] auto kind() const -> std::string_view override { return "evaluation error"; }
};

// nesting or recursion deeper than the configured limit
struct recursion_error final : carlae_error
{
    using carlae_error::carlae_error;

    [[nodiscard]] auto kind() const -> std::string_view override { return "recursion error"; }
};

template<typename Error, typename... T>
auto make_error(fmt::format_string<T...> fmt, T&&... args) -> Error
{
    return Error(fmt::format(fmt, std::forward<T>(args)...));
}
