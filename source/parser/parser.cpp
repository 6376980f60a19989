#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#include "parser.hpp"

#include <ast/combination.hpp>
#include <ast/decimal_literal.hpp>
#include <ast/expression.hpp>
#include <ast/identifier.hpp>
#include <ast/integer_literal.hpp>
#include <error.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

namespace
{
auto strip_plus_sign(std::string_view literal) -> std::optional<std::string_view>
{
    if (!literal.starts_with('+')) {
        return literal;
    }
    literal.remove_prefix(1);
    if (literal.empty() || literal.starts_with('+') || literal.starts_with('-')) {
        return std::nullopt;
    }
    return literal;
}

template<typename T>
auto parse_number(std::string_view literal) -> std::optional<T>
{
    const auto digits = strip_plus_sign(literal);
    if (!digits.has_value()) {
        return std::nullopt;
    }
    const auto* last = digits->data() + digits->size();
    T value {};
    const auto [ptr, ec] = std::from_chars(digits->data(), last, value);
    if (ptr != last) {
        return std::nullopt;
    }
    if constexpr (std::is_floating_point_v<T>) {
        // from_chars leaves the value untouched on overflow or underflow, strtod saturates to
        // +-HUGE_VAL or a signed zero
        if (ec == std::errc::result_out_of_range) {
            return std::strtod(std::string {*digits}.c_str(), nullptr);
        }
    }
    if (ec != std::errc {}) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

parser::parser(std::vector<token> tokens, std::size_t max_depth)
    : m_tokens {std::move(tokens)}
    , m_max_depth {max_depth}
{
}

auto parser::parse_expression() const -> expression_ptr
{
    if (m_tokens.empty()) {
        throw make_error<syntax_error>("empty program");
    }
    return parse(m_tokens, 0);
}

auto parser::parse(token_span tokens, std::size_t depth) const -> expression_ptr
{
    using enum token_type;
    const auto& first = tokens.front();
    if (depth >= m_max_depth) {
        throw make_error<recursion_error>("expression at {} is nested deeper than {} levels", first.loc, m_max_depth);
    }
    if (tokens.size() == 1) {
        if (first.type == lparen || first.type == rparen) {
            throw make_error<syntax_error>("unbalanced parentheses: lone `{}` at {}", first.literal, first.loc);
        }
        return parse_atom(first);
    }
    const auto& last = tokens.back();
    if (first.type != lparen) {
        throw make_error<syntax_error>("expected `(` at {}, got `{}`", first.loc, first.literal);
    }
    if (last.type != rparen) {
        throw make_error<syntax_error>("expected `)` at {}, got `{}`", last.loc, last.literal);
    }
    expressions elements;
    for (const auto group : group_tokens(tokens.subspan(1, tokens.size() - 2))) {
        elements.push_back(parse(group, depth + 1));
    }
    return std::make_shared<combination>(std::move(elements), first.loc);
}

auto parser::parse_atom(const token& tkn) -> expression_ptr
{
    if (const auto integer = parse_number<std::int64_t>(tkn.literal); integer.has_value()) {
        return std::make_shared<integer_literal>(*integer, tkn.loc);
    }
    if (const auto decimal = parse_number<double>(tkn.literal); decimal.has_value()) {
        return std::make_shared<decimal_literal>(*decimal, tkn.loc);
    }
    return std::make_shared<identifier>(std::string {tkn.literal}, tkn.loc);
}

// Splits the inside of a combination into its top level elements: a single token at depth 0, or a
// balanced run from a `(` at depth 0 to the `)` closing it.
auto parser::group_tokens(token_span tokens) -> std::vector<token_span>
{
    using enum token_type;
    std::vector<token_span> groups;
    std::size_t depth = 0;
    std::size_t group_start = 0;
    for (std::size_t idx = 0; idx < tokens.size(); ++idx) {
        const auto& tkn = tokens[idx];
        if (tkn.type == lparen) {
            if (depth == 0) {
                group_start = idx;
            }
            depth++;
            continue;
        }
        if (tkn.type == rparen) {
            if (depth == 0) {
                throw make_error<syntax_error>("unbalanced parentheses: unexpected `)` at {}", tkn.loc);
            }
            depth--;
            if (depth == 0) {
                groups.push_back(tokens.subspan(group_start, idx - group_start + 1));
            }
            continue;
        }
        if (depth == 0) {
            groups.push_back(tokens.subspan(idx, 1));
        }
    }
    if (depth > 0) {
        throw make_error<syntax_error>("unbalanced parentheses: `(` at {} is never closed", tokens[group_start].loc);
    }
    return groups;
}

auto parse(std::vector<token> tokens) -> expression_ptr
{
    return parser {std::move(tokens)}.parse_expression();
}
