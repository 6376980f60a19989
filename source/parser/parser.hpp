#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include <ast/expression.hpp>
#include <lexer/token.hpp>

constexpr std::size_t max_nesting_depth = 1000;

class parser final
{
  public:
    explicit parser(std::vector<token> tokens, std::size_t max_depth = max_nesting_depth);
    auto parse_expression() const -> expression_ptr;

  private:
    using token_span = std::span<const token>;

    auto parse(token_span tokens, std::size_t depth) const -> expression_ptr;
    static auto parse_atom(const token& tkn) -> expression_ptr;
    static auto group_tokens(token_span tokens) -> std::vector<token_span>;

    std::vector<token> m_tokens;
    std::size_t m_max_depth;
};

auto parse(std::vector<token> tokens) -> expression_ptr;
