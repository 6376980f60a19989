#include <algorithm>
#include <array>
#include <string_view>
#include <utility>
#include <vector>

#include "lexer.hpp"

#include "location.hpp"
#include "token.hpp"
#include "token_type.hpp"

namespace
{
constexpr auto comment_start = '#';
constexpr auto keyword_count = 2;
using keyword_pair = std::pair<std::string_view, token_type>;
using keyword_lookup_table = std::array<keyword_pair, keyword_count>;

constexpr auto build_keyword_to_token_type_map() -> keyword_lookup_table
{
    return {
        std::pair {":=", token_type::assign},
        std::pair {"function", token_type::function},
    };
}

constexpr auto keyword_tokens = build_keyword_to_token_type_map();

inline auto is_whitespace(char chr) -> bool
{
    return chr == ' ' || chr == '\n' || chr == '\t' || chr == '\r';
}

inline auto is_paren(char chr) -> bool
{
    return chr == '(' || chr == ')';
}

inline auto is_delimiter(char chr) -> bool
{
    return is_whitespace(chr) || is_paren(chr);
}

}  // namespace

lexer::lexer(std::string_view input, std::string_view filename)
    : m_input {input}
    , m_filename {filename}
{
}

auto lexer::next_token() -> token
{
    using enum token_type;
    skip_whitespace();
    const auto loc = current_loc();
    if (at_end()) {
        return token {.type = eof, .literal = "", .loc = loc};
    }
    if (is_paren(current_char())) {
        const auto tkn = token {.type = current_char() == '(' ? lparen : rparen,
                                .literal = m_input.substr(m_position, 1),
                                .loc = loc};
        read_char();
        return tkn;
    }
    return read_atom_or_keyword();
}

auto lexer::read_char() -> void
{
    if (current_char() == '\n') {
        m_row++;
        m_column = 0;
    } else {
        m_column++;
    }
    m_position++;
}

auto lexer::skip_whitespace() -> void
{
    while (!at_end()) {
        if (current_char() == comment_start) {
            while (!at_end() && current_char() != '\n') {
                read_char();
            }
            continue;
        }
        if (!is_whitespace(current_char())) {
            break;
        }
        read_char();
    }
}

// A keyword is split off as soon as the pending atom spells it, so `:=x` lexes as `:=` `x`.
auto lexer::read_atom_or_keyword() -> token
{
    const auto loc = current_loc();
    const auto position = m_position;
    while (!at_end() && !is_delimiter(current_char()) && current_char() != comment_start) {
        read_char();
        const auto literal = m_input.substr(position, m_position - position);
        const auto itr = std::find_if(keyword_tokens.cbegin(),
                                      keyword_tokens.cend(),
                                      [literal](const keyword_pair& pair) { return pair.first == literal; });
        if (itr != keyword_tokens.cend()) {
            return token {.type = itr->second, .literal = literal, .loc = loc};
        }
    }
    return token {.type = token_type::atom, .literal = m_input.substr(position, m_position - position), .loc = loc};
}

auto lexer::at_end() const -> bool
{
    return m_position >= m_input.size();
}

auto lexer::current_char() const -> std::string_view::value_type
{
    return m_input[m_position];
}

auto lexer::current_loc() const -> location
{
    return location {.filename = m_filename, .line = m_row + 1, .column = m_column + 1};
}

auto tokenize(std::string_view source, std::string_view filename) -> std::vector<token>
{
    auto lxr = lexer {source, filename};
    std::vector<token> tokens;
    for (auto tkn = lxr.next_token(); tkn.type != token_type::eof; tkn = lxr.next_token()) {
        tokens.push_back(tkn);
    }
    return tokens;
}
