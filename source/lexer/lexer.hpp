#pragma once
#include <cstddef>
#include <string_view>
#include <vector>

#include "location.hpp"
#include "token.hpp"

class lexer final
{
  public:
    explicit lexer(std::string_view input, std::string_view filename = "<stdin>");

    auto next_token() -> token;

  private:
    auto read_char() -> void;
    auto skip_whitespace() -> void;
    auto read_atom_or_keyword() -> token;
    [[nodiscard]] auto at_end() const -> bool;
    [[nodiscard]] auto current_char() const -> std::string_view::value_type;
    [[nodiscard]] auto current_loc() const -> location;

    std::string_view m_input;
    std::string_view m_filename;
    std::string_view::size_type m_position {0};
    std::size_t m_row {0};
    std::size_t m_column {0};
};

auto tokenize(std::string_view source, std::string_view filename = "<stdin>") -> std::vector<token>;
