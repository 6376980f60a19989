#pragma once

#include <algorithm>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

template<typename Node>
auto join(const std::vector<Node>& nodes, std::string_view sep = {}) -> std::string
{
    auto strs = std::vector<std::string>();
    std::transform(
        nodes.cbegin(), nodes.cend(), std::back_inserter(strs), [](const auto& node) { return node->string(); });
    return fmt::format("{}", fmt::join(strs.cbegin(), strs.cend(), sep));
}

// keeps a trailing `.0` on integral values so decimals never read back as integers
inline auto decimal_to_string(double d) -> std::string
{
    auto str = fmt::format("{}", d);
    if (str.find_first_not_of("-0123456789") == std::string::npos) {
        str += ".0";
    }
    return str;
}
