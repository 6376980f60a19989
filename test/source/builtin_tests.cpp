#include <algorithm>
#include <initializer_list>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <builtin/builtin.hpp>
#include <error.hpp>
#include <eval/object.hpp>
#include <gtest/gtest.h>

#include "testutils.hpp"

namespace
{
auto call(std::string_view name, const std::vector<object>& arguments) -> object
{
    const auto& builtins = builtin::builtins();
    const auto itr = std::find_if(
        builtins.cbegin(), builtins.cend(), [name](const builtin* bltn) { return bltn->name == name; });
    if (itr == builtins.cend()) {
        throw std::invalid_argument("no such builtin");
    }
    return (*itr)->body(arguments);
}

auto integers(std::initializer_list<integer_value> values) -> std::vector<object>
{
    std::vector<object> result;
    for (const auto value : values) {
        result.push_back(object {value});
    }
    return result;
}
}  // namespace

TEST(builtin, testTable)
{
    std::vector<std::string_view> names;
    for (const auto* bltn : builtin::builtins()) {
        names.push_back(bltn->name);
    }
    EXPECT_EQ(names, (std::vector<std::string_view> {"+", "-", "*", "/"}));
}

TEST(builtin, testIntegerArithmetic)
{
    assert_integer_object(call("+", {}), 0);
    assert_integer_object(call("+", integers({1, 2, 3, 4})), 10);
    assert_integer_object(call("-", integers({5})), -5);
    assert_integer_object(call("-", integers({10, 3, 2})), 5);
    assert_integer_object(call("*", {}), 1);
    assert_integer_object(call("*", integers({2, 3, 4})), 24);
    assert_integer_object(call("/", integers({7})), 7);
    assert_integer_object(call("/", integers({100, 5, 2})), 10);
    assert_integer_object(call("/", integers({7, 2})), 3);
    assert_integer_object(call("/", integers({-7, 2})), -3);
}

TEST(builtin, testDecimalPromotion)
{
    assert_decimal_object(call("+", {object {integer_value {1}}, object {decimal_value {2.5}}}), 3.5);
    assert_decimal_object(call("-", {object {decimal_value {1.5}}}), -1.5);
    assert_decimal_object(call("-", {object {integer_value {10}}, object {decimal_value {0.5}}}), 9.5);
    assert_decimal_object(call("*", {object {decimal_value {2.0}}, object {integer_value {3}}}), 6.0);
    assert_decimal_object(call("/", {object {integer_value {7}}, object {decimal_value {2.0}}}), 3.5);
    assert_decimal_object(call("/", {object {decimal_value {1.0}}, object {integer_value {4}}}), 0.25);
}

TEST(builtin, testIntegerWrapsAround)
{
    constexpr auto max = std::numeric_limits<integer_value>::max();
    constexpr auto min = std::numeric_limits<integer_value>::min();
    assert_integer_object(call("+", integers({max, 1})), min);
    assert_integer_object(call("-", integers({min})), min);
    assert_integer_object(call("/", integers({min, -1})), min);
}

TEST(builtin, testErrors)
{
    EXPECT_THROW(call("-", {}), evaluation_error);
    EXPECT_THROW(call("/", {}), evaluation_error);
    EXPECT_THROW(call("/", integers({1, 0})), evaluation_error);
    EXPECT_THROW(call("/", {object {decimal_value {1.0}}, object {decimal_value {0.0}}}), evaluation_error);
    EXPECT_THROW(call("+", {object {integer_value {1}}, object {}}), evaluation_error);
    EXPECT_THROW(call("-", {object {}}), evaluation_error);
    EXPECT_THROW(call("*", {object {builtin::builtins().front()}}), evaluation_error);
}
