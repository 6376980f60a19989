#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <error.hpp>
#include <eval/environment.hpp>
#include <eval/object.hpp>
#include <eval/run.hpp>
#include <gtest/gtest.h>

#include "testutils.hpp"

// NOLINTBEGIN(*-magic-numbers)
TEST(eval, testIntegerExpressions)
{
    struct integer_test
    {
        std::string_view input;
        std::int64_t expected;
    };
    const std::vector<integer_test> tests {
        {"5", 5},
        {"-10", -10},
        {"(+ 2 3)", 5},
        {"(+ 1 2 3 4 5)", 15},
        {"(- 10 1 2)", 7},
        {"(- 5)", -5},
        {"(* 2 (+ 3 4))", 14},
        {"(/ 100 7)", 14},
        {"(+ (* 2 2) (- 10 (/ 9 3)))", 11},
    };
    for (const auto& [input, expected] : tests) {
        SCOPED_TRACE(input);
        assert_integer_object(test_eval(input), expected);
    }
}

TEST(eval, testDecimalExpressions)
{
    struct decimal_test
    {
        std::string_view input;
        double expected;
    };
    const std::vector<decimal_test> tests {
        {"2.5", 2.5},
        {"(+ 1 2.5)", 3.5},
        {"(* 2.0 3)", 6.0},
        {"(/ 7 2.0)", 3.5},
        {"(- 0.5)", -0.5},
        {"(+ 0.1 0.2)", 0.1 + 0.2},
    };
    for (const auto& [input, expected] : tests) {
        SCOPED_TRACE(input);
        assert_decimal_object(test_eval(input), expected);
    }
}

TEST(eval, testNil)
{
    assert_nil_object(test_eval("()"));
    assert_nil_object(test_eval("(())"));
}

TEST(eval, testSingleElementCombination)
{
    assert_integer_object(test_eval("(5)"), 5);
    assert_integer_object(test_eval("((+ 1 2))"), 3);
    assert_decimal_object(test_eval("(((2.5)))"), 2.5);
    EXPECT_TRUE(test_eval("+").is<builtin_value>());
    EXPECT_TRUE(test_eval("(+)").is<builtin_value>());
    EXPECT_TRUE(test_eval("((*))").is<builtin_value>());
}

TEST(eval, testAssignment)
{
    assert_integer_object(test_eval("(:= x 10)"), 10);
    assert_integer_object(test_eval_multi({"(:= x 10)", "(+ x x)"}), 20);
    assert_integer_object(test_eval_multi({"(:= x 10)", "(:= x (+ x 1))", "x"}), 11);
    assert_decimal_object(test_eval_multi({"(:= pi 3.14)", "(* pi 2)"}), 6.28);
}

TEST(eval, testFunctionDefinition)
{
    assert_closure_object(test_eval("(:= (square x) (* x x))"), {"x"});
    assert_integer_object(test_eval_multi({"(:= (square x) (* x x))", "(square 6)"}), 36);
    assert_closure_object(test_eval("(function (a b) (+ a b))"), {"a", "b"});
    assert_closure_object(test_eval("(function () 42)"), {});
    assert_integer_object(test_eval("((function (a b) (+ a b)) 3 4)"), 7);
    assert_integer_object(
        test_eval_multi({"(:= add (function (a b) (+ a b)))", "(add (add 1 2) (add 3 4))"}), 10);
}

TEST(eval, testFunctionWithoutArgumentsIsNotCalled)
{
    assert_closure_object(test_eval_multi({"(:= (answer) 42)", "(answer)"}), {});
}

TEST(eval, testLexicalScope)
{
    assert_integer_object(test_eval_multi({
                              "(:= x 1)",
                              "(:= (show-x ignored) x)",
                              "(:= (caller x) (show-x 0))",
                              "(caller 2)",
                          }),
                          1);
}

TEST(eval, testClosures)
{
    assert_integer_object(test_eval_multi({
                              "(:= (make-adder n) (function (x) (+ x n)))",
                              "(:= add5 (make-adder 5))",
                              "(add5 10)",
                          }),
                          15);
    assert_integer_object(test_eval_multi({
                              "(:= (make-adder n) (function (x) (+ x n)))",
                              "(:= add1 (make-adder 1))",
                              "(:= add2 (make-adder 2))",
                              "(+ (add1 10) (add2 10))",
                          }),
                          23);
    assert_integer_object(test_eval("(((function (a) (function (b) (* a b))) 6) 7)"), 42);
}

TEST(eval, testShadowing)
{
    assert_integer_object(test_eval_multi({"(:= x 1)", "(:= (f x) (* x 10))", "(f 5)"}), 50);
    assert_integer_object(test_eval_multi({"(:= x 1)", "(:= (f x) (* x 10))", "(f 5)", "x"}), 1);
    assert_integer_object(test_eval_multi({"(:= (f y) (:= x y))", "(:= x 1)", "(f 99)", "x"}), 1);
}

TEST(eval, testLateBinding)
{
    assert_integer_object(test_eval_multi({"(:= (get-y ignored) y)", "(:= y 3)", "(get-y 0)"}), 3);
    assert_integer_object(test_eval_multi({"(:= (get-y ignored) y)", "(:= y 3)", "(:= y 4)", "(get-y 0)"}), 4);
}

TEST(eval, testFalsyBindings)
{
    assert_integer_object(test_eval_multi({"(:= z 0)", "z"}), 0);
    assert_decimal_object(test_eval_multi({"(:= z 0.0)", "z"}), 0.0);
    assert_nil_object(test_eval_multi({"(:= z ())", "z"}));
    assert_integer_object(test_eval_multi({"(:= z 0)", "(:= (f ignored) z)", "(f 1)"}), 0);
}

TEST(eval, testErrors)
{
    struct error_test
    {
        std::deque<std::string> inputs;
        std::string_view expected_kind;
    };
    const std::vector<error_test> tests {
        {{"undefined"}, "name error"},
        {{"(+ 1 nope)"}, "name error"},
        {{"(nope 1 2)"}, "name error"},
        {{"(:= (f a) b)", "(f 1)"}, "name error"},
        {{"(1 2)"}, "evaluation error"},
        {{"(() 1)"}, "evaluation error"},
        {{"(/ 1 0)"}, "evaluation error"},
        {{"(+ 1 (function (x) x))"}, "evaluation error"},
        {{"(:= x)"}, "evaluation error"},
        {{"(:= x 1 2)"}, "evaluation error"},
        {{"(:= 5 1)"}, "evaluation error"},
        {{"(:= () 1)"}, "evaluation error"},
        {{"(:= (f 1) 1)"}, "evaluation error"},
        {{"(function x x)"}, "evaluation error"},
        {{"(function (1) 1)"}, "evaluation error"},
        {{"(function (a))"}, "evaluation error"},
        {{"((function (a) a) 1 2)"}, "evaluation error"},
        {{"(:= (f a b) a)", "(f 1)"}, "evaluation error"},
        {{"(+ 1"}, "syntax error"},
        {{")"}, "syntax error"},
        {{"(+ 1 2) 3"}, "syntax error"},
        {{""}, "syntax error"},
    };
    for (const auto& [inputs, expected_kind] : tests) {
        SCOPED_TRACE(inputs.back());
        try {
            static_cast<void>(test_eval_multi(inputs));
            ADD_FAILURE() << "expected " << expected_kind;
        } catch (const carlae_error& e) {
            EXPECT_EQ(e.kind(), expected_kind) << e.what();
        }
    }
}

TEST(eval, testErrorLeavesEarlierBindings)
{
    auto env = run("(:= x 5)").second;
    EXPECT_THROW(static_cast<void>(run("(+ x nope)", env)), name_error);
    assert_integer_object(run("x", env).first, 5);
    env->break_cycle();
}

TEST(eval, testBreakCycleReleasesNestedDefinitions)
{
    auto env = run("(:= (f x) (:= (g y) y))").second;
    std::weak_ptr<environment> call_frame;
    {
        const auto inner = run("(f 1)", env).first;
        assert_closure_object(inner, {"y"});
        call_frame = inner.as<closure_value>()->env;
    }
    assert_closure_object(run("(f 2)", env).first, {"y"});
    EXPECT_FALSE(call_frame.expired());
    env->break_cycle();
    EXPECT_TRUE(call_frame.expired());
}

TEST(eval, testRecursionLimit)
{
    EXPECT_THROW(static_cast<void>(test_eval_multi({"(:= (loop n) (loop n))", "(loop 1)"})), recursion_error);
    assert_integer_object(test_eval_multi({"(:= (id n) n)", "(id (id (id (id 4))))"}), 4);
}
// NOLINTEND(*-magic-numbers)
