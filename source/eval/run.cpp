#include <memory>
#include <string_view>
#include <utility>

#include "run.hpp"

#include <builtin/builtin.hpp>
#include <lexer/lexer.hpp>
#include <parser/parser.hpp>

#include "environment.hpp"
#include "evaluator.hpp"

auto make_global_environment() -> environment_ptr
{
    auto global_env = std::make_shared<environment>();
    for (const auto* bltn : builtin::builtins()) {
        global_env->set(bltn->name, object {bltn});
    }
    return global_env;
}

auto run(std::string_view source, environment_ptr env, std::string_view filename) -> run_result
{
    if (!env) {
        env = make_frame(make_global_environment());
    }
    const auto tree = parse(tokenize(source, filename));
    auto result = evaluate(*tree, env);
    return {std::move(result), std::move(env)};
}
