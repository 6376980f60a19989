#pragma once

#include <string_view>
#include <utility>

#include "environment_fwd.hpp"
#include "object.hpp"

using run_result = std::pair<object, environment_ptr>;

// the root environment holding the builtin table
auto make_global_environment() -> environment_ptr;

// Tokenizes, parses and evaluates `source` in `env`. Without an environment a fresh one, chained
// under a fresh builtin root, is created. Either way the environment is returned with the value so
// that bindings carry over to the next call. `filename` shows up in error locations.
auto run(std::string_view source, environment_ptr env = {}, std::string_view filename = "<stdin>") -> run_result;
