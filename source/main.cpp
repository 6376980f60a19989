#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <error.hpp>
#include <eval/environment.hpp>
#include <eval/evaluator.hpp>
#include <eval/object.hpp>
#include <eval/run.hpp>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <lexer/lexer.hpp>
#include <parser/parser.hpp>

namespace
{
constexpr auto prompt = "in> ";
constexpr auto exit_command = "EXIT";

struct command_line_args
{
    bool help {};
    bool debug {};
    std::string_view file;
};

auto print_error(const carlae_error& error)
{
    fmt::print(stderr, "{}: {}\n", error.kind(), error.what());
}

[[noreturn]] auto show_usage(std::string_view program, std::string_view error_msg = {})
{
    auto exit_code = EXIT_SUCCESS;
    if (!error_msg.empty()) {
        fmt::print("Error: {}\n", error_msg);
        exit_code = EXIT_FAILURE;
    }
    fmt::print("Usage: {} [-d] [-h] [<file>]\n\n", program);
    // NOLINTBEGIN(concurrency-mt-unsafe)
    exit(exit_code);
    // NOLINTEND(concurrency-mt-unsafe)
}

auto parse_command_line(std::string_view program, int argc, char** argv) -> command_line_args
{
    command_line_args opts {};
    for (std::string_view arg : std::span(argv, static_cast<size_t>(argc))) {
        if (arg[0] == '-' && arg.size() == 1) {
            show_usage(program, fmt::format("invalid option {}", arg));
        }
        if (arg[0] == '-' && arg.size() > 1) {
            switch (arg[1]) {
                case 'h':
                    opts.help = true;
                    break;
                case 'd':
                    opts.debug = true;
                    break;
                default: {
                    show_usage(program, fmt::format("invalid option {}", arg));
                }
            }
        } else {
            if (opts.file.empty()) {
                opts.file = arg;
            } else {
                fmt::print("ignoring file argument {}, already have one set.\n", arg);
            }
        }
    }
    return opts;
}

// Echoes each stage to stderr in debug mode, otherwise runs the source in one go.
auto evaluate_source(std::string_view source,
                     std::string_view filename,
                     const environment_ptr& env,
                     const command_line_args& opts) -> object
{
    if (!opts.debug) {
        return run(source, env, filename).first;
    }
    const auto tokens = tokenize(source, filename);
    std::vector<std::string_view> literals;
    literals.reserve(tokens.size());
    for (const auto& tkn : tokens) {
        literals.push_back(tkn.literal);
    }
    fmt::print(stderr, "tokens: {}\n", fmt::join(literals, " "));
    const auto tree = parse(tokens);
    fmt::print(stderr, "tree: {}\n", tree->string());
    return evaluate(*tree, env);
}

auto run_file(const command_line_args& opts) -> int
{
    std::ifstream ifs(std::string {opts.file});
    if (!ifs) {
        std::cerr << "ERROR: could not open file: " << opts.file << '\n';
        return 1;
    }
    const std::string contents {(std::istreambuf_iterator<char>(ifs)), (std::istreambuf_iterator<char>())};
    auto env = make_frame(make_global_environment());
    auto exit_code = 0;
    try {
        fmt::print("{}\n", evaluate_source(contents, opts.file, env, opts));
    } catch (const carlae_error& e) {
        print_error(e);
        exit_code = 1;
    }
    env->break_cycle();
    return exit_code;
}

auto run_repl(const command_line_args& opts) -> int
{
    std::cout << "This is the Carlae programming language. Type " << exit_command << " to quit.\n";
    auto env = make_frame(make_global_environment());
    auto show_prompt = []() { std::cout << prompt << std::flush; };
    auto input = std::string {};
    show_prompt();
    while (getline(std::cin, input)) {
        if (input == exit_command) {
            break;
        }
        try {
            fmt::print("out> {}\n", evaluate_source(input, "<stdin>", env, opts));
        } catch (const carlae_error& e) {
            print_error(e);
        }
        show_prompt();
    }
    env->break_cycle();
    return 0;
}
}  // namespace

auto main(int argc, char* argv[]) -> int
{
    auto program = std::string_view(*argv);
    auto opts = parse_command_line(program, argc - 1, ++argv);
    if (opts.help) {
        show_usage(program);
    }
    try {
        if (!opts.file.empty()) {
            return run_file(opts);
        }
        return run_repl(opts);

    } catch (const std::exception& e) {
        std::cerr << "Caught an exception: " << e.what() << '\n';
        return 1;
    }
}
