#pragma once
#include <cstddef>
#include <functional>
#include <string_view>
#include <vector>
#include "stackcalc/parser.hpp"
#include "stackcalc/program.hpp"
#include "stackcalc/token.hpp"

namespace stackcalc {

enum class Engine {
    VM,   // compile, then run on the stack machine
    Tree, // interpret the AST directly
};

struct Options {
    Engine engine{Engine::VM};
    std::size_t max_depth{kDefaultMaxDepth};
};

// Observers for the intermediate results of evaluate(). Empty hooks are
// skipped; on_program only fires for Engine::VM.
struct Trace {
    std::function<void(const std::vector<Token>&)> on_tokens;
    std::function<void(const Expr&)> on_ast;
    std::function<void(const Program&)> on_program;
};

/// Tokenize, parse and evaluate one infix expression.
/// Throws LexError, ParseError or RuntimeError; all derive from Error.
double evaluate(std::string_view input, const Options& opts = {}, const Trace& trace = {});

} // namespace stackcalc
