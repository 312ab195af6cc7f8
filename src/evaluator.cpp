#include "stackcalc/evaluator.hpp"
#include "stackcalc/compiler.hpp"
#include "stackcalc/lexer.hpp"
#include "stackcalc/vm.hpp"

namespace stackcalc {

double evaluate(std::string_view input, const Options& opts, const Trace& trace) {
    std::vector<Token> tokens = tokenize(input);
    if (trace.on_tokens) trace.on_tokens(tokens);

    Expr ast = parse(tokens, opts.max_depth);
    if (trace.on_ast) trace.on_ast(ast);

    if (opts.engine == Engine::Tree) return interpret(ast);

    Program program = compile(ast);
    if (trace.on_program) trace.on_program(program);
    return run(program);
}

} // namespace stackcalc
