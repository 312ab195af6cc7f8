#include <gtest/gtest.h>
#include <stackcalc/compiler.hpp>
#include <stackcalc/evaluator.hpp>
#include <stackcalc/lexer.hpp>
#include <stackcalc/vm.hpp>

#include <cmath>
#include <string>
#include <vector>

namespace {

using stackcalc::Engine;
using stackcalc::Options;
using stackcalc::evaluate;

static Options tree_engine() {
    Options o;
    o.engine = Engine::Tree;
    return o;
}

TEST(Expr, Scenarios) {
    EXPECT_DOUBLE_EQ(evaluate("( 1 + 2 ) * 3"), 9.0);
    EXPECT_DOUBLE_EQ(evaluate("( 1 + 2 ) * 3 + 2 * 3"), 15.0);
    EXPECT_DOUBLE_EQ(evaluate("1 + 2 + 3 + 4"), 10.0);
    EXPECT_DOUBLE_EQ(evaluate("5"), 5.0);
}

TEST(Expr, SubtractionAndDivisionGroupRight) {
    EXPECT_DOUBLE_EQ(evaluate("10 - 5 - 2"), 7.0);
    EXPECT_DOUBLE_EQ(evaluate("8 / 4 / 2"), 4.0);
    EXPECT_DOUBLE_EQ(evaluate("( 10 - 5 ) - 2"), 3.0);
    EXPECT_DOUBLE_EQ(evaluate("2 * 3 - 4 - 1"), 3.0);
}

TEST(Expr, DecimalsAndCompactSpacing) {
    EXPECT_DOUBLE_EQ(evaluate("0.5*(3+1)"), 2.0);
    EXPECT_DOUBLE_EQ(evaluate("1.5e1 / 3"), 5.0);
}

TEST(Expr, SignedLiterals) {
    EXPECT_DOUBLE_EQ(evaluate("3 * -5"), -15.0);
    EXPECT_DOUBLE_EQ(evaluate("10 - -5"), 15.0);
    EXPECT_DOUBLE_EQ(evaluate("(-2) * +4"), -8.0);
    EXPECT_THROW(evaluate("1 -5"), stackcalc::ParseError);
}

TEST(Expr, DivideByZero) {
    double r = evaluate("1 / 0");
    EXPECT_TRUE(std::isinf(r));
    EXPECT_GT(r, 0.0);
}

TEST(Expr, EnginesAgree) {
    const char* inputs[] = {
        "( 1 + 2 ) * 3 + 2 * 3",
        "10 - 5 - 2",
        "1 / ( 2 - ( 3 * ( 4 + 5 ) ) ) / 6",
        "7 / 3 * 2 - 1",
        "1 / 0",
    };
    for (const char* in : inputs) {
        EXPECT_EQ(evaluate(in), evaluate(in, tree_engine())) << in;
    }
    EXPECT_TRUE(std::isnan(evaluate("0 / 0", tree_engine())));
}

TEST(Expr, InterpretMatchesCompiledProgram) {
    auto ast = stackcalc::parse(stackcalc::tokenize("( 4 - 1 ) * ( 2 + 6 ) / 3"));
    EXPECT_EQ(stackcalc::interpret(ast), stackcalc::run(stackcalc::compile(ast)));
    EXPECT_DOUBLE_EQ(stackcalc::interpret(ast), 8.0);
}

TEST(Expr, ErrorsReportTheirStage) {
    auto stage_of = [](const std::string& in) {
        try {
            evaluate(in);
        } catch (const stackcalc::Error& e) {
            return e.stage();
        }
        ADD_FAILURE() << "expected an error for: " << in;
        return stackcalc::Stage::Runtime;
    };

    EXPECT_EQ(stage_of("1 + two"), stackcalc::Stage::Lex);
    EXPECT_EQ(stage_of("( 1 + 2"), stackcalc::Stage::Parse);
    EXPECT_EQ(stage_of(""), stackcalc::Stage::Parse);
    EXPECT_EQ(stage_of("3 2 1 + +"), stackcalc::Stage::Parse);
    EXPECT_STREQ(stackcalc::to_string(stackcalc::Stage::Lex), "lex");
}

static std::string nested_parens(std::size_t levels) {
    return std::string(levels, '(') + "2" + std::string(levels, ')');
}

static std::string sum_chain(std::size_t terms) {
    std::string s = "1";
    for (std::size_t i = 1; i < terms; ++i) s += " + 1";
    return s;
}

TEST(Expr, DeepestAcceptedInputEvaluates) {
    Options vm;
    vm.max_depth = stackcalc::kMaxDepthLimit;
    Options tree = tree_engine();
    tree.max_depth = stackcalc::kMaxDepthLimit;

    // Each parenthesis costs two levels, plus two for the outermost Expression.
    const std::size_t levels = (stackcalc::kMaxDepthLimit - 2) / 2;
    EXPECT_DOUBLE_EQ(evaluate(nested_parens(levels), vm), 2.0);
    EXPECT_DOUBLE_EQ(evaluate(nested_parens(levels), tree), 2.0);
    EXPECT_THROW(evaluate(nested_parens(levels + 1), vm), stackcalc::ParseError);

    const std::size_t terms = stackcalc::kMaxDepthLimit - 1;
    EXPECT_DOUBLE_EQ(evaluate(sum_chain(terms), vm), static_cast<double>(terms));
    EXPECT_DOUBLE_EQ(evaluate(sum_chain(terms), tree), static_cast<double>(terms));
    EXPECT_THROW(evaluate(sum_chain(terms + 1), vm), stackcalc::ParseError);
}

TEST(Expr, TraceSeesEachStage) {
    std::vector<std::string> seen;
    stackcalc::Trace trace;
    trace.on_tokens = [&](const std::vector<stackcalc::Token>& toks) {
        seen.push_back("tokens " + std::to_string(toks.size()));
    };
    trace.on_ast = [&](const stackcalc::Expr& e) { seen.push_back("ast " + stackcalc::to_string(e)); };
    trace.on_program = [&](const stackcalc::Program& p) {
        seen.push_back("program " + std::to_string(p.code.size()));
    };

    EXPECT_DOUBLE_EQ(evaluate("( 1 + 2 ) * 3", Options{}, trace), 9.0);
    std::vector<std::string> want{"tokens 7", "ast Mul(Add(1, 2), 3)", "program 5"};
    EXPECT_EQ(seen, want);

    seen.clear();
    EXPECT_DOUBLE_EQ(evaluate("4 / 2", tree_engine(), trace), 2.0);
    std::vector<std::string> tree_want{"tokens 3", "ast Div(4, 2)"};
    EXPECT_EQ(seen, tree_want);
}

TEST(Expr, MaxDepthOption) {
    Options o;
    o.max_depth = 4;
    EXPECT_DOUBLE_EQ(evaluate("1 + 2", o), 3.0);
    EXPECT_THROW(evaluate("( ( ( 1 ) ) )", o), stackcalc::ParseError);
}

} // namespace
