#include <stackcalc/evaluator.hpp>
#include <stackcalc/lexer.hpp>
#include <stackcalc/parser.hpp>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitUsage = 2;
constexpr int kExitLex = 3;
constexpr int kExitParse = 4;
constexpr int kExitRuntime = 5;

struct UsageError : std::runtime_error { using std::runtime_error::runtime_error; };

struct Config {
    stackcalc::Options eval;
    int precision{15};
    bool show_tokens{false};
    bool show_ast{false};
    bool show_disasm{false};
    bool help{false};
    bool from_args{false};
    std::string expression;
};

const std::string kUsage =
    "usage: stackcalc [options] [--] [expression...]\n"
    "\n"
    "Evaluates an infix arithmetic expression (+ - * / and parentheses).\n"
    "Reads one line from standard input when no expression is given.\n"
    "Options start with '--' (or are -h); '--' ends them.\n"
    "\n"
    "options:\n"
    "  --engine=vm|tree   evaluate on the stack machine (default) or walk the tree\n"
    "  --max-depth=N      parser nesting limit, 1.." + std::to_string(stackcalc::kMaxDepthLimit) +
    " (default " + std::to_string(stackcalc::kDefaultMaxDepth) + ")\n"
    "  --precision=N      significant digits in the result, 1..17 (default 15)\n"
    "  --tokens           print tokens to stderr\n"
    "  --ast              print the syntax tree to stderr\n"
    "  --disasm           print the compiled program to stderr\n"
    "  --trace            all of the above\n"
    "  -h, --help         show this help\n";

unsigned long parse_count(std::string_view flag, std::string_view text, unsigned long lo, unsigned long hi) {
    std::string s(text);
    char* end = nullptr;
    unsigned long v = std::strtoul(s.c_str(), &end, 10);
    if (s.empty() || s[0] == '-' || end != s.c_str() + s.size() || v < lo || v > hi) {
        throw UsageError("invalid value for " + std::string(flag) + ": '" + s + "'");
    }
    return v;
}

Config parse_args(int argc, char** argv) {
    Config cfg;
    std::vector<std::string> words;
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);

        const bool is_option = arg == "-h" || (arg.size() >= 2 && arg.substr(0, 2) == "--");
        if (options_done || !is_option) {
            words.emplace_back(arg);
            continue;
        }

        auto value_of = [&](std::string_view name) -> std::string_view {
            return arg.substr(name.size() + 1);
        };
        auto has_value = [&](std::string_view name) {
            return arg.size() > name.size() && arg.substr(0, name.size()) == name && arg[name.size()] == '=';
        };

        if (arg == "--") {
            options_done = true;
        } else if (arg == "-h" || arg == "--help") {
            cfg.help = true;
        } else if (arg == "--tokens") {
            cfg.show_tokens = true;
        } else if (arg == "--ast") {
            cfg.show_ast = true;
        } else if (arg == "--disasm") {
            cfg.show_disasm = true;
        } else if (arg == "--trace") {
            cfg.show_tokens = cfg.show_ast = cfg.show_disasm = true;
        } else if (has_value("--engine")) {
            std::string_view v = value_of("--engine");
            if (v == "vm") cfg.eval.engine = stackcalc::Engine::VM;
            else if (v == "tree") cfg.eval.engine = stackcalc::Engine::Tree;
            else throw UsageError("invalid value for --engine: '" + std::string(v) + "'");
        } else if (has_value("--max-depth")) {
            cfg.eval.max_depth = parse_count("--max-depth", value_of("--max-depth"), 1, stackcalc::kMaxDepthLimit);
        } else if (has_value("--precision")) {
            cfg.precision = static_cast<int>(parse_count("--precision", value_of("--precision"), 1, 17));
        } else {
            throw UsageError("unknown option '" + std::string(arg) + "'");
        }
    }

    if (!words.empty()) {
        cfg.from_args = true;
        for (std::size_t i = 0; i < words.size(); ++i) {
            if (i) cfg.expression += ' ';
            cfg.expression += words[i];
        }
    }
    return cfg;
}

stackcalc::Trace make_trace(const Config& cfg) {
    stackcalc::Trace trace;
    if (cfg.show_tokens) {
        trace.on_tokens = [](const std::vector<stackcalc::Token>& tokens) {
            std::cerr << "tokens:";
            for (const auto& t : tokens) std::cerr << ' ' << stackcalc::to_string(t);
            std::cerr << "\n";
        };
    }
    if (cfg.show_ast) {
        trace.on_ast = [](const stackcalc::Expr& ast) { std::cerr << "ast: " << stackcalc::to_string(ast) << "\n"; };
    }
    if (cfg.show_disasm) {
        trace.on_program = [](const stackcalc::Program& p) { std::cerr << "program:\n" << stackcalc::disassemble(p); };
    }
    return trace;
}

int fail(const char* stage, const char* kind, const char* what, int code) {
    std::cerr << "stackcalc: " << stage << " error";
    if (kind) std::cerr << " (" << kind << ")";
    std::cerr << ": " << what << "\n";
    return code;
}

} // namespace

int main(int argc, char** argv) {
    Config cfg;
    try {
        cfg = parse_args(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "stackcalc: " << e.what() << "\n" << kUsage;
        return kExitUsage;
    }

    if (cfg.help) {
        std::cout << kUsage;
        return 0;
    }

    std::string input = cfg.expression;
    if (!cfg.from_args && !std::getline(std::cin, input)) input.clear();

    try {
        double result = stackcalc::evaluate(input, cfg.eval, make_trace(cfg));
        std::cout << std::setprecision(cfg.precision) << result << "\n";
    } catch (const stackcalc::LexError& e) {
        return fail("lex", nullptr, e.what(), kExitLex);
    } catch (const stackcalc::ParseError& e) {
        return fail("parse", stackcalc::to_string(e.kind()), e.what(), kExitParse);
    } catch (const stackcalc::RuntimeError& e) {
        return fail("runtime", stackcalc::to_string(e.kind()), e.what(), kExitRuntime);
    }
    return 0;
}
