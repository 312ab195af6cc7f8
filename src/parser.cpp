#include "stackcalc/parser.hpp"
#include <algorithm>
#include <utility>

namespace stackcalc {

ParseError::ParseError(ParseErrorKind kind, const std::string& what, std::size_t pos)
    : Error(Stage::Parse, what), kind_(kind), pos_(pos) {}

const char* to_string(ParseErrorKind k) {
    switch (k) {
        case ParseErrorKind::UnexpectedToken:      return "unexpected token";
        case ParseErrorKind::UnmatchedParenthesis: return "unmatched parenthesis";
        case ParseErrorKind::UnexpectedEndOfInput: return "unexpected end of input";
        case ParseErrorKind::NestingTooDeep:       return "nesting too deep";
    }
    return "unknown";
}

namespace {

class Parser {
public:
    Parser(const std::vector<Token>& toks, std::size_t max_depth)
        : toks_(toks), max_depth_(max_depth) {}

    Expr parse_all() {
        Expr e = expression();
        const Token& t = peek();
        if (t.kind == TokKind::RParen) {
            fail(ParseErrorKind::UnmatchedParenthesis, "Unmatched ')'", t);
        }
        if (t.kind != TokKind::End) {
            fail(ParseErrorKind::UnexpectedToken, "Unexpected '" + to_string(t) + "' after expression", t);
        }
        return e;
    }

private:
    // Guards one level of recursion.
    struct Nest {
        explicit Nest(Parser& p) : p_(p) {
            if (++p_.depth_ > p_.max_depth_) {
                p_.fail(ParseErrorKind::NestingTooDeep,
                        "Expression nested deeper than " + std::to_string(p_.max_depth_) + " levels", p_.peek());
            }
        }
        ~Nest() { --p_.depth_; }
        Nest(const Nest&) = delete;
        Nest& operator=(const Nest&) = delete;

        Parser& p_;
    };

    const Token& peek() const {
        if (i_ < toks_.size()) return toks_[i_];
        return end_;
    }

    Token advance() {
        Token t = peek();
        if (i_ < toks_.size()) ++i_;
        return t;
    }

    [[noreturn]] void fail(ParseErrorKind kind, const std::string& msg, const Token& at) const {
        throw ParseError(kind, msg + " at offset " + std::to_string(at.pos), at.pos);
    }

    // Expression ::= Product (('+'|'-') Expression)?
    Expr expression() {
        Nest nest(*this);
        Expr lhs = product();
        TokKind k = peek().kind;
        if (k != TokKind::Plus && k != TokKind::Minus) return lhs;
        advance();
        Expr rhs = expression();
        return make_binary(std::move(lhs), k == TokKind::Plus ? BinOp::Add : BinOp::Sub, std::move(rhs));
    }

    // Product ::= Value (('*'|'/') Product)?
    Expr product() {
        Nest nest(*this);
        Expr lhs = value();
        TokKind k = peek().kind;
        if (k != TokKind::Star && k != TokKind::Slash) return lhs;
        advance();
        Expr rhs = product();
        return make_binary(std::move(lhs), k == TokKind::Star ? BinOp::Mul : BinOp::Div, std::move(rhs));
    }

    // Value ::= Number | '(' Expression ')'
    Expr value() {
        Token t = advance();
        switch (t.kind) {
            case TokKind::Number:
                return make_literal(t.number);

            case TokKind::LParen: {
                Expr inner = expression();
                const Token& close = peek();
                if (close.kind != TokKind::RParen) {
                    fail(ParseErrorKind::UnmatchedParenthesis,
                         "Expected ')' to close '(' at offset " + std::to_string(t.pos) + ", found '" +
                             to_string(close) + "'",
                         close);
                }
                advance();
                return inner;
            }

            case TokKind::End:
                fail(ParseErrorKind::UnexpectedEndOfInput, "Expected a number or '('", t);

            default:
                fail(ParseErrorKind::UnexpectedToken, "Expected a number or '(', found '" + to_string(t) + "'", t);
        }
    }

    const std::vector<Token>& toks_;
    std::size_t i_{0};
    std::size_t depth_{0};
    std::size_t max_depth_;
    Token end_{TokKind::End, 0.0, toks_.empty() ? 0 : toks_.back().pos + toks_.back().len, 0};
};

} // namespace

Expr parse(const std::vector<Token>& tokens, std::size_t max_depth) {
    Parser p(tokens, std::min(max_depth, kMaxDepthLimit));
    return p.parse_all();
}

} // namespace stackcalc
