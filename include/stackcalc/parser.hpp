#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "stackcalc/ast.hpp"
#include "stackcalc/error.hpp"
#include "stackcalc/token.hpp"

namespace stackcalc {

enum class ParseErrorKind {
    UnexpectedToken,
    UnmatchedParenthesis,
    UnexpectedEndOfInput,
    NestingTooDeep,
};

const char* to_string(ParseErrorKind k);

struct ParseError : Error {
    ParseError(ParseErrorKind kind, const std::string& what, std::size_t pos);

    ParseErrorKind kind() const noexcept { return kind_; }
    std::size_t pos() const noexcept { return pos_; }

private:
    ParseErrorKind kind_;
    std::size_t pos_;
};

inline constexpr std::size_t kDefaultMaxDepth = 4096;

// Upper bound on max_depth. Compiling, interpreting and destroying a tree
// recurse once per level, so deeper trees could exhaust the native stack.
inline constexpr std::size_t kMaxDepthLimit = 8192;

// Expression ::= Product (('+'|'-') Expression)?
// Product    ::= Value   (('*'|'/') Product)?
// Value      ::= Number | '(' Expression ')'
//
// Both binary levels recurse on the right, so "10 - 5 - 2" is 10 - (5 - 2).
// The whole token sequence must be consumed. max_depth is clamped to
// kMaxDepthLimit.
Expr parse(const std::vector<Token>& tokens, std::size_t max_depth = kDefaultMaxDepth);

} // namespace stackcalc
