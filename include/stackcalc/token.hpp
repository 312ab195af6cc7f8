#pragma once
#include <cstddef>
#include <string>

namespace stackcalc {

enum class TokKind {
    Number,

    Plus, Minus, Star, Slash,
    LParen, RParen,

    // internal: exhausted input, never part of a tokenize() result
    End,
};

struct Token {
    TokKind kind{TokKind::End};
    double number{0.0};   // Number
    std::size_t pos{0};   // byte offset into the source
    std::size_t len{0};   // bytes of source text; 0 for End
};

// "+", "(", the number itself, or "<end>".
std::string to_string(const Token& t);

// Shortest-looking decimal form used by every printer: 15 significant digits.
std::string format_number(double x);

} // namespace stackcalc
