#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "stackcalc/error.hpp"
#include "stackcalc/token.hpp"

namespace stackcalc {

struct LexError : Error {
    LexError(const std::string& what, std::string word, std::size_t pos);

    const std::string& word() const noexcept { return word_; }
    std::size_t pos() const noexcept { return pos_; }

private:
    std::string word_;
    std::size_t pos_;
};

class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}

    // Returns TokKind::End once the input is exhausted, and keeps doing so.
    Token next();

private:
    void skip_ws();
    bool is_end() const { return i_ >= s_.size(); }
    std::size_t word_end(std::size_t from) const;
    bool signed_number_at(std::size_t at) const;
    Token number();

    std::string_view s_;
    std::size_t i_{0};
};

// Split a whole input into tokens. The End marker is not included.
// Throws LexError on the first word that is neither a number nor an operator.
// Numbers are read with std::strtod, so LC_NUMERIC must use '.' as the
// decimal point (the "C" locale every program starts in).
std::vector<Token> tokenize(std::string_view input);

} // namespace stackcalc
