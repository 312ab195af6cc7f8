#include "stackcalc/lexer.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <utility>

namespace stackcalc {

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

static bool is_operator(char c) {
    switch (c) {
        case '+': case '-': case '*': case '/': case '(': case ')':
            return true;
        default:
            return false;
    }
}

// Characters that may legally follow the last character of a token.
static bool is_delimiter(char c) {
    return std::isspace(static_cast<unsigned char>(c)) || is_operator(c);
}

LexError::LexError(const std::string& what, std::string word, std::size_t pos)
    : Error(Stage::Lex, what), word_(std::move(word)), pos_(pos) {}

void Lexer::skip_ws() {
    while (!is_end() && std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
}

std::size_t Lexer::word_end(std::size_t from) const {
    while (from < s_.size() && !is_delimiter(s_[from])) ++from;
    return from;
}

Token Lexer::next() {
    skip_ws();
    if (is_end()) return {TokKind::End, 0.0, s_.size(), 0};

    const std::size_t at = i_;
    char c = s_[i_];

    if ((c == '+' || c == '-') && signed_number_at(at)) return number();

    switch (c) {
        case '+': ++i_; return {TokKind::Plus, 0.0, at, 1};
        case '-': ++i_; return {TokKind::Minus, 0.0, at, 1};
        case '*': ++i_; return {TokKind::Star, 0.0, at, 1};
        case '/': ++i_; return {TokKind::Slash, 0.0, at, 1};
        case '(': ++i_; return {TokKind::LParen, 0.0, at, 1};
        case ')': ++i_; return {TokKind::RParen, 0.0, at, 1};
        default: break;
    }

    if (is_digit(c) || c == '.') return number();

    std::string word(s_.substr(at, word_end(at) - at));
    throw LexError("Unrecognized token '" + word + "' at offset " + std::to_string(at), word, at);
}

// A sign belongs to the number when it starts a word (start of input, after
// whitespace or after '(') and a digit or '.' follows it. "3 * -5" is a
// product; "1 -5" is two numbers.
bool Lexer::signed_number_at(std::size_t at) const {
    if (at + 1 >= s_.size()) return false;
    char after = s_[at + 1];
    if (!is_digit(after) && after != '.') return false;
    if (at == 0) return true;
    char before = s_[at - 1];
    return std::isspace(static_cast<unsigned char>(before)) || before == '(';
}

// [+|-] (digits ['.' digits] | '.' digits), then optionally (e|E) [+|-] digits.
// The number must end at a delimiter or at the end of input.
Token Lexer::number() {
    const std::size_t start = i_;
    std::size_t j = i_;
    if (s_[j] == '+' || s_[j] == '-') ++j;
    const std::size_t body = j;

    auto digits = [&]() {
        std::size_t n = 0;
        while (j < s_.size() && is_digit(s_[j])) { ++j; ++n; }
        return n;
    };

    std::size_t mantissa = digits();
    if (j < s_.size() && s_[j] == '.') {
        ++j;
        mantissa += digits();
    }
    bool ok = mantissa > 0;

    if (ok && j < s_.size() && (s_[j] == 'e' || s_[j] == 'E')) {
        ++j;
        if (j < s_.size() && (s_[j] == '+' || s_[j] == '-')) ++j;
        if (digits() == 0) ok = false;
    }

    if (ok && j < s_.size() && !is_delimiter(s_[j])) ok = false;

    if (!ok) {
        std::string word(s_.substr(start, std::max(j, word_end(body)) - start));
        throw LexError("Invalid number '" + word + "' at offset " + std::to_string(start), word, start);
    }

    // strtod needs a terminated buffer; the view may not have one.
    // It also reads the decimal point from LC_NUMERIC, which is "C" unless
    // the host program calls setlocale.
    std::string text(s_.substr(start, j - start));
    i_ = j;

    Token t{TokKind::Number};
    t.number = std::strtod(text.c_str(), nullptr);
    t.pos = start;
    t.len = j - start;
    return t;
}

std::vector<Token> tokenize(std::string_view input) {
    Lexer lex(input);
    std::vector<Token> out;
    for (Token t = lex.next(); t.kind != TokKind::End; t = lex.next()) {
        out.push_back(t);
    }
    return out;
}

std::string format_number(double x) {
    std::ostringstream os;
    os << std::setprecision(15) << x;
    return os.str();
}

std::string to_string(const Token& t) {
    switch (t.kind) {
        case TokKind::Number: return format_number(t.number);
        case TokKind::Plus:   return "+";
        case TokKind::Minus:  return "-";
        case TokKind::Star:   return "*";
        case TokKind::Slash:  return "/";
        case TokKind::LParen: return "(";
        case TokKind::RParen: return ")";
        case TokKind::End:    return "<end>";
    }
    return "?";
}

} // namespace stackcalc
