#include "stackcalc/ast.hpp"
#include <algorithm>
#include <utility>
#include "stackcalc/token.hpp"

namespace stackcalc {

char symbol(BinOp op) {
    switch (op) {
        case BinOp::Add: return '+';
        case BinOp::Sub: return '-';
        case BinOp::Mul: return '*';
        case BinOp::Div: return '/';
    }
    return '?';
}

static const char* name(BinOp op) {
    switch (op) {
        case BinOp::Add: return "Add";
        case BinOp::Sub: return "Sub";
        case BinOp::Mul: return "Mul";
        case BinOp::Div: return "Div";
    }
    return "?";
}

Expr make_literal(double value) {
    return Expr{Literal{value}};
}

Expr make_binary(Expr left, BinOp op, Expr right) {
    return Expr{BinaryOp{std::make_unique<Expr>(std::move(left)), op, std::make_unique<Expr>(std::move(right))}};
}

std::string to_string(const Expr& e) {
    return std::visit(overloaded{
        [](const Literal& l) { return format_number(l.value); },
        [](const BinaryOp& b) {
            return std::string(name(b.op)) + "(" + to_string(*b.left) + ", " + to_string(*b.right) + ")";
        },
    }, e.node);
}

std::size_t literal_count(const Expr& e) {
    return std::visit(overloaded{
        [](const Literal&) -> std::size_t { return 1; },
        [](const BinaryOp& b) { return literal_count(*b.left) + literal_count(*b.right); },
    }, e.node);
}

std::size_t depth(const Expr& e) {
    return std::visit(overloaded{
        [](const Literal&) -> std::size_t { return 1; },
        [](const BinaryOp& b) { return 1 + std::max(depth(*b.left), depth(*b.right)); },
    }, e.node);
}

double interpret(const Expr& e) {
    return std::visit(overloaded{
        [](const Literal& l) { return l.value; },
        [](const BinaryOp& b) {
            double lhs = interpret(*b.left);
            double rhs = interpret(*b.right);
            switch (b.op) {
                case BinOp::Add: return lhs + rhs;
                case BinOp::Sub: return lhs - rhs;
                case BinOp::Mul: return lhs * rhs;
                case BinOp::Div: return lhs / rhs;
            }
            return lhs;
        },
    }, e.node);
}

} // namespace stackcalc
