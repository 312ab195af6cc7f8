#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <variant>

namespace stackcalc {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

enum class BinOp { Add, Sub, Mul, Div };

char symbol(BinOp op);

struct Expr;

struct Literal {
    double value{0.0};
};

struct BinaryOp {
    std::unique_ptr<Expr> left;
    BinOp op{BinOp::Add};
    std::unique_ptr<Expr> right;
};

// A strict binary tree: every BinaryOp owns exactly two subtrees.
struct Expr {
    std::variant<Literal, BinaryOp> node;
};

Expr make_literal(double value);
Expr make_binary(Expr left, BinOp op, Expr right);

/// Prefix rendering, e.g. "Mul(Add(1, 2), 3)".
std::string to_string(const Expr& e);

std::size_t literal_count(const Expr& e);

/// Number of nodes on the longest root-to-leaf path (a Literal has depth 1).
std::size_t depth(const Expr& e);

/// Evaluate the tree directly, without compiling it.
/// Division follows IEEE 754, as in the VM.
double interpret(const Expr& e);

} // namespace stackcalc
