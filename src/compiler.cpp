#include "stackcalc/compiler.hpp"

namespace stackcalc {

static Op opcode(BinOp op) {
    switch (op) {
        case BinOp::Add: return Op::Add;
        case BinOp::Sub: return Op::Sub;
        case BinOp::Mul: return Op::Mul;
        case BinOp::Div: return Op::Div;
    }
    return Op::Add;
}

static void emit(const Expr& e, Program& p) {
    std::visit(overloaded{
        [&](const Literal& l) { p.code.push_back(Instr{Op::PushValue, l.value}); },
        [&](const BinaryOp& b) {
            emit(*b.left, p);
            emit(*b.right, p);
            p.code.push_back(Instr{opcode(b.op)});
        },
    }, e.node);
}

Program compile(const Expr& e) {
    Program p;
    p.code.reserve(2 * literal_count(e) - 1);
    emit(e, p);
    return p;
}

} // namespace stackcalc
