#include "stackcalc/vm.hpp"

namespace stackcalc {

double NumericBackend::binary(Op op, double a, double b) const {
    switch (op) {
        case Op::Add: return a + b;
        case Op::Sub: return a - b;
        case Op::Mul: return a * b;
        case Op::Div: return a / b; // IEEE 754: x/0 is +-inf, 0/0 is NaN
        case Op::PushValue: break;
    }
    throw RuntimeError(RuntimeErrorKind::MalformedProgram, std::string("Not a binary instruction: ") + to_string(op));
}

double run(const Program& p) {
    NumericBackend backend;
    return p.execute(backend);
}

} // namespace stackcalc
