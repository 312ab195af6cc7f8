#include "stackcalc/program.hpp"
#include "stackcalc/token.hpp"

namespace stackcalc {

const char* to_string(Op op) {
    switch (op) {
        case Op::PushValue: return "PUSH";
        case Op::Add:       return "ADD";
        case Op::Sub:       return "SUB";
        case Op::Mul:       return "MUL";
        case Op::Div:       return "DIV";
    }
    return "???";
}

const char* to_string(RuntimeErrorKind k) {
    switch (k) {
        case RuntimeErrorKind::StackUnderflow:   return "stack underflow";
        case RuntimeErrorKind::MalformedProgram: return "malformed program";
    }
    return "unknown";
}

std::string disassemble(const Program& p) {
    std::string out;
    for (const auto& ins : p.code) {
        out += to_string(ins.op);
        if (ins.op == Op::PushValue) {
            out += ' ';
            out += format_number(ins.number);
        }
        out += '\n';
    }
    return out;
}

} // namespace stackcalc
