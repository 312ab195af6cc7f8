#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include "stackcalc/error.hpp"

namespace stackcalc {

enum class RuntimeErrorKind {
    StackUnderflow,
    MalformedProgram,
};

const char* to_string(RuntimeErrorKind k);

struct RuntimeError : Error {
    RuntimeError(RuntimeErrorKind kind, const std::string& what)
        : Error(Stage::Runtime, what), kind_(kind) {}

    RuntimeErrorKind kind() const noexcept { return kind_; }

private:
    RuntimeErrorKind kind_;
};

enum class Op {
    PushValue,
    Add,
    Sub,
    Mul,
    Div,
};

// Mnemonic: "PUSH", "ADD", "SUB", "MUL", "DIV".
const char* to_string(Op op);

struct Instr {
    Op op{Op::PushValue};
    double number{0.0}; // PushValue operand
};

struct Program {
    std::vector<Instr> code;

    // Run the code against an empty operand stack and return the single value
    // left on it. Backend supplies the value type:
    //   Value make_number(double);
    //   Value binary(Op, const Value& a, const Value& b);
    template <class Backend>
    auto execute(Backend& backend) const -> decltype(backend.make_number(0.0)) {
        using Value = decltype(backend.make_number(0.0));

        std::vector<Value> st;
        st.reserve(code.size());

        for (std::size_t pc = 0; pc < code.size(); ++pc) {
            const Instr& ins = code[pc];
            switch (ins.op) {
                case Op::PushValue:
                    st.emplace_back(backend.make_number(ins.number));
                    break;

                case Op::Add:
                case Op::Sub:
                case Op::Mul:
                case Op::Div: {
                    if (st.size() < 2) {
                        throw RuntimeError(RuntimeErrorKind::StackUnderflow,
                                           "Stack underflow at instruction " + std::to_string(pc) + " (" +
                                               to_string(ins.op) + "): need 2 operands, have " +
                                               std::to_string(st.size()));
                    }
                    Value b = std::move(st.back());
                    st.pop_back();
                    Value a = std::move(st.back());
                    st.pop_back();
                    st.emplace_back(backend.binary(ins.op, a, b));
                } break;
            }
        }

        if (st.size() != 1) {
            throw RuntimeError(RuntimeErrorKind::MalformedProgram,
                               "Malformed program: " + std::to_string(st.size()) +
                                   " values left on the stack, expected 1");
        }
        return std::move(st.back());
    }
};

// One instruction per line: "PUSH 1", "ADD", ...
std::string disassemble(const Program& p);

} // namespace stackcalc
