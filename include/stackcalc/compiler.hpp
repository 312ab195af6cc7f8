#pragma once
#include "stackcalc/ast.hpp"
#include "stackcalc/program.hpp"

namespace stackcalc {

// Post-order lowering: left operand, right operand, then the operator.
// A tree with n literals yields 2n - 1 instructions.
Program compile(const Expr& e);

} // namespace stackcalc
