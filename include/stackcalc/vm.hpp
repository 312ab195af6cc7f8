#pragma once
#include "stackcalc/program.hpp"

namespace stackcalc {

// Backend for Program::execute over plain doubles.
struct NumericBackend {
    double make_number(double x) const { return x; }
    double binary(Op op, double a, double b) const;
};

// Division by zero is not an error: the IEEE 754 result (inf or NaN) is
// returned. Throws RuntimeError on a malformed program.
double run(const Program& p);

} // namespace stackcalc
