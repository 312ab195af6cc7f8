#include "stackcalc/error.hpp"

namespace stackcalc {

const char* to_string(Stage s) {
    switch (s) {
        case Stage::Lex:     return "lex";
        case Stage::Parse:   return "parse";
        case Stage::Runtime: return "runtime";
    }
    return "unknown";
}

} // namespace stackcalc
