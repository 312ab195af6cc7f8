#pragma once
#include <stdexcept>
#include <string>

namespace stackcalc {

// Pipeline stage that detected a failure.
enum class Stage {
    Lex,
    Parse,
    Runtime,
};

const char* to_string(Stage s);

struct Error : std::runtime_error {
    Error(Stage stage, const std::string& what) : std::runtime_error(what), stage_(stage) {}

    Stage stage() const noexcept { return stage_; }

private:
    Stage stage_;
};

} // namespace stackcalc
