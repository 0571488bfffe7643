#pragma once

#include <parexec/mode.hh>
#include <string_view>
#include <vector>

namespace parexec {

struct ExampleProgram {
    std::string_view name;
    Mode mode;
    Language language;
    std::string_view source;
};

// Built-in example programs, immutable process-wide state
const std::vector<ExampleProgram>& list_example_programs();

// Returns nullptr if there is no example named @p name
const ExampleProgram* find_example_program(std::string_view name);

} // namespace parexec
