#pragma once

#include <string>
#include <vector>

namespace flags {

struct ParseResult {
    std::string script_file;
    std::vector<std::string> script_args;
    int exit_code = 0;
    bool should_exit = false;
};

// Fills the config namespace from argv. Option parsing stops at the first operand, which names
// the script; everything after it becomes the script's arguments.
ParseResult parse_arguments(int argc, char* argv[]);

}  // namespace flags
