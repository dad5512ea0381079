#include "set_command.h"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "builtin.h"
#include "error_out.h"
#include "shell.h"

namespace {

bool apply_named_option(Shell* shell, const std::string& name, bool enable) {
    if (name == "errexit") {
        shell->set_errexit(enable);
        return true;
    }
    if (name == "noexec") {
        shell->set_noexec(enable);
        return true;
    }
    print_error({ErrorType::INVALID_ARGUMENT, "set", name + ": invalid option name", {}});
    return false;
}

void print_options(Shell* shell) {
    std::cout << "errexit\t" << (shell->is_errexit_enabled() ? "on" : "off") << '\n';
    std::cout << "noexec\t" << (shell->is_noexec_enabled() ? "on" : "off") << '\n';
    std::cout.flush();
}

}  // namespace

int set_command(const std::vector<std::string>& args, Shell* shell) {
    if (builtin_handle_help(args, {"Usage: set [-+en] [-o option] [--] [ARG ...]",
                                   "Set or unset shell options and positional parameters.",
                                   "",
                                   "Options:",
                                   "  -e              Exit on error (errexit)",
                                   "  -n              Read but don't execute commands (noexec)",
                                   "  -o option       Set option by name",
                                   "  +<option>       Unset the specified option",
                                   "  --              End options; remaining args set $1, $2, etc.",
                                   "",
                                   "With no arguments, print all shell variables."})) {
        return 0;
    }
    if (shell == nullptr) {
        print_error({ErrorType::RUNTIME_ERROR, "set", "shell not available", {}});
        return 1;
    }

    if (args.size() == 1) {
        for (const auto& entry : shell->list_variables()) {
            std::cout << entry.first << "=" << entry.second << '\n';
        }
        std::cout.flush();
        return 0;
    }

    size_t i = 1;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--") {
            std::vector<std::string> params(args.begin() + static_cast<std::ptrdiff_t>(i + 1),
                                            args.end());
            shell->set_positional_parameters(params);
            return 0;
        }
        if (arg.size() < 2 || (arg[0] != '-' && arg[0] != '+')) {
            break;
        }

        bool enable = arg[0] == '-';
        if (arg[1] == 'o') {
            if (i + 1 >= args.size()) {
                print_options(shell);
                continue;
            }
            if (!apply_named_option(shell, args[++i], enable)) {
                return 1;
            }
            continue;
        }

        for (size_t j = 1; j < arg.size(); ++j) {
            switch (arg[j]) {
                case 'e':
                    shell->set_errexit(enable);
                    break;
                case 'n':
                    shell->set_noexec(enable);
                    break;
                default:
                    print_error({ErrorType::INVALID_ARGUMENT, "set",
                                 std::string(1, arg[0]) + arg[j] + ": invalid option", {}});
                    return 2;
            }
        }
    }

    if (i < args.size()) {
        std::vector<std::string> params(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
        shell->set_positional_parameters(params);
    }
    return 0;
}

int shift_command(const std::vector<std::string>& args, Shell* shell) {
    if (builtin_handle_help(args, {"Usage: shift [N]",
                                   "Shift positional parameters to the left by N (default 1)."})) {
        return 0;
    }
    if (shell == nullptr) {
        return 1;
    }

    int count = 1;
    if (args.size() > 1) {
        char* endptr = nullptr;
        long value = std::strtol(args[1].c_str(), &endptr, 10);
        if (args[1].empty() || *endptr != '\0' || value < 0) {
            print_error({ErrorType::INVALID_ARGUMENT, "shift",
                         args[1] + ": numeric argument required", {}});
            return 1;
        }
        count = static_cast<int>(value);
    }
    return shell->shift_positional_parameters(count);
}
