#include "exit_command.h"

#include <cstdlib>
#include <string>
#include <vector>

#include "builtin.h"
#include "error_out.h"
#include "shell.h"

int exit_command(const std::vector<std::string>& args, Shell* shell) {
    if (builtin_handle_help(args, {"Usage: exit [N]",
                                   "Exit the shell with status N (default last command)."})) {
        return 0;
    }
    if (shell == nullptr) {
        return 1;
    }
    if (args.size() > 2) {
        print_error({ErrorType::INVALID_ARGUMENT, "exit", "too many arguments", {}});
        return 1;
    }

    int exit_code = shell->get_last_exit_code();
    if (args.size() == 2) {
        char* endptr = nullptr;
        long code = std::strtol(args[1].c_str(), &endptr, 10);
        if (args[1].empty() || endptr == nullptr || *endptr != '\0') {
            print_error(
                {ErrorType::INVALID_ARGUMENT, "exit", args[1] + ": numeric argument required", {}});
            exit_code = 2;
        } else {
            exit_code = static_cast<int>(code) & 0xFF;
        }
    }

    shell->request_exit(exit_code);
    return exit_code;
}
