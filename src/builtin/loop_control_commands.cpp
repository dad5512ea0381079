#include "loop_control_commands.h"

#include <cstdlib>
#include <string>
#include <vector>

#include "builtin.h"
#include "control_flow_executor.h"
#include "error_out.h"
#include "function_manager.h"
#include "script_manager.h"
#include "shell.h"

namespace {

bool parse_count(const std::string& command, const std::vector<std::string>& args, int& count,
                 int min_value) {
    if (args.size() < 2) {
        return true;
    }
    char* endptr = nullptr;
    long value = std::strtol(args[1].c_str(), &endptr, 10);
    if (args[1].empty() || *endptr != '\0' || value < min_value) {
        print_error({ErrorType::INVALID_ARGUMENT, command, "invalid level: " + args[1], {}});
        return false;
    }
    count = static_cast<int>(value);
    return true;
}

int loop_control(const std::string& command, const std::vector<std::string>& args, Shell* shell,
                 bool is_break) {
    int levels = 1;
    if (!parse_count(command, args, levels, 1)) {
        return 1;
    }
    if (shell == nullptr || shell->get_executor().loop_depth() == 0) {
        print_error({ErrorType::SYNTAX_ERROR, command,
                     "only meaningful in a 'for', 'while', 'until' or 'select' loop", {}});
        return 0;
    }
    shell->request_loop_signal(is_break ? control_flow::ControlSignal::break_levels(levels)
                                        : control_flow::ControlSignal::continue_levels(levels));
    return 0;
}

}  // namespace

int break_command(const std::vector<std::string>& args, Shell* shell) {
    if (builtin_handle_help(
            args, {"Usage: break [N]", "Exit N levels of enclosing loops (default 1)."})) {
        return 0;
    }
    return loop_control("break", args, shell, true);
}

int continue_command(const std::vector<std::string>& args, Shell* shell) {
    if (builtin_handle_help(
            args, {"Usage: continue [N]",
                   "Skip to the next iteration of the current loop or Nth enclosing loop."})) {
        return 0;
    }
    return loop_control("continue", args, shell, false);
}

int return_command(const std::vector<std::string>& args, Shell* shell) {
    if (builtin_handle_help(
            args, {"Usage: return [N]",
                   "Exit a function or sourced script with status N (default last status)."})) {
        return 0;
    }
    if (shell == nullptr) {
        return 1;
    }

    int exit_code = shell->get_last_exit_code();
    if (args.size() > 1) {
        char* endptr = nullptr;
        long value = std::strtol(args[1].c_str(), &endptr, 10);
        if (args[1].empty() || *endptr != '\0') {
            print_error({ErrorType::INVALID_ARGUMENT, "return",
                         args[1] + ": numeric argument required", {}});
            return 2;
        }
        exit_code = static_cast<int>(value) & 0xFF;
    }

    if (shell->get_script_manager().can_return_from_source()) {
        shell->get_script_manager().request_return(exit_code);
        return exit_code;
    }
    if (shell->get_function_manager().in_function()) {
        shell->get_function_manager().request_return(exit_code);
        return exit_code;
    }

    print_error({ErrorType::SYNTAX_ERROR, "return",
                 "can only return from a function or sourced script", {}});
    return 1;
}
